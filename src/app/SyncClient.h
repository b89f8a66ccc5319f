#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include "../core/ConfigManager.h"
#include "../network/ConnectionManager.h"
#include "../sync/ConversationStore.h"
#include "../sync/HistoryMerge.h"
#include "../sync/InboundPipeline.h"
#include "../sync/OutboundPipeline.h"

namespace asio { class io_context; }

namespace Courier {

    class CryptoProvider;
    class MessageCacheDb;
    class Transport;

    // The synchronization layer as one owned object. The UI reads the store
    // and calls the imperative methods below; everything happens on the
    // io_context passed in.
    class SyncClient {
    public:
        using ConnectHandler = ConnectionManager::ConnectHandler;
        using SendHandler = OutboundPipeline::SendHandler;
        using LoadHandler = HistoryMerge::LoadHandler;

        /// `history` null means history requests go over the connection itself.
        SyncClient(asio::io_context& context, Transport& transport, CryptoProvider& crypto,
            SessionStore* sessionStore, SyncConfig config, HistoryApi* history = nullptr);
        ~SyncClient();

        SyncClient(const SyncClient&) = delete;
        SyncClient& operator=(const SyncClient&) = delete;

        void Init();
        void Shutdown();

        void Connect(const Credential& credential, ConnectHandler handler);
        void Disconnect();

        /// Joins the room and, with the cache enabled, hydrates the timeline.
        void OpenConversation(const ConversationKey& key);
        void CloseConversation(const ConversationKey& key);

        void Send(const ConversationKey& target, const std::string& plaintext,
            const std::string& replyToId, SendHandler handler);
        void Resend(const std::string& correlationToken, SendHandler handler);
        void LoadOlder(const ConversationKey& key, LoadHandler handler);
        void LoadOlder(const ConversationKey& key, int pageSize, const std::string& beforeId, LoadHandler handler);

        /// At most one signal per typing_resend_ms per conversation reaches the wire.
        std::error_code StartTyping(const ConversationKey& key);
        std::error_code StopTyping(const ConversationKey& key);

        const ConversationStore& Store() const { return m_Store; }
        ConnectionManager& Connection() { return m_Connection; }
        const SyncConfig& Config() const { return m_Config; }
        bool CacheEnabled() const;

        SubscriptionId OnConversationChanged(std::function<void(const ConversationKey&)> handler);
        SubscriptionId OnTypingChanged(std::function<void(const ConversationKey&)> handler);
        SubscriptionId OnConnectivityChanged(std::function<void(bool)> handler);
        void RemoveConversationListener(SubscriptionId id) { m_Store.Changed().Unsubscribe(id); }
        void RemoveTypingListener(SubscriptionId id) { m_Store.TypingChanged().Unsubscribe(id); }
        void RemoveConnectivityListener(SubscriptionId id) { m_Connection.ConnectivityChanged().Unsubscribe(id); }

    private:
        struct Internals;

        void ScheduleTypingSweep();
        void WriteThrough(const ConversationKey& key);
        void Hydrate(const ConversationKey& key);

        asio::io_context& m_Context;
        SyncConfig m_Config;
        ConversationStore m_Store;
        ConnectionManager m_Connection;
        std::unique_ptr<SocketHistoryApi> m_SocketHistory;
        HistoryApi& m_History;
        OutboundPipeline m_Outbound;
        InboundPipeline m_Inbound;
        HistoryMerge m_HistoryMerge;
        std::unique_ptr<MessageCacheDb> m_Cache;
        std::unique_ptr<Internals> m_Internals;
        std::shared_ptr<bool> m_Alive;

        std::map<ConversationKey, int64_t> m_LastTypingSent;
        SubscriptionId m_CacheSub = 0;
        bool m_Initialized = false;
        bool m_ShutDown = false;
    };

} // namespace Courier
