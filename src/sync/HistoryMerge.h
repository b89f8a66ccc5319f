#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "ConversationStore.h"
#include "../shared/PacketHandler.h"

namespace asio { class io_context; }

namespace Courier {

    class ConnectionManager;
    class CryptoProvider;

    // Source of older, still-encrypted pages of a conversation.
    class HistoryApi {
    public:
        /// The page's `returned` drives pagination; `messages` may hold fewer.
        using FetchHandler = std::function<void(std::error_code, HistoryPage)>;

        virtual ~HistoryApi() = default;
        /// `beforeId` empty means the newest page.
        virtual void FetchPage(const ConversationKey& key, int pageSize, const std::string& beforeId,
            FetchHandler handler) = 0;
    };

    // History over the live connection: History_Request frames answered by
    // History_Response frames carrying the same requestId.
    class SocketHistoryApi : public HistoryApi {
    public:
        SocketHistoryApi(asio::io_context& context, ConnectionManager& connection,
            std::chrono::milliseconds timeout);
        ~SocketHistoryApi() override;

        void FetchPage(const ConversationKey& key, int pageSize, const std::string& beforeId,
            FetchHandler handler) override;

        size_t InFlight() const { return m_Pending.size(); }

    private:
        struct PendingRequest;

        void OnPage(const HistoryPage& page);
        void OnTimeout(uint64_t requestId);

        asio::io_context& m_Context;
        ConnectionManager& m_Connection;
        std::chrono::milliseconds m_Timeout;
        uint64_t m_NextRequestId = 0;
        std::map<uint64_t, std::unique_ptr<PendingRequest>> m_Pending;
        SubscriptionId m_PageSub = 0;
        std::shared_ptr<bool> m_Alive;
    };

    constexpr const char* kUndecryptablePlaceholder = "[Unable to decrypt message]";

    // Pulls an older page and merges it without disturbing what real-time
    // ingestion put in the timeline meanwhile.
    class HistoryMerge {
    public:
        using LoadHandler = std::function<void(std::error_code, size_t fetched)>;

        HistoryMerge(asio::io_context& context, ConversationStore& store, HistoryApi& api,
            CryptoProvider& crypto, ConnectionManager& connection);
        ~HistoryMerge();

        HistoryMerge(const HistoryMerge&) = delete;
        HistoryMerge& operator=(const HistoryMerge&) = delete;

        /// `beforeId` empty means "older than the oldest record we hold". A call
        /// for a conversation that already has a fetch in flight completes at
        /// once with a count of zero.
        void LoadOlder(const ConversationKey& key, int pageSize, const std::string& beforeId, LoadHandler handler);

        bool IsLoading(const ConversationKey& key) const { return m_InFlight.count(key) != 0; }

    private:
        void MergeDecrypted(const ConversationKey& key, int pageSize, HistoryPage page, LoadHandler handler);

        asio::io_context& m_Context;
        ConversationStore& m_Store;
        HistoryApi& m_Api;
        CryptoProvider& m_Crypto;
        ConnectionManager& m_Connection;
        std::set<ConversationKey> m_InFlight;
        std::shared_ptr<bool> m_Alive;
    };

} // namespace Courier
