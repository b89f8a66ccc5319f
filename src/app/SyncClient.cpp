#include "SyncClient.h"
#include "../core/Logger.h"
#include "../core/SyncError.h"
#include "../storage/MessageCacheDb.h"
#include <asio.hpp>
#include <algorithm>

namespace Courier {

    namespace {
        OutboundSettings OutboundFrom(const SyncConfig& cfg) {
            OutboundSettings s;
            s.maxMessageLength = static_cast<size_t>(std::max(cfg.maxMessageLength, 1));
            s.pendingTimeout = std::chrono::milliseconds(cfg.pendingTimeoutMs);
            return s;
        }

        InboundSettings InboundFrom(const SyncConfig& cfg) {
            InboundSettings s;
            s.sendDeliveryReceipts = cfg.sendDeliveryReceipts;
            return s;
        }
    }

    struct SyncClient::Internals {
        explicit Internals(asio::io_context& ctx) : typingSweep(ctx) {}
        asio::steady_timer typingSweep;
    };

    SyncClient::SyncClient(asio::io_context& context, Transport& transport, CryptoProvider& crypto,
        SessionStore* sessionStore, SyncConfig config, HistoryApi* history)
        : m_Context(context)
        , m_Config(std::move(config))
        , m_Connection(context, transport, sessionStore, ConnectionSettings::FromConfig(m_Config))
        , m_SocketHistory(history ? std::unique_ptr<SocketHistoryApi>()
            : std::make_unique<SocketHistoryApi>(context, m_Connection, std::chrono::milliseconds(m_Config.connectTimeoutMs)))
        , m_History(history ? *history : *m_SocketHistory)
        , m_Outbound(context, m_Store, m_Connection, crypto, OutboundFrom(m_Config))
        , m_Inbound(m_Store, m_Connection, crypto, InboundFrom(m_Config))
        , m_HistoryMerge(context, m_Store, m_History, crypto, m_Connection)
        , m_Internals(std::make_unique<Internals>(context))
        , m_Alive(std::make_shared<bool>(true))
    {
    }

    SyncClient::~SyncClient() {
        Shutdown();
        m_Alive.reset();
    }

    void SyncClient::Init() {
        if (m_Initialized || m_ShutDown) return;
        m_Initialized = true;

        if (m_Config.cacheEnabled) {
            m_Cache = std::make_unique<MessageCacheDb>();
            if (m_Cache->Open(m_Config.cachePath)) {
                LOG_INFO("Message cache at " + m_Config.cachePath);
                m_CacheSub = m_Store.Changed().Subscribe([this](const ConversationKey& key) { WriteThrough(key); });
            } else {
                LOG_ERROR("Message cache disabled: cannot open " + m_Config.cachePath);
                m_Cache.reset();
            }
        }

        m_Outbound.Start();
        m_Inbound.Start();
        ScheduleTypingSweep();
        LOG_SYNC("Sync client initialized");
    }

    void SyncClient::Shutdown() {
        if (!m_Initialized || m_ShutDown) return;
        m_ShutDown = true;

        m_Internals->typingSweep.cancel();
        m_Outbound.Stop();
        m_Inbound.Stop();
        m_Connection.Disconnect();
        if (m_CacheSub) {
            m_Store.Changed().Unsubscribe(m_CacheSub);
            m_CacheSub = 0;
        }
        if (m_Cache) m_Cache->Close();
        LOG_SYNC("Sync client shut down");
    }

    bool SyncClient::CacheEnabled() const {
        return m_Cache && m_Cache->IsOpen();
    }

    // ── Connection ───────────────────────────────────────────────────────

    void SyncClient::Connect(const Credential& credential, ConnectHandler handler) {
        if (m_ShutDown) {
            const auto ec = make_error_code(SyncError::Shutdown);
            if (handler) asio::post(m_Context, [handler = std::move(handler), ec] { handler(ec); });
            return;
        }
        m_Connection.Connect(credential, std::move(handler));
    }

    void SyncClient::Disconnect() {
        m_Connection.Disconnect();
    }

    // ── Conversations ────────────────────────────────────────────────────

    void SyncClient::OpenConversation(const ConversationKey& key) {
        if (!key.IsValid()) return;
        Hydrate(key);
        if (auto ec = m_Connection.JoinRoom(key))
            LOG_DEBUG("Join " + key.ToString() + " deferred until connected: " + ec.message());
    }

    void SyncClient::CloseConversation(const ConversationKey& key) {
        if (!key.IsValid()) return;
        StopTyping(key);
        if (auto ec = m_Connection.LeaveRoom(key))
            LOG_DEBUG("Leave " + key.ToString() + " not sent: " + ec.message());
    }

    void SyncClient::Send(const ConversationKey& target, const std::string& plaintext,
        const std::string& replyToId, SendHandler handler)
    {
        m_LastTypingSent.erase(target);
        m_Outbound.Send(target, plaintext, replyToId, std::move(handler));
    }

    void SyncClient::Resend(const std::string& correlationToken, SendHandler handler) {
        m_Outbound.Resend(correlationToken, std::move(handler));
    }

    void SyncClient::LoadOlder(const ConversationKey& key, LoadHandler handler) {
        LoadOlder(key, m_Config.historyPageSize, {}, std::move(handler));
    }

    void SyncClient::LoadOlder(const ConversationKey& key, int pageSize, const std::string& beforeId,
        LoadHandler handler)
    {
        m_HistoryMerge.LoadOlder(key, pageSize, beforeId, std::move(handler));
    }

    // ── Typing ───────────────────────────────────────────────────────────

    std::error_code SyncClient::StartTyping(const ConversationKey& key) {
        const int64_t now = NowMs();
        auto it = m_LastTypingSent.find(key);
        if (it != m_LastTypingSent.end() && now - it->second < m_Config.typingResendMs) return {};
        std::error_code ec = m_Connection.StartTyping(key);
        if (!ec) m_LastTypingSent[key] = now;
        return ec;
    }

    std::error_code SyncClient::StopTyping(const ConversationKey& key) {
        if (m_LastTypingSent.erase(key) == 0) return {};
        return m_Connection.StopTyping(key);
    }

    void SyncClient::ScheduleTypingSweep() {
        const auto period = std::chrono::milliseconds(std::max(m_Config.typingExpiryMs / 2, 10));
        m_Internals->typingSweep.expires_after(period);
        std::weak_ptr<bool> alive = m_Alive;
        m_Internals->typingSweep.async_wait([this, alive](std::error_code ec) {
            if (ec || alive.expired() || m_ShutDown) return;
            const size_t expired = m_Store.PruneTyping(NowMs() - m_Config.typingExpiryMs);
            if (expired > 0) LOG_DEBUG("Expired " + std::to_string(expired) + " typing entries");
            ScheduleTypingSweep();
        });
    }

    // ── Subscriptions ────────────────────────────────────────────────────

    SubscriptionId SyncClient::OnConversationChanged(std::function<void(const ConversationKey&)> handler) {
        return m_Store.Changed().Subscribe(std::move(handler));
    }

    SubscriptionId SyncClient::OnTypingChanged(std::function<void(const ConversationKey&)> handler) {
        return m_Store.TypingChanged().Subscribe(std::move(handler));
    }

    SubscriptionId SyncClient::OnConnectivityChanged(std::function<void(bool)> handler) {
        return m_Connection.ConnectivityChanged().Subscribe(
            [handler = std::move(handler)](const bool& up) { if (handler) handler(up); });
    }

    // ── Cache ────────────────────────────────────────────────────────────

    void SyncClient::Hydrate(const ConversationKey& key) {
        if (!CacheEnabled()) return;
        std::vector<Message> cached = m_Cache->LoadLatest(key, m_Config.historyPageSize);
        if (cached.empty()) return;
        const std::optional<bool> hasMore = m_Cache->GetHasMore(key);
        const size_t added = m_Store.MergePage(key, std::move(cached), hasMore);
        LOG_SYNC("Hydrated " + std::to_string(added) + " cached messages into " + key.ToString());
    }

    void SyncClient::WriteThrough(const ConversationKey& key) {
        if (!CacheEnabled()) return;
        std::vector<Message> reconciled;
        for (auto& m : m_Store.Timeline(key))
            if (m.HasId()) reconciled.push_back(std::move(m));
        if (!m_Cache->UpsertMessages(reconciled)) return;
        m_Cache->SetHasMore(key, m_Store.HasMore(key));
        m_Cache->PruneKeepLast(key, m_Config.cacheKeepLast);
    }

} // namespace Courier
