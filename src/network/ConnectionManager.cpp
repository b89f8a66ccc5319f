#include "ConnectionManager.h"
#include "../core/Logger.h"
#include <asio.hpp>
#include <algorithm>
#include <vector>

namespace Courier {

    const char* ToString(ConnectionState state) {
        switch (state) {
        case ConnectionState::Disconnected:   return "Disconnected";
        case ConnectionState::Connecting:     return "Connecting";
        case ConnectionState::Authenticating: return "Authenticating";
        case ConnectionState::Connected:      return "Connected";
        case ConnectionState::Reconnecting:   return "Reconnecting";
        }
        return "Unknown";
    }

    ConnectionSettings ConnectionSettings::FromConfig(const SyncConfig& cfg) {
        ConnectionSettings s;
        s.host = cfg.host;
        s.port = cfg.port;
        s.connectTimeout = std::chrono::milliseconds(cfg.connectTimeoutMs);
        s.reconnectDelayMin = std::chrono::milliseconds(cfg.reconnectDelayMinMs);
        s.reconnectDelayMax = std::chrono::milliseconds(std::max(cfg.reconnectDelayMaxMs, cfg.reconnectDelayMinMs));
        return s;
    }

    struct ConnectionManager::Waiter {
        explicit Waiter(asio::io_context& ctx) : timer(ctx) {}
        ConnectHandler handler;
        asio::steady_timer timer;
    };

    struct ConnectionManager::Timers {
        explicit Timers(asio::io_context& ctx) : backoff(ctx), attempt(ctx) {}
        asio::steady_timer backoff;   // delay before the next automatic attempt
        asio::steady_timer attempt;   // ceiling on one automatic attempt
    };

    ConnectionManager::ConnectionManager(asio::io_context& context, Transport& transport,
        SessionStore* sessionStore, ConnectionSettings settings)
        : m_Context(context)
        , m_Transport(transport)
        , m_SessionStore(sessionStore)
        , m_Settings(std::move(settings))
        , m_Timers(std::make_unique<Timers>(context))
        , m_Alive(std::make_shared<bool>(true))
    {
        m_Transport.SetOpenedHandler([this](std::error_code ec) { OnTransportOpened(ec); });
        m_Transport.SetFrameHandler([this](PacketType type, const std::string& body) { OnFrame(type, body); });
        m_Transport.SetClosedHandler([this](std::error_code ec) { OnTransportClosed(ec); });
    }

    ConnectionManager::~ConnectionManager() {
        m_Alive.reset();
        CancelTimers();
        m_Transport.Close();
        m_Transport.SetOpenedHandler(nullptr);
        m_Transport.SetFrameHandler(nullptr);
        m_Transport.SetClosedHandler(nullptr);
        m_Waiters.clear();
    }

    std::chrono::milliseconds ConnectionManager::BackoffDelay(uint32_t attempt) const {
        const auto maxDelay = std::max(m_Settings.reconnectDelayMax, m_Settings.reconnectDelayMin);
        auto delay = m_Settings.reconnectDelayMin;
        for (uint32_t i = 0; i < attempt && delay < maxDelay; ++i) delay *= 2;
        return std::min(delay, maxDelay);
    }

    // ── Connect / Disconnect ─────────────────────────────────────────────

    void ConnectionManager::Connect(const Credential& credential, ConnectHandler handler) {
        if (!credential.IsValid()) {
            PostCompletion(std::move(handler), make_error_code(SyncError::AuthenticationError));
            return;
        }

        switch (m_State) {
        case ConnectionState::Connected:
            PostCompletion(std::move(handler), {});
            return;

        case ConnectionState::Connecting:
        case ConnectionState::Authenticating:
            // Join the in-flight attempt; never a second transport.
            AddWaiter(std::move(handler));
            return;

        case ConnectionState::Reconnecting:
            LOG_NETWORK("Connect during backoff: attempting now");
            m_Timers->backoff.cancel();
            m_Credential = credential;
            AddWaiter(std::move(handler));
            StartAttempt();
            return;

        case ConnectionState::Disconnected:
            m_Credential = credential;
            m_ReconnectAttempt = 0;
            m_InReconnectCycle = false;
            AddWaiter(std::move(handler));
            StartAttempt();
            return;
        }
    }

    void ConnectionManager::ConnectWithLastCredential(ConnectHandler handler) {
        std::optional<Credential> cred = m_Credential;
        if (!cred && m_SessionStore) cred = m_SessionStore->CurrentCredential();
        if (!cred) {
            PostCompletion(std::move(handler), make_error_code(SyncError::NotConnected));
            return;
        }
        Connect(*cred, std::move(handler));
    }

    void ConnectionManager::Disconnect() {
        LOG_NETWORK("Disconnect requested");
        CancelTimers();
        ++m_AttemptSeq;
        m_Transport.Close();
        m_Credential.reset();
        m_InReconnectCycle = false;
        m_ReconnectAttempt = 0;
        SetState(ConnectionState::Disconnected);
        ResolveWaiters(make_error_code(SyncError::Shutdown));
    }

    // ── Waiters ──────────────────────────────────────────────────────────

    void ConnectionManager::AddWaiter(ConnectHandler handler) {
        const uint64_t id = ++m_NextWaiterId;
        auto waiter = std::make_unique<Waiter>(m_Context);
        waiter->handler = std::move(handler);
        waiter->timer.expires_after(m_Settings.connectTimeout);
        std::weak_ptr<bool> alive = m_Alive;
        waiter->timer.async_wait([this, alive, id](std::error_code ec) {
            if (ec || alive.expired()) return;
            OnWaiterTimeout(id);
        });
        m_Waiters.emplace(id, std::move(waiter));
    }

    void ConnectionManager::OnWaiterTimeout(uint64_t waiterId) {
        auto it = m_Waiters.find(waiterId);
        if (it == m_Waiters.end()) return;
        ConnectHandler handler = std::move(it->second->handler);
        m_Waiters.erase(it);
        LOG_WARN(std::string("Connect timed out in state ") + ToString(m_State));

        // The last caller of a first attempt gave up: abandon the attempt.
        const bool attempting = m_State == ConnectionState::Connecting || m_State == ConnectionState::Authenticating;
        if (m_Waiters.empty() && attempting && !m_InReconnectCycle) {
            ++m_AttemptSeq;
            m_Transport.Close();
            SetState(ConnectionState::Disconnected);
        }
        if (handler) handler(make_error_code(SyncError::ConnectTimeout));
    }

    void ConnectionManager::ResolveWaiters(std::error_code ec) {
        auto waiters = std::move(m_Waiters);
        m_Waiters.clear();
        for (auto& [id, waiter] : waiters) {
            waiter->timer.cancel();
            if (waiter->handler) waiter->handler(ec);
        }
    }

    void ConnectionManager::PostCompletion(ConnectHandler handler, std::error_code ec) {
        if (!handler) return;
        asio::post(m_Context, [handler = std::move(handler), ec] { handler(ec); });
    }

    // ── Attempt lifecycle ────────────────────────────────────────────────

    void ConnectionManager::StartAttempt() {
        const uint64_t seq = ++m_AttemptSeq;
        SetState(ConnectionState::Connecting);

        if (m_InReconnectCycle) {
            m_Timers->attempt.expires_after(m_Settings.connectTimeout);
            std::weak_ptr<bool> alive = m_Alive;
            m_Timers->attempt.async_wait([this, alive, seq](std::error_code ec) {
                if (ec || alive.expired() || seq != m_AttemptSeq) return;
                if (m_State != ConnectionState::Connecting && m_State != ConnectionState::Authenticating) return;
                OnAttemptFailed(SyncError::ConnectTimeout, "attempt timed out");
            });
        }

        LOG_NETWORK("Opening transport to " + m_Settings.host + ":" + std::to_string(m_Settings.port));
        m_Transport.Open(m_Settings.host, m_Settings.port);
    }

    void ConnectionManager::OnTransportOpened(std::error_code ec) {
        if (m_State != ConnectionState::Connecting) return;
        if (ec) {
            OnAttemptFailed(SyncError::TransportError, ec.message());
            return;
        }
        if (!m_Credential) {
            OnAttemptFailed(SyncError::AuthenticationError, "no credential");
            return;
        }
        SetState(ConnectionState::Authenticating);
        if (!m_Transport.Send(PacketType::Authenticate, PacketHandler::CreateAuthenticatePayload(m_Credential->token)))
            OnAttemptFailed(SyncError::TransportError, "transport refused authenticate frame");
    }

    void ConnectionManager::OnTransportClosed(std::error_code ec) {
        switch (m_State) {
        case ConnectionState::Connected:
            LOG_WARN("Connection lost: " + ec.message());
            m_InReconnectCycle = true;
            SetState(ConnectionState::Reconnecting);
            ScheduleReconnect();
            break;
        case ConnectionState::Connecting:
        case ConnectionState::Authenticating:
            OnAttemptFailed(SyncError::TransportError, ec.message());
            break;
        default:
            break;
        }
    }

    void ConnectionManager::OnAuthenticated(const std::string& body) {
        auto identity = PacketHandler::ParseAuthenticated(body);
        if (!identity) {
            OnAttemptFailed(SyncError::TransportError, "malformed Authenticated frame");
            return;
        }
        m_Timers->attempt.cancel();
        m_Identity = *identity;
        m_ReconnectAttempt = 0;
        const bool resumed = m_InReconnectCycle;
        m_InReconnectCycle = false;
        LOG_NETWORK("Authenticated as " + m_Identity.username + " (" + m_Identity.userId + ")"
            + (resumed ? ", session resumed" : ""));

        for (const auto& room : m_Rooms) {
            const PacketType type = room.kind == ConversationKind::Channel ? PacketType::Channel_Join : PacketType::Dm_Join;
            m_Transport.Send(type, PacketHandler::CreateRoomPayload(room));
        }

        SetState(ConnectionState::Connected);
        ResolveWaiters({});
    }

    void ConnectionManager::OnAttemptFailed(SyncError error, const std::string& reason) {
        ++m_AttemptSeq;
        m_Timers->attempt.cancel();
        m_Transport.Close();
        LOG_WARN(std::string("Connect attempt failed (") + Courier::ToString(error) + "): " + reason);

        if (m_InReconnectCycle) {
            SetState(ConnectionState::Reconnecting);
            ResolveWaiters(make_error_code(error));
            ScheduleReconnect();
            return;
        }
        SetState(ConnectionState::Disconnected);
        ResolveWaiters(make_error_code(error));
    }

    void ConnectionManager::OnAuthRejected(const std::string& reason) {
        LOG_ERROR("Authentication rejected: " + reason);
        ++m_AttemptSeq;
        CancelTimers();
        m_Transport.Close();
        const std::optional<Credential> rejected = std::move(m_Credential);
        m_Credential.reset();
        m_InReconnectCycle = false;
        m_ReconnectAttempt = 0;
        SetState(ConnectionState::Disconnected);
        ResolveWaiters(make_error_code(SyncError::AuthenticationError));
        if (m_SessionStore && rejected) m_SessionStore->OnAuthenticationFailed(*rejected, reason);
    }

    void ConnectionManager::ScheduleReconnect() {
        if (!m_Credential) {
            LOG_ERROR("Cannot reconnect without a credential");
            m_InReconnectCycle = false;
            SetState(ConnectionState::Disconnected);
            return;
        }
        const auto delay = BackoffDelay(m_ReconnectAttempt);
        ++m_ReconnectAttempt;
        LOG_NETWORK("Reconnect attempt " + std::to_string(m_ReconnectAttempt) + " in "
            + std::to_string(delay.count()) + " ms");

        m_Timers->backoff.expires_after(delay);
        std::weak_ptr<bool> alive = m_Alive;
        m_Timers->backoff.async_wait([this, alive](std::error_code ec) {
            if (ec || alive.expired()) return;
            if (m_State != ConnectionState::Reconnecting) return;
            StartAttempt();
        });
    }

    void ConnectionManager::CancelTimers() {
        m_Timers->backoff.cancel();
        m_Timers->attempt.cancel();
    }

    void ConnectionManager::SetState(ConnectionState state) {
        if (m_State == state) return;
        const ConnectionState previous = m_State;
        m_State = state;
        LOG_NETWORK(std::string("State ") + ToString(previous) + " -> " + ToString(state));
        m_StateChanged.Publish(state);
        if (state == ConnectionState::Connected) m_ConnectivityChanged.Publish(true);
        else if (previous == ConnectionState::Connected) m_ConnectivityChanged.Publish(false);
    }

    // ── Inbound frames ───────────────────────────────────────────────────

    void ConnectionManager::OnFrame(PacketType type, const std::string& body) {
        try {
            switch (type) {
            case PacketType::Authenticated:
                if (m_State == ConnectionState::Authenticating) OnAuthenticated(body);
                return;
            case PacketType::Auth_Error:
                if (m_State == ConnectionState::Authenticating || m_State == ConnectionState::Connected)
                    OnAuthRejected(PacketHandler::ParseAuthError(body));
                return;
            case PacketType::Ping:
                m_Transport.Send(PacketType::Pong, "{}");
                return;
            case PacketType::Pong:
                return;
            default:
                break;
            }

            if (m_State != ConnectionState::Connected) {
                LOG_DEBUG("Ignoring frame " + std::to_string(static_cast<int>(type)) + " before authentication");
                return;
            }

            switch (type) {
            case PacketType::Message_Received:
                if (auto env = PacketHandler::ParseMessageReceived(body)) m_EnvelopeReceived.Publish(*env);
                else LOG_WARN("Dropping malformed Message_Received frame");
                break;
            case PacketType::Message_Ack:
                if (auto ack = PacketHandler::ParseAck(body)) m_SendAcknowledged.Publish(*ack);
                else LOG_WARN("Dropping malformed Message_Ack frame");
                break;
            case PacketType::Message_Error:
                if (auto f = PacketHandler::ParseSendFailure(body)) m_SendFailed.Publish(*f);
                else LOG_WARN("Dropping malformed Message_Error frame");
                break;
            case PacketType::Typing_Start:
                if (auto t = PacketHandler::ParseTyping(body)) m_TypingStarted.Publish(*t);
                break;
            case PacketType::Typing_Stop:
                if (auto t = PacketHandler::ParseTyping(body)) m_TypingStopped.Publish(*t);
                break;
            case PacketType::Presence_Update:
                if (auto p = PacketHandler::ParsePresence(body)) m_PresenceChanged.Publish(*p);
                break;
            case PacketType::History_Response:
                if (auto page = PacketHandler::ParseHistoryResponse(body)) m_HistoryReceived.Publish(*page);
                else LOG_WARN("Dropping malformed History_Response frame");
                break;
            default:
                LOG_DEBUG("Unhandled frame type " + std::to_string(static_cast<int>(type)));
                break;
            }
        }
        catch (const std::exception& e) {
            LOG_ERROR(std::string("Frame handler failed: ") + e.what());
        }
    }

    // ── Commands ─────────────────────────────────────────────────────────

    std::error_code ConnectionManager::SendCommand(PacketType type, const std::string& body) {
        if (!IsConnected()) return make_error_code(SyncError::NotConnected);
        if (!m_Transport.Send(type, body)) return make_error_code(SyncError::NotConnected);
        return {};
    }

    std::error_code ConnectionManager::JoinRoom(const ConversationKey& key) {
        if (!key.IsValid()) return make_error_code(SyncError::InvalidMessage);
        m_Rooms.insert(key);
        const PacketType type = key.kind == ConversationKind::Channel ? PacketType::Channel_Join : PacketType::Dm_Join;
        return SendCommand(type, PacketHandler::CreateRoomPayload(key));
    }

    std::error_code ConnectionManager::LeaveRoom(const ConversationKey& key) {
        if (!key.IsValid()) return make_error_code(SyncError::InvalidMessage);
        m_Rooms.erase(key);
        const PacketType type = key.kind == ConversationKind::Channel ? PacketType::Channel_Leave : PacketType::Dm_Leave;
        return SendCommand(type, PacketHandler::CreateRoomPayload(key));
    }

    std::error_code ConnectionManager::SendReceipt(const std::string& messageId, MessageStatus status) {
        if (messageId.empty()) return make_error_code(SyncError::InvalidMessage);
        return SendCommand(PacketType::Receipt_Send, PacketHandler::CreateReceiptPayload(messageId, status));
    }

    std::error_code ConnectionManager::StartTyping(const ConversationKey& key) {
        return SendCommand(PacketType::Typing_Start, PacketHandler::CreateTypingPayload(key));
    }

    std::error_code ConnectionManager::StopTyping(const ConversationKey& key) {
        return SendCommand(PacketType::Typing_Stop, PacketHandler::CreateTypingPayload(key));
    }

    std::error_code ConnectionManager::SendEnvelope(const OutboundEnvelope& envelope) {
        if (!envelope.target.IsValid()) return make_error_code(SyncError::InvalidMessage);
        return SendCommand(PacketType::Message_Send, PacketHandler::CreateMessageSendPayload(envelope));
    }

    std::error_code ConnectionManager::RequestHistory(uint64_t requestId, const ConversationKey& key, int limit,
        const std::string& beforeId)
    {
        if (!key.IsValid()) return make_error_code(SyncError::InvalidMessage);
        return SendCommand(PacketType::History_Request,
            PacketHandler::CreateHistoryRequestPayload(requestId, key, limit, beforeId));
    }

} // namespace Courier
