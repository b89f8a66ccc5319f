#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include "Transport.h"
#include "../core/ConfigManager.h"
#include "../core/SessionStore.h"
#include "../core/SyncError.h"
#include "../shared/PacketHandler.h"
#include "../sync/EventChannel.h"

namespace asio { class io_context; }

namespace Courier {

    enum class ConnectionState { Disconnected, Connecting, Authenticating, Connected, Reconnecting };

    const char* ToString(ConnectionState state);

    struct ConnectionSettings {
        std::string host = Globals::DEFAULT_HOST;
        int port = Globals::DEFAULT_PORT;
        std::chrono::milliseconds connectTimeout{ Globals::CONNECT_TIMEOUT_MS };
        std::chrono::milliseconds reconnectDelayMin{ Globals::RECONNECT_DELAY_MIN_MS };
        std::chrono::milliseconds reconnectDelayMax{ Globals::RECONNECT_DELAY_MAX_MS };

        static ConnectionSettings FromConfig(const SyncConfig& cfg);
    };

    // Owns one logical session with the server: connect and authenticate,
    // reconnect forever with bounded backoff after an unexpected drop, and fan
    // server events out on typed channels. Everything runs on one io_context.
    class ConnectionManager {
    public:
        using ConnectHandler = std::function<void(std::error_code)>;

        ConnectionManager(asio::io_context& context, Transport& transport,
            SessionStore* sessionStore, ConnectionSettings settings);
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        /// Completes once the server has confirmed the credential. A call made
        /// while an attempt is in flight joins it with its own timeout.
        void Connect(const Credential& credential, ConnectHandler handler);
        /// Replays the retained credential, else the session store's.
        void ConnectWithLastCredential(ConnectHandler handler);
        /// Cancels everything in flight and forgets the credential.
        void Disconnect();

        ConnectionState State() const { return m_State; }
        bool IsConnected() const { return m_State == ConnectionState::Connected; }
        const SessionIdentity& Identity() const { return m_Identity; }
        uint32_t ReconnectAttempt() const { return m_ReconnectAttempt; }
        std::chrono::milliseconds BackoffDelay(uint32_t attempt) const;
        const ConnectionSettings& Settings() const { return m_Settings; }

        // ── Commands (NotConnected unless Connected) ──
        /// The room is remembered either way and joined on every authentication.
        std::error_code JoinRoom(const ConversationKey& key);
        std::error_code LeaveRoom(const ConversationKey& key);
        std::error_code SendReceipt(const std::string& messageId, MessageStatus status);
        std::error_code StartTyping(const ConversationKey& key);
        std::error_code StopTyping(const ConversationKey& key);
        std::error_code SendEnvelope(const OutboundEnvelope& envelope);
        std::error_code RequestHistory(uint64_t requestId, const ConversationKey& key, int limit,
            const std::string& beforeId);

        // ── Events ──
        EventChannel<ServerEnvelope>& EnvelopeReceived() { return m_EnvelopeReceived; }
        EventChannel<SendAck>& SendAcknowledged() { return m_SendAcknowledged; }
        EventChannel<SendFailure>& SendFailed() { return m_SendFailed; }
        EventChannel<TypingSignal>& TypingStarted() { return m_TypingStarted; }
        EventChannel<TypingSignal>& TypingStopped() { return m_TypingStopped; }
        EventChannel<PresenceSignal>& PresenceChanged() { return m_PresenceChanged; }
        EventChannel<HistoryPage>& HistoryReceived() { return m_HistoryReceived; }
        EventChannel<bool>& ConnectivityChanged() { return m_ConnectivityChanged; }
        EventChannel<ConnectionState>& StateChanged() { return m_StateChanged; }

    private:
        struct Waiter;

        void AddWaiter(ConnectHandler handler);
        void OnWaiterTimeout(uint64_t waiterId);
        void ResolveWaiters(std::error_code ec);

        void StartAttempt();
        void OnTransportOpened(std::error_code ec);
        void OnTransportClosed(std::error_code ec);
        void OnFrame(PacketType type, const std::string& body);
        void OnAuthenticated(const std::string& body);
        void OnAttemptFailed(SyncError error, const std::string& reason);
        void OnAuthRejected(const std::string& reason);
        void ScheduleReconnect();
        void CancelTimers();
        void SetState(ConnectionState state);
        void PostCompletion(ConnectHandler handler, std::error_code ec);
        std::error_code SendCommand(PacketType type, const std::string& body);

        asio::io_context& m_Context;
        Transport& m_Transport;
        SessionStore* m_SessionStore;
        ConnectionSettings m_Settings;

        struct Timers;
        std::unique_ptr<Timers> m_Timers;
        std::shared_ptr<bool> m_Alive;

        ConnectionState m_State = ConnectionState::Disconnected;
        std::optional<Credential> m_Credential;
        SessionIdentity m_Identity;
        uint32_t m_ReconnectAttempt = 0;
        // True from the first unexpected drop until the next authentication.
        bool m_InReconnectCycle = false;
        uint64_t m_AttemptSeq = 0;
        uint64_t m_NextWaiterId = 0;
        std::map<uint64_t, std::unique_ptr<Waiter>> m_Waiters;
        std::set<ConversationKey> m_Rooms;

        EventChannel<ServerEnvelope> m_EnvelopeReceived;
        EventChannel<SendAck> m_SendAcknowledged;
        EventChannel<SendFailure> m_SendFailed;
        EventChannel<TypingSignal> m_TypingStarted;
        EventChannel<TypingSignal> m_TypingStopped;
        EventChannel<PresenceSignal> m_PresenceChanged;
        EventChannel<HistoryPage> m_HistoryReceived;
        EventChannel<bool> m_ConnectivityChanged;
        EventChannel<ConnectionState> m_StateChanged;
    };

} // namespace Courier
