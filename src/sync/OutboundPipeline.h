#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include "ConversationStore.h"
#include "../core/Globals.h"

namespace asio { class io_context; }

namespace Courier {

    class ConnectionManager;
    class CryptoProvider;
    struct OutboundEnvelope;
    struct SendAck;
    struct SendFailure;

    struct OutboundSettings {
        size_t maxMessageLength = Globals::MAX_MESSAGE_LEN;
        // Zero disables the watchdog: a record then stays PENDING until ack or error.
        std::chrono::milliseconds pendingTimeout{ Globals::PENDING_TIMEOUT_MS };
    };

    // Compose -> envelope -> optimistic PENDING record -> wire. Reconciles the
    // server's ack or error against the store by correlation token.
    class OutboundPipeline {
    public:
        using SendHandler = std::function<void(std::error_code, const std::string& correlationToken)>;
        using Clock = std::function<int64_t()>;

        OutboundPipeline(asio::io_context& context, ConversationStore& store,
            ConnectionManager& connection, CryptoProvider& crypto, OutboundSettings settings = {});
        ~OutboundPipeline();

        OutboundPipeline(const OutboundPipeline&) = delete;
        OutboundPipeline& operator=(const OutboundPipeline&) = delete;

        void Start();
        void Stop();

        /// The handler receives the correlation token once the envelope is on
        /// the wire (or the record has been marked FAILED). It never waits for
        /// the server's acknowledgment.
        void Send(const ConversationKey& target, const std::string& plaintext,
            const std::string& replyToId, SendHandler handler);
        /// User re-submission of a FAILED record under a fresh token.
        void Resend(const std::string& correlationToken, SendHandler handler);

        void SetClock(Clock clock) { m_Clock = std::move(clock); }
        size_t ArmedWatchdogs() const { return m_Watchdogs.size(); }

    private:
        struct Watchdog;

        void Transmit(const OutboundEnvelope& envelope, SendHandler handler);
        void FailNotConnected(const std::string& token, SendHandler& handler);
        void ArmWatchdog(const std::string& token);
        void DisarmWatchdog(const std::string& token);
        void OnWatchdog(const std::string& token);
        void OnAck(const SendAck& ack);
        void OnFailure(const SendFailure& failure);
        void Complete(SendHandler& handler, std::error_code ec, const std::string& token);

        asio::io_context& m_Context;
        ConversationStore& m_Store;
        ConnectionManager& m_Connection;
        CryptoProvider& m_Crypto;
        OutboundSettings m_Settings;
        Clock m_Clock;

        std::map<std::string, std::unique_ptr<Watchdog>> m_Watchdogs;
        std::shared_ptr<bool> m_Alive;
        SubscriptionId m_AckSub = 0;
        SubscriptionId m_FailSub = 0;
        bool m_Started = false;
    };

} // namespace Courier
