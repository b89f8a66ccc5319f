#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "ConversationStore.h"

namespace Courier {

    class ConnectionManager;
    class CryptoProvider;
    struct ServerEnvelope;
    struct TypingSignal;
    struct PresenceSignal;

    /// Builds the store record for a decrypted server envelope. The client nonce
    /// becomes the correlation token only on our own messages.
    Message MessageFromEnvelope(const ServerEnvelope& env, std::string plaintext, const std::string& selfUserId);

    struct InboundSettings {
        bool sendDeliveryReceipts = true;
    };

    // Server push -> decrypt -> ConversationStore::Ingest. Also keeps the
    // ephemeral typing and presence state in step with the event stream.
    class InboundPipeline {
    public:
        using Clock = std::function<int64_t()>;

        InboundPipeline(ConversationStore& store, ConnectionManager& connection,
            CryptoProvider& crypto, InboundSettings settings = {});
        ~InboundPipeline();

        InboundPipeline(const InboundPipeline&) = delete;
        InboundPipeline& operator=(const InboundPipeline&) = delete;

        void Start();
        void Stop();

        void HandleEnvelope(const ServerEnvelope& env);

        void SetClock(Clock clock) { m_Clock = std::move(clock); }
        uint64_t DroppedCount() const { return m_Dropped; }

    private:
        void HandleTypingStart(const TypingSignal& signal);
        void HandleTypingStop(const TypingSignal& signal);
        void HandlePresence(const PresenceSignal& signal);
        void HandleConnectivity(bool connected);

        ConversationStore& m_Store;
        ConnectionManager& m_Connection;
        CryptoProvider& m_Crypto;
        InboundSettings m_Settings;
        Clock m_Clock;
        std::shared_ptr<bool> m_Alive;
        uint64_t m_Dropped = 0;

        bool m_Started = false;
        SubscriptionId m_EnvelopeSub = 0;
        SubscriptionId m_TypingStartSub = 0;
        SubscriptionId m_TypingStopSub = 0;
        SubscriptionId m_PresenceSub = 0;
        SubscriptionId m_ConnectivitySub = 0;
    };

} // namespace Courier
