#include "InboundPipeline.h"
#include "../core/Logger.h"
#include "../crypto/CryptoProvider.h"
#include "../network/ConnectionManager.h"

namespace Courier {

    Message MessageFromEnvelope(const ServerEnvelope& env, std::string plaintext, const std::string& selfUserId) {
        Message m;
        m.id = env.id;
        m.senderId = env.senderId;
        m.senderUsername = env.senderUsername;
        m.conversation = env.conversation;
        m.content = std::move(plaintext);
        m.timestamp = env.createdAt;
        m.status = env.status.value_or(MessageStatus::Sent);
        m.replyToId = env.replyToId;
        if (!env.clientNonce.empty() && (selfUserId.empty() || env.senderId == selfUserId))
            m.correlationToken = env.clientNonce;
        return m;
    }

    InboundPipeline::InboundPipeline(ConversationStore& store, ConnectionManager& connection,
        CryptoProvider& crypto, InboundSettings settings)
        : m_Store(store)
        , m_Connection(connection)
        , m_Crypto(crypto)
        , m_Settings(settings)
        , m_Clock(&NowMs)
        , m_Alive(std::make_shared<bool>(true))
    {
    }

    InboundPipeline::~InboundPipeline() {
        Stop();
        m_Alive.reset();
    }

    void InboundPipeline::Start() {
        if (m_Started) return;
        m_Started = true;
        m_EnvelopeSub = m_Connection.EnvelopeReceived().Subscribe([this](const ServerEnvelope& e) { HandleEnvelope(e); });
        m_TypingStartSub = m_Connection.TypingStarted().Subscribe([this](const TypingSignal& t) { HandleTypingStart(t); });
        m_TypingStopSub = m_Connection.TypingStopped().Subscribe([this](const TypingSignal& t) { HandleTypingStop(t); });
        m_PresenceSub = m_Connection.PresenceChanged().Subscribe([this](const PresenceSignal& p) { HandlePresence(p); });
        m_ConnectivitySub = m_Connection.ConnectivityChanged().Subscribe([this](const bool& up) { HandleConnectivity(up); });
    }

    void InboundPipeline::Stop() {
        if (!m_Started) return;
        m_Started = false;
        m_Connection.EnvelopeReceived().Unsubscribe(m_EnvelopeSub);
        m_Connection.TypingStarted().Unsubscribe(m_TypingStartSub);
        m_Connection.TypingStopped().Unsubscribe(m_TypingStopSub);
        m_Connection.PresenceChanged().Unsubscribe(m_PresenceSub);
        m_Connection.ConnectivityChanged().Unsubscribe(m_ConnectivitySub);
    }

    void InboundPipeline::HandleEnvelope(const ServerEnvelope& env) {
        if (env.id.empty() || !env.conversation.IsValid()) {
            ++m_Dropped;
            LOG_WARN("Dropping envelope without id or conversation");
            return;
        }

        std::weak_ptr<bool> alive = m_Alive;
        m_Crypto.Decrypt(env.encryptedEnvelope, env.protocolVersion, env.conversation,
            [this, alive, env](std::error_code ec, std::string plaintext) {
                if (alive.expired()) return;
                if (ec) {
                    // One bad envelope never blocks the ones behind it.
                    ++m_Dropped;
                    LOG_WARN("Dropping message " + env.id + " in " + env.conversation.ToString()
                        + ": " + ec.message());
                    return;
                }

                const std::string selfId = m_Connection.Identity().userId;
                Message msg = MessageFromEnvelope(env, std::move(plaintext), selfId);
                const IngestResult result = m_Store.Ingest(std::move(msg));
                if (result == IngestResult::Rejected) {
                    ++m_Dropped;
                    return;
                }
                if (result == IngestResult::Reconciled)
                    LOG_SYNC("Self echo " + env.id + " reconciled with " + env.clientNonce);

                const bool fromOther = !selfId.empty() && env.senderId != selfId;
                if (fromOther && m_Settings.sendDeliveryReceipts && result == IngestResult::Inserted) {
                    if (auto rec = m_Connection.SendReceipt(env.id, MessageStatus::Delivered))
                        LOG_DEBUG("Delivery receipt for " + env.id + " not sent: " + rec.message());
                }
            });
    }

    void InboundPipeline::HandleTypingStart(const TypingSignal& signal) {
        if (signal.userId == m_Connection.Identity().userId) return;
        m_Store.SetTyping(signal.conversation, signal.userId, signal.username, m_Clock());
    }

    void InboundPipeline::HandleTypingStop(const TypingSignal& signal) {
        m_Store.ClearTyping(signal.conversation, signal.userId);
    }

    void InboundPipeline::HandlePresence(const PresenceSignal& signal) {
        m_Store.SetPresence(signal.userId, signal.status);
    }

    void InboundPipeline::HandleConnectivity(bool connected) {
        if (connected) return;
        // Events missed while offline cannot be replayed; start over on reconnect.
        m_Store.ClearAllTyping();
        m_Store.ClearPresence();
    }

} // namespace Courier
