#include "OutboundPipeline.h"
#include "../core/Logger.h"
#include "../core/SyncError.h"
#include "../crypto/CryptoProvider.h"
#include "../network/ConnectionManager.h"
#include <asio.hpp>

namespace Courier {

    struct OutboundPipeline::Watchdog {
        explicit Watchdog(asio::io_context& ctx) : timer(ctx) {}
        asio::steady_timer timer;
    };

    OutboundPipeline::OutboundPipeline(asio::io_context& context, ConversationStore& store,
        ConnectionManager& connection, CryptoProvider& crypto, OutboundSettings settings)
        : m_Context(context)
        , m_Store(store)
        , m_Connection(connection)
        , m_Crypto(crypto)
        , m_Settings(settings)
        , m_Clock(&NowMs)
        , m_Alive(std::make_shared<bool>(true))
    {
    }

    OutboundPipeline::~OutboundPipeline() {
        Stop();
        m_Alive.reset();
    }

    void OutboundPipeline::Start() {
        if (m_Started) return;
        m_Started = true;
        m_AckSub = m_Connection.SendAcknowledged().Subscribe([this](const SendAck& ack) { OnAck(ack); });
        m_FailSub = m_Connection.SendFailed().Subscribe([this](const SendFailure& f) { OnFailure(f); });
    }

    void OutboundPipeline::Stop() {
        if (!m_Started) return;
        m_Started = false;
        m_Connection.SendAcknowledged().Unsubscribe(m_AckSub);
        m_Connection.SendFailed().Unsubscribe(m_FailSub);
        for (auto& [token, dog] : m_Watchdogs) dog->timer.cancel();
        m_Watchdogs.clear();
    }

    void OutboundPipeline::Complete(SendHandler& handler, std::error_code ec, const std::string& token) {
        if (handler) handler(ec, token);
    }

    void OutboundPipeline::Send(const ConversationKey& target, const std::string& plaintext,
        const std::string& replyToId, SendHandler handler)
    {
        std::error_code invalid;
        if (!target.IsValid()) invalid = make_error_code(SyncError::InvalidMessage);
        else if (plaintext.find_first_not_of(" \t\r\n") == std::string::npos) invalid = make_error_code(SyncError::InvalidMessage);
        else if (plaintext.size() > m_Settings.maxMessageLength) invalid = make_error_code(SyncError::InvalidMessage);
        if (invalid) {
            LOG_WARN("Send rejected: empty or oversized message for " + target.ToString());
            if (handler) asio::post(m_Context, [handler = std::move(handler), invalid] { handler(invalid, {}); });
            return;
        }

        std::weak_ptr<bool> alive = m_Alive;
        m_Crypto.PrepareEnvelope(plaintext, target,
            [this, alive, target, plaintext, replyToId, handler = std::move(handler)]
            (std::error_code ec, PreparedEnvelope prepared) mutable {
                if (alive.expired()) return;
                if (ec) {
                    LOG_ERROR("Envelope preparation failed for " + target.ToString() + ": " + ec.message());
                    Complete(handler, ec, {});
                    return;
                }
                if (prepared.correlationToken.empty()) {
                    LOG_ERROR("Crypto provider returned no correlation token");
                    Complete(handler, make_error_code(SyncError::SendFailed), {});
                    return;
                }

                // Phase 1: the sender sees the message before anything touches the wire.
                Message local;
                local.correlationToken = prepared.correlationToken;
                local.senderId = m_Connection.Identity().userId;
                local.senderUsername = m_Connection.Identity().username;
                local.conversation = target;
                local.content = plaintext;
                local.timestamp = m_Clock();
                local.status = MessageStatus::Pending;
                local.replyToId = replyToId;
                if (!m_Store.InsertPending(local)) {
                    LOG_ERROR("Crypto provider reused correlation token " + prepared.correlationToken);
                    Complete(handler, make_error_code(SyncError::SendFailed), {});
                    return;
                }

                OutboundEnvelope env;
                env.target = target;
                env.encryptedEnvelope = std::move(prepared.envelope);
                env.clientNonce = prepared.correlationToken;
                env.protocolVersion = prepared.protocolVersion;
                env.replyToId = replyToId;

                if (m_Connection.IsConnected()) {
                    Transmit(env, std::move(handler));
                    return;
                }

                // Exactly one silent reconnect before giving up.
                LOG_SYNC("Not connected; reconnecting once before sending " + env.clientNonce);
                m_Connection.ConnectWithLastCredential(
                    [this, alive, env, handler = std::move(handler)](std::error_code ec) mutable {
                        if (alive.expired()) return;
                        if (ec) {
                            LOG_WARN("Silent reconnect failed: " + ec.message());
                            FailNotConnected(env.clientNonce, handler);
                            return;
                        }
                        Transmit(env, std::move(handler));
                    });
            });
    }

    void OutboundPipeline::Transmit(const OutboundEnvelope& envelope, SendHandler handler) {
        if (std::error_code ec = m_Connection.SendEnvelope(envelope)) {
            LOG_WARN("Transmit failed for " + envelope.clientNonce + ": " + ec.message());
            FailNotConnected(envelope.clientNonce, handler);
            return;
        }
        ArmWatchdog(envelope.clientNonce);
        Complete(handler, {}, envelope.clientNonce);
    }

    void OutboundPipeline::FailNotConnected(const std::string& token, SendHandler& handler) {
        m_Store.ReconcileFailure(token, "not connected");
        Complete(handler, make_error_code(SyncError::NotConnected), token);
    }

    void OutboundPipeline::Resend(const std::string& correlationToken, SendHandler handler) {
        auto record = m_Store.FindByToken(correlationToken);
        if (!record || record->status != MessageStatus::Failed) {
            const auto ec = make_error_code(SyncError::InvalidMessage);
            if (handler) asio::post(m_Context, [handler = std::move(handler), ec] { handler(ec, {}); });
            return;
        }
        LOG_SYNC("Re-submitting failed message " + correlationToken);
        Send(record->conversation, record->content, record->replyToId, std::move(handler));
    }

    // ── Watchdog ─────────────────────────────────────────────────────────

    void OutboundPipeline::ArmWatchdog(const std::string& token) {
        if (m_Settings.pendingTimeout.count() <= 0) return;
        auto dog = std::make_unique<Watchdog>(m_Context);
        dog->timer.expires_after(m_Settings.pendingTimeout);
        std::weak_ptr<bool> alive = m_Alive;
        dog->timer.async_wait([this, alive, token](std::error_code ec) {
            if (ec || alive.expired()) return;
            OnWatchdog(token);
        });
        m_Watchdogs[token] = std::move(dog);
    }

    void OutboundPipeline::DisarmWatchdog(const std::string& token) {
        auto it = m_Watchdogs.find(token);
        if (it == m_Watchdogs.end()) return;
        it->second->timer.cancel();
        m_Watchdogs.erase(it);
    }

    void OutboundPipeline::OnWatchdog(const std::string& token) {
        m_Watchdogs.erase(token);
        auto record = m_Store.FindByToken(token);
        if (!record || record->status != MessageStatus::Pending) return;
        LOG_WARN("No acknowledgment for " + token + " within "
            + std::to_string(m_Settings.pendingTimeout.count()) + " ms; marking failed");
        m_Store.ReconcileFailure(token, "timeout");
    }

    // ── Reconciliation ───────────────────────────────────────────────────

    void OutboundPipeline::OnAck(const SendAck& ack) {
        DisarmWatchdog(ack.clientNonce);
        if (!m_Store.ReconcileAck(ack.clientNonce, ack.messageId, ack.status))
            LOG_DEBUG("Ack for " + ack.clientNonce + " matched no unreconciled record");
    }

    void OutboundPipeline::OnFailure(const SendFailure& failure) {
        DisarmWatchdog(failure.clientNonce);
        LOG_WARN("Server rejected " + failure.clientNonce + ": " + failure.error);
        m_Store.ReconcileFailure(failure.clientNonce, failure.error);
    }

} // namespace Courier
