#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Protocol.h"
#include "../sync/Message.h"

namespace Courier {

    // Encrypted message as pushed by the server or returned in a history page.
    struct ServerEnvelope {
        std::string id;
        std::string senderId;
        std::string senderUsername;
        ConversationKey conversation;
        std::string encryptedEnvelope;
        int protocolVersion = 1;
        int64_t createdAt = 0;                 // ms since epoch
        std::string replyToId;
        std::string clientNonce;               // present on the echo of a message we sent
        std::optional<MessageStatus> status;
    };

    struct OutboundEnvelope {
        ConversationKey target;
        std::string encryptedEnvelope;
        std::string clientNonce;
        int protocolVersion = 1;
        std::string replyToId;
    };

    struct SendAck {
        std::string clientNonce;
        std::string messageId;
        MessageStatus status = MessageStatus::Sent;
    };

    struct SendFailure {
        std::string clientNonce;
        std::string error;
    };

    struct TypingSignal {
        std::string userId;
        std::string username;
        ConversationKey conversation;
    };

    struct PresenceSignal {
        std::string userId;
        std::string status;
    };

    struct SessionIdentity {
        std::string userId;
        std::string username;
    };

    struct HistoryPage {
        uint64_t requestId = 0;
        std::vector<ServerEnvelope> messages;
        size_t returned = 0;    // records the server sent, unreadable ones included
    };

    class PacketHandler {
    public:
        // ── Client -> Server ──
        static std::string CreateAuthenticatePayload(const std::string& token);
        static std::string CreateMessageSendPayload(const OutboundEnvelope& env);
        static std::string CreateReceiptPayload(const std::string& messageId, MessageStatus status);
        static std::string CreateRoomPayload(const ConversationKey& key);
        static std::string CreateTypingPayload(const ConversationKey& key);
        static std::string CreateHistoryRequestPayload(uint64_t requestId, const ConversationKey& key,
            int limit, const std::string& beforeId);

        // ── Server -> Client ── (nullopt on a malformed body)
        static std::optional<SessionIdentity> ParseAuthenticated(const std::string& body);
        static std::string ParseAuthError(const std::string& body);
        static std::optional<ServerEnvelope> ParseMessageReceived(const std::string& body);
        static std::optional<SendAck> ParseAck(const std::string& body);
        static std::optional<SendFailure> ParseSendFailure(const std::string& body);
        static std::optional<TypingSignal> ParseTyping(const std::string& body);
        static std::optional<PresenceSignal> ParsePresence(const std::string& body);
        static std::optional<HistoryPage> ParseHistoryResponse(const std::string& body);

        // Shared by push and history parsing; also used by test servers.
        static std::optional<ServerEnvelope> ParseServerEnvelope(const nlohmann::json& j);
        static nlohmann::json ServerEnvelopeToJson(const ServerEnvelope& env);
        static std::optional<ConversationKey> ParseConversationKey(const nlohmann::json& j);
        static void PutConversationKey(nlohmann::json& j, const ConversationKey& key);
        /// Accepts ms since epoch as a number or an ISO-8601 UTC string.
        static std::optional<int64_t> ParseTimestamp(const nlohmann::json& v);
    };

} // namespace Courier
