#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Courier {

    enum class MessageStatus : uint8_t { Pending, Sent, Delivered, Read, Failed };

    const char* ToString(MessageStatus status);
    /// Accepts the server spellings too ("SENDING" is the server's name for PENDING).
    std::optional<MessageStatus> ParseMessageStatus(const std::string& s);

    enum class ConversationKind : uint8_t { Channel, Direct };

    // Exactly one of {channel, direct conversation}: the kind is a tag, not a
    // pair of optional ids, so "both" and "neither" cannot be represented.
    struct ConversationKey {
        ConversationKind kind = ConversationKind::Channel;
        std::string id;

        static ConversationKey Channel(std::string channelId) { return { ConversationKind::Channel, std::move(channelId) }; }
        static ConversationKey Direct(std::string conversationId) { return { ConversationKind::Direct, std::move(conversationId) }; }

        bool IsValid() const { return !id.empty(); }
        std::string ToString() const;
        /// "channel:<id>" or "dm:<id>".
        static std::optional<ConversationKey> Parse(const std::string& s);

        bool operator==(const ConversationKey& o) const { return kind == o.kind && id == o.id; }
        bool operator!=(const ConversationKey& o) const { return !(*this == o); }
        bool operator<(const ConversationKey& o) const {
            if (kind != o.kind) return kind < o.kind;
            return id < o.id;
        }
    };

    struct Message {
        std::string id;                 // server-assigned; empty while pending
        std::string correlationToken;   // client nonce; empty on messages from others
        std::string senderId;
        std::string senderUsername;
        ConversationKey conversation;
        std::string content;            // decrypted plaintext
        int64_t timestamp = 0;          // ms since epoch
        MessageStatus status = MessageStatus::Sent;
        std::string replyToId;          // empty = not a reply
        std::string failureReason;      // set when status == Failed

        bool HasId() const { return !id.empty(); }
        bool HasToken() const { return !correlationToken.empty(); }
    };

    struct TypingEntry {
        std::string userId;
        std::string username;
        int64_t lastSignalTime = 0;
    };

    int64_t NowMs();

} // namespace Courier
