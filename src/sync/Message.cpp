#include "Message.h"
#include <chrono>

namespace Courier {

    const char* ToString(MessageStatus status) {
        switch (status) {
            case MessageStatus::Pending:   return "PENDING";
            case MessageStatus::Sent:      return "SENT";
            case MessageStatus::Delivered: return "DELIVERED";
            case MessageStatus::Read:      return "READ";
            case MessageStatus::Failed:    return "FAILED";
        }
        return "SENT";
    }

    std::optional<MessageStatus> ParseMessageStatus(const std::string& s) {
        if (s == "PENDING" || s == "SENDING") return MessageStatus::Pending;
        if (s == "SENT") return MessageStatus::Sent;
        if (s == "DELIVERED") return MessageStatus::Delivered;
        if (s == "READ") return MessageStatus::Read;
        if (s == "FAILED") return MessageStatus::Failed;
        return std::nullopt;
    }

    std::string ConversationKey::ToString() const {
        return (kind == ConversationKind::Channel ? "channel:" : "dm:") + id;
    }

    std::optional<ConversationKey> ConversationKey::Parse(const std::string& s) {
        const size_t colon = s.find(':');
        if (colon == std::string::npos || colon + 1 >= s.size()) return std::nullopt;
        const std::string prefix = s.substr(0, colon);
        std::string id = s.substr(colon + 1);
        if (prefix == "channel") return Channel(std::move(id));
        if (prefix == "dm") return Direct(std::move(id));
        return std::nullopt;
    }

    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

} // namespace Courier
