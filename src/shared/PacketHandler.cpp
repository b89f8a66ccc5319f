#include "PacketHandler.h"
#include <cmath>
#include <cstdio>
#include <limits>

namespace Courier {

    using json = nlohmann::json;

    namespace {
        json ParseBody(const std::string& body) {
            return json::parse(body, nullptr, false);
        }

        std::string StringField(const json& j, const char* name) {
            auto it = j.find(name);
            if (it == j.end() || !it->is_string()) return {};
            return it->get<std::string>();
        }

        // Days since 1970-01-01 for a proleptic Gregorian date.
        int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }
    }

    // ── Client -> Server ─────────────────────────────────────────────────

    std::string PacketHandler::CreateAuthenticatePayload(const std::string& token) {
        return json{ {"token", token} }.dump();
    }

    std::string PacketHandler::CreateMessageSendPayload(const OutboundEnvelope& env) {
        json j;
        PutConversationKey(j, env.target);
        j["encryptedEnvelope"] = env.encryptedEnvelope;
        j["protocolVersion"] = env.protocolVersion;
        j["clientNonce"] = env.clientNonce;
        if (!env.replyToId.empty()) j["replyToId"] = env.replyToId;
        return j.dump();
    }

    std::string PacketHandler::CreateReceiptPayload(const std::string& messageId, MessageStatus status) {
        return json{ {"messageId", messageId}, {"status", ToString(status)} }.dump();
    }

    std::string PacketHandler::CreateRoomPayload(const ConversationKey& key) {
        json j = json::object();
        PutConversationKey(j, key);
        return j.dump();
    }

    std::string PacketHandler::CreateTypingPayload(const ConversationKey& key) {
        return CreateRoomPayload(key);
    }

    std::string PacketHandler::CreateHistoryRequestPayload(uint64_t requestId, const ConversationKey& key,
        int limit, const std::string& beforeId)
    {
        json j;
        j["requestId"] = requestId;
        PutConversationKey(j, key);
        j["limit"] = limit;
        if (!beforeId.empty()) j["before"] = beforeId;
        return j.dump();
    }

    // ── Server -> Client ─────────────────────────────────────────────────

    std::optional<SessionIdentity> PacketHandler::ParseAuthenticated(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        SessionIdentity id;
        id.userId = StringField(j, "userId");
        id.username = StringField(j, "username");
        if (id.userId.empty()) return std::nullopt;
        return id;
    }

    std::string PacketHandler::ParseAuthError(const std::string& body) {
        json j = ParseBody(body);
        std::string msg = j.is_object() ? StringField(j, "message") : std::string{};
        return msg.empty() ? "authentication rejected" : msg;
    }

    std::optional<ServerEnvelope> PacketHandler::ParseMessageReceived(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        return ParseServerEnvelope(j);
    }

    std::optional<SendAck> PacketHandler::ParseAck(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        SendAck ack;
        ack.clientNonce = StringField(j, "clientNonce");
        ack.messageId = StringField(j, "messageId");
        if (ack.clientNonce.empty() || ack.messageId.empty()) return std::nullopt;
        if (auto st = ParseMessageStatus(StringField(j, "status"))) ack.status = *st;
        return ack;
    }

    std::optional<SendFailure> PacketHandler::ParseSendFailure(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        SendFailure f;
        f.clientNonce = StringField(j, "clientNonce");
        f.error = StringField(j, "error");
        if (f.clientNonce.empty()) return std::nullopt;
        if (f.error.empty()) f.error = "rejected by server";
        return f;
    }

    std::optional<TypingSignal> PacketHandler::ParseTyping(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        auto key = ParseConversationKey(j);
        if (!key) return std::nullopt;
        TypingSignal t;
        t.userId = StringField(j, "userId");
        t.username = StringField(j, "username");
        t.conversation = *key;
        if (t.userId.empty()) return std::nullopt;
        return t;
    }

    std::optional<PresenceSignal> PacketHandler::ParsePresence(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        PresenceSignal p;
        p.userId = StringField(j, "userId");
        p.status = StringField(j, "status");
        if (p.userId.empty()) return std::nullopt;
        return p;
    }

    std::optional<HistoryPage> PacketHandler::ParseHistoryResponse(const std::string& body) {
        json j = ParseBody(body);
        if (!j.is_object()) return std::nullopt;
        auto rid = j.find("requestId");
        if (rid == j.end() || !rid->is_number_unsigned()) return std::nullopt;
        auto msgs = j.find("messages");
        if (msgs == j.end() || !msgs->is_array()) return std::nullopt;

        HistoryPage page;
        page.requestId = rid->get<uint64_t>();
        page.returned = msgs->size();
        for (const auto& item : *msgs) {
            // One unreadable record does not invalidate the page.
            if (auto env = ParseServerEnvelope(item)) page.messages.push_back(std::move(*env));
        }
        return page;
    }

    // ── Shared ───────────────────────────────────────────────────────────

    std::optional<ServerEnvelope> PacketHandler::ParseServerEnvelope(const json& j) {
        if (!j.is_object()) return std::nullopt;
        auto key = ParseConversationKey(j);
        if (!key) return std::nullopt;

        ServerEnvelope env;
        env.id = StringField(j, "id");
        env.senderId = StringField(j, "senderId");
        env.senderUsername = StringField(j, "senderUsername");
        env.conversation = *key;
        env.encryptedEnvelope = StringField(j, "encryptedEnvelope");
        env.replyToId = StringField(j, "replyToId");
        env.clientNonce = StringField(j, "clientNonce");
        if (env.id.empty()) return std::nullopt;

        auto pv = j.find("protocolVersion");
        if (pv != j.end() && pv->is_number_integer()) env.protocolVersion = pv->get<int>();

        auto ts = j.find("createdAt");
        if (ts != j.end()) {
            if (auto parsed = ParseTimestamp(*ts)) env.createdAt = *parsed;
        }

        const std::string status = StringField(j, "status");
        if (!status.empty()) env.status = ParseMessageStatus(status);
        return env;
    }

    json PacketHandler::ServerEnvelopeToJson(const ServerEnvelope& env) {
        json j;
        j["id"] = env.id;
        j["senderId"] = env.senderId;
        j["senderUsername"] = env.senderUsername;
        PutConversationKey(j, env.conversation);
        j["encryptedEnvelope"] = env.encryptedEnvelope;
        j["protocolVersion"] = env.protocolVersion;
        j["createdAt"] = env.createdAt;
        if (!env.replyToId.empty()) j["replyToId"] = env.replyToId;
        if (!env.clientNonce.empty()) j["clientNonce"] = env.clientNonce;
        if (env.status) j["status"] = ToString(*env.status);
        return j;
    }

    std::optional<ConversationKey> PacketHandler::ParseConversationKey(const json& j) {
        const std::string channelId = StringField(j, "channelId");
        const std::string conversationId = StringField(j, "conversationId");
        if (!channelId.empty() && !conversationId.empty()) return std::nullopt;
        if (!channelId.empty()) return ConversationKey::Channel(channelId);
        if (!conversationId.empty()) return ConversationKey::Direct(conversationId);
        return std::nullopt;
    }

    void PacketHandler::PutConversationKey(json& j, const ConversationKey& key) {
        if (key.kind == ConversationKind::Channel) j["channelId"] = key.id;
        else j["conversationId"] = key.id;
    }

    std::optional<int64_t> PacketHandler::ParseTimestamp(const json& v) {
        if (v.is_number_unsigned()) {
            const uint64_t u = v.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(u);
        }
        if (v.is_number_integer()) return v.get<int64_t>();
        if (v.is_number_float()) {
            // [-2^63, 2^63) is exactly the range that truncates into int64_t.
            const double d = v.get<double>();
            constexpr double kLimit = 9223372036854775808.0;
            if (!std::isfinite(d) || d < -kLimit || d >= kLimit) return std::nullopt;
            return static_cast<int64_t>(d);
        }
        if (!v.is_string()) return std::nullopt;

        const std::string s = v.get<std::string>();
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
        if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec) != 6)
            return std::nullopt;
        if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return std::nullopt;

        int64_t ms = 0;
        const size_t dot = s.find('.', 19);
        if (dot != std::string::npos) {
            int64_t scale = 100;
            for (size_t i = dot + 1; i < s.size() && s[i] >= '0' && s[i] <= '9'; ++i) {
                ms += (s[i] - '0') * scale;
                scale /= 10;
            }
        }

        const int64_t days = DaysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
        return ((days * 24 + h) * 60 + mi) * 60000LL + sec * 1000LL + ms;
    }

} // namespace Courier
