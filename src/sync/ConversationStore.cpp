#include "ConversationStore.h"
#include "../core/Logger.h"
#include <algorithm>
#include <set>

namespace Courier {

    namespace {
        // Assigns the server id to the record at `index`. If another record of the
        // same timeline already carries that id (an echo that arrived without its
        // correlation token), that record absorbs the token and the local one is
        // dropped so the id stays unique.
        void AdoptServerId(std::vector<Message>& messages, size_t index,
            const std::string& serverId, MessageStatus status)
        {
            if (status == MessageStatus::Pending) status = MessageStatus::Sent;
            for (size_t j = 0; j < messages.size(); ++j) {
                if (j == index || messages[j].id != serverId) continue;
                if (messages[j].correlationToken.empty())
                    messages[j].correlationToken = messages[index].correlationToken;
                messages.erase(messages.begin() + static_cast<std::ptrdiff_t>(index));
                return;
            }
            Message& rec = messages[index];
            rec.id = serverId;
            rec.status = status;
            rec.failureReason.clear();
        }

        std::optional<size_t> IndexOfUnreconciled(const std::vector<Message>& messages, const std::string& token) {
            if (token.empty()) return std::nullopt;
            for (size_t i = 0; i < messages.size(); ++i) {
                if (messages[i].correlationToken == token && !messages[i].HasId()) return i;
            }
            return std::nullopt;
        }
    }

    void ConversationStore::SortTimeline(Conversation& conv) {
        std::stable_sort(conv.messages.begin(), conv.messages.end(),
            [](const Message& a, const Message& b) { return a.timestamp < b.timestamp; });
    }

    Message* ConversationStore::FindIn(Conversation& conv, const std::string& id) {
        if (id.empty()) return nullptr;
        for (auto& m : conv.messages)
            if (m.id == id) return &m;
        return nullptr;
    }

    Message* ConversationStore::FindTokenIn(Conversation& conv, const std::string& token) {
        if (token.empty()) return nullptr;
        for (auto& m : conv.messages)
            if (m.correlationToken == token) return &m;
        return nullptr;
    }

    bool ConversationStore::InsertPending(Message msg) {
        if (!msg.conversation.IsValid() || !msg.HasToken() || msg.HasId()) {
            LOG_WARN("InsertPending: rejected malformed local record");
            return false;
        }
        msg.status = MessageStatus::Pending;

        // A token is never inserted twice anywhere: an unreconciled record is rewritten.
        for (auto& [key, conv] : m_Conversations) {
            if (Message* existing = FindTokenIn(conv, msg.correlationToken)) {
                // A reconciled record keeps its server id; the token is spent.
                if (existing->HasId()) {
                    LOG_WARN("InsertPending: token already reconciled as " + existing->id);
                    return false;
                }
                msg.conversation = key;
                *existing = std::move(msg);
                const ConversationKey changed = key;
                SortTimeline(conv);
                m_Changed.Publish(changed);
                return true;
            }
        }

        const ConversationKey key = msg.conversation;
        auto& conv = m_Conversations[key];
        conv.messages.push_back(std::move(msg));
        SortTimeline(conv);
        m_Changed.Publish(key);
        return true;
    }

    IngestResult ConversationStore::Ingest(Message msg) {
        if (!msg.HasId() || !msg.conversation.IsValid()) return IngestResult::Rejected;

        const ConversationKey key = msg.conversation;
        auto& conv = m_Conversations[key];

        // 1. Same server id: overwrite mutable fields, never a second entry.
        if (Message* existing = FindIn(conv, msg.id)) {
            existing->status = msg.status;
            existing->content = std::move(msg.content);
            existing->timestamp = msg.timestamp;
            existing->replyToId = std::move(msg.replyToId);
            if (!msg.senderUsername.empty()) existing->senderUsername = std::move(msg.senderUsername);
            existing->failureReason.clear();
            if (!existing->HasToken() && msg.HasToken()) {
                const std::string token = msg.correlationToken;
                existing->correlationToken = token;
                // The local copy of the same message would now share the token.
                if (auto idx = IndexOfUnreconciled(conv.messages, token))
                    conv.messages.erase(conv.messages.begin() + static_cast<std::ptrdiff_t>(*idx));
            }
            SortTimeline(conv);
            m_Changed.Publish(key);
            return IngestResult::Updated;
        }

        // 2. Server echo of our own message: rewrite the local record in place.
        if (msg.HasToken()) {
            if (auto idx = IndexOfUnreconciled(conv.messages, msg.correlationToken)) {
                AdoptServerId(conv.messages, *idx, msg.id, msg.status);
                SortTimeline(conv);
                m_Changed.Publish(key);
                return IngestResult::Reconciled;
            }
            for (auto& [otherKey, other] : m_Conversations) {
                if (otherKey == key) continue;
                if (auto idx = IndexOfUnreconciled(other.messages, msg.correlationToken)) {
                    LOG_WARN("Ingest: echo for " + msg.id + " matched a record filed under " + otherKey.ToString());
                    AdoptServerId(other.messages, *idx, msg.id, msg.status);
                    SortTimeline(other);
                    const ConversationKey changed = otherKey;
                    m_Changed.Publish(changed);
                    return IngestResult::Reconciled;
                }
            }
        }

        // 3. New record.
        conv.messages.push_back(std::move(msg));
        SortTimeline(conv);
        m_Changed.Publish(key);
        return IngestResult::Inserted;
    }

    bool ConversationStore::ReconcileAck(const std::string& token, const std::string& serverId, MessageStatus status) {
        if (token.empty() || serverId.empty()) return false;
        for (auto& [key, conv] : m_Conversations) {
            auto idx = IndexOfUnreconciled(conv.messages, token);
            if (!idx) continue;
            AdoptServerId(conv.messages, *idx, serverId, status);
            SortTimeline(conv);
            const ConversationKey changed = key;
            m_Changed.Publish(changed);
            return true;
        }
        return false;
    }

    bool ConversationStore::ReconcileFailure(const std::string& token, const std::string& reason) {
        if (token.empty()) return false;
        for (auto& [key, conv] : m_Conversations) {
            Message* rec = FindTokenIn(conv, token);
            if (!rec) continue;
            if (rec->status != MessageStatus::Pending) return false;
            rec->status = MessageStatus::Failed;
            rec->failureReason = reason;
            const ConversationKey changed = key;
            m_Changed.Publish(changed);
            return true;
        }
        return false;
    }

    size_t ConversationStore::MergePage(const ConversationKey& key, std::vector<Message> page, std::optional<bool> hasMore) {
        if (!key.IsValid()) return 0;
        auto& conv = m_Conversations[key];

        size_t added = 0;
        bool changed = false;
        std::set<std::string> seen;
        for (auto& m : page) {
            if (!m.HasId() || !seen.insert(m.id).second) continue;
            if (FindIn(conv, m.id)) continue;

            if (auto idx = IndexOfUnreconciled(conv.messages, m.correlationToken)) {
                AdoptServerId(conv.messages, *idx, m.id, m.status);
                changed = true;
                continue;
            }
            m.conversation = key;
            conv.messages.push_back(std::move(m));
            ++added;
        }

        if (hasMore && conv.hasMore != *hasMore) {
            conv.hasMore = *hasMore;
            changed = true;
        }
        if (added > 0 || changed) {
            SortTimeline(conv);
            m_Changed.Publish(key);
        }
        return added;
    }

    void ConversationStore::SetHasMore(const ConversationKey& key, bool hasMore) {
        auto& conv = m_Conversations[key];
        if (conv.hasMore == hasMore) return;
        conv.hasMore = hasMore;
        m_Changed.Publish(key);
    }

    // ── Typing ───────────────────────────────────────────────────────────

    void ConversationStore::SetTyping(const ConversationKey& key, const std::string& userId,
        const std::string& username, int64_t now)
    {
        if (userId.empty()) return;
        auto& typing = m_Conversations[key].typing;
        auto it = std::find_if(typing.begin(), typing.end(),
            [&userId](const TypingEntry& t) { return t.userId == userId; });
        if (it != typing.end()) {
            it->lastSignalTime = now;
            if (!username.empty()) it->username = username;
        } else {
            typing.push_back({ userId, username, now });
        }
        m_TypingChanged.Publish(key);
    }

    bool ConversationStore::ClearTyping(const ConversationKey& key, const std::string& userId) {
        auto convIt = m_Conversations.find(key);
        if (convIt == m_Conversations.end()) return false;
        auto& typing = convIt->second.typing;
        auto it = std::remove_if(typing.begin(), typing.end(),
            [&userId](const TypingEntry& t) { return t.userId == userId; });
        if (it == typing.end()) return false;
        typing.erase(it, typing.end());
        m_TypingChanged.Publish(key);
        return true;
    }

    void ConversationStore::ClearAllTyping() {
        std::vector<ConversationKey> touched;
        for (auto& [key, conv] : m_Conversations) {
            if (conv.typing.empty()) continue;
            conv.typing.clear();
            touched.push_back(key);
        }
        for (const auto& key : touched) m_TypingChanged.Publish(key);
    }

    size_t ConversationStore::PruneTyping(int64_t cutoff) {
        size_t removed = 0;
        std::vector<ConversationKey> touched;
        for (auto& [key, conv] : m_Conversations) {
            auto it = std::remove_if(conv.typing.begin(), conv.typing.end(),
                [cutoff](const TypingEntry& t) { return t.lastSignalTime < cutoff; });
            if (it == conv.typing.end()) continue;
            removed += static_cast<size_t>(std::distance(it, conv.typing.end()));
            conv.typing.erase(it, conv.typing.end());
            touched.push_back(key);
        }
        for (const auto& key : touched) m_TypingChanged.Publish(key);
        return removed;
    }

    void ConversationStore::SetPresence(const std::string& userId, const std::string& status) {
        if (userId.empty()) return;
        m_Presence[userId] = status;
    }

    std::string ConversationStore::Presence(const std::string& userId) const {
        auto it = m_Presence.find(userId);
        return it != m_Presence.end() ? it->second : std::string{};
    }

    // ── Reads ────────────────────────────────────────────────────────────

    std::vector<Message> ConversationStore::Timeline(const ConversationKey& key) const {
        auto it = m_Conversations.find(key);
        return it != m_Conversations.end() ? it->second.messages : std::vector<Message>{};
    }

    bool ConversationStore::HasMore(const ConversationKey& key) const {
        auto it = m_Conversations.find(key);
        return it == m_Conversations.end() || it->second.hasMore;
    }

    std::vector<TypingEntry> ConversationStore::Typing(const ConversationKey& key) const {
        auto it = m_Conversations.find(key);
        return it != m_Conversations.end() ? it->second.typing : std::vector<TypingEntry>{};
    }

    std::optional<Message> ConversationStore::FindByToken(const std::string& token) const {
        if (token.empty()) return std::nullopt;
        for (const auto& [key, conv] : m_Conversations)
            for (const auto& m : conv.messages)
                if (m.correlationToken == token) return m;
        return std::nullopt;
    }

    std::optional<Message> ConversationStore::FindById(const ConversationKey& key, const std::string& id) const {
        auto it = m_Conversations.find(key);
        if (it == m_Conversations.end() || id.empty()) return std::nullopt;
        for (const auto& m : it->second.messages)
            if (m.id == id) return m;
        return std::nullopt;
    }

    std::vector<ConversationKey> ConversationStore::Conversations() const {
        std::vector<ConversationKey> keys;
        keys.reserve(m_Conversations.size());
        for (const auto& [key, conv] : m_Conversations) keys.push_back(key);
        return keys;
    }

} // namespace Courier
