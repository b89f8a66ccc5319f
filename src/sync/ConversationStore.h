#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Message.h"
#include "EventChannel.h"

namespace Courier {

    enum class IngestResult {
        Inserted,    // new record appended
        Updated,     // same id already present; fields overwritten
        Reconciled,  // matched a local record by correlation token (self echo)
        Rejected     // no id or invalid conversation key
    };

    // The single source of truth for conversation timelines. Every timeline is
    // kept non-decreasing by timestamp after each mutation, and neither ids nor
    // correlation tokens ever repeat inside one timeline. Not thread-safe: all
    // calls happen on the event loop.
    class ConversationStore {
    public:
        ConversationStore() = default;
        ConversationStore(const ConversationStore&) = delete;
        ConversationStore& operator=(const ConversationStore&) = delete;

        // ── Phase 1: local, synchronous, always succeeds for a well-formed record ──
        bool InsertPending(Message msg);

        // ── Phase 2: remote reconciliation ──
        IngestResult Ingest(Message msg);
        bool ReconcileAck(const std::string& token, const std::string& serverId, MessageStatus status);
        bool ReconcileFailure(const std::string& token, const std::string& reason);
        /// Returns the number of net-new records. Existing records are left untouched.
        size_t MergePage(const ConversationKey& key, std::vector<Message> page, std::optional<bool> hasMore);
        void SetHasMore(const ConversationKey& key, bool hasMore);

        // ── Ephemeral state ──
        void SetTyping(const ConversationKey& key, const std::string& userId, const std::string& username, int64_t now);
        bool ClearTyping(const ConversationKey& key, const std::string& userId);
        void ClearAllTyping();
        size_t PruneTyping(int64_t cutoff);

        void SetPresence(const std::string& userId, const std::string& status);
        std::string Presence(const std::string& userId) const;
        void ClearPresence() { m_Presence.clear(); }

        // ── Reads ──
        std::vector<Message> Timeline(const ConversationKey& key) const;
        bool HasMore(const ConversationKey& key) const;
        std::vector<TypingEntry> Typing(const ConversationKey& key) const;
        std::optional<Message> FindByToken(const std::string& token) const;
        std::optional<Message> FindById(const ConversationKey& key, const std::string& id) const;
        std::vector<ConversationKey> Conversations() const;

        EventChannel<ConversationKey>& Changed() { return m_Changed; }
        EventChannel<ConversationKey>& TypingChanged() { return m_TypingChanged; }

    private:
        struct Conversation {
            std::vector<Message> messages;
            std::vector<TypingEntry> typing;
            bool hasMore = true;
        };

        static void SortTimeline(Conversation& conv);
        static Message* FindIn(Conversation& conv, const std::string& id);
        static Message* FindTokenIn(Conversation& conv, const std::string& token);

        std::map<ConversationKey, Conversation> m_Conversations;
        std::map<std::string, std::string> m_Presence;
        EventChannel<ConversationKey> m_Changed;
        EventChannel<ConversationKey> m_TypingChanged;
    };

} // namespace Courier
