#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../sync/Message.h"

struct sqlite3;

namespace Courier {

    // Local write-through copy of reconciled records, keyed by conversation
    // and server id. Holds decrypted plaintext, so it is opt-in.
    class MessageCacheDb {
    public:
        MessageCacheDb();
        ~MessageCacheDb();

        MessageCacheDb(const MessageCacheDb&) = delete;
        MessageCacheDb& operator=(const MessageCacheDb&) = delete;

        bool Open(const std::string& path);
        void Close();
        bool IsOpen() const { return m_Db != nullptr; }

        /// Records without a server id are skipped.
        bool UpsertMessages(const std::vector<Message>& msgs);
        std::vector<Message> LoadLatest(const ConversationKey& key, int limit);
        std::vector<Message> LoadOlder(const ConversationKey& key, int64_t beforeTs, int limit);

        bool PruneKeepLast(const ConversationKey& key, int keepLastN);

        bool SetHasMore(const ConversationKey& key, bool hasMore);
        std::optional<bool> GetHasMore(const ConversationKey& key);

    private:
        bool InitSchema();
        std::vector<Message> QueryMessages(const char* sql, const ConversationKey& key, int64_t a, int b, bool bindA);
        bool Exec(const char* sql);
        void CloseLocked();

        sqlite3* m_Db = nullptr;
        std::mutex m_Mutex;
    };
}
