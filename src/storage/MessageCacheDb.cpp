#include "MessageCacheDb.h"
#include "../core/Logger.h"
#include <algorithm>
#include <sqlite3.h>

namespace Courier {

    namespace {
        int Clamp(int v, int lo, int hi) {
            if (v < lo) return lo;
            if (v > hi) return hi;
            return v;
        }

        void BindText(sqlite3_stmt* stmt, int idx, const std::string& s) {
            sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
        }

        std::string ColumnText(sqlite3_stmt* stmt, int col) {
            const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return s ? s : "";
        }

        constexpr const char* kSelectColumns =
            "SELECT conversation, id, token, sender, sender_name, content, ts, status, reply_to FROM messages ";
    }

    MessageCacheDb::MessageCacheDb() = default;

    MessageCacheDb::~MessageCacheDb() {
        Close();
    }

    bool MessageCacheDb::Open(const std::string& path) {
        std::lock_guard<std::mutex> g(m_Mutex);
        CloseLocked();

        if (sqlite3_open_v2(path.c_str(), &m_Db,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK)
        {
            LOG_ERROR("Cannot open message cache " + path + ": " + (m_Db ? sqlite3_errmsg(m_Db) : "out of memory"));
            CloseLocked();
            return false;
        }

        sqlite3_busy_timeout(m_Db, 5000);
        Exec("PRAGMA journal_mode=WAL;");
        Exec("PRAGMA synchronous=NORMAL;");
        Exec("PRAGMA temp_store=MEMORY;");

        if (!InitSchema()) {
            LOG_ERROR(std::string("Cannot create cache schema: ") + sqlite3_errmsg(m_Db));
            CloseLocked();
            return false;
        }
        return true;
    }

    void MessageCacheDb::Close() {
        std::lock_guard<std::mutex> g(m_Mutex);
        CloseLocked();
    }

    void MessageCacheDb::CloseLocked() {
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
    }

    bool MessageCacheDb::Exec(const char* sql) {
        if (!m_Db) return false;
        return sqlite3_exec(m_Db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    bool MessageCacheDb::InitSchema() {
        if (!m_Db) return false;
        const char* sql =
            "CREATE TABLE IF NOT EXISTS messages ("
            "  conversation TEXT NOT NULL,"
            "  id TEXT NOT NULL,"
            "  token TEXT NOT NULL DEFAULT '',"
            "  sender TEXT NOT NULL,"
            "  sender_name TEXT NOT NULL DEFAULT '',"
            "  content TEXT NOT NULL,"
            "  ts INTEGER NOT NULL,"
            "  status INTEGER NOT NULL,"
            "  reply_to TEXT NOT NULL DEFAULT '',"
            "  PRIMARY KEY(conversation, id)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_messages_conversation_ts ON messages(conversation, ts);"
            "CREATE TABLE IF NOT EXISTS sync_state ("
            "  conversation TEXT PRIMARY KEY,"
            "  has_more INTEGER NOT NULL DEFAULT 1"
            ");";

        return Exec(sql);
    }

    bool MessageCacheDb::UpsertMessages(const std::vector<Message>& msgs) {
        if (msgs.empty()) return true;
        std::lock_guard<std::mutex> g(m_Mutex);
        if (!m_Db) return false;

        Exec("BEGIN;");

        sqlite3_stmt* stmt = nullptr;
        const char* q =
            "INSERT INTO messages (conversation, id, token, sender, sender_name, content, ts, status, reply_to) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(conversation, id) DO UPDATE SET "
            "  token=excluded.token,"
            "  sender=excluded.sender,"
            "  sender_name=excluded.sender_name,"
            "  content=excluded.content,"
            "  ts=excluded.ts,"
            "  status=excluded.status,"
            "  reply_to=excluded.reply_to;";

        bool ok = (sqlite3_prepare_v2(m_Db, q, -1, &stmt, nullptr) == SQLITE_OK);
        if (ok) {
            for (const auto& m : msgs) {
                if (!m.HasId() || !m.conversation.IsValid()) continue;
                sqlite3_reset(stmt);
                sqlite3_clear_bindings(stmt);
                BindText(stmt, 1, m.conversation.ToString());
                BindText(stmt, 2, m.id);
                BindText(stmt, 3, m.correlationToken);
                BindText(stmt, 4, m.senderId);
                BindText(stmt, 5, m.senderUsername);
                BindText(stmt, 6, m.content);
                sqlite3_bind_int64(stmt, 7, m.timestamp);
                sqlite3_bind_int(stmt, 8, static_cast<int>(m.status));
                BindText(stmt, 9, m.replyToId);
                if (sqlite3_step(stmt) != SQLITE_DONE) { ok = false; break; }
            }
            sqlite3_finalize(stmt);
        }

        if (!ok) LOG_ERROR(std::string("Cache upsert failed: ") + sqlite3_errmsg(m_Db));
        Exec(ok ? "COMMIT;" : "ROLLBACK;");
        return ok;
    }

    std::vector<Message> MessageCacheDb::QueryMessages(const char* sql, const ConversationKey& key,
        int64_t a, int b, bool bindA)
    {
        std::vector<Message> out;
        if (!m_Db) return out;
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) return out;

        int idx = 1;
        BindText(stmt, idx++, key.ToString());
        if (bindA) sqlite3_bind_int64(stmt, idx++, a);
        sqlite3_bind_int(stmt, idx, b);

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Message m;
            m.conversation = key;
            m.id = ColumnText(stmt, 1);
            m.correlationToken = ColumnText(stmt, 2);
            m.senderId = ColumnText(stmt, 3);
            m.senderUsername = ColumnText(stmt, 4);
            m.content = ColumnText(stmt, 5);
            m.timestamp = sqlite3_column_int64(stmt, 6);
            const int status = sqlite3_column_int(stmt, 7);
            m.status = (status >= 0 && status <= static_cast<int>(MessageStatus::Failed))
                ? static_cast<MessageStatus>(status) : MessageStatus::Sent;
            m.replyToId = ColumnText(stmt, 8);
            out.push_back(std::move(m));
        }
        sqlite3_finalize(stmt);
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::vector<Message> MessageCacheDb::LoadLatest(const ConversationKey& key, int limit) {
        std::lock_guard<std::mutex> g(m_Mutex);
        limit = Clamp(limit, 1, 5000);
        if (!m_Db || !key.IsValid()) return {};
        const std::string q = std::string(kSelectColumns)
            + "WHERE conversation = ? ORDER BY ts DESC, id DESC LIMIT ?;";
        return QueryMessages(q.c_str(), key, 0, limit, false);
    }

    std::vector<Message> MessageCacheDb::LoadOlder(const ConversationKey& key, int64_t beforeTs, int limit) {
        std::lock_guard<std::mutex> g(m_Mutex);
        limit = Clamp(limit, 1, 5000);
        if (!m_Db || !key.IsValid()) return {};
        const std::string q = std::string(kSelectColumns)
            + "WHERE conversation = ? AND ts < ? ORDER BY ts DESC, id DESC LIMIT ?;";
        return QueryMessages(q.c_str(), key, beforeTs, limit, true);
    }

    bool MessageCacheDb::PruneKeepLast(const ConversationKey& key, int keepLastN) {
        std::lock_guard<std::mutex> g(m_Mutex);
        if (!m_Db || !key.IsValid()) return false;
        keepLastN = Clamp(keepLastN, 0, 50000);

        sqlite3_stmt* stmt = nullptr;
        const char* q =
            "DELETE FROM messages WHERE conversation = ? AND id NOT IN ("
            "  SELECT id FROM messages WHERE conversation = ? ORDER BY ts DESC, id DESC LIMIT ?"
            ");";
        bool ok = (sqlite3_prepare_v2(m_Db, q, -1, &stmt, nullptr) == SQLITE_OK);
        if (ok) {
            const std::string conv = key.ToString();
            BindText(stmt, 1, conv);
            BindText(stmt, 2, conv);
            sqlite3_bind_int(stmt, 3, keepLastN);
            ok = (sqlite3_step(stmt) == SQLITE_DONE);
            sqlite3_finalize(stmt);
        }
        return ok;
    }

    bool MessageCacheDb::SetHasMore(const ConversationKey& key, bool hasMore) {
        std::lock_guard<std::mutex> g(m_Mutex);
        if (!m_Db || !key.IsValid()) return false;
        sqlite3_stmt* stmt = nullptr;
        const char* q =
            "INSERT INTO sync_state (conversation, has_more) VALUES (?, ?) "
            "ON CONFLICT(conversation) DO UPDATE SET has_more = excluded.has_more;";
        bool ok = (sqlite3_prepare_v2(m_Db, q, -1, &stmt, nullptr) == SQLITE_OK);
        if (ok) {
            BindText(stmt, 1, key.ToString());
            sqlite3_bind_int(stmt, 2, hasMore ? 1 : 0);
            ok = (sqlite3_step(stmt) == SQLITE_DONE);
            sqlite3_finalize(stmt);
        }
        return ok;
    }

    std::optional<bool> MessageCacheDb::GetHasMore(const ConversationKey& key) {
        std::lock_guard<std::mutex> g(m_Mutex);
        if (!m_Db || !key.IsValid()) return std::nullopt;
        sqlite3_stmt* stmt = nullptr;
        std::optional<bool> out;
        if (sqlite3_prepare_v2(m_Db, "SELECT has_more FROM sync_state WHERE conversation = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, key.ToString());
            if (sqlite3_step(stmt) == SQLITE_ROW) out = sqlite3_column_int(stmt, 0) != 0;
            sqlite3_finalize(stmt);
        }
        return out;
    }

} // namespace Courier
