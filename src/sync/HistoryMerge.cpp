#include "HistoryMerge.h"
#include "InboundPipeline.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include "../core/SyncError.h"
#include "../crypto/CryptoProvider.h"
#include "../network/ConnectionManager.h"
#include <asio.hpp>
#include <algorithm>

namespace Courier {

    // ── SocketHistoryApi ─────────────────────────────────────────────────

    struct SocketHistoryApi::PendingRequest {
        explicit PendingRequest(asio::io_context& ctx) : timer(ctx) {}
        FetchHandler handler;
        asio::steady_timer timer;
    };

    SocketHistoryApi::SocketHistoryApi(asio::io_context& context, ConnectionManager& connection,
        std::chrono::milliseconds timeout)
        : m_Context(context)
        , m_Connection(connection)
        , m_Timeout(timeout)
        , m_Alive(std::make_shared<bool>(true))
    {
        m_PageSub = m_Connection.HistoryReceived().Subscribe([this](const HistoryPage& page) { OnPage(page); });
    }

    SocketHistoryApi::~SocketHistoryApi() {
        m_Alive.reset();
        m_Connection.HistoryReceived().Unsubscribe(m_PageSub);
        m_Pending.clear();
    }

    void SocketHistoryApi::FetchPage(const ConversationKey& key, int pageSize, const std::string& beforeId,
        FetchHandler handler)
    {
        const uint64_t requestId = ++m_NextRequestId;
        if (std::error_code ec = m_Connection.RequestHistory(requestId, key, pageSize, beforeId)) {
            asio::post(m_Context, [handler = std::move(handler), ec] { handler(ec, {}); });
            return;
        }

        auto req = std::make_unique<PendingRequest>(m_Context);
        req->handler = std::move(handler);
        req->timer.expires_after(m_Timeout);
        std::weak_ptr<bool> alive = m_Alive;
        req->timer.async_wait([this, alive, requestId](std::error_code ec) {
            if (ec || alive.expired()) return;
            OnTimeout(requestId);
        });
        m_Pending.emplace(requestId, std::move(req));
    }

    void SocketHistoryApi::OnPage(const HistoryPage& page) {
        auto it = m_Pending.find(page.requestId);
        if (it == m_Pending.end()) {
            LOG_DEBUG("History response " + std::to_string(page.requestId) + " has no pending request");
            return;
        }
        auto req = std::move(it->second);
        m_Pending.erase(it);
        req->timer.cancel();
        if (req->handler) req->handler({}, page);
    }

    void SocketHistoryApi::OnTimeout(uint64_t requestId) {
        auto it = m_Pending.find(requestId);
        if (it == m_Pending.end()) return;
        auto req = std::move(it->second);
        m_Pending.erase(it);
        LOG_WARN("History request " + std::to_string(requestId) + " timed out");
        if (req->handler) req->handler(make_error_code(SyncError::ConnectTimeout), {});
    }

    // ── HistoryMerge ─────────────────────────────────────────────────────

    HistoryMerge::HistoryMerge(asio::io_context& context, ConversationStore& store, HistoryApi& api,
        CryptoProvider& crypto, ConnectionManager& connection)
        : m_Context(context)
        , m_Store(store)
        , m_Api(api)
        , m_Crypto(crypto)
        , m_Connection(connection)
        , m_Alive(std::make_shared<bool>(true))
    {
    }

    HistoryMerge::~HistoryMerge() {
        m_Alive.reset();
    }

    void HistoryMerge::LoadOlder(const ConversationKey& key, int pageSize, const std::string& beforeId,
        LoadHandler handler)
    {
        if (!key.IsValid()) {
            const auto ec = make_error_code(SyncError::InvalidMessage);
            if (handler) asio::post(m_Context, [handler = std::move(handler), ec] { handler(ec, 0); });
            return;
        }
        if (IsLoading(key)) {
            if (handler) asio::post(m_Context, [handler = std::move(handler)] { handler({}, 0); });
            return;
        }
        if (pageSize <= 0) pageSize = Globals::HISTORY_PAGE_SIZE;

        std::string cursor = beforeId;
        if (cursor.empty()) {
            for (const auto& m : m_Store.Timeline(key)) {
                if (m.HasId()) { cursor = m.id; break; }
            }
        }

        m_InFlight.insert(key);
        LOG_SYNC("Loading up to " + std::to_string(pageSize) + " messages of " + key.ToString()
            + (cursor.empty() ? std::string{} : " before " + cursor));

        std::weak_ptr<bool> alive = m_Alive;
        m_Api.FetchPage(key, pageSize, cursor,
            [this, alive, key, pageSize, handler = std::move(handler)]
            (std::error_code ec, HistoryPage page) mutable {
                if (alive.expired()) return;
                if (ec) {
                    m_InFlight.erase(key);
                    LOG_WARN("History fetch for " + key.ToString() + " failed: " + ec.message());
                    if (handler) handler(ec, 0);
                    return;
                }
                MergeDecrypted(key, pageSize, std::move(page), std::move(handler));
            });
    }

    void HistoryMerge::MergeDecrypted(const ConversationKey& key, int pageSize, HistoryPage page, LoadHandler handler)
    {
        struct Batch {
            std::vector<ServerEnvelope> envelopes;
            std::vector<Message> decrypted;
            size_t remaining = 0;
            size_t returned = 0;
            size_t failures = 0;
            LoadHandler handler;
        };
        auto batch = std::make_shared<Batch>();
        batch->returned = std::max(page.returned, page.messages.size());
        batch->envelopes = std::move(page.messages);
        batch->decrypted.resize(batch->envelopes.size());
        batch->remaining = batch->envelopes.size();
        batch->handler = std::move(handler);

        std::weak_ptr<bool> alive = m_Alive;
        auto finish = [this, alive, key, pageSize, batch] {
            if (alive.expired()) return;
            m_InFlight.erase(key);
            // A full page means older history may exist, even if some records were unreadable.
            const size_t fetched = batch->returned;
            const bool hasMore = fetched >= static_cast<size_t>(pageSize);
            const size_t dropped = fetched - batch->envelopes.size();
            const size_t added = m_Store.MergePage(key, std::move(batch->decrypted), hasMore);
            LOG_SYNC("History " + key.ToString() + ": fetched " + std::to_string(fetched) + ", added "
                + std::to_string(added) + (batch->failures ? ", undecryptable " + std::to_string(batch->failures) : std::string{})
                + (dropped ? ", malformed " + std::to_string(dropped) : std::string{}));
            if (batch->handler) batch->handler({}, fetched);
        };

        if (batch->remaining == 0) {
            finish();
            return;
        }

        const std::string selfId = m_Connection.Identity().userId;
        for (size_t i = 0; i < batch->envelopes.size(); ++i) {
            const ServerEnvelope& env = batch->envelopes[i];
            m_Crypto.Decrypt(env.encryptedEnvelope, env.protocolVersion, env.conversation,
                [batch, i, selfId, finish](std::error_code ec, std::string plaintext) {
                    const ServerEnvelope& source = batch->envelopes[i];
                    if (ec) {
                        // Keep the slot so the paging cursor stays where the server thinks it is.
                        ++batch->failures;
                        plaintext = kUndecryptablePlaceholder;
                    }
                    batch->decrypted[i] = MessageFromEnvelope(source, std::move(plaintext), selfId);
                    if (--batch->remaining == 0) finish();
                });
        }
    }

} // namespace Courier
