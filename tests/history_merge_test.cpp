#include <gtest/gtest.h>

#include "TestDoubles.h"
#include "network/ConnectionManager.h"
#include "sync/HistoryMerge.h"

#include <string>
#include <vector>

using namespace Courier;
using namespace Courier::Test;

namespace {

    const ConversationKey general = ConversationKey::Channel("general");

    struct LoadResult {
        bool done = false;
        std::error_code ec;
        size_t fetched = 0;
    };

    struct Fixture {
        Fixture() : merge(ctx, store, api, crypto, conn) {}

        HistoryMerge::LoadHandler Into(LoadResult& r) {
            return [&r](std::error_code ec, size_t fetched) {
                r.done = true;
                r.ec = ec;
                r.fetched = fetched;
            };
        }

        void SeedLive(const std::string& id, int64_t ts) {
            Message m;
            m.id = id;
            m.senderId = "u-other";
            m.conversation = general;
            m.content = "live " + id;
            m.timestamp = ts;
            store.Ingest(m);
        }

        asio::io_context ctx;
        FakeTransport transport{ ctx };
        FakeCrypto crypto{ ctx };
        FakeHistoryApi api;
        ConversationStore store;
        ConnectionManager conn{ ctx, transport, nullptr, ConnectionSettings{} };
        HistoryMerge merge;
    };

    std::vector<int64_t> Timestamps(const std::vector<Message>& timeline) {
        std::vector<int64_t> out;
        for (const auto& m : timeline) out.push_back(m.timestamp);
        return out;
    }

} // namespace

TEST(HistoryMerge, older_page_merges_without_duplicates) {
    Fixture f;
    f.SeedLive("m10", 10);
    f.SeedLive("m20", 20);
    f.SeedLive("m30", 30);

    LoadResult r;
    f.merge.LoadOlder(general, 3, {}, f.Into(r));
    ASSERT_EQ(f.api.requests.size(), 1u);
    EXPECT_EQ(f.api.requests[0].beforeId, "m10");
    EXPECT_EQ(f.api.requests[0].pageSize, 3);
    EXPECT_TRUE(f.merge.IsLoading(general));

    f.api.Complete({}, {
        MakeEnvelope("m5", general, 5, "five"),
        MakeEnvelope("m10", general, 10, "ten from history"),
        MakeEnvelope("m15", general, 15, "fifteen"),
    });

    ASSERT_TRUE(r.done);
    EXPECT_FALSE(r.ec);
    EXPECT_EQ(r.fetched, 3u);
    EXPECT_FALSE(f.merge.IsLoading(general));

    auto timeline = f.store.Timeline(general);
    EXPECT_EQ(Timestamps(timeline), (std::vector<int64_t>{ 5, 10, 15, 20, 30 }));
    // The live copy of m10 wins over the historical one.
    EXPECT_EQ(f.store.FindById(general, "m10")->content, "live m10");
    EXPECT_TRUE(f.store.HasMore(general));
}

TEST(HistoryMerge, short_page_ends_pagination) {
    Fixture f;
    LoadResult r;
    f.merge.LoadOlder(general, 50, {}, f.Into(r));
    EXPECT_TRUE(f.api.requests[0].beforeId.empty());
    f.api.Complete({}, { MakeEnvelope("m1", general, 1, "one") });

    ASSERT_TRUE(r.done);
    EXPECT_EQ(r.fetched, 1u);
    EXPECT_FALSE(f.store.HasMore(general));
}

TEST(HistoryMerge, empty_page_ends_pagination) {
    Fixture f;
    LoadResult r;
    f.merge.LoadOlder(general, 50, {}, f.Into(r));
    f.api.Complete({}, {});
    ASSERT_TRUE(r.done);
    EXPECT_EQ(r.fetched, 0u);
    EXPECT_FALSE(f.store.HasMore(general));
}

TEST(HistoryMerge, explicit_cursor_is_passed_through) {
    Fixture f;
    f.SeedLive("m10", 10);
    LoadResult r;
    f.merge.LoadOlder(general, 20, "m99", f.Into(r));
    EXPECT_EQ(f.api.requests[0].beforeId, "m99");
}

TEST(HistoryMerge, undecryptable_record_keeps_placeholder) {
    Fixture f;
    ServerEnvelope bad = MakeEnvelope("m2", general, 2, "x");
    bad.encryptedEnvelope = "corrupt";

    LoadResult r;
    f.merge.LoadOlder(general, 3, {}, f.Into(r));
    f.api.Complete({}, { MakeEnvelope("m1", general, 1, "one"), bad, MakeEnvelope("m3", general, 3, "three") });

    ASSERT_TRUE(r.done);
    EXPECT_EQ(r.fetched, 3u);
    auto timeline = f.store.Timeline(general);
    ASSERT_EQ(timeline.size(), 3u);
    EXPECT_EQ(timeline[1].id, "m2");
    EXPECT_EQ(timeline[1].content, kUndecryptablePlaceholder);
    EXPECT_EQ(timeline[2].content, "three");
}

TEST(HistoryMerge, full_page_with_malformed_record_keeps_pagination_open) {
    Fixture f;
    LoadResult r;
    f.merge.LoadOlder(general, 3, {}, f.Into(r));
    // The server sent three records; one was dropped as malformed before it got here.
    f.api.Complete({}, { MakeEnvelope("m1", general, 1, "one"), MakeEnvelope("m3", general, 3, "three") }, 3);

    ASSERT_TRUE(r.done);
    EXPECT_FALSE(r.ec);
    EXPECT_EQ(r.fetched, 3u);
    EXPECT_TRUE(f.store.HasMore(general));
    EXPECT_EQ(f.store.Timeline(general).size(), 2u);
}

TEST(HistoryMerge, async_decrypt_completes_after_all_records) {
    Fixture f;
    f.crypto.asyncDecrypt = true;
    LoadResult r;
    f.merge.LoadOlder(general, 2, {}, f.Into(r));
    f.api.Complete({}, { MakeEnvelope("m2", general, 2, "b"), MakeEnvelope("m1", general, 1, "a") });
    EXPECT_FALSE(r.done);

    ASSERT_TRUE(RunUntil(f.ctx, [&] { return r.done; }));
    EXPECT_EQ(f.store.Timeline(general).size(), 2u);
    EXPECT_EQ(f.store.Timeline(general)[0].id, "m1");
}

TEST(HistoryMerge, concurrent_loads_are_coalesced) {
    Fixture f;
    LoadResult first, second;
    f.merge.LoadOlder(general, 10, {}, f.Into(first));
    f.merge.LoadOlder(general, 10, {}, f.Into(second));
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return second.done; }));

    EXPECT_FALSE(second.ec);
    EXPECT_EQ(second.fetched, 0u);
    EXPECT_EQ(f.api.requests.size(), 1u);
    EXPECT_FALSE(first.done);

    // Another conversation is not blocked.
    LoadResult other;
    f.merge.LoadOlder(ConversationKey::Direct("d1"), 10, {}, f.Into(other));
    EXPECT_EQ(f.api.requests.size(), 2u);
}

TEST(HistoryMerge, fetch_error_is_reported_and_unblocks) {
    Fixture f;
    LoadResult r;
    f.merge.LoadOlder(general, 10, {}, f.Into(r));
    f.api.Complete(make_error_code(SyncError::NotConnected), {});
    ASSERT_TRUE(r.done);
    EXPECT_EQ(r.ec, SyncError::NotConnected);
    EXPECT_FALSE(f.merge.IsLoading(general));
    EXPECT_TRUE(f.store.HasMore(general));
}

TEST(HistoryMerge, invalid_key_and_default_page_size) {
    Fixture f;
    LoadResult r;
    f.merge.LoadOlder(ConversationKey::Channel(""), 10, {}, f.Into(r));
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return r.done; }));
    EXPECT_EQ(r.ec, SyncError::InvalidMessage);
    EXPECT_TRUE(f.api.requests.empty());

    LoadResult d;
    f.merge.LoadOlder(general, 0, {}, f.Into(d));
    ASSERT_EQ(f.api.requests.size(), 1u);
    EXPECT_EQ(f.api.requests[0].pageSize, 50);
}

TEST(HistoryMerge, history_page_reconciles_own_pending_message) {
    Fixture f;
    Message pending;
    pending.correlationToken = "tok-1";
    pending.senderId = "u-self";
    pending.conversation = general;
    pending.content = "mine";
    pending.timestamp = 40;
    f.store.InsertPending(pending);

    LoadResult r;
    f.merge.LoadOlder(general, 10, {}, f.Into(r));
    f.api.Complete({}, { MakeEnvelope("m40", general, 40, "mine", "u-self", "tok-1") });

    auto timeline = f.store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m40");
    EXPECT_EQ(timeline[0].status, MessageStatus::Sent);
}

// -- history over the connection ------------------------------------------------

namespace {

    struct SocketFixture {
        SocketFixture() {
            bool done = false;
            conn.Connect(Credential{ "alice", "secret" }, [&done](std::error_code) { done = true; });
            RunUntil(ctx, [&done] { return done; });
        }

        asio::io_context ctx;
        FakeTransport transport{ ctx };
        ConnectionManager conn{ ctx, transport, nullptr, ConnectionSettings{} };
        SocketHistoryApi api{ ctx, conn, 50ms };
    };

} // namespace

TEST(SocketHistoryApi, request_and_response_are_matched_by_id) {
    SocketFixture f;
    ASSERT_TRUE(f.conn.IsConnected());

    bool done = false;
    HistoryPage page;
    f.api.FetchPage(general, 25, "m10", [&](std::error_code ec, HistoryPage received) {
        EXPECT_FALSE(ec);
        page = std::move(received);
        done = true;
    });
    auto requests = f.transport.SentJson(PacketType::History_Request);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0]["limit"].get<int>(), 25);
    EXPECT_EQ(requests[0]["before"].get<std::string>(), "m10");
    EXPECT_EQ(requests[0]["channelId"].get<std::string>(), "general");
    const uint64_t rid = requests[0]["requestId"].get<uint64_t>();

    nlohmann::json stale;
    stale["requestId"] = rid + 100;
    stale["messages"] = nlohmann::json::array();
    f.transport.Deliver(PacketType::History_Response, stale.dump());
    EXPECT_FALSE(done);

    nlohmann::json response;
    response["requestId"] = rid;
    response["messages"] = nlohmann::json::array({
        PacketHandler::ServerEnvelopeToJson(MakeEnvelope("m5", general, 5, "five")),
        nlohmann::json{ {"channelId", "general"} },
    });
    f.transport.Deliver(PacketType::History_Response, response.dump());

    ASSERT_TRUE(done);
    ASSERT_EQ(page.messages.size(), 1u);
    EXPECT_EQ(page.messages[0].id, "m5");
    EXPECT_EQ(page.returned, 2u);
    EXPECT_EQ(f.api.InFlight(), 0u);
}

TEST(SocketHistoryApi, unanswered_request_times_out) {
    SocketFixture f;
    std::error_code result;
    bool done = false;
    f.api.FetchPage(general, 25, {}, [&](std::error_code ec, HistoryPage) { result = ec; done = true; });
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return done; }));
    EXPECT_EQ(result, SyncError::ConnectTimeout);
    EXPECT_EQ(f.api.InFlight(), 0u);
}

TEST(SocketHistoryApi, offline_request_fails_fast) {
    asio::io_context ctx;
    FakeTransport transport(ctx);
    ConnectionManager conn(ctx, transport, nullptr, ConnectionSettings{});
    SocketHistoryApi api(ctx, conn, 50ms);

    std::error_code result;
    bool done = false;
    api.FetchPage(general, 25, {}, [&](std::error_code ec, HistoryPage) { result = ec; done = true; });
    ASSERT_TRUE(RunUntil(ctx, [&] { return done; }));
    EXPECT_EQ(result, SyncError::NotConnected);
    EXPECT_TRUE(transport.sent.empty());
}
