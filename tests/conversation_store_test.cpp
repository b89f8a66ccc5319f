#include <gtest/gtest.h>

#include "sync/ConversationStore.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace Courier;

namespace {

    const ConversationKey general = ConversationKey::Channel("general");

    Message Remote(const std::string& id, int64_t ts, const std::string& content = "hi",
        const ConversationKey& key = general)
    {
        Message m;
        m.id = id;
        m.senderId = "u-other";
        m.senderUsername = "other";
        m.conversation = key;
        m.content = content;
        m.timestamp = ts;
        m.status = MessageStatus::Sent;
        return m;
    }

    Message Local(const std::string& token, int64_t ts, const std::string& content = "mine",
        const ConversationKey& key = general)
    {
        Message m;
        m.correlationToken = token;
        m.senderId = "u-self";
        m.senderUsername = "me";
        m.conversation = key;
        m.content = content;
        m.timestamp = ts;
        return m;
    }

    bool IsSorted(const std::vector<Message>& timeline) {
        return std::is_sorted(timeline.begin(), timeline.end(),
            [](const Message& a, const Message& b) { return a.timestamp < b.timestamp; });
    }

    std::vector<std::string> Ids(const std::vector<Message>& timeline) {
        std::vector<std::string> ids;
        for (const auto& m : timeline) ids.push_back(m.id);
        return ids;
    }

} // namespace

// -- keys ----------------------------------------------------------------------

TEST(ConversationKey, parse_and_format) {
    auto ch = ConversationKey::Parse("channel:abc");
    ASSERT_TRUE(ch.has_value());
    EXPECT_EQ(ch->kind, ConversationKind::Channel);
    EXPECT_EQ(ch->id, "abc");
    EXPECT_EQ(ch->ToString(), "channel:abc");

    auto dm = ConversationKey::Parse("dm:xyz");
    ASSERT_TRUE(dm.has_value());
    EXPECT_EQ(dm->kind, ConversationKind::Direct);
    EXPECT_EQ(dm->ToString(), "dm:xyz");

    EXPECT_FALSE(ConversationKey::Parse("channel:").has_value());
    EXPECT_FALSE(ConversationKey::Parse("room:abc").has_value());
    EXPECT_FALSE(ConversationKey::Parse("").has_value());
}

TEST(ConversationKey, channel_and_direct_with_same_id_differ) {
    EXPECT_NE(ConversationKey::Channel("x"), ConversationKey::Direct("x"));
    EXPECT_FALSE(ConversationKey::Channel("").IsValid());
}

TEST(MessageStatus, server_spellings) {
    EXPECT_EQ(ParseMessageStatus("SENDING"), MessageStatus::Pending);
    EXPECT_EQ(ParseMessageStatus("PENDING"), MessageStatus::Pending);
    EXPECT_EQ(ParseMessageStatus("DELIVERED"), MessageStatus::Delivered);
    EXPECT_EQ(ParseMessageStatus("READ"), MessageStatus::Read);
    EXPECT_FALSE(ParseMessageStatus("bogus").has_value());
    EXPECT_STREQ(ToString(MessageStatus::Failed), "FAILED");
}

// -- insert pending ------------------------------------------------------------

TEST(ConversationStore, insert_pending_forces_pending_status) {
    ConversationStore store;
    Message m = Local("tok-1", 100);
    m.status = MessageStatus::Delivered;
    ASSERT_TRUE(store.InsertPending(m));

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].status, MessageStatus::Pending);
    EXPECT_FALSE(timeline[0].HasId());
}

TEST(ConversationStore, insert_pending_rejects_malformed_records) {
    ConversationStore store;
    EXPECT_FALSE(store.InsertPending(Local("", 100)));
    Message withId = Local("tok-1", 100);
    withId.id = "m1";
    EXPECT_FALSE(store.InsertPending(withId));
    EXPECT_FALSE(store.InsertPending(Local("tok-2", 100, "x", ConversationKey::Channel(""))));
    EXPECT_TRUE(store.Timeline(general).empty());
}

TEST(ConversationStore, insert_pending_with_known_token_rewrites) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100, "first"));
    store.InsertPending(Local("tok-1", 200, "second"));

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].content, "second");
}

TEST(ConversationStore, insert_pending_never_overwrites_reconciled_record) {
    ConversationStore store;
    ASSERT_TRUE(store.InsertPending(Local("tok-1", 100, "first")));
    ASSERT_TRUE(store.ReconcileAck("tok-1", "m1", MessageStatus::Sent));

    int changes = 0;
    store.Changed().Subscribe([&changes](const ConversationKey&) { ++changes; });
    EXPECT_FALSE(store.InsertPending(Local("tok-1", 200, "second")));

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m1");
    EXPECT_EQ(timeline[0].status, MessageStatus::Sent);
    EXPECT_EQ(timeline[0].content, "first");
    EXPECT_EQ(changes, 0);
}

// -- ingest --------------------------------------------------------------------

TEST(ConversationStore, ingest_is_idempotent_by_id) {
    ConversationStore store;
    EXPECT_EQ(store.Ingest(Remote("m1", 100, "hello")), IngestResult::Inserted);
    EXPECT_EQ(store.Ingest(Remote("m1", 100, "hello")), IngestResult::Updated);
    Message edited = Remote("m1", 100, "hello");
    edited.status = MessageStatus::Read;
    EXPECT_EQ(store.Ingest(edited), IngestResult::Updated);

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].status, MessageStatus::Read);
}

TEST(ConversationStore, ingest_without_id_is_rejected) {
    ConversationStore store;
    EXPECT_EQ(store.Ingest(Local("tok-1", 100)), IngestResult::Rejected);
    EXPECT_TRUE(store.Timeline(general).empty());
}

TEST(ConversationStore, self_echo_replaces_local_record) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100, "hi"));

    Message echo = Remote("m1", 105, "hi");
    echo.senderId = "u-self";
    echo.correlationToken = "tok-1";
    EXPECT_EQ(store.Ingest(echo), IngestResult::Reconciled);

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m1");
    EXPECT_EQ(timeline[0].correlationToken, "tok-1");
    EXPECT_EQ(timeline[0].status, MessageStatus::Sent);
}

TEST(ConversationStore, echo_then_ack_leaves_one_record) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));

    Message echo = Remote("m1", 100, "mine");
    echo.correlationToken = "tok-1";
    store.Ingest(echo);
    EXPECT_FALSE(store.ReconcileAck("tok-1", "m1", MessageStatus::Sent));
    EXPECT_EQ(store.Timeline(general).size(), 1u);
}

TEST(ConversationStore, ack_merges_with_echo_that_lacked_a_token) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));
    store.Ingest(Remote("m1", 101, "mine"));
    ASSERT_EQ(store.Timeline(general).size(), 2u);

    EXPECT_TRUE(store.ReconcileAck("tok-1", "m1", MessageStatus::Sent));

    auto timeline = store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m1");
    EXPECT_EQ(timeline[0].correlationToken, "tok-1");
}

TEST(ConversationStore, timeline_stays_sorted_under_any_arrival_order) {
    ConversationStore store;
    store.Ingest(Remote("m3", 300));
    store.Ingest(Remote("m1", 100));
    store.InsertPending(Local("tok-1", 250));
    store.Ingest(Remote("m2", 200));
    store.MergePage(general, { Remote("m0", 50), Remote("m4", 400) }, true);

    auto timeline = store.Timeline(general);
    EXPECT_TRUE(IsSorted(timeline));
    EXPECT_EQ(timeline.size(), 6u);
    EXPECT_EQ(timeline.front().id, "m0");
    EXPECT_EQ(timeline.back().id, "m4");
}

TEST(ConversationStore, equal_timestamps_keep_arrival_order) {
    ConversationStore store;
    store.Ingest(Remote("a", 100));
    store.Ingest(Remote("b", 100));
    store.Ingest(Remote("c", 100));
    EXPECT_EQ(Ids(store.Timeline(general)), (std::vector<std::string>{ "a", "b", "c" }));
}

// -- ack / failure -------------------------------------------------------------

TEST(ConversationStore, ack_assigns_server_id) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));
    EXPECT_TRUE(store.ReconcileAck("tok-1", "m1", MessageStatus::Delivered));

    auto rec = store.FindByToken("tok-1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->id, "m1");
    EXPECT_EQ(rec->status, MessageStatus::Delivered);
}

TEST(ConversationStore, ack_for_unknown_token_is_a_no_op) {
    ConversationStore store;
    store.Ingest(Remote("m1", 100));
    int changes = 0;
    store.Changed().Subscribe([&changes](const ConversationKey&) { ++changes; });

    EXPECT_FALSE(store.ReconcileAck("evicted", "m9", MessageStatus::Sent));
    EXPECT_EQ(changes, 0);
    EXPECT_EQ(store.Timeline(general).size(), 1u);
}

TEST(ConversationStore, failure_marks_pending_record) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));
    EXPECT_TRUE(store.ReconcileFailure("tok-1", "rate limited"));

    auto rec = store.FindByToken("tok-1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, MessageStatus::Failed);
    EXPECT_EQ(rec->failureReason, "rate limited");
}

TEST(ConversationStore, failure_after_ack_is_ignored) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));
    store.ReconcileAck("tok-1", "m1", MessageStatus::Sent);
    EXPECT_FALSE(store.ReconcileFailure("tok-1", "late"));
    EXPECT_EQ(store.FindByToken("tok-1")->status, MessageStatus::Sent);
}

TEST(ConversationStore, ack_after_failure_still_reconciles) {
    ConversationStore store;
    store.InsertPending(Local("tok-1", 100));
    store.ReconcileFailure("tok-1", "timeout");
    EXPECT_TRUE(store.ReconcileAck("tok-1", "m1", MessageStatus::Sent));

    auto rec = store.FindByToken("tok-1");
    EXPECT_EQ(rec->status, MessageStatus::Sent);
    EXPECT_TRUE(rec->failureReason.empty());
}

// -- history pages -------------------------------------------------------------

TEST(ConversationStore, merge_page_counts_only_new_records) {
    ConversationStore store;
    store.Ingest(Remote("m2", 200));
    size_t added = store.MergePage(general, { Remote("m1", 100), Remote("m2", 200), Remote("m1", 100) }, std::nullopt);
    EXPECT_EQ(added, 1u);
    EXPECT_EQ(Ids(store.Timeline(general)), (std::vector<std::string>{ "m1", "m2" }));
}

TEST(ConversationStore, merge_page_does_not_overwrite_live_state) {
    ConversationStore store;
    Message live = Remote("m1", 100, "fresh");
    live.status = MessageStatus::Read;
    store.Ingest(live);

    store.MergePage(general, { Remote("m1", 100, "stale") }, std::nullopt);
    auto rec = store.FindById(general, "m1");
    EXPECT_EQ(rec->content, "fresh");
    EXPECT_EQ(rec->status, MessageStatus::Read);
}

TEST(ConversationStore, paginated_pages_join_in_order) {
    ConversationStore store;
    store.MergePage(general, { Remote("m10", 10), Remote("m20", 20), Remote("m30", 30) }, true);
    store.MergePage(general, { Remote("m5", 5), Remote("m10", 10), Remote("m15", 15) }, false);

    EXPECT_EQ(Ids(store.Timeline(general)),
        (std::vector<std::string>{ "m5", "m10", "m15", "m20", "m30" }));
    EXPECT_FALSE(store.HasMore(general));
}

TEST(ConversationStore, has_more_defaults_to_true) {
    ConversationStore store;
    EXPECT_TRUE(store.HasMore(ConversationKey::Direct("unknown")));
    store.SetHasMore(general, false);
    EXPECT_FALSE(store.HasMore(general));
}

TEST(ConversationStore, conversations_are_isolated) {
    ConversationStore store;
    const auto dm = ConversationKey::Direct("general");
    store.Ingest(Remote("m1", 100, "a", general));
    store.Ingest(Remote("m1", 100, "b", dm));
    EXPECT_EQ(store.Timeline(general).size(), 1u);
    EXPECT_EQ(store.Timeline(dm).size(), 1u);
    EXPECT_EQ(store.Conversations().size(), 2u);
}

// -- change notification -------------------------------------------------------

TEST(ConversationStore, changed_fires_per_mutation) {
    ConversationStore store;
    std::vector<ConversationKey> seen;
    auto id = store.Changed().Subscribe([&seen](const ConversationKey& key) { seen.push_back(key); });

    store.InsertPending(Local("tok-1", 100));
    store.ReconcileAck("tok-1", "m1", MessageStatus::Sent);
    store.Ingest(Remote("m2", 200));
    EXPECT_EQ(seen.size(), 3u);

    store.Changed().Unsubscribe(id);
    store.Ingest(Remote("m3", 300));
    EXPECT_EQ(seen.size(), 3u);
}

// -- typing and presence -------------------------------------------------------

TEST(ConversationStore, typing_refresh_keeps_one_entry) {
    ConversationStore store;
    store.SetTyping(general, "u-other", "other", 1000);
    store.SetTyping(general, "u-other", "", 2000);

    auto typing = store.Typing(general);
    ASSERT_EQ(typing.size(), 1u);
    EXPECT_EQ(typing[0].lastSignalTime, 2000);
    EXPECT_EQ(typing[0].username, "other");
}

TEST(ConversationStore, typing_prune_removes_stale_entries) {
    ConversationStore store;
    store.SetTyping(general, "a", "a", 1000);
    store.SetTyping(general, "b", "b", 5000);
    EXPECT_EQ(store.PruneTyping(3000), 1u);

    auto typing = store.Typing(general);
    ASSERT_EQ(typing.size(), 1u);
    EXPECT_EQ(typing[0].userId, "b");
}

TEST(ConversationStore, clear_all_typing_and_presence) {
    ConversationStore store;
    int typingEvents = 0;
    store.TypingChanged().Subscribe([&typingEvents](const ConversationKey&) { ++typingEvents; });
    store.SetTyping(general, "a", "a", 1000);
    store.SetTyping(ConversationKey::Direct("d"), "b", "b", 1000);
    store.SetPresence("a", "online");

    store.ClearAllTyping();
    store.ClearPresence();
    EXPECT_TRUE(store.Typing(general).empty());
    EXPECT_EQ(store.Presence("a"), "");
    EXPECT_EQ(typingEvents, 4);
    EXPECT_TRUE(store.ClearTyping(general, "a") == false);
}
