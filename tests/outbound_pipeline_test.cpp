#include <gtest/gtest.h>

#include "TestDoubles.h"
#include "network/ConnectionManager.h"
#include "sync/OutboundPipeline.h"

#include <string>

using namespace Courier;
using namespace Courier::Test;

namespace {

    const ConversationKey general = ConversationKey::Channel("general");
    const Credential alice{ "alice", "secret" };

    ConnectionSettings FastSettings() {
        ConnectionSettings s;
        s.connectTimeout = 200ms;
        s.reconnectDelayMin = 10ms;
        s.reconnectDelayMax = 20ms;
        return s;
    }

    struct Fixture {
        explicit Fixture(OutboundSettings settings = {}) : outbound(ctx, store, conn, crypto, settings) {
            outbound.Start();
            outbound.SetClock([this] { return ++clock; });
        }

        bool Connect() {
            bool done = false;
            std::error_code result;
            conn.Connect(alice, [&](std::error_code ec) { result = ec; done = true; });
            RunUntil(ctx, [&] { return done; });
            return done && !result;
        }

        struct Outcome {
            bool done = false;
            std::error_code ec;
            std::string token;
        };

        Outcome SendAndWait(const std::string& text, const ConversationKey& key = general) {
            Outcome out;
            outbound.Send(key, text, {}, [&out](std::error_code ec, const std::string& token) {
                out.done = true;
                out.ec = ec;
                out.token = token;
            });
            RunUntil(ctx, [&out] { return out.done; });
            return out;
        }

        asio::io_context ctx;
        FakeTransport transport{ ctx };
        FakeCrypto crypto{ ctx };
        MemorySessionStore sessions;
        ConversationStore store;
        ConnectionManager conn{ ctx, transport, &sessions, FastSettings() };
        OutboundPipeline outbound;
        int64_t clock = 1000;
    };

} // namespace

TEST(OutboundPipeline, send_inserts_pending_then_transmits) {
    Fixture f;
    ASSERT_TRUE(f.Connect());

    int changes = 0;
    bool sawPending = false;
    f.store.Changed().Subscribe([&](const ConversationKey& key) {
        ++changes;
        auto timeline = f.store.Timeline(key);
        if (!timeline.empty() && timeline.back().status == MessageStatus::Pending) sawPending = true;
    });

    auto out = f.SendAndWait("hello");
    ASSERT_TRUE(out.done);
    EXPECT_FALSE(out.ec);
    EXPECT_EQ(out.token, "tok-1");
    EXPECT_TRUE(sawPending);
    EXPECT_EQ(changes, 1);

    auto rec = f.store.FindByToken("tok-1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, MessageStatus::Pending);
    EXPECT_EQ(rec->content, "hello");
    EXPECT_EQ(rec->senderId, "u-self");
    EXPECT_EQ(rec->timestamp, 1001);

    auto frames = f.transport.SentJson(PacketType::Message_Send);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0]["clientNonce"].get<std::string>(), "tok-1");
    EXPECT_EQ(frames[0]["encryptedEnvelope"].get<std::string>(), "enc:hello");
    EXPECT_EQ(frames[0]["channelId"].get<std::string>(), "general");
    EXPECT_EQ(frames[0]["protocolVersion"].get<int>(), 2);
    EXPECT_EQ(f.outbound.ArmedWatchdogs(), 1u);
}

TEST(OutboundPipeline, rejects_empty_whitespace_and_oversized_text) {
    OutboundSettings settings;
    settings.maxMessageLength = 8;
    Fixture f(settings);
    ASSERT_TRUE(f.Connect());

    EXPECT_EQ(f.SendAndWait("").ec, SyncError::InvalidMessage);
    EXPECT_EQ(f.SendAndWait(" \t\n").ec, SyncError::InvalidMessage);
    EXPECT_EQ(f.SendAndWait("123456789").ec, SyncError::InvalidMessage);
    EXPECT_EQ(f.SendAndWait("ok", ConversationKey::Channel("")).ec, SyncError::InvalidMessage);
    EXPECT_FALSE(f.SendAndWait("12345678").ec);

    EXPECT_EQ(f.crypto.prepareCalls, 1);
    EXPECT_EQ(f.store.Timeline(general).size(), 1u);
}

TEST(OutboundPipeline, ack_reconciles_pending_record) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"tok-1","messageId":"m1","status":"SENT"})");

    auto rec = f.store.FindByToken(out.token);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->id, "m1");
    EXPECT_EQ(rec->status, MessageStatus::Sent);
    EXPECT_EQ(f.outbound.ArmedWatchdogs(), 0u);
}

TEST(OutboundPipeline, reused_token_does_not_clobber_acknowledged_record) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    f.crypto.fixedToken = "tok-same";
    auto first = f.SendAndWait("hello");
    ASSERT_FALSE(first.ec);
    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"tok-same","messageId":"m1","status":"SENT"})");

    auto second = f.SendAndWait("again");
    EXPECT_EQ(second.ec, SyncError::SendFailed);
    EXPECT_EQ(f.transport.CountSent(PacketType::Message_Send), 1u);

    auto timeline = f.store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m1");
    EXPECT_EQ(timeline[0].content, "hello");
}

TEST(OutboundPipeline, server_error_marks_record_failed) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    f.transport.Deliver(PacketType::Message_Error, R"({"clientNonce":"tok-1","error":"rate limited"})");

    auto rec = f.store.FindByToken(out.token);
    EXPECT_EQ(rec->status, MessageStatus::Failed);
    EXPECT_EQ(rec->failureReason, "rate limited");
    // Failed sends are never retried on their own.
    RunFor(f.ctx, 30ms);
    EXPECT_EQ(f.transport.CountSent(PacketType::Message_Send), 1u);
}

TEST(OutboundPipeline, not_connected_without_credential_fails_fast) {
    Fixture f;
    auto out = f.SendAndWait("hello");
    ASSERT_TRUE(out.done);
    EXPECT_EQ(out.ec, SyncError::NotConnected);
    EXPECT_EQ(out.token, "tok-1");

    auto rec = f.store.FindByToken("tok-1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, MessageStatus::Failed);
    EXPECT_EQ(rec->failureReason, "not connected");
    EXPECT_EQ(f.transport.openCount, 0);
}

TEST(OutboundPipeline, reconnects_once_with_stored_credential) {
    Fixture f;
    f.sessions.credential = alice;
    auto out = f.SendAndWait("hello");
    ASSERT_TRUE(out.done);
    EXPECT_FALSE(out.ec);
    EXPECT_TRUE(f.conn.IsConnected());
    EXPECT_EQ(f.transport.openCount, 1);
    EXPECT_EQ(f.transport.CountSent(PacketType::Message_Send), 1u);
}

TEST(OutboundPipeline, failed_silent_reconnect_marks_record_failed) {
    Fixture f;
    f.sessions.credential = alice;
    f.transport.openMode = FakeTransport::OpenMode::Refuse;
    auto out = f.SendAndWait("hello");
    EXPECT_EQ(out.ec, SyncError::NotConnected);
    EXPECT_EQ(f.store.FindByToken(out.token)->status, MessageStatus::Failed);
    EXPECT_EQ(f.transport.openCount, 1);
}

TEST(OutboundPipeline, transport_refusing_frame_marks_record_failed) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    f.transport.refuseSends = true;
    auto out = f.SendAndWait("hello");
    EXPECT_EQ(out.ec, SyncError::NotConnected);
    EXPECT_EQ(f.store.FindByToken(out.token)->status, MessageStatus::Failed);
    EXPECT_EQ(f.outbound.ArmedWatchdogs(), 0u);
}

TEST(OutboundPipeline, crypto_failure_creates_no_record) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    f.crypto.failPrepare = true;
    auto out = f.SendAndWait("hello");
    EXPECT_EQ(out.ec, SyncError::SendFailed);
    EXPECT_TRUE(out.token.empty());
    EXPECT_TRUE(f.store.Timeline(general).empty());
}

TEST(OutboundPipeline, watchdog_fails_unacknowledged_record) {
    OutboundSettings settings;
    settings.pendingTimeout = 30ms;
    Fixture f(settings);
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    ASSERT_TRUE(RunUntil(f.ctx, [&] { return f.store.FindByToken(out.token)->status == MessageStatus::Failed; }));
    EXPECT_EQ(f.store.FindByToken(out.token)->failureReason, "timeout");
    EXPECT_EQ(f.outbound.ArmedWatchdogs(), 0u);

    // A late ack still wins.
    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"tok-1","messageId":"m1"})");
    auto rec = f.store.FindByToken(out.token);
    EXPECT_EQ(rec->status, MessageStatus::Sent);
    EXPECT_EQ(rec->id, "m1");
    EXPECT_TRUE(rec->failureReason.empty());
}

TEST(OutboundPipeline, zero_timeout_disables_watchdog) {
    OutboundSettings settings;
    settings.pendingTimeout = 0ms;
    Fixture f(settings);
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");
    EXPECT_EQ(f.outbound.ArmedWatchdogs(), 0u);
    RunFor(f.ctx, 30ms);
    EXPECT_EQ(f.store.FindByToken(out.token)->status, MessageStatus::Pending);
}

TEST(OutboundPipeline, ack_after_echo_without_nonce_merges) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    ServerEnvelope echo = MakeEnvelope("m1", general, 1001, "hello", "u-self");
    f.store.Ingest(Message{ echo.id, {}, echo.senderId, echo.senderUsername, general, "hello", 1001,
        MessageStatus::Sent, {}, {} });
    ASSERT_EQ(f.store.Timeline(general).size(), 2u);

    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"tok-1","messageId":"m1"})");
    auto timeline = f.store.Timeline(general);
    ASSERT_EQ(timeline.size(), 1u);
    EXPECT_EQ(timeline[0].id, "m1");
    EXPECT_EQ(timeline[0].correlationToken, out.token);
}

TEST(OutboundPipeline, ack_for_unknown_token_is_ignored) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"gone","messageId":"m1"})");
    EXPECT_TRUE(f.store.Conversations().empty());
}

TEST(OutboundPipeline, resend_uses_fresh_token_and_keeps_failed_record) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto first = f.SendAndWait("hello");
    f.transport.Deliver(PacketType::Message_Error, R"({"clientNonce":"tok-1","error":"boom"})");

    Fixture::Outcome second;
    f.outbound.Resend(first.token, [&second](std::error_code ec, const std::string& token) {
        second.done = true;
        second.ec = ec;
        second.token = token;
    });
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return second.done; }));
    EXPECT_FALSE(second.ec);
    EXPECT_EQ(second.token, "tok-2");

    EXPECT_EQ(f.store.FindByToken("tok-1")->status, MessageStatus::Failed);
    EXPECT_EQ(f.store.FindByToken("tok-2")->status, MessageStatus::Pending);
    EXPECT_EQ(f.store.FindByToken("tok-2")->content, "hello");
    EXPECT_EQ(f.transport.CountSent(PacketType::Message_Send), 2u);
}

TEST(OutboundPipeline, resend_of_non_failed_record_is_invalid) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    std::error_code result;
    bool done = false;
    f.outbound.Resend(out.token, [&](std::error_code ec, const std::string&) { result = ec; done = true; });
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return done; }));
    EXPECT_EQ(result, SyncError::InvalidMessage);

    done = false;
    f.outbound.Resend("unknown", [&](std::error_code ec, const std::string&) { result = ec; done = true; });
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return done; }));
    EXPECT_EQ(result, SyncError::InvalidMessage);
}

TEST(OutboundPipeline, pending_survives_drop_and_ack_after_reconnect) {
    Fixture f;
    ASSERT_TRUE(f.Connect());
    auto out = f.SendAndWait("hello");

    f.transport.Drop();
    ASSERT_TRUE(RunUntil(f.ctx, [&] { return f.conn.IsConnected(); }));
    EXPECT_EQ(f.store.FindByToken(out.token)->status, MessageStatus::Pending);

    f.transport.Deliver(PacketType::Message_Ack, R"({"clientNonce":"tok-1","messageId":"m1"})");
    EXPECT_EQ(f.store.FindByToken(out.token)->id, "m1");
}
