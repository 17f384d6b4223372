#include <shelter/worker/background_sync.h>
#include <gtest/gtest.h>

#include "test_fakes.h"

#include <set>

using namespace shelter::worker;
using shelter::core::DiagnosticEmitter;
using shelter::testing::FakeFetcher;
using shelter::testing::make_response;
namespace net = shelter::net;

namespace {

constexpr const char kTag[] = "attendance-sync";

net::Request make_post(const std::string& url, const std::string& body) {
    net::Request request;
    request.url = url;
    request.method = net::Method::POST;
    request.set_body(body);
    return request;
}

} // namespace

TEST(SyncQueueTest, ActionIdsAreUniqueHex) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_action_id();
        EXPECT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(SyncQueueTest, ReplaySendsInOrderAndConsumes) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    fetcher.route("http://h/api/checkin", 200, "{}");
    fetcher.route("http://h/api/checkout", 201, "{}");

    auto first = queue.enqueue(make_post("http://h/api/checkin", "in"), kTag);
    auto second = queue.enqueue(make_post("http://h/api/checkout", "out"), kTag);
    EXPECT_NE(first, second);

    auto report = queue.replay(kTag);
    EXPECT_EQ(report.delivered, 2u);
    EXPECT_EQ(queue.size(), 0u);

    auto sent = fetcher.requests();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].body_as_string(), "in");
    EXPECT_EQ(sent[0].headers.get("Idempotency-Key"), first);
    EXPECT_EQ(sent[1].headers.get("idempotency-key"), second);

    // Consumed exactly once
    queue.replay(kTag);
    EXPECT_EQ(fetcher.call_count(), 2u);
}

TEST(SyncQueueTest, NetworkFailureStopsAndKeepsRemaining) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    fetcher.route("http://h/api/checkin", 200, "{}");
    fetcher.fail("http://h/api/checkout");

    queue.enqueue(make_post("http://h/api/checkin", "1"), kTag);
    auto stuck = queue.enqueue(make_post("http://h/api/checkout", "2"), kTag);
    queue.enqueue(make_post("http://h/api/checkin", "3"), kTag);

    EXPECT_THROW(queue.replay(kTag), SyncError);
    auto pending = queue.pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, stuck);
    EXPECT_EQ(pending[0].attempts, 1u);
    EXPECT_EQ(fetcher.call_count(), 2u);
}

TEST(SyncQueueTest, ServerErrorIsRetriedClientErrorIsDropped) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    fetcher.route("http://h/api/checkin", 409, "duplicate");
    fetcher.route("http://h/api/checkout", 503, "busy");

    queue.enqueue(make_post("http://h/api/checkin", "a"), kTag);
    queue.enqueue(make_post("http://h/api/checkout", "b"), kTag);

    EXPECT_THROW(queue.replay(kTag), SyncError);
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.pending()[0].request.url, "http://h/api/checkout");
    EXPECT_FALSE(diagnostics.events_by_severity(shelter::core::Severity::Warning).empty());

    fetcher.route("http://h/api/checkout", 200, "ok");
    auto report = queue.replay(kTag);
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(SyncQueueTest, OtherTagsAreLeftAlone) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    fetcher.route("http://h/api/checkin", 200, "{}");

    queue.enqueue(make_post("http://h/api/checkin", "x"), "other-tag");
    queue.enqueue(make_post("http://h/api/checkin", "y"), kTag);

    queue.replay(kTag);
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.pending()[0].tag, "other-tag");
}

TEST(SyncQueueTest, SnapshotRestoresQueue) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    auto id = queue.enqueue(make_post("http://h/api/checkin", R"({"id":1})"), kTag);

    SyncQueue restored(fetcher, diagnostics);
    restored.deserialize(queue.serialize());
    auto pending = restored.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, id);
    EXPECT_EQ(pending[0].request.method, net::Method::POST);
    EXPECT_EQ(pending[0].request.body_as_string(), R"({"id":1})");
    EXPECT_EQ(pending[0].request.headers.get("Idempotency-Key"), id);
    EXPECT_EQ(pending[0].created_at_ms, queue.pending()[0].created_at_ms);
}

TEST(SyncQueueTest, CorruptSnapshotThrows) {
    FakeFetcher fetcher;
    DiagnosticEmitter diagnostics;
    SyncQueue queue(fetcher, diagnostics);
    EXPECT_THROW(queue.deserialize({0, 1, 2}), SyncError);
    EXPECT_THROW(queue.deserialize({0, 0, 0, 0}), SyncError);
}
