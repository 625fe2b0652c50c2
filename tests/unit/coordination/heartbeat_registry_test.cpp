#include <gtest/gtest.h>
#include <surge/coordination/heartbeat_registry.h>
#include <surge/store/sqlite_state_store.h>

using namespace surge;
using namespace surge::coordination;
using control::WorkerStatus;
using namespace std::chrono_literals;

namespace {

store::HeartbeatRecord beat(const std::string& id, WorkerStatus status, int64_t atMs) {
    store::HeartbeatRecord hb;
    hb.runId = "run";
    hb.workerId = id;
    hb.status = status;
    hb.lastHeartbeatMs = atMs;
    return hb;
}

} // namespace

TEST(HeartbeatClassifyTest, StaleOnlyWhenOverdueAndNotTerminal) {
    const int64_t now = 100'000;
    EXPECT_FALSE(isStale(beat("a", WorkerStatus::Running, now - 5'000), now, 10s));
    EXPECT_FALSE(isStale(beat("a", WorkerStatus::Running, now - 10'000), now, 10s));
    EXPECT_TRUE(isStale(beat("a", WorkerStatus::Running, now - 10'001), now, 10s));
    EXPECT_TRUE(isStale(beat("a", WorkerStatus::Ready, now - 60'000), now, 10s));
    EXPECT_FALSE(isStale(beat("a", WorkerStatus::Stopped, now - 60'000), now, 10s));
    EXPECT_FALSE(isStale(beat("a", WorkerStatus::Failed, now - 60'000), now, 10s));
}

TEST(HeartbeatClassifyTest, CountsByStatus) {
    const int64_t now = 50'000;
    auto summary = classify({beat("ready", WorkerStatus::Ready, now),
                             beat("running", WorkerStatus::Running, now - 1'000),
                             beat("silent", WorkerStatus::Running, now - 30'000),
                             beat("done", WorkerStatus::Stopped, now - 30'000),
                             beat("broken", WorkerStatus::Failed, now)},
                            now, 10s);
    EXPECT_EQ(summary.total, 5);
    EXPECT_EQ(summary.ready, 1);
    EXPECT_EQ(summary.running, 2);
    EXPECT_EQ(summary.stopped, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.alive, 2);
    EXPECT_EQ(summary.stale, 1);
    ASSERT_EQ(summary.staleWorkerIds.size(), 1u);
    EXPECT_EQ(summary.staleWorkerIds[0], "silent");
    EXPECT_EQ(summary.terminal(), 2);
}

TEST(HeartbeatRegistryTest, SummarizesFromStore) {
    auto opened = store::SqliteStateStore::open({.path = ":memory:"});
    ASSERT_TRUE(opened.has_value());
    auto& st = *opened.value();

    HeartbeatRegistry registry(st, 10s);
    const int64_t now = epochMillis();
    ASSERT_TRUE(registry.beat(beat("w1", WorkerStatus::Ready, now)).has_value());
    ASSERT_TRUE(registry.beat(beat("w2", WorkerStatus::Ready, now - 60'000)).has_value());

    auto summary = registry.summarize("run", now);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().ready, 2);
    EXPECT_EQ(summary.value().alive, 1);
    EXPECT_EQ(summary.value().stale, 1);

    // Re-beating clears staleness.
    ASSERT_TRUE(registry.beat(beat("w2", WorkerStatus::Ready, now)).has_value());
    EXPECT_EQ(registry.summarize("run", now).value().alive, 2);

    auto cleared = registry.clear("run");
    ASSERT_TRUE(cleared.has_value());
    EXPECT_EQ(cleared.value(), 2);
    EXPECT_EQ(registry.summarize("run", now).value().total, 0);
}
