#include <gtest/gtest.h>
#include <surge/coordination/control_event_log.h>
#include <surge/store/sqlite_state_store.h>

using namespace surge;
using namespace surge::coordination;
using namespace surge::control;

class ControlEventLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = store::SqliteStateStore::open({.path = ":memory:"});
        ASSERT_TRUE(opened.has_value());
        store_ = std::move(opened).value();
        log_ = std::make_unique<ControlEventLog>(*store_);
    }

    std::unique_ptr<store::SqliteStateStore> store_;
    std::unique_ptr<ControlEventLog> log_;
};

TEST_F(ControlEventLogTest, AppendAssignsIncreasingSequences) {
    int64_t last = 0;
    for (int i = 0; i < 5; ++i) {
        auto event = log_->append("run", ScaleToPayload{i, std::nullopt});
        ASSERT_TRUE(event.has_value());
        EXPECT_GT(event.value().sequence, last);
        last = event.value().sequence;
    }
    auto all = log_->readAfter("run", 0);
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 5u);
    for (size_t i = 1; i < all.value().size(); ++i)
        EXPECT_LT(all.value()[i - 1].sequence, all.value()[i].sequence);
}

TEST_F(ControlEventLogTest, CursorDeliversEachEventOnce) {
    ControlEventCursor cursor;
    ASSERT_TRUE(log_->append("run", SetPhasePayload{RunPhase::Warmup}).has_value());
    ASSERT_TRUE(log_->append("run", SetPhasePayload{RunPhase::Running}).has_value());

    auto first = cursor.poll(*log_, "run");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().size(), 2u);
    EXPECT_EQ(cursor.lastSeenSequence(), 2);

    auto empty = cursor.poll(*log_, "run");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());

    ASSERT_TRUE(log_->append("run", StopPayload{kStopDurationElapsed, 5.0}).has_value());
    auto third = cursor.poll(*log_, "run");
    ASSERT_TRUE(third.has_value());
    ASSERT_EQ(third.value().size(), 1u);
    EXPECT_EQ(third.value()[0].type(), ControlEventType::Stop);
}

TEST_F(ControlEventLogTest, CursorDropsReplaysAndOutOfOrderEvents) {
    ControlEventCursor cursor(3);
    ControlEvent old;
    old.sequence = 2;
    EXPECT_FALSE(cursor.admit(old));

    ControlEvent same;
    same.sequence = 3;
    EXPECT_FALSE(cursor.admit(same));

    ControlEvent next;
    next.sequence = 5;
    EXPECT_TRUE(cursor.admit(next));
    EXPECT_FALSE(cursor.admit(next));

    ControlEvent late;
    late.sequence = 4;
    EXPECT_FALSE(cursor.admit(late));
    EXPECT_EQ(cursor.lastSeenSequence(), 5);
}

TEST_F(ControlEventLogTest, RunsAreIndependent) {
    ASSERT_TRUE(log_->append("a", SetPhasePayload{RunPhase::Warmup}).has_value());
    ASSERT_TRUE(log_->append("b", SetPhasePayload{RunPhase::Warmup}).has_value());
    ASSERT_TRUE(log_->append("b", SetPhasePayload{RunPhase::Running}).has_value());

    EXPECT_EQ(log_->readAfter("a", 0).value().size(), 1u);
    EXPECT_EQ(log_->readAfter("b", 0).value().size(), 2u);
    EXPECT_EQ(log_->readAfter("b", 1).value().size(), 1u);
}
