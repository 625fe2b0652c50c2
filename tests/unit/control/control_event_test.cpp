#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <surge/control/control_event.h>

using namespace surge;
using namespace surge::control;

TEST(ControlEventTest, TypeNames) {
    EXPECT_STREQ(toString(ControlEventType::SetPhase), "SET_PHASE");
    EXPECT_STREQ(toString(ControlEventType::ScaleTo), "SCALE_TO");
    EXPECT_STREQ(toString(ControlEventType::Stop), "STOP");
    EXPECT_EQ(parseControlEventType("SCALE_TO"), ControlEventType::ScaleTo);
    EXPECT_FALSE(parseControlEventType("scale_to").has_value());
    EXPECT_FALSE(parseControlEventType("PAUSE").has_value());
}

TEST(ControlEventTest, EncodesScaleToWithOptionalGroup) {
    auto all = nlohmann::json::parse(encodeEventData(ScaleToPayload{12, std::nullopt}));
    EXPECT_EQ(all["target"], 12);
    EXPECT_FALSE(all.contains("worker_group_id"));

    auto one = nlohmann::json::parse(encodeEventData(ScaleToPayload{4, 2}));
    EXPECT_EQ(one["worker_group_id"], 2);
}

TEST(ControlEventTest, DecodesStopPayload) {
    auto decoded = decodeEventData(ControlEventType::Stop,
                                   R"({"reason":"duration_elapsed","drain_timeout_seconds":7.5})");
    ASSERT_TRUE(decoded.has_value());
    const auto& stop = std::get<StopPayload>(decoded.value());
    EXPECT_EQ(stop.reason, kStopDurationElapsed);
    EXPECT_DOUBLE_EQ(stop.drainTimeoutSeconds, 7.5);
}

TEST(ControlEventTest, DecodesSetPhaseMeasurementAlias) {
    auto decoded = decodeEventData(ControlEventType::SetPhase, R"({"phase":"MEASUREMENT"})");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<SetPhasePayload>(decoded.value()).phase, RunPhase::Running);
}

TEST(ControlEventTest, RejectsMalformedPayloads) {
    auto notJson = decodeEventData(ControlEventType::Stop, "{not json");
    ASSERT_FALSE(notJson.has_value());
    EXPECT_EQ(notJson.error().code, ErrorCode::InvalidData);

    auto array = decodeEventData(ControlEventType::Stop, "[1,2]");
    EXPECT_FALSE(array.has_value());

    auto noTarget = decodeEventData(ControlEventType::ScaleTo, R"({"worker_group_id":1})");
    EXPECT_FALSE(noTarget.has_value());

    auto negative = decodeEventData(ControlEventType::ScaleTo, R"({"target":-3})");
    EXPECT_FALSE(negative.has_value());

    auto badPhase = decodeEventData(ControlEventType::SetPhase, R"({"phase":"PAUSED"})");
    EXPECT_FALSE(badPhase.has_value());
}

TEST(ControlEventTest, ScaleToGroupAddressing) {
    ScaleToPayload broadcast{10, std::nullopt};
    EXPECT_TRUE(appliesToGroup(broadcast, 0));
    EXPECT_TRUE(appliesToGroup(broadcast, 5));

    ScaleToPayload targeted{3, 1};
    EXPECT_TRUE(appliesToGroup(targeted, 1));
    EXPECT_FALSE(appliesToGroup(targeted, 0));
}

TEST(ControlEventTest, EventTypeFollowsPayload) {
    ControlEvent event;
    event.payload = StopPayload{kStopCancelled, 1.0};
    EXPECT_EQ(event.type(), ControlEventType::Stop);
    event.payload = SetPhasePayload{RunPhase::Warmup};
    EXPECT_EQ(event.type(), ControlEventType::SetPhase);
}
