// =============================================================================
// Unit tests for gesture.hpp
// Tests: gesture kinds, touch sequences on the wire, parameter binding
// =============================================================================
#include <gtest/gtest.h>
#include "gesture.hpp"

using namespace droidpilot;
using std::chrono::milliseconds;
using json = nlohmann::json;

// =============================================================================
// Kinds
// =============================================================================

TEST(GestureKindTest, BuilderProducesExpectedKinds) {
    EXPECT_EQ(GestureBuilder::tap(50, 50).kind(), GestureKind::Tap);
    EXPECT_EQ(GestureBuilder::doubleTap(50, 50).kind(), GestureKind::DoubleTap);
    EXPECT_EQ(GestureBuilder::longPress(50, 50, std::nullopt, milliseconds(1000)).kind(),
              GestureKind::LongPress);
    EXPECT_EQ(GestureBuilder::swipe({0, 0}, {100, 50}, milliseconds(200)).kind(), GestureKind::Swipe);
    EXPECT_EQ(GestureBuilder::flick({0, 0}, {100, 50}, milliseconds(200)).kind(), GestureKind::Flick);
}

TEST(GestureKindTest, KindNames) {
    EXPECT_STREQ(gestureKindStr(GestureKind::Tap), "tap");
    EXPECT_STREQ(gestureKindStr(GestureKind::DoubleTap), "double_tap");
    EXPECT_STREQ(gestureKindStr(GestureKind::LongPress), "long_press");
    EXPECT_STREQ(gestureKindStr(GestureKind::Swipe), "swipe");
    EXPECT_STREQ(gestureKindStr(GestureKind::Flick), "flick");
}

// =============================================================================
// Wire shape
// =============================================================================

TEST(GestureJsonTest, TapIsSingleReleasedTouch) {
    json j = GestureBuilder::tap(25, 75, Offset{3, -4}).toJson();

    ASSERT_EQ(j["gestures"].size(), 1u);
    const json& g = j["gestures"][0];
    EXPECT_FALSE(g["flick"].get<bool>());
    ASSERT_EQ(g["touches"].size(), 1u);

    const json& t = g["touches"][0];
    EXPECT_DOUBLE_EQ(t["x"].get<double>(), 25.0);
    EXPECT_DOUBLE_EQ(t["y"].get<double>(), 75.0);
    EXPECT_DOUBLE_EQ(t["offset_x"].get<double>(), 3.0);
    EXPECT_DOUBLE_EQ(t["offset_y"].get<double>(), -4.0);
    EXPECT_DOUBLE_EQ(t["wait"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(t["time"].get<double>(), 0.0);
    EXPECT_TRUE(t["release"].get<bool>());
}

TEST(GestureJsonTest, UnboundGestureHasNullParameters) {
    json j = GestureBuilder::tap(50, 50).toJson();
    EXPECT_TRUE(j["query_string"].is_null());
    EXPECT_TRUE(j["timeout"].is_null());
}

TEST(GestureJsonTest, DoubleTapWaitsBetweenTouches) {
    json touches = GestureBuilder::doubleTap(10, 20).toJson()["gestures"][0]["touches"];

    ASSERT_EQ(touches.size(), 2u);
    EXPECT_DOUBLE_EQ(touches[0]["wait"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(touches[1]["wait"].get<double>(), 0.1);
    for (const auto& t : touches) {
        EXPECT_DOUBLE_EQ(t["x"].get<double>(), 10.0);
        EXPECT_DOUBLE_EQ(t["y"].get<double>(), 20.0);
        EXPECT_TRUE(t["release"].get<bool>());
    }
}

TEST(GestureJsonTest, LongPressHoldsForDuration) {
    json touches = GestureBuilder::longPress(50, 50, std::nullopt, milliseconds(1500))
                       .toJson()["gestures"][0]["touches"];
    ASSERT_EQ(touches.size(), 1u);
    EXPECT_DOUBLE_EQ(touches[0]["time"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(touches[0]["offset_x"].get<double>(), 0.0);
}

TEST(GestureJsonTest, SwipeHoldsThenReleasesAtTarget) {
    json j = GestureBuilder::swipe({0, 0}, {100, 50}, milliseconds(200)).toJson();
    const json& g = j["gestures"][0];
    EXPECT_FALSE(g["flick"].get<bool>());

    const json& touches = g["touches"];
    ASSERT_EQ(touches.size(), 2u);
    EXPECT_DOUBLE_EQ(touches[0]["x"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(touches[0]["y"].get<double>(), 0.0);
    EXPECT_FALSE(touches[0]["release"].get<bool>());
    EXPECT_DOUBLE_EQ(touches[1]["x"].get<double>(), 100.0);
    EXPECT_DOUBLE_EQ(touches[1]["y"].get<double>(), 50.0);
    EXPECT_DOUBLE_EQ(touches[1]["time"].get<double>(), 0.2);
    EXPECT_TRUE(touches[1]["release"].get<bool>());
}

TEST(GestureJsonTest, FlickSetsFlag) {
    json j = GestureBuilder::flick({10, 10}, {90, 10}, milliseconds(100)).toJson();
    EXPECT_TRUE(j["gestures"][0]["flick"].get<bool>());
    EXPECT_EQ(j["gestures"][0]["touches"].size(), 2u);
}

// =============================================================================
// withParameters
// =============================================================================

TEST(GestureParametersTest, BindingReturnsCopy) {
    GestureDescriptor original = GestureBuilder::swipe({0, 0}, {100, 50}, milliseconds(200));
    GestureDescriptor bound = GestureBuilder::withParameters(original, "* id:'list'", milliseconds(30000));

    EXPECT_FALSE(original.isBound());
    EXPECT_FALSE(original.queryString().has_value());
    EXPECT_TRUE(bound.isBound());
    EXPECT_EQ(*bound.queryString(), "* id:'list'");
    EXPECT_EQ(bound.timeout()->count(), 30000);
    EXPECT_EQ(bound.kind(), original.kind());
}

TEST(GestureParametersTest, BoundJsonCarriesQueryAndTimeoutInSeconds) {
    auto bound = GestureBuilder::withParameters(GestureBuilder::tap(50, 50), "*", milliseconds(12000));
    json j = bound.toJson();
    EXPECT_EQ(j["query_string"], "*");
    EXPECT_DOUBLE_EQ(j["timeout"].get<double>(), 12.0);
}

TEST(GestureParametersTest, RebindingReplacesParameters) {
    auto first = GestureBuilder::withParameters(GestureBuilder::tap(50, 50), "a", milliseconds(1000));
    auto second = GestureBuilder::withParameters(first, "b", milliseconds(2000));
    EXPECT_EQ(*first.queryString(), "a");
    EXPECT_EQ(*second.queryString(), "b");
    EXPECT_EQ(second.timeout()->count(), 2000);
}
