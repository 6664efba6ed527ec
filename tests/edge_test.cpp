#include "edge.hpp"
#include <gtest/gtest.h>

TEST(EdgeScrollTest, MiddleOfWindowDoesNotScroll) {
    EXPECT_FALSE(edgeScrollFor(250.0, 0.0, 500.0, 40.0, 4).has_value());
    EXPECT_FALSE(edgeScrollFor(40.0, 0.0, 500.0, 40.0, 4).has_value());
    EXPECT_FALSE(edgeScrollFor(460.0, 0.0, 500.0, 40.0, 4).has_value());
}

TEST(EdgeScrollTest, TopBandScrollsBackward) {
    const auto SCROLL = edgeScrollFor(30.0, 0.0, 500.0, 40.0, 4);
    ASSERT_TRUE(SCROLL.has_value());
    EXPECT_EQ(SCROLL->direction, SCROLL_BACKWARD);
    EXPECT_DOUBLE_EQ(SCROLL->speedMultiplier, 0.25);
}

TEST(EdgeScrollTest, BottomBandScrollsForward) {
    const auto SCROLL = edgeScrollFor(495.0, 0.0, 500.0, 40.0, 4);
    ASSERT_TRUE(SCROLL.has_value());
    EXPECT_EQ(SCROLL->direction, SCROLL_FORWARD);
    EXPECT_DOUBLE_EQ(SCROLL->speedMultiplier, 1.0);
}

TEST(EdgeScrollTest, NearbyPositionsShareAStep) {
    const auto A = edgeScrollFor(131.0, 100.0, 600.0, 40.0, 4);
    const auto B = edgeScrollFor(135.0, 100.0, 600.0, 40.0, 4);
    ASSERT_TRUE(A && B);
    EXPECT_DOUBLE_EQ(A->speedMultiplier, B->speedMultiplier);
    EXPECT_DOUBLE_EQ(A->speedMultiplier, 0.25);

    const auto DEEPER = edgeScrollFor(115.0, 100.0, 600.0, 40.0, 4);
    ASSERT_TRUE(DEEPER);
    EXPECT_DOUBLE_EQ(DEEPER->speedMultiplier, 0.75);
}

TEST(EdgeScrollTest, PastTheEdgeIsFullSpeed) {
    const auto ABOVE = edgeScrollFor(-20.0, 0.0, 500.0, 40.0, 4);
    ASSERT_TRUE(ABOVE);
    EXPECT_EQ(ABOVE->direction, SCROLL_BACKWARD);
    EXPECT_DOUBLE_EQ(ABOVE->speedMultiplier, 1.0);

    const auto BELOW = edgeScrollFor(900.0, 0.0, 500.0, 40.0, 4);
    ASSERT_TRUE(BELOW);
    EXPECT_EQ(BELOW->direction, SCROLL_FORWARD);
    EXPECT_DOUBLE_EQ(BELOW->speedMultiplier, 1.0);
}

TEST(EdgeScrollTest, ShortWindowPicksTheCloserEdge) {
    const auto SCROLL = edgeScrollFor(35.0, 0.0, 50.0, 40.0, 4);
    ASSERT_TRUE(SCROLL);
    EXPECT_EQ(SCROLL->direction, SCROLL_FORWARD);
}

TEST(EdgeScrollTest, DegenerateInput) {
    EXPECT_FALSE(edgeScrollFor(5.0, 0.0, 500.0, 0.0, 4).has_value());
    EXPECT_FALSE(edgeScrollFor(5.0, 500.0, 500.0, 40.0, 4).has_value());

    const auto ONESTEP = edgeScrollFor(39.0, 0.0, 500.0, 40.0, 0);
    ASSERT_TRUE(ONESTEP);
    EXPECT_DOUBLE_EQ(ONESTEP->speedMultiplier, 1.0);
}
