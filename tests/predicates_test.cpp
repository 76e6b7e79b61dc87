#include <gtest/gtest.h>
#include "predicates.hpp"

using namespace patterns;

namespace {

CandleFeatures make(double open, double high, double low, double close) {
    return derive_candle(Candle(open, high, low, close));
}

} // namespace

// ============================================================================
// Doji Family
// ============================================================================

TEST(DojiPredicateTest, FlatBodyWithRangeIsDoji) {
    auto c = make(100.0, 100.05, 99.95, 100.0);
    EXPECT_TRUE(is_doji(c));
    EXPECT_TRUE(is_long_legged_doji(c));
    EXPECT_FALSE(is_dragonfly_doji(c));
    EXPECT_FALSE(is_gravestone_doji(c));
    EXPECT_FALSE(is_tight_doji(c));
}

TEST(DojiPredicateTest, BodyAtTenPercentBoundary) {
    // body 1, range 10
    EXPECT_TRUE(is_doji(make(100.0, 105.0, 95.0, 101.0)));
    // body 2, range 10
    EXPECT_FALSE(is_doji(make(100.0, 105.0, 95.0, 102.0)));
}

TEST(DojiPredicateTest, ZeroRangeCandleFailsEveryDojiTest) {
    auto c = make(100.0, 100.0, 100.0, 100.0);
    EXPECT_EQ(c.total_size, 0.0);
    EXPECT_FALSE(is_doji(c));
    EXPECT_FALSE(is_dragonfly_doji(c));
    EXPECT_FALSE(is_gravestone_doji(c));
    EXPECT_FALSE(is_long_legged_doji(c));
    EXPECT_FALSE(is_tight_doji(c));
}

TEST(DojiPredicateTest, Dragonfly) {
    // Open/close at the high with a long lower shadow
    auto c = make(100.0, 100.0, 90.0, 100.0);
    EXPECT_TRUE(is_dragonfly_doji(c));
    EXPECT_FALSE(is_gravestone_doji(c));
}

TEST(DojiPredicateTest, Gravestone) {
    auto c = make(100.0, 110.0, 100.0, 100.0);
    EXPECT_TRUE(is_gravestone_doji(c));
    EXPECT_FALSE(is_dragonfly_doji(c));
}

TEST(DojiPredicateTest, TightShadows) {
    // Shadows and body always sum to the range for a derived candle, so the
    // tight branch is only reachable with hand-built features
    auto c = make(100.0, 101.2, 99.8, 101.0);
    c.total_size = 10.4;
    EXPECT_TRUE(is_tight_doji(c));
    EXPECT_FALSE(is_tight_doji(make(100.0, 101.2, 99.8, 101.0)));
}

// ============================================================================
// Baseline-relative single-candle predicates
// ============================================================================

TEST(SingleCandlePredicateTest, Hammer) {
    auto c = make(100.0, 102.0, 90.0, 101.0);
    EXPECT_TRUE(is_hammer(c, 3.1));
    EXPECT_FALSE(is_hanging_man(c, 3.1)); // bullish
    EXPECT_FALSE(is_inverted_hammer(c, 3.1));
}

TEST(SingleCandlePredicateTest, HangingManIsBearishHammer) {
    auto c = make(101.0, 102.0, 90.0, 100.0);
    EXPECT_TRUE(is_hammer(c, 3.0));
    EXPECT_TRUE(is_hanging_man(c, 3.0));
}

TEST(SingleCandlePredicateTest, InvertedHammerAndShootingStar) {
    auto bullish = make(100.0, 110.0, 99.5, 101.0);
    EXPECT_TRUE(is_inverted_hammer(bullish, 3.0));
    EXPECT_FALSE(is_shooting_star(bullish, 3.0));

    auto bearish = make(101.0, 110.0, 99.5, 100.0);
    EXPECT_TRUE(is_inverted_hammer(bearish, 3.0));
    EXPECT_TRUE(is_shooting_star(bearish, 3.0));
}

TEST(SingleCandlePredicateTest, SpinningTop) {
    auto c = make(100.0, 105.0, 95.0, 101.0);
    EXPECT_TRUE(is_spinning_top(c, 3.0));
    EXPECT_FALSE(is_spinning_top(c, 5.0));
}

TEST(SingleCandlePredicateTest, ZeroBaselineFailsRelativeTests) {
    auto c = make(100.0, 105.0, 95.0, 101.0);
    EXPECT_FALSE(is_hammer(c, 0.0));
    EXPECT_FALSE(is_inverted_hammer(c, 0.0));
    EXPECT_FALSE(is_spinning_top(c, 0.0));
}

TEST(SingleCandlePredicateTest, Marubozu) {
    auto bullish = make(100.0, 110.2, 99.8, 110.0);
    EXPECT_TRUE(is_marubozu(bullish, 3.0));
    EXPECT_TRUE(is_bullish_marubozu(bullish, 3.0));
    EXPECT_FALSE(is_bearish_marubozu(bullish, 3.0));

    auto bearish = make(110.0, 110.2, 99.8, 100.0);
    EXPECT_TRUE(is_bearish_marubozu(bearish, 3.0));
    EXPECT_FALSE(is_bullish_marubozu(bearish, 3.0));

    // Body not large enough relative to the baseline
    EXPECT_FALSE(is_marubozu(bullish, 6.0));
    // Upper shadow of 2 on a body of 10
    EXPECT_FALSE(is_marubozu(make(100.0, 112.0, 99.8, 110.0), 3.0));
}

// ============================================================================
// Two-candle predicates
// ============================================================================

TEST(TwoCandlePredicateTest, BullishEngulfing) {
    auto previous = make(120.0, 128.0, 94.0, 115.0);
    auto current = make(95.0, 125.0, 94.0, 124.0);
    EXPECT_TRUE(is_bullish_engulfing(current, previous));
    EXPECT_FALSE(is_bearish_engulfing(current, previous));
}

TEST(TwoCandlePredicateTest, BearishEngulfing) {
    auto previous = make(100.0, 106.0, 99.0, 105.0);
    auto current = make(107.0, 108.0, 97.0, 98.0);
    EXPECT_TRUE(is_bearish_engulfing(current, previous));
    EXPECT_FALSE(is_bullish_engulfing(current, previous));
}

TEST(TwoCandlePredicateTest, BullishHaramiAndCross) {
    auto previous = make(110.0, 111.0, 99.0, 100.0);
    auto inside = make(103.0, 106.0, 102.0, 105.0);
    EXPECT_TRUE(is_bullish_harami(inside, previous));
    EXPECT_FALSE(is_harami_cross(inside, previous));

    auto inside_doji = make(104.0, 106.0, 102.0, 104.1);
    EXPECT_TRUE(is_bullish_harami(inside_doji, previous));
    EXPECT_TRUE(is_harami_cross(inside_doji, previous));
}

TEST(TwoCandlePredicateTest, BearishHarami) {
    auto previous = make(100.0, 111.0, 99.0, 110.0);
    auto inside = make(106.0, 107.0, 102.0, 103.0);
    EXPECT_TRUE(is_bearish_harami(inside, previous));
    EXPECT_FALSE(is_bullish_harami(inside, previous));
}

TEST(TwoCandlePredicateTest, PiercingAndDarkCloud) {
    auto bearish = make(110.0, 111.0, 100.0, 101.0);
    auto piercing = make(99.0, 108.0, 98.0, 107.0);
    EXPECT_TRUE(is_piercing_pattern(piercing, bearish));
    // Close below previous close + half body (105.5)
    EXPECT_FALSE(is_piercing_pattern(make(99.0, 106.0, 98.0, 105.0), bearish));

    auto bullish = make(100.0, 110.0, 99.0, 109.0);
    auto cloud = make(111.0, 112.0, 102.0, 103.0);
    EXPECT_TRUE(is_dark_cloud_cover(cloud, bullish));
    EXPECT_FALSE(is_dark_cloud_cover(make(109.5, 112.0, 102.0, 103.0), bullish));
}

TEST(TwoCandlePredicateTest, Tweezers) {
    auto up = make(100.0, 110.0, 99.0, 108.0);
    auto down = make(108.0, 110.5, 101.0, 102.0);
    EXPECT_TRUE(is_tweezer_tops(down, up));
    EXPECT_FALSE(is_tweezer_bottoms(down, up));

    auto falling = make(108.0, 109.0, 100.0, 101.0);
    auto rising = make(101.0, 107.0, 100.2, 106.0);
    EXPECT_TRUE(is_tweezer_bottoms(rising, falling));
    EXPECT_FALSE(is_tweezer_tops(rising, falling));
}

TEST(TwoCandlePredicateTest, TweezerBottomsWithZeroLowFails) {
    auto falling = make(2.0, 3.0, 0.0, 1.0);
    auto rising = make(1.0, 3.0, 0.0, 2.0);
    EXPECT_FALSE(is_tweezer_bottoms(rising, falling));
}

// ============================================================================
// Three-candle predicates
// ============================================================================

TEST(ThreeCandlePredicateTest, MorningAndEveningStar) {
    auto first = make(120.0, 125.0, 115.0, 118.0);
    auto second = make(115.0, 116.0, 114.0, 115.1);
    auto third = make(110.0, 126.0, 109.0, 125.0);
    EXPECT_TRUE(is_morning_star(first, second, third));
    EXPECT_FALSE(is_evening_star(first, second, third));

    auto up = make(100.0, 111.0, 99.0, 110.0);
    auto small = make(111.0, 112.0, 110.0, 111.5);
    auto down = make(109.0, 110.0, 100.0, 102.0);
    EXPECT_TRUE(is_evening_star(up, small, down));
}

TEST(ThreeCandlePredicateTest, SoldiersAndCrows) {
    auto a = make(118.0, 125.0, 115.0, 120.0);
    auto b = make(120.0, 128.0, 118.0, 122.0);
    auto c = make(122.0, 130.0, 120.0, 125.0);
    EXPECT_TRUE(is_three_white_soldiers(a, b, c));
    EXPECT_FALSE(is_three_black_crows(a, b, c));
    // Equal open is not strictly increasing
    EXPECT_FALSE(is_three_white_soldiers(a, make(118.0, 128.0, 117.0, 122.0), c));

    auto x = make(125.0, 126.0, 119.0, 120.0);
    auto y = make(122.0, 123.0, 116.0, 117.0);
    auto z = make(119.0, 120.0, 112.0, 113.0);
    EXPECT_TRUE(is_three_black_crows(x, y, z));
}

TEST(ThreeCandlePredicateTest, ThreeInsideUpAndDown) {
    auto first = make(110.0, 111.0, 99.0, 100.0);
    auto second = make(103.0, 106.0, 102.0, 105.0);
    auto third = make(105.0, 109.0, 104.0, 108.0);
    EXPECT_TRUE(is_three_inside_up(first, second, third));
    EXPECT_FALSE(is_three_inside_up(first, second, make(105.0, 106.5, 104.0, 105.5)));

    auto up = make(100.0, 111.0, 99.0, 110.0);
    auto inside = make(106.0, 107.0, 102.0, 103.0);
    auto drop = make(103.0, 104.0, 98.0, 100.0);
    EXPECT_TRUE(is_three_inside_down(up, inside, drop));
}

TEST(ThreeCandlePredicateTest, ThreeOutsideUpAndDown) {
    auto first = make(105.0, 106.0, 99.0, 100.0);
    auto engulf = make(99.0, 108.0, 98.0, 107.0);
    auto confirm = make(107.0, 112.0, 106.0, 111.0);
    EXPECT_TRUE(is_three_outside_up(first, engulf, confirm));

    auto rise = make(100.0, 106.0, 99.0, 105.0);
    auto bear_engulf = make(107.0, 108.0, 97.0, 98.0);
    auto fall = make(98.0, 99.0, 94.0, 95.0);
    EXPECT_TRUE(is_three_outside_down(rise, bear_engulf, fall));
    EXPECT_FALSE(is_three_outside_up(rise, bear_engulf, fall));
}
