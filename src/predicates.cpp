#include "predicates.hpp"

#include <cmath>

namespace patterns {

namespace {

constexpr double SMALL_RATIO = 0.1;
constexpr double LEG_RATIO = 0.2;
constexpr double STAR_BODY_RATIO = 0.5;
constexpr double LONG_FACTOR = 2.0;

bool has_range(const CandleFeatures& c) {
    return c.total_size > 0.0;
}

bool hammer_geometry(const CandleFeatures& c, double avg_body) {
    return c.lower_shadow > LONG_FACTOR * avg_body &&
           c.upper_shadow < avg_body &&
           c.body_size < avg_body;
}

bool inverted_hammer_geometry(const CandleFeatures& c, double avg_body) {
    return c.upper_shadow > LONG_FACTOR * avg_body &&
           c.lower_shadow < avg_body &&
           c.body_size < avg_body;
}

double body_midpoint(const CandleFeatures& c) {
    return (c.open + c.close) / 2.0;
}

} // namespace

// ============================================================================
// Single-candle predicates
// ============================================================================

bool is_doji(const CandleFeatures& c) {
    return has_range(c) && c.body_size <= SMALL_RATIO * c.total_size;
}

bool is_dragonfly_doji(const CandleFeatures& c) {
    return is_doji(c) &&
           c.upper_shadow <= SMALL_RATIO * c.total_size &&
           c.lower_shadow > LONG_FACTOR * c.body_size;
}

bool is_gravestone_doji(const CandleFeatures& c) {
    return is_doji(c) &&
           c.lower_shadow <= SMALL_RATIO * c.total_size &&
           c.upper_shadow > LONG_FACTOR * c.body_size;
}

bool is_long_legged_doji(const CandleFeatures& c) {
    return is_doji(c) &&
           c.upper_shadow > LEG_RATIO * c.total_size &&
           c.lower_shadow > LEG_RATIO * c.total_size;
}

bool is_tight_doji(const CandleFeatures& c) {
    return is_doji(c) &&
           c.upper_shadow <= SMALL_RATIO * c.total_size &&
           c.lower_shadow <= SMALL_RATIO * c.total_size;
}

bool is_hammer(const CandleFeatures& c, double avg_body) {
    return hammer_geometry(c, avg_body);
}

bool is_inverted_hammer(const CandleFeatures& c, double avg_body) {
    return inverted_hammer_geometry(c, avg_body);
}

bool is_hanging_man(const CandleFeatures& c, double avg_body) {
    return hammer_geometry(c, avg_body) && c.is_bearish;
}

bool is_shooting_star(const CandleFeatures& c, double avg_body) {
    return inverted_hammer_geometry(c, avg_body) && c.is_bearish;
}

bool is_spinning_top(const CandleFeatures& c, double avg_body) {
    return c.upper_shadow > avg_body &&
           c.lower_shadow > avg_body &&
           c.body_size < avg_body;
}

bool is_marubozu(const CandleFeatures& c, double avg_body) {
    return c.body_size > LONG_FACTOR * avg_body &&
           c.upper_shadow < SMALL_RATIO * c.body_size &&
           c.lower_shadow < SMALL_RATIO * c.body_size;
}

bool is_bullish_marubozu(const CandleFeatures& c, double avg_body) {
    return is_marubozu(c, avg_body) && c.is_bullish;
}

bool is_bearish_marubozu(const CandleFeatures& c, double avg_body) {
    return is_marubozu(c, avg_body) && c.is_bearish;
}

// ============================================================================
// Two-candle predicates
// ============================================================================

bool is_bullish_engulfing(const CandleFeatures& current,
                          const CandleFeatures& previous) {
    return previous.is_bearish && current.is_bullish &&
           current.open < previous.close &&
           current.close > previous.open;
}

bool is_bearish_engulfing(const CandleFeatures& current,
                          const CandleFeatures& previous) {
    return previous.is_bullish && current.is_bearish &&
           current.open > previous.close &&
           current.close < previous.open;
}

bool is_bullish_harami(const CandleFeatures& current,
                       const CandleFeatures& previous) {
    return previous.is_bearish && current.is_bullish &&
           current.high < previous.open &&
           current.low > previous.close;
}

bool is_bearish_harami(const CandleFeatures& current,
                       const CandleFeatures& previous) {
    return previous.is_bullish && current.is_bearish &&
           current.high < previous.close &&
           current.low > previous.open;
}

bool is_harami_cross(const CandleFeatures& current,
                     const CandleFeatures& previous) {
    // Doji-ness is judged on the current candle's own range, not the baseline
    return (is_bullish_harami(current, previous) ||
            is_bearish_harami(current, previous)) &&
           is_doji(current);
}

bool is_piercing_pattern(const CandleFeatures& current,
                         const CandleFeatures& previous) {
    return previous.is_bearish && current.is_bullish &&
           current.open < previous.low &&
           current.close > previous.close + previous.body_size / 2.0;
}

bool is_dark_cloud_cover(const CandleFeatures& current,
                         const CandleFeatures& previous) {
    return previous.is_bullish && current.is_bearish &&
           current.open > previous.high &&
           current.close < previous.close - previous.body_size / 2.0;
}

bool is_tweezer_tops(const CandleFeatures& current,
                     const CandleFeatures& previous) {
    return std::abs(current.high - previous.high) < SMALL_RATIO * current.high &&
           current.is_bearish && previous.is_bullish;
}

bool is_tweezer_bottoms(const CandleFeatures& current,
                        const CandleFeatures& previous) {
    return std::abs(current.low - previous.low) < SMALL_RATIO * current.low &&
           current.is_bullish && previous.is_bearish;
}

// ============================================================================
// Three-candle predicates
// ============================================================================

bool is_morning_star(const CandleFeatures& first, const CandleFeatures& second,
                     const CandleFeatures& third) {
    return first.is_bearish &&
           second.body_size < STAR_BODY_RATIO * first.body_size &&
           third.is_bullish &&
           third.close > body_midpoint(first);
}

bool is_evening_star(const CandleFeatures& first, const CandleFeatures& second,
                     const CandleFeatures& third) {
    return first.is_bullish &&
           second.body_size < STAR_BODY_RATIO * first.body_size &&
           third.is_bearish &&
           third.close < body_midpoint(first);
}

bool is_three_white_soldiers(const CandleFeatures& first,
                             const CandleFeatures& second,
                             const CandleFeatures& third) {
    return first.is_bullish && second.is_bullish && third.is_bullish &&
           second.open > first.open && third.open > second.open &&
           second.close > first.close && third.close > second.close;
}

bool is_three_black_crows(const CandleFeatures& first,
                          const CandleFeatures& second,
                          const CandleFeatures& third) {
    return first.is_bearish && second.is_bearish && third.is_bearish &&
           second.open < first.open && third.open < second.open &&
           second.close < first.close && third.close < second.close;
}

bool is_three_inside_up(const CandleFeatures& first,
                        const CandleFeatures& second,
                        const CandleFeatures& third) {
    return first.is_bearish && is_bullish_harami(second, first) &&
           third.is_bullish && third.close > second.high;
}

bool is_three_inside_down(const CandleFeatures& first,
                          const CandleFeatures& second,
                          const CandleFeatures& third) {
    return first.is_bullish && is_bearish_harami(second, first) &&
           third.is_bearish && third.close < second.low;
}

bool is_three_outside_up(const CandleFeatures& first,
                         const CandleFeatures& second,
                         const CandleFeatures& third) {
    return first.is_bearish && is_bullish_engulfing(second, first) &&
           third.is_bullish && third.close > second.high;
}

bool is_three_outside_down(const CandleFeatures& first,
                           const CandleFeatures& second,
                           const CandleFeatures& third) {
    return first.is_bullish && is_bearish_engulfing(second, first) &&
           third.is_bearish && third.close < second.low;
}

} // namespace patterns
