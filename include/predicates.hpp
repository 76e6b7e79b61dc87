#pragma once

#include "candle_features.hpp"

namespace patterns {

// ============================================================================
// Single-candle predicates
// ============================================================================
//
// `avg_body` is the trailing mean body size at the candle's index. Every
// Doji-family test fails for a zero-range candle.

bool is_doji(const CandleFeatures &c);
bool is_dragonfly_doji(const CandleFeatures &c);
bool is_gravestone_doji(const CandleFeatures &c);
bool is_long_legged_doji(const CandleFeatures &c);

/// Doji whose upper and lower shadows are both within 10% of the range
bool is_tight_doji(const CandleFeatures &c);

bool is_hammer(const CandleFeatures &c, double avg_body);
bool is_inverted_hammer(const CandleFeatures &c, double avg_body);
bool is_hanging_man(const CandleFeatures &c, double avg_body);
bool is_shooting_star(const CandleFeatures &c, double avg_body);
bool is_spinning_top(const CandleFeatures &c, double avg_body);

/// Large body with negligible shadows, either direction
bool is_marubozu(const CandleFeatures &c, double avg_body);
bool is_bullish_marubozu(const CandleFeatures &c, double avg_body);
bool is_bearish_marubozu(const CandleFeatures &c, double avg_body);

// ============================================================================
// Two-candle predicates (previous is chronologically before current)
// ============================================================================

bool is_bullish_engulfing(const CandleFeatures &current,
                          const CandleFeatures &previous);
bool is_bearish_engulfing(const CandleFeatures &current,
                          const CandleFeatures &previous);
bool is_bullish_harami(const CandleFeatures &current,
                       const CandleFeatures &previous);
bool is_bearish_harami(const CandleFeatures &current,
                       const CandleFeatures &previous);

/// Either harami where the current candle is itself a doji
bool is_harami_cross(const CandleFeatures &current,
                     const CandleFeatures &previous);

bool is_piercing_pattern(const CandleFeatures &current,
                         const CandleFeatures &previous);
bool is_dark_cloud_cover(const CandleFeatures &current,
                         const CandleFeatures &previous);
bool is_tweezer_tops(const CandleFeatures &current,
                     const CandleFeatures &previous);
bool is_tweezer_bottoms(const CandleFeatures &current,
                        const CandleFeatures &previous);

// ============================================================================
// Three-candle predicates (first, second, third in chronological order)
// ============================================================================

bool is_morning_star(const CandleFeatures &first, const CandleFeatures &second,
                     const CandleFeatures &third);
bool is_evening_star(const CandleFeatures &first, const CandleFeatures &second,
                     const CandleFeatures &third);
bool is_three_white_soldiers(const CandleFeatures &first,
                             const CandleFeatures &second,
                             const CandleFeatures &third);
bool is_three_black_crows(const CandleFeatures &first,
                          const CandleFeatures &second,
                          const CandleFeatures &third);
bool is_three_inside_up(const CandleFeatures &first,
                        const CandleFeatures &second,
                        const CandleFeatures &third);
bool is_three_inside_down(const CandleFeatures &first,
                          const CandleFeatures &second,
                          const CandleFeatures &third);
bool is_three_outside_up(const CandleFeatures &first,
                         const CandleFeatures &second,
                         const CandleFeatures &third);
bool is_three_outside_down(const CandleFeatures &first,
                           const CandleFeatures &second,
                           const CandleFeatures &third);

} // namespace patterns
