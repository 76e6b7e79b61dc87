#pragma once

#include "candle_features.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace patterns {

/// Candlestick pattern vocabulary, in evaluation order
enum class PatternLabel : uint8_t {
  DOJI,
  DRAGONFLY_DOJI,
  GRAVESTONE_DOJI,
  LONG_LEGGED_DOJI,
  HAMMER,
  INVERTED_HAMMER,
  HANGING_MAN,
  SHOOTING_STAR,
  SPINNING_TOP,
  BULLISH_MARUBOZU,
  BEARISH_MARUBOZU,
  BULLISH_ENGULFING,
  BEARISH_ENGULFING,
  BULLISH_HARAMI,
  BEARISH_HARAMI,
  HARAMI_CROSS,
  PIERCING_PATTERN,
  DARK_CLOUD_COVER,
  TWEEZER_TOPS,
  TWEEZER_BOTTOMS,
  MORNING_STAR,
  EVENING_STAR,
  THREE_WHITE_SOLDIERS,
  THREE_BLACK_CROWS,
  THREE_INSIDE_UP,
  THREE_INSIDE_DOWN,
  THREE_OUTSIDE_UP,
  THREE_OUTSIDE_DOWN
};

/// Rules in the same family are mutually exclusive: first match wins
enum class PatternFamily : uint8_t { NONE, DOJI };

/// Read-only view of the candles ending at one index of a feature vector.
class TailView {
public:
  TailView(const std::vector<CandleFeatures> &features, std::size_t index)
      : features_(features), index_(index) {}

  /// Candle `offset` positions before the evaluated one (0 = evaluated)
  const CandleFeatures &back(std::size_t offset = 0) const {
    return features_[index_ - offset];
  }

  /// Number of candles available up to and including the evaluated one
  std::size_t depth() const { return index_ + 1; }

private:
  const std::vector<CandleFeatures> &features_;
  std::size_t index_;
};

/// One entry of the rule table
struct PatternRule {
  PatternLabel label;
  std::size_t arity; // Candles the rule looks at (1, 2 or 3)
  PatternFamily family;
  std::function<bool(const TailView &)> matches;
};

/// Rule table in fixed evaluation order: single-candle rules (Doji family
/// first), then two-candle, then three-candle. The Doji family lists
/// Dragonfly, Gravestone, tight Doji, Long-legged and fallback Doji, so
/// `DOJI` appears twice.
const std::vector<PatternRule> &pattern_rules();

/// Display name, e.g. "Long-legged Doji"
std::string to_string(PatternLabel label);

/// Inverse of to_string; nullopt for names outside the vocabulary
std::optional<PatternLabel> parse_label(const std::string &name);

/// Every label once, in evaluation order
const std::vector<PatternLabel> &all_labels();

/// Static description for a display name
std::string pattern_description(const std::string &name);
std::string pattern_description(PatternLabel label);

} // namespace patterns
