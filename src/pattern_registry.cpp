#include "pattern_registry.hpp"
#include "predicates.hpp"

namespace patterns {

namespace {

struct LabelInfo {
  PatternLabel label;
  const char *name;
  const char *description;
};

const std::vector<LabelInfo> &label_table() {
  static const std::vector<LabelInfo> table = {
      {PatternLabel::DOJI, "Doji",
       "A doji occurs when the open and close prices are virtually equal, "
       "indicating indecision in the market."},
      {PatternLabel::DRAGONFLY_DOJI, "Dragonfly Doji",
       "A doji with a long lower shadow and virtually no upper shadow."},
      {PatternLabel::GRAVESTONE_DOJI, "Gravestone Doji",
       "A doji with a long upper shadow and virtually no lower shadow."},
      {PatternLabel::LONG_LEGGED_DOJI, "Long-legged Doji",
       "A doji with long upper and lower shadows."},
      {PatternLabel::HAMMER, "Hammer",
       "A bullish reversal pattern with a small body at the top and a long "
       "lower shadow."},
      {PatternLabel::INVERTED_HAMMER, "Inverted Hammer",
       "A bullish reversal pattern with a small body at the bottom and a long "
       "upper shadow."},
      {PatternLabel::HANGING_MAN, "Hanging Man",
       "A bearish reversal pattern that looks like a hammer but appears after "
       "an uptrend."},
      {PatternLabel::SHOOTING_STAR, "Shooting Star",
       "A bearish reversal pattern with a small body at the bottom and a long "
       "upper shadow."},
      {PatternLabel::SPINNING_TOP, "Spinning Top",
       "A pattern indicating indecision with small body and long shadows."},
      {PatternLabel::BULLISH_MARUBOZU, "Bullish Marubozu",
       "A strong bullish candle with no shadows."},
      {PatternLabel::BEARISH_MARUBOZU, "Bearish Marubozu",
       "A strong bearish candle with no shadows."},
      {PatternLabel::BULLISH_ENGULFING, "Bullish Engulfing",
       "A bullish reversal pattern where the current candle completely "
       "engulfs the previous bearish candle."},
      {PatternLabel::BEARISH_ENGULFING, "Bearish Engulfing",
       "A bearish reversal pattern where the current candle completely "
       "engulfs the previous bullish candle."},
      {PatternLabel::BULLISH_HARAMI, "Bullish Harami",
       "A bullish reversal pattern where a small bullish candle is contained "
       "within the previous bearish candle."},
      {PatternLabel::BEARISH_HARAMI, "Bearish Harami",
       "A bearish reversal pattern where a small bearish candle is contained "
       "within the previous bullish candle."},
      {PatternLabel::HARAMI_CROSS, "Harami Cross",
       "A harami pattern where the second candle is a doji."},
      {PatternLabel::PIERCING_PATTERN, "Piercing Pattern",
       "A bullish reversal pattern where the current candle opens below the "
       "previous low but closes above the midpoint."},
      {PatternLabel::DARK_CLOUD_COVER, "Dark Cloud Cover",
       "A bearish reversal pattern where the current candle opens above the "
       "previous high but closes below the midpoint."},
      {PatternLabel::TWEEZER_TOPS, "Tweezer Tops",
       "Two candles with identical highs, indicating resistance."},
      {PatternLabel::TWEEZER_BOTTOMS, "Tweezer Bottoms",
       "Two candles with identical lows, indicating support."},
      {PatternLabel::MORNING_STAR, "Morning Star",
       "A bullish reversal pattern with a bearish candle, a small-bodied "
       "candle, and a bullish candle."},
      {PatternLabel::EVENING_STAR, "Evening Star",
       "A bearish reversal pattern with a bullish candle, a small-bodied "
       "candle, and a bearish candle."},
      {PatternLabel::THREE_WHITE_SOLDIERS, "Three White Soldiers",
       "Three consecutive bullish candles with higher opens and closes."},
      {PatternLabel::THREE_BLACK_CROWS, "Three Black Crows",
       "Three consecutive bearish candles with lower opens and closes."},
      {PatternLabel::THREE_INSIDE_UP, "Three Inside Up",
       "A bullish reversal pattern with a bearish candle, a harami, and a "
       "bullish candle."},
      {PatternLabel::THREE_INSIDE_DOWN, "Three Inside Down",
       "A bearish reversal pattern with a bullish candle, a harami, and a "
       "bearish candle."},
      {PatternLabel::THREE_OUTSIDE_UP, "Three Outside Up",
       "A bullish reversal pattern with a bearish candle, an engulfing, and a "
       "bullish candle."},
      {PatternLabel::THREE_OUTSIDE_DOWN, "Three Outside Down",
       "A bearish reversal pattern with a bullish candle, an engulfing, and a "
       "bearish candle."},
  };
  return table;
}

const LabelInfo *find_info(PatternLabel label) {
  for (const auto &info : label_table()) {
    if (info.label == label) {
      return &info;
    }
  }
  return nullptr;
}

// Adapters from the uniform rule signature to each predicate arity

PatternRule one_candle(PatternLabel label,
                       bool (*predicate)(const CandleFeatures &),
                       PatternFamily family = PatternFamily::NONE) {
  return PatternRule{label, 1, family, [predicate](const TailView &tail) {
                       return predicate(tail.back());
                     }};
}

PatternRule one_candle_baseline(
    PatternLabel label, bool (*predicate)(const CandleFeatures &, double)) {
  return PatternRule{label, 1, PatternFamily::NONE,
                     [predicate](const TailView &tail) {
                       const CandleFeatures &c = tail.back();
                       return predicate(c, c.avg_body_size);
                     }};
}

PatternRule two_candle(PatternLabel label,
                       bool (*predicate)(const CandleFeatures &,
                                         const CandleFeatures &)) {
  return PatternRule{label, 2, PatternFamily::NONE,
                     [predicate](const TailView &tail) {
                       return predicate(tail.back(0), tail.back(1));
                     }};
}

PatternRule three_candle(PatternLabel label,
                         bool (*predicate)(const CandleFeatures &,
                                           const CandleFeatures &,
                                           const CandleFeatures &)) {
  return PatternRule{label, 3, PatternFamily::NONE,
                     [predicate](const TailView &tail) {
                       return predicate(tail.back(2), tail.back(1),
                                        tail.back(0));
                     }};
}

std::vector<PatternRule> build_rules() {
  using L = PatternLabel;
  const auto doji = PatternFamily::DOJI;

  std::vector<PatternRule> rules;
  rules.reserve(32);

  // Doji family, highest priority first
  rules.push_back(one_candle(L::DRAGONFLY_DOJI, is_dragonfly_doji, doji));
  rules.push_back(one_candle(L::GRAVESTONE_DOJI, is_gravestone_doji, doji));
  rules.push_back(one_candle(L::DOJI, is_tight_doji, doji));
  rules.push_back(one_candle(L::LONG_LEGGED_DOJI, is_long_legged_doji, doji));
  rules.push_back(one_candle(L::DOJI, is_doji, doji));

  rules.push_back(one_candle_baseline(L::HAMMER, is_hammer));
  rules.push_back(one_candle_baseline(L::INVERTED_HAMMER, is_inverted_hammer));
  rules.push_back(one_candle_baseline(L::HANGING_MAN, is_hanging_man));
  rules.push_back(one_candle_baseline(L::SHOOTING_STAR, is_shooting_star));
  rules.push_back(one_candle_baseline(L::SPINNING_TOP, is_spinning_top));
  rules.push_back(one_candle_baseline(L::BULLISH_MARUBOZU, is_bullish_marubozu));
  rules.push_back(one_candle_baseline(L::BEARISH_MARUBOZU, is_bearish_marubozu));

  rules.push_back(two_candle(L::BULLISH_ENGULFING, is_bullish_engulfing));
  rules.push_back(two_candle(L::BEARISH_ENGULFING, is_bearish_engulfing));
  rules.push_back(two_candle(L::BULLISH_HARAMI, is_bullish_harami));
  rules.push_back(two_candle(L::BEARISH_HARAMI, is_bearish_harami));
  rules.push_back(two_candle(L::HARAMI_CROSS, is_harami_cross));
  rules.push_back(two_candle(L::PIERCING_PATTERN, is_piercing_pattern));
  rules.push_back(two_candle(L::DARK_CLOUD_COVER, is_dark_cloud_cover));
  rules.push_back(two_candle(L::TWEEZER_TOPS, is_tweezer_tops));
  rules.push_back(two_candle(L::TWEEZER_BOTTOMS, is_tweezer_bottoms));

  rules.push_back(three_candle(L::MORNING_STAR, is_morning_star));
  rules.push_back(three_candle(L::EVENING_STAR, is_evening_star));
  rules.push_back(three_candle(L::THREE_WHITE_SOLDIERS, is_three_white_soldiers));
  rules.push_back(three_candle(L::THREE_BLACK_CROWS, is_three_black_crows));
  rules.push_back(three_candle(L::THREE_INSIDE_UP, is_three_inside_up));
  rules.push_back(three_candle(L::THREE_INSIDE_DOWN, is_three_inside_down));
  rules.push_back(three_candle(L::THREE_OUTSIDE_UP, is_three_outside_up));
  rules.push_back(three_candle(L::THREE_OUTSIDE_DOWN, is_three_outside_down));

  return rules;
}

} // namespace

const std::vector<PatternRule> &pattern_rules() {
  static const std::vector<PatternRule> rules = build_rules();
  return rules;
}

std::string to_string(PatternLabel label) {
  const LabelInfo *info = find_info(label);
  return info != nullptr ? std::string{info->name} : std::string{"Unknown"};
}

std::optional<PatternLabel> parse_label(const std::string &name) {
  for (const auto &info : label_table()) {
    if (name == info.name) {
      return info.label;
    }
  }
  return std::nullopt;
}

const std::vector<PatternLabel> &all_labels() {
  static const std::vector<PatternLabel> labels = [] {
    std::vector<PatternLabel> out;
    out.reserve(label_table().size());
    for (const auto &info : label_table()) {
      out.push_back(info.label);
    }
    return out;
  }();
  return labels;
}

std::string pattern_description(const std::string &name) {
  auto label = parse_label(name);
  if (!label) {
    return "Pattern description not available.";
  }
  return pattern_description(*label);
}

std::string pattern_description(PatternLabel label) {
  const LabelInfo *info = find_info(label);
  return info != nullptr ? std::string{info->description}
                         : std::string{"Pattern description not available."};
}

} // namespace patterns
