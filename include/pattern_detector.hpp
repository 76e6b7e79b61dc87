#pragma once

#include "candle_features.hpp"
#include "candle_types.hpp"
#include "pattern_registry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace patterns {

/// Evaluates the pattern rule table against a candle series.
///
/// Stateless apart from the baseline window, so one instance may be shared
/// across threads evaluating independent series.
class PatternDetector {
public:
  /// @param window Trailing candles used for the average body/range baselines
  /// @throws std::invalid_argument if window is zero
  explicit PatternDetector(std::size_t window = DEFAULT_BASELINE_WINDOW);

  /// Pattern names for the most recent candle; empty for an empty series
  std::vector<std::string> detect(const CandleSeries &series) const;

  /// Same as detect(), as labels
  std::vector<PatternLabel> detect_labels(const CandleSeries &series) const;

  /// Labels for the candle at `index`, looking only at candles up to it.
  /// Tiers needing more candles than are available are skipped.
  /// @throws std::out_of_range if index is past the end of features
  std::vector<PatternLabel>
  detect_at(const std::vector<CandleFeatures> &features,
            std::size_t index) const;

  /// Labels for every candle, aligned with the series
  std::vector<std::vector<PatternLabel>> scan(const CandleSeries &series) const;

  std::size_t window() const { return window_; }

private:
  std::size_t window_;
};

/// Convenience wrapper around a default PatternDetector
std::vector<std::string> detect_candlestick_patterns(const CandleSeries &series);

/// Display names for a list of labels, order preserved
std::vector<std::string> to_strings(const std::vector<PatternLabel> &labels);

} // namespace patterns
