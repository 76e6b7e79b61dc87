#pragma once

#include "candle_types.hpp"

#include <cstddef>
#include <vector>

namespace patterns {

/// Geometry of one candle plus the trailing baselines at its index
struct CandleFeatures {
  // Raw prices, kept so multi-candle predicates can compare levels
  double open;
  double high;
  double low;
  double close;

  double body;         // close - open (signed)
  double body_size;    // |body|
  double upper_shadow; // high - max(open, close)
  double lower_shadow; // min(open, close) - low
  double total_size;   // high - low
  bool is_bullish;     // body > 0
  bool is_bearish;     // body < 0

  double avg_body_size;  // Trailing mean of body_size
  double avg_total_size; // Trailing mean of total_size

  CandleFeatures()
      : open(0.0), high(0.0), low(0.0), close(0.0), body(0.0), body_size(0.0),
        upper_shadow(0.0), lower_shadow(0.0), total_size(0.0),
        is_bullish(false), is_bearish(false), avg_body_size(0.0),
        avg_total_size(0.0) {}
};

/// Fixed-capacity trailing mean over the most recent samples.
///
/// Samples live in a ring buffer of `capacity` slots. Until the buffer fills,
/// the mean covers every sample pushed so far (minimum sample size 1).
class RollingMean {
public:
  /// @param capacity Number of trailing samples to average
  /// @throws std::invalid_argument if capacity is zero
  explicit RollingMean(std::size_t capacity);

  /// Add a sample and return the mean of the current window
  double push(double value);

  /// Mean of the current window (0 if nothing has been pushed)
  double mean() const;

  std::size_t size() const { return count_; }
  std::size_t capacity() const { return samples_.size(); }

private:
  std::vector<double> samples_;
  std::size_t next_;
  std::size_t count_;
};

/// Compute geometry for a single candle; baselines are left at zero
CandleFeatures derive_candle(const Candle &candle);

/// Compute aligned features for every candle in the series.
///
/// Baselines at index i average indices [max(0, i - window + 1), i].
/// @throws std::invalid_argument if window is zero
std::vector<CandleFeatures>
derive_features(const CandleSeries &series,
                std::size_t window = DEFAULT_BASELINE_WINDOW);

} // namespace patterns
