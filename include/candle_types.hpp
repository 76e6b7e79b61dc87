#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace patterns {

/// Baseline window used for average body / range (in candles)
constexpr std::size_t DEFAULT_BASELINE_WINDOW = 20;

/// Represents a single OHLC observation
struct Candle {
  uint64_t open_time; // Unix timestamp (seconds), 0 if unknown
  double open;        // First trade price in period
  double high;        // Highest trade price in period
  double low;         // Lowest trade price in period
  double close;       // Last trade price in period
  double volume;      // Traded volume, 0 if not supplied

  Candle()
      : open_time(0), open(0.0), high(0.0), low(0.0), close(0.0),
        volume(0.0) {}

  Candle(double o, double h, double l, double c, double v = 0.0,
         uint64_t t = 0)
      : open_time(t), open(o), high(h), low(l), close(c), volume(v) {}
};

/// Chronologically ordered candles, index 0 = oldest
using CandleSeries = std::vector<Candle>;

} // namespace patterns
