#include "candle_features.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace patterns {

// ============================================================================
// RollingMean Implementation
// ============================================================================

RollingMean::RollingMean(std::size_t capacity)
    : samples_(capacity, 0.0), next_(0), count_(0) {
    if (capacity == 0) {
        throw std::invalid_argument("rolling window must be > 0");
    }
}

double RollingMean::push(double value) {
    samples_[next_] = value;
    next_ = (next_ + 1) % samples_.size();
    if (count_ < samples_.size()) {
        count_++;
    }
    return mean();
}

double RollingMean::mean() const {
    if (count_ == 0) {
        return 0.0;
    }

    // Sum the live slots oldest-first so the result only depends on the
    // samples inside the window, not on how many were evicted before them
    double sum = 0.0;
    std::size_t start = (next_ + samples_.size() - count_) % samples_.size();
    for (std::size_t i = 0; i < count_; ++i) {
        sum += samples_[(start + i) % samples_.size()];
    }
    return sum / static_cast<double>(count_);
}

// ============================================================================
// Feature Derivation
// ============================================================================

CandleFeatures derive_candle(const Candle& candle) {
    CandleFeatures f;
    f.open = candle.open;
    f.high = candle.high;
    f.low = candle.low;
    f.close = candle.close;

    f.body = candle.close - candle.open;
    f.body_size = std::abs(f.body);
    f.upper_shadow = candle.high - std::max(candle.open, candle.close);
    f.lower_shadow = std::min(candle.open, candle.close) - candle.low;
    f.total_size = candle.high - candle.low;
    f.is_bullish = f.body > 0.0;
    f.is_bearish = f.body < 0.0;
    return f;
}

std::vector<CandleFeatures> derive_features(const CandleSeries& series,
                                            std::size_t window) {
    if (window == 0) {
        throw std::invalid_argument("baseline window must be > 0");
    }

    std::vector<CandleFeatures> features;
    if (series.empty()) {
        return features;
    }
    features.reserve(series.size());

    // A window wider than the series never fills
    std::size_t capacity = std::min(window, series.size());
    RollingMean body_mean(capacity);
    RollingMean total_mean(capacity);

    for (const auto& candle : series) {
        CandleFeatures f = derive_candle(candle);
        f.avg_body_size = body_mean.push(f.body_size);
        f.avg_total_size = total_mean.push(f.total_size);
        features.push_back(f);
    }

    return features;
}

} // namespace patterns
