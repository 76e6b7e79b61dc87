#include "pattern_detector.hpp"

#include <stdexcept>

namespace patterns {

PatternDetector::PatternDetector(std::size_t window) : window_(window) {
    if (window_ == 0) {
        throw std::invalid_argument("window must be > 0");
    }
}

std::vector<PatternLabel>
PatternDetector::detect_at(const std::vector<CandleFeatures>& features,
                           std::size_t index) const {
    if (index >= features.size()) {
        throw std::out_of_range("detect_at index " + std::to_string(index) +
                                " past end of " +
                                std::to_string(features.size()) + " candles");
    }

    TailView tail(features, index);
    std::vector<PatternLabel> labels;
    bool doji_emitted = false;

    // Rules are grouped by arity in table order, so skipping a rule whose
    // arity exceeds the available depth drops exactly that tier
    for (const auto& rule : pattern_rules()) {
        if (rule.arity > tail.depth()) {
            continue;
        }
        if (rule.family == PatternFamily::DOJI && doji_emitted) {
            continue;
        }
        if (!rule.matches(tail)) {
            continue;
        }

        labels.push_back(rule.label);
        if (rule.family == PatternFamily::DOJI) {
            doji_emitted = true;
        }
    }

    return labels;
}

std::vector<PatternLabel>
PatternDetector::detect_labels(const CandleSeries& series) const {
    if (series.empty()) {
        return {};
    }
    auto features = derive_features(series, window_);
    return detect_at(features, features.size() - 1);
}

std::vector<std::string>
PatternDetector::detect(const CandleSeries& series) const {
    return to_strings(detect_labels(series));
}

std::vector<std::vector<PatternLabel>>
PatternDetector::scan(const CandleSeries& series) const {
    std::vector<std::vector<PatternLabel>> result;
    result.reserve(series.size());

    auto features = derive_features(series, window_);
    for (std::size_t i = 0; i < features.size(); ++i) {
        result.push_back(detect_at(features, i));
    }
    return result;
}

std::vector<std::string> detect_candlestick_patterns(const CandleSeries& series) {
    static const PatternDetector detector;
    return detector.detect(series);
}

std::vector<std::string> to_strings(const std::vector<PatternLabel>& labels) {
    std::vector<std::string> names;
    names.reserve(labels.size());
    for (auto label : labels) {
        names.push_back(to_string(label));
    }
    return names;
}

} // namespace patterns
