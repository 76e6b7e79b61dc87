#pragma once

#include "candle_types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace patterns {

struct JetStreamConfig {
  std::string url;
  std::string stream;
  std::string subject_root;
  std::chrono::milliseconds publish_timeout{500};
};

/// Patterns found on the last candle of one series
struct PatternReport {
  std::string symbol;
  std::string timeframe;
  uint64_t bar_time{0};       // open_time of the labelled candle
  uint32_t series_length{0};  // candles in the evaluated series
  std::vector<std::string> labels;
  std::vector<Candle> tail;   // up to the last three candles, oldest first
};

/// Assemble a report for the last candle of `series`
PatternReport make_report(const std::string &symbol,
                          const std::string &timeframe,
                          const CandleSeries &series,
                          const std::vector<std::string> &labels);

/// Abstract publisher interface for emitting detection reports.
class PatternPublisher {
public:
  virtual ~PatternPublisher() = default;

  virtual void publish(const PatternReport &report) = 0;
};

/// In-memory publisher used for tests and dry runs.
class InMemoryPublisher : public PatternPublisher {
public:
  void publish(const PatternReport &report) override;

  std::vector<PatternReport> snapshot() const;

private:
  mutable std::mutex mutex_;
  std::vector<PatternReport> emitted_;
};

/// JetStream publisher that serializes reports to protobuf and writes to NATS.
class JetStreamPublisher : public PatternPublisher {
public:
  explicit JetStreamPublisher(const JetStreamConfig &config);
  ~JetStreamPublisher() override;

  JetStreamPublisher(const JetStreamPublisher &) = delete;
  JetStreamPublisher &operator=(const JetStreamPublisher &) = delete;

  void publish(const PatternReport &report) override;

  /// Serialized protobuf payload for a report
  static std::string encode(const PatternReport &report);

private:
  struct Connection; // NATS connection and JetStream context

  JetStreamConfig config_;
  std::unique_ptr<Connection> conn_;
  mutable std::mutex mutex_;
};

/// Replace characters not valid in a NATS subject token with '_'
std::string sanitize_token(const std::string &token);

/// Subject for a report: {root}.patterns.{timeframe}.{symbol}
/// An empty timeframe publishes under "raw".
std::string build_subject(const std::string &subject_root,
                          const PatternReport &report);

/// JetStream de-duplication id `{subject}:{bar_time}`, or empty when the
/// report carries no bar time and cannot be told apart from earlier ones.
std::string report_msg_id(const std::string &subject,
                          const PatternReport &report);

} // namespace patterns
