#include "publisher.hpp"
#include "pattern.pb.h"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nats.h>

namespace patterns {

PatternReport make_report(const std::string &symbol,
                          const std::string &timeframe,
                          const CandleSeries &series,
                          const std::vector<std::string> &labels) {
  PatternReport report;
  report.symbol = symbol;
  report.timeframe = timeframe;
  report.series_length = static_cast<uint32_t>(series.size());
  report.labels = labels;
  if (!series.empty()) {
    report.bar_time = series.back().open_time;
    std::size_t first = series.size() > 3 ? series.size() - 3 : 0;
    report.tail.assign(series.begin() + static_cast<std::ptrdiff_t>(first),
                       series.end());
  }
  return report;
}

void InMemoryPublisher::publish(const PatternReport &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  emitted_.push_back(report);
}

std::vector<PatternReport> InMemoryPublisher::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return emitted_;
}

std::string sanitize_token(const std::string &token) {
  std::string sanitized;
  sanitized.reserve(token.size());
  for (char c : token) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
    }
  }
  return sanitized;
}

namespace {

std::string natsErrorMessage(natsStatus status) {
  const char *text = natsStatus_GetText(status);
  return text != nullptr ? std::string{text} : std::string{"unknown"};
}

} // namespace

struct JetStreamPublisher::Connection {
  natsConnection *conn{nullptr};
  jsCtx *js{nullptr};

  ~Connection() {
    if (js != nullptr) {
      jsCtx_Destroy(js);
    }
    if (conn != nullptr) {
      natsConnection_Close(conn);
      natsConnection_Destroy(conn);
    }
  }
};

JetStreamPublisher::JetStreamPublisher(const JetStreamConfig &config)
    : config_(config), conn_(std::make_unique<Connection>()) {
  natsOptions *opts = nullptr;
  natsStatus status = natsOptions_Create(&opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsOptions_Create failed: " +
                             natsErrorMessage(status));
  }

  if (config_.url.empty()) {
    config_.url = "nats://127.0.0.1:4222";
  }
  if (config_.subject_root.empty()) {
    config_.subject_root = "market";
  }

  status = natsOptions_SetURL(opts, config_.url.c_str());
  if (status != NATS_OK) {
    natsOptions_Destroy(opts);
    throw std::runtime_error("natsOptions_SetURL failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_Connect(&conn_->conn, opts);
  natsOptions_Destroy(opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsConnection_Connect failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_JetStream(&conn_->js, conn_->conn, nullptr);
  if (status != NATS_OK) {
    throw std::runtime_error("natsConnection_JetStream failed: " +
                             natsErrorMessage(status));
  }
}

JetStreamPublisher::~JetStreamPublisher() = default;

std::string build_subject(const std::string &subject_root,
                          const PatternReport &report) {
  std::ostringstream subject;
  subject << subject_root << ".patterns."
          << sanitize_token(report.timeframe.empty() ? "raw" : report.timeframe)
          << '.' << sanitize_token(report.symbol);
  return subject.str();
}

std::string report_msg_id(const std::string &subject,
                          const PatternReport &report) {
  if (report.bar_time == 0) {
    return {};
  }
  return subject + ":" + std::to_string(report.bar_time);
}

std::string JetStreamPublisher::encode(const PatternReport &report) {
  patterns::v1::PatternReport proto_report;
  proto_report.set_symbol(report.symbol);
  proto_report.set_timeframe(report.timeframe);
  proto_report.set_bar_time(report.bar_time);
  proto_report.set_series_length(report.series_length);
  for (const auto &label : report.labels) {
    proto_report.add_labels(label);
  }
  for (const auto &candle : report.tail) {
    auto *proto_candle = proto_report.add_tail();
    proto_candle->set_open_time(candle.open_time);
    proto_candle->set_open(candle.open);
    proto_candle->set_high(candle.high);
    proto_candle->set_low(candle.low);
    proto_candle->set_close(candle.close);
    proto_candle->set_volume(candle.volume);
  }

  std::string payload;
  if (!proto_report.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize pattern report protobuf");
  }
  return payload;
}

void JetStreamPublisher::publish(const PatternReport &report) {
  if (conn_->js == nullptr) {
    throw std::runtime_error("JetStream context not initialized");
  }

  std::string payload = encode(report);
  if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("payload too large for js_Publish");
  }

  jsPubAck *ack = nullptr;
  jsErrCode err_code = static_cast<jsErrCode>(0);
  std::string subject = build_subject(config_.subject_root, report);
  std::string msg_id = report_msg_id(subject, report);

  jsPubOptions opts;
  jsPubOptions_Init(&opts);
  if (!config_.stream.empty()) {
    opts.ExpectStream = config_.stream.c_str();
  }
  if (!msg_id.empty()) {
    opts.MsgId = msg_id.c_str();
  }
  if (config_.publish_timeout.count() > 0) {
    opts.MaxWait = config_.publish_timeout.count();
  }

  natsStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = js_Publish(&ack, conn_->js, subject.c_str(), payload.data(),
                        static_cast<int>(payload.size()), &opts, &err_code);
  }

  bool duplicate = ack != nullptr && ack->Duplicate;
  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }

  if (status != NATS_OK) {
    throw std::runtime_error("js_Publish failed: " + natsErrorMessage(status) +
                             ", jsErrCode=" + std::to_string(err_code));
  }
  if (duplicate) {
    throw std::runtime_error("js_Publish dropped duplicate report " + msg_id);
  }
}

} // namespace patterns
