#include "pattern_detector.hpp"
#include "publisher.hpp"
#include "series_loader.hpp"

#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>

namespace {

struct ReplayOptions {
  std::string input_path;
  std::string symbol = "UNKNOWN";
  std::string timeframe = "1d";
  std::size_t window = patterns::DEFAULT_BASELINE_WINDOW;
  bool all_bars = false;
  bool publish = false;
  patterns::JetStreamConfig js;
};

void usage() {
  std::cerr << "Usage: pattern_replay --input FILE [--symbol SYM] "
            << "[--timeframe TF] [--window N] [--all-bars] [--publish] "
            << "[--nats-url URL] [--stream NAME] [--subject-root ROOT]\n";
}

bool parse_args(int argc, char **argv, ReplayOptions &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--input" && i + 1 < argc) {
      opts.input_path = argv[++i];
    } else if (arg == "--symbol" && i + 1 < argc) {
      opts.symbol = argv[++i];
    } else if (arg == "--timeframe" && i + 1 < argc) {
      opts.timeframe = argv[++i];
    } else if (arg == "--window" && i + 1 < argc) {
      opts.window = static_cast<std::size_t>(std::stoul(argv[++i]));
    } else if (arg == "--all-bars") {
      opts.all_bars = true;
    } else if (arg == "--publish") {
      opts.publish = true;
    } else if (arg == "--nats-url" && i + 1 < argc) {
      opts.js.url = argv[++i];
    } else if (arg == "--stream" && i + 1 < argc) {
      opts.js.stream = argv[++i];
    } else if (arg == "--subject-root" && i + 1 < argc) {
      opts.js.subject_root = argv[++i];
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (opts.input_path.empty()) {
    usage();
    return false;
  }
  return true;
}

void print_labels(const std::vector<std::string> &labels) {
  if (labels.empty()) {
    std::cout << "  (no patterns)\n";
    return;
  }
  for (const auto &label : labels) {
    std::cout << "  " << label << ": " << patterns::pattern_description(label)
              << "\n";
  }
}

} // namespace

int main(int argc, char **argv) {
  ReplayOptions opts;
  opts.js.url = "nats://127.0.0.1:4222";
  opts.js.stream = "MARKET";
  opts.js.subject_root = "market";

  try {
    if (!parse_args(argc, argv, opts)) {
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "invalid argument value: " << ex.what() << "\n";
    usage();
    return 1;
  }

  patterns::CandleSeries series;
  try {
    series = patterns::load_series_csv_file(opts.input_path);
  } catch (const patterns::SchemaError &ex) {
    std::cerr << "schema error in " << opts.input_path << ": " << ex.what()
              << "\n";
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }

  if (series.empty()) {
    std::cerr << "no candles read from input" << std::endl;
    return 1;
  }
  std::cout << "loaded " << series.size() << " candles for " << opts.symbol
            << std::endl;

  std::vector<std::string> last_labels;
  try {
    patterns::PatternDetector detector(opts.window);
    if (opts.all_bars) {
      auto per_bar = detector.scan(series);
      for (std::size_t i = 0; i < per_bar.size(); ++i) {
        std::cout << "bar " << i << " t=" << series[i].open_time << "\n";
        print_labels(patterns::to_strings(per_bar[i]));
      }
      last_labels = patterns::to_strings(per_bar.back());
    } else {
      last_labels = detector.detect(series);
      std::cout << "last bar t=" << series.back().open_time << "\n";
      print_labels(last_labels);
    }
  } catch (const std::exception &ex) {
    std::cerr << "detection failed: " << ex.what() << "\n";
    return 1;
  }

  if (!opts.publish) {
    return 0;
  }

  auto report =
      patterns::make_report(opts.symbol, opts.timeframe, series, last_labels);
  try {
    std::unique_ptr<patterns::PatternPublisher> publisher =
        std::make_unique<patterns::JetStreamPublisher>(opts.js);
    publisher->publish(report);
  } catch (const std::exception &ex) {
    std::cerr << "failed to publish pattern report: " << ex.what() << "\n";
    return 1;
  }

  std::cout << "published " << report.labels.size() << " patterns for "
            << report.symbol << std::endl;
  return 0;
}
