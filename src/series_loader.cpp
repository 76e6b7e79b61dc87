#include "series_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace patterns {

namespace {

const char *const REQUIRED_FIELDS[] = {"open", "high", "low", "close"};

std::string trim(const std::string &value) {
  auto begin = value.begin();
  auto end = value.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }
  return std::string(begin, end);
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::vector<std::string> split_row(const std::string &line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) {
    cells.push_back(trim(cell));
  }
  // getline drops a trailing empty cell
  if (!line.empty() && line.back() == ',') {
    cells.emplace_back();
  }
  return cells;
}

bool skip_line(const std::string &line) {
  std::string trimmed = trim(line);
  return trimmed.empty() || trimmed[0] == '#';
}

double parse_number(const std::string &cell, const std::string &column,
                    std::size_t line_no) {
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(cell, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (cell.empty() || consumed != cell.size()) {
    throw SchemaError("line " + std::to_string(line_no) + ": column '" +
                      column + "' is not numeric: '" + cell + "'");
  }
  if (!std::isfinite(value)) {
    throw SchemaError("line " + std::to_string(line_no) + ": column '" +
                      column + "' is not finite: '" + cell + "'");
  }
  return value;
}

uint64_t parse_time(const std::string &cell, std::size_t line_no) {
  std::size_t consumed = 0;
  uint64_t value = 0;
  try {
    // stoull wraps negative input instead of failing
    if (!cell.empty() && cell[0] != '-') {
      value = std::stoull(cell, &consumed);
    }
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (cell.empty() || consumed != cell.size()) {
    throw SchemaError("line " + std::to_string(line_no) +
                      ": time column is not a Unix timestamp: '" + cell + "'");
  }
  return value;
}

} // namespace

Candle candle_from_fields(const std::map<std::string, double> &fields) {
  for (const char *name : REQUIRED_FIELDS) {
    auto field = fields.find(name);
    if (field == fields.end()) {
      throw SchemaError(std::string{"missing required field: "} + name);
    }
    if (!std::isfinite(field->second)) {
      throw SchemaError(std::string{"field is not finite: "} + name);
    }
  }

  Candle candle(fields.at("open"), fields.at("high"), fields.at("low"),
                fields.at("close"));

  auto volume = fields.find("volume");
  if (volume != fields.end()) {
    candle.volume = volume->second;
  }
  auto open_time = fields.find("open_time");
  if (open_time != fields.end()) {
    double seconds = open_time->second;
    // 2^64, the first value past the uint64_t range
    if (!std::isfinite(seconds) || seconds < 0.0 ||
        seconds >= 18446744073709551616.0) {
      throw SchemaError("field open_time out of range: " +
                        std::to_string(seconds));
    }
    candle.open_time = static_cast<uint64_t>(seconds);
  }
  return candle;
}

CandleSeries load_series_csv(std::istream &input) {
  CandleSeries series;
  std::string line;
  std::size_t line_no = 0;

  // Locate the header
  std::vector<std::string> header;
  while (std::getline(input, line)) {
    ++line_no;
    if (!skip_line(line)) {
      for (const auto &name : split_row(line)) {
        header.push_back(lower(name));
      }
      break;
    }
  }
  if (header.empty()) {
    throw SchemaError("input has no header row");
  }

  std::map<std::string, std::size_t> columns;
  for (std::size_t i = 0; i < header.size(); ++i) {
    columns.emplace(header[i], i);
  }
  for (const char *name : REQUIRED_FIELDS) {
    if (columns.find(name) == columns.end()) {
      throw SchemaError(std::string{"missing required column: "} + name);
    }
  }

  std::size_t volume_col = header.size();
  std::size_t time_col = header.size();
  if (columns.count("volume") != 0) {
    volume_col = columns["volume"];
  }
  for (const char *name : {"time", "timestamp", "open_time"}) {
    if (columns.count(name) != 0) {
      time_col = columns[name];
      break;
    }
  }

  while (std::getline(input, line)) {
    ++line_no;
    if (skip_line(line)) {
      continue;
    }

    std::vector<std::string> cells = split_row(line);
    if (cells.size() < header.size()) {
      throw SchemaError("line " + std::to_string(line_no) + ": expected " +
                        std::to_string(header.size()) + " columns, got " +
                        std::to_string(cells.size()));
    }

    std::map<std::string, double> fields;
    for (const char *name : REQUIRED_FIELDS) {
      fields[name] = parse_number(cells[columns[name]], name, line_no);
    }

    Candle candle = candle_from_fields(fields);
    if (volume_col < cells.size() && !cells[volume_col].empty()) {
      candle.volume = parse_number(cells[volume_col], "volume", line_no);
    }
    if (time_col < cells.size() && !cells[time_col].empty()) {
      candle.open_time = parse_time(cells[time_col], line_no);
    }
    series.push_back(candle);
  }

  return series;
}

CandleSeries load_series_csv_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("failed to open input file: " + path);
  }
  return load_series_csv(file);
}

} // namespace patterns
