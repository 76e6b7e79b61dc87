#pragma once

#include "candle_types.hpp"

#include <istream>
#include <map>
#include <stdexcept>
#include <string>

namespace patterns {

/// Input is missing a required OHLC field or carries a non-numeric one.
/// Fatal for the evaluation it occurred in.
class SchemaError : public std::invalid_argument {
public:
  explicit SchemaError(const std::string &what)
      : std::invalid_argument(what) {}
};

/// Build a candle from named fields.
/// Requires open, high, low and close; volume and open_time are optional.
/// @throws SchemaError naming the first missing required field
Candle candle_from_fields(const std::map<std::string, double> &fields);

/// Parse a CSV series. The first non-blank, non-comment line is the header;
/// column names are matched case-insensitively. Recognized optional columns
/// are volume and one of time / timestamp / open_time (Unix seconds).
/// @throws SchemaError on a missing required column or unparsable value
CandleSeries load_series_csv(std::istream &input);

/// @throws std::runtime_error if the file cannot be opened
/// @throws SchemaError as for load_series_csv
CandleSeries load_series_csv_file(const std::string &path);

} // namespace patterns
