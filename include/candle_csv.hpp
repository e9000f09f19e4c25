#pragma once

#include "candle_types.hpp"

#include <istream>
#include <optional>
#include <string>

namespace ta {

/// Parse one `time,open,high,low,close,volume` line.
/// Returns nullopt for blank lines, `#` comments and a non-numeric header.
/// @throws std::invalid_argument for a line with missing or malformed fields
std::optional<Candle> parse_candle_line(const std::string &line);

/// Read every candle from `in`, skipping (and reporting on stderr) malformed
/// lines, then normalize the series (sorted by time, unique timestamps).
CandleSeries read_candles_csv(std::istream &in);

/// read_candles_csv() on a file
/// @throws std::runtime_error if the file cannot be opened
CandleSeries load_candles_csv(const std::string &path);

} // namespace ta
