#pragma once

#include "candle_types.hpp"
#include "summary.hpp"

#include <ostream>
#include <string>

namespace ta {
namespace v1 {
class AnalysisReport;
} // namespace v1

/// Copy a report into its protobuf message
void to_proto(const AnalysisReport &report, const std::string &symbol,
              Timeframe timeframe, v1::AnalysisReport *out);

/// Protobuf wire payload for a report
/// @throws std::runtime_error if serialization fails
std::string serialize_report(const AnalysisReport &report,
                             const std::string &symbol, Timeframe timeframe);

/// Human-readable multi-line rendering, one `key=value` group per line
void write_report_text(std::ostream &os, const AnalysisReport &report,
                       const std::string &symbol, Timeframe timeframe);

} // namespace ta
