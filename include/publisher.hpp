#pragma once

#include "candle_types.hpp"
#include "summary.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace ta {

/// Abstract publisher interface for delivering analysis reports.
class ReportPublisher {
public:
  virtual ~ReportPublisher() = default;

  /// Publish the report computed for a symbol and timeframe.
  virtual void publish(const std::string &symbol, Timeframe timeframe,
                       const AnalysisReport &report) = 0;
};

/// One recorded publish() call
struct PublishedReport {
  std::string symbol;
  Timeframe timeframe;
  AnalysisReport report;
};

/// In-memory publisher used for tests and dry runs.
class InMemoryReportPublisher : public ReportPublisher {
public:
  void publish(const std::string &symbol, Timeframe timeframe,
               const AnalysisReport &report) override;

  std::vector<PublishedReport> snapshot() const;

private:
  mutable std::mutex mutex_;
  std::vector<PublishedReport> published_;
};

/// Replace every character outside [A-Za-z0-9-] with '_' so the token is a
/// single subject element
std::string sanitize_subject_token(const std::string &token);

/// <subject_root>.report.<timeframe>.<sanitized symbol>
std::string report_subject(const std::string &subject_root,
                           const std::string &symbol, Timeframe timeframe);

/// JetStream dedupe id: one message per subject and last candle time, so a
/// replayed series does not publish the same report twice
std::string report_message_id(const std::string &subject,
                              const AnalysisReport &report);

/// Compute the summary and hand it to `publisher`.
/// @return the summary status; nothing is published unless it is Ok
SummaryStatus publish_summary(ReportPublisher &publisher, SeriesView series,
                              const std::string &symbol, Timeframe timeframe,
                              const SummaryConfig &config = SummaryConfig{});

} // namespace ta
