#include "publisher.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

namespace ta {

void InMemoryReportPublisher::publish(const std::string &symbol,
                                      Timeframe timeframe,
                                      const AnalysisReport &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  published_.push_back({symbol, timeframe, report});
}

std::vector<PublishedReport> InMemoryReportPublisher::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

std::string sanitize_subject_token(const std::string &token) {
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

std::string report_subject(const std::string &subject_root,
                           const std::string &symbol, Timeframe timeframe) {
  std::ostringstream subject;
  subject << subject_root << ".report." << to_string(timeframe) << '.'
          << sanitize_subject_token(symbol);
  return subject.str();
}

std::string report_message_id(const std::string &subject,
                              const AnalysisReport &report) {
  return subject + ":" + std::to_string(report.time);
}

SummaryStatus publish_summary(ReportPublisher &publisher, SeriesView series,
                              const std::string &symbol, Timeframe timeframe,
                              const SummaryConfig &config) {
  SummaryResult result = summarize(series, config);
  if (!result.ok()) {
    std::cerr << "[SKIP] symbol=" << symbol
              << " timeframe=" << to_string(timeframe)
              << " candles=" << series.size() << " reason=\"" << result.message
              << "\"\n";
    return result.status;
  }

  publisher.publish(symbol, timeframe, *result.report);

  std::cout << "[PUBLISH] symbol=" << symbol
            << " timeframe=" << to_string(timeframe)
            << " time=" << result.report->time
            << " close=" << result.report->price.current
            << " trend=\"" << to_string(result.report->trend) << "\""
            << " signals=" << result.report->signals.size() << "\n";
  return result.status;
}

} // namespace ta
