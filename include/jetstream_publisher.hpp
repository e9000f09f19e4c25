#pragma once

#include "publisher.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

struct __natsConnection;
struct __jsCtx;

namespace ta {

struct JetStreamConfig {
  std::string url;
  std::string stream;
  std::string subject_root;
  std::chrono::milliseconds publish_timeout{500};
};

/// JetStream publisher that serializes reports to protobuf and writes to NATS.
/// Subject: <subject_root>.report.<timeframe>.<symbol>
class JetStreamReportPublisher : public ReportPublisher {
public:
  /// @throws std::runtime_error if the connection cannot be established
  explicit JetStreamReportPublisher(const JetStreamConfig &config);
  ~JetStreamReportPublisher() override;

  JetStreamReportPublisher(const JetStreamReportPublisher &) = delete;
  JetStreamReportPublisher &operator=(const JetStreamReportPublisher &) = delete;

  /// @throws std::runtime_error on serialization or publish failure
  void publish(const std::string &symbol, Timeframe timeframe,
               const AnalysisReport &report) override;

private:
  void close();

  JetStreamConfig config_;
  __natsConnection *conn_{nullptr};
  __jsCtx *js_{nullptr};
  mutable std::mutex mutex_;
};

} // namespace ta
