#include "jetstream_publisher.hpp"
#include "report_codec.hpp"

#include <limits>
#include <memory>
#include <stdexcept>

#include <nats.h>

namespace ta {

namespace {

constexpr const char *DEFAULT_URL = "nats://127.0.0.1:4222";

using OptionsPtr = std::unique_ptr<natsOptions, decltype(&natsOptions_Destroy)>;

void check(natsStatus status, const char *call) {
  if (status == NATS_OK) {
    return;
  }
  const char *text = natsStatus_GetText(status);
  throw std::runtime_error(std::string(call) + " failed: " +
                           (text != nullptr ? text : "unknown"));
}

} // namespace

JetStreamReportPublisher::JetStreamReportPublisher(const JetStreamConfig &config)
    : config_(config) {
  if (config_.url.empty()) {
    config_.url = DEFAULT_URL;
  }

  natsOptions *raw_opts = nullptr;
  check(natsOptions_Create(&raw_opts), "natsOptions_Create");
  OptionsPtr opts(raw_opts, &natsOptions_Destroy);
  check(natsOptions_SetURL(opts.get(), config_.url.c_str()), "natsOptions_SetURL");
  check(natsConnection_Connect(&conn_, opts.get()), "natsConnection_Connect");

  try {
    check(natsConnection_JetStream(&js_, conn_, nullptr), "natsConnection_JetStream");
  } catch (...) {
    close();
    throw;
  }
}

JetStreamReportPublisher::~JetStreamReportPublisher() { close(); }

void JetStreamReportPublisher::close() {
  if (js_ != nullptr) {
    jsCtx_Destroy(js_);
    js_ = nullptr;
  }
  if (conn_ != nullptr) {
    natsConnection_Close(conn_);
    natsConnection_Destroy(conn_);
    conn_ = nullptr;
  }
}

void JetStreamReportPublisher::publish(const std::string &symbol,
                                       Timeframe timeframe,
                                       const AnalysisReport &report) {
  if (js_ == nullptr) {
    throw std::runtime_error("JetStream context not initialized");
  }

  const std::string payload = serialize_report(report, symbol, timeframe);
  if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("report payload too large for js_Publish");
  }

  const std::string subject =
      report_subject(config_.subject_root, symbol, timeframe);
  const std::string msg_id = report_message_id(subject, report);

  jsPubOptions opts;
  jsPubOptions_Init(&opts);
  if (!config_.stream.empty()) {
    opts.ExpectStream = config_.stream.c_str();
  }
  opts.MsgId = msg_id.c_str();
  if (config_.publish_timeout.count() > 0) {
    opts.MaxWait = config_.publish_timeout.count();
  }

  jsPubAck *ack = nullptr;
  jsErrCode err_code = static_cast<jsErrCode>(0);
  natsStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = js_Publish(&ack, js_, subject.c_str(), payload.data(),
                        static_cast<int>(payload.size()), &opts, &err_code);
  }
  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }

  if (status != NATS_OK) {
    const char *text = natsStatus_GetText(status);
    throw std::runtime_error("js_Publish to " + subject + " failed: " +
                             (text != nullptr ? text : "unknown") +
                             ", jsErrCode=" + std::to_string(err_code));
  }
}

} // namespace ta
