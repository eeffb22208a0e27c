/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp
 */
#include "arena/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace arena {
namespace {
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view MetricName(Metric metric) {
  switch (metric) {
    case Metric::kTicks:
      return "ticks";
    case Metric::kFullFrames:
      return "fullFrames";
    case Metric::kDeltaFrames:
      return "deltaFrames";
    case Metric::kDroppedFrames:
      return "droppedFrames";
    case Metric::kCriticalOverflows:
      return "criticalOverflows";
    case Metric::kMalformedMessages:
      return "malformedMessages";
    case Metric::kEncodingFaults:
      return "encodingFaults";
    case Metric::kStorageFailures:
      return "storageFailures";
    case Metric::kChatFiltered:
      return "chatFiltered";
    case Metric::kHandshakesRejected:
      return "handshakesRejected";
    case Metric::kCount:
      break;
  }
  return "unknown";
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel level) : level_(level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) {
  websocket_active_.store(static_cast<std::int64_t>(count));
}

void Observability::AdjustWebsocketActive(int delta) { websocket_active_.fetch_add(delta); }

void Observability::Add(Metric metric, std::uint64_t amount) {
  counters_[static_cast<std::size_t>(metric)].fetch_add(amount);
}

std::uint64_t Observability::Get(Metric metric) const { return counters_[static_cast<std::size_t>(metric)].load(); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t queue_depth) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = static_cast<std::uint64_t>(std::max<std::int64_t>(0, websocket_active_.load()));
  snapshot.active_sessions = active_sessions;
  snapshot.queue_depth = queue_depth;
  for (std::size_t i = 0; i < counters_.size(); ++i) {
    snapshot.counters[i] = counters_[i].load();
  }
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < level_.load()) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["userId"] = *ctx.player_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(LogMutex());
  std::cout << line << std::endl;
}

}  // namespace arena
