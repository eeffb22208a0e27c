/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

LogLevel ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> player_id;
  std::optional<std::uint64_t> session_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

enum class Metric : std::size_t {
  kTicks = 0,
  kFullFrames,
  kDeltaFrames,
  kDroppedFrames,
  kCriticalOverflows,
  kMalformedMessages,
  kEncodingFaults,
  kStorageFailures,
  kChatFiltered,
  kHandshakesRejected,
  kCount,
};

std::string_view MetricName(Metric metric);

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t queue_depth{0};
  std::array<std::uint64_t, static_cast<std::size_t>(Metric::kCount)> counters{};

  std::uint64_t Get(Metric metric) const { return counters[static_cast<std::size_t>(metric)]; }
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void AdjustWebsocketActive(int delta);
  void Add(Metric metric, std::uint64_t amount = 1);
  std::uint64_t Get(Metric metric) const;
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t queue_depth) const;
  void Log(const LogContext& ctx) const;
  void SetLevel(LogLevel level) { level_.store(level); }

 private:
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::int64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(Metric::kCount)> counters_{};
  std::atomic<LogLevel> level_;
};

}  // namespace arena
