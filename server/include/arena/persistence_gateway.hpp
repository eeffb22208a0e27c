/*
 * 설명: 플레이어 레코드 영속화 게이트웨이. 쓰기는 전용 워커 스레드에서 수행하고,
 *       실패한 쓰기는 상한이 있는 재시도 버퍼에 넣어 지수 백오프로 다시 시도한다.
 *       종료 시점 최종 점수 쓰기는 성공하거나 프로세스가 종료될 때까지 버리지 않는다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/unit/persistence_gateway_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "arena/observability.hpp"
#include "arena/player_store.hpp"

namespace arena {

enum class WriteClass {
  kInterim,
  kFinal,
};

enum class WriteStatus {
  kWritten,
  kDropped,
  kSuperseded,
  kAborted,
};

enum class LoadStatus {
  kFound,
  kNotFound,
  kUnavailable,
};

struct LoadResult {
  LoadStatus status{LoadStatus::kNotFound};
  std::optional<PlayerRecord> record;
};

struct RetryPolicy {
  std::size_t buffer_capacity{256};
  std::chrono::milliseconds base_delay{std::chrono::milliseconds(100)};
  std::chrono::milliseconds max_delay{std::chrono::milliseconds(5000)};
  std::size_t max_interim_attempts{8};
};

// attempt는 1부터 시작한다. jitter_ms는 [0, base/4] 범위 값이 들어온다.
std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, std::size_t attempt, std::int64_t jitter_ms);

class PersistenceGateway {
 public:
  PersistenceGateway(std::shared_ptr<PlayerStore> store, const RetryPolicy& policy);
  ~PersistenceGateway();

  PersistenceGateway(const PersistenceGateway&) = delete;
  PersistenceGateway& operator=(const PersistenceGateway&) = delete;

  void SetObservability(std::shared_ptr<Observability> observability);
  void Start();
  void Shutdown();

  std::shared_future<WriteStatus> UpsertPlayer(const PlayerRecord& record, WriteClass write_class);
  LoadResult LoadPlayer(const std::string& player_id);
  // 최선 노력 쓰기. 실패해도 재시도하지 않는다.
  void SaveLeaderboard(const std::string& region, std::uint64_t version, const nlohmann::json& payload);
  // 해당 플레이어의 재시도 대기 중간 쓰기를 취소한다. 최종 쓰기는 유지된다.
  std::size_t CancelInterim(const std::string& player_id);

  std::size_t PendingRetries() const;
  std::size_t PendingWrites() const;
  bool Running() const;

 private:
  struct WriteJob {
    PlayerRecord record;
    WriteClass write_class{WriteClass::kInterim};
    std::shared_ptr<std::promise<WriteStatus>> promise;
    std::size_t attempts{0};
    std::chrono::steady_clock::time_point next_attempt{};
  };

  struct LeaderboardJob {
    std::string region;
    std::uint64_t version{0};
    nlohmann::json payload;
  };

  void WorkerLoop();
  bool TryWrite(WriteJob& job);
  void TryLeaderboard(const LeaderboardJob& job);
  void ScheduleRetry(WriteJob job);
  void Resolve(WriteJob& job, WriteStatus status);
  void LogStorage(const std::string& name, const std::string& player_id, LogLevel level, nlohmann::json detail);

  std::shared_ptr<PlayerStore> store_;
  RetryPolicy policy_;
  std::shared_ptr<Observability> observability_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<WriteJob> fresh_;
  std::deque<LeaderboardJob> leaderboards_;
  std::deque<WriteJob> retries_;
  bool stopping_{false};
  bool started_{false};
  std::thread worker_;
};

}  // namespace arena
