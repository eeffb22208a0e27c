/*
 * 설명: 영속화 워커 스레드, 재시도 버퍼의 드롭/대체 정책, 지수 백오프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/unit/persistence_gateway_test.cpp
 */
#include "arena/persistence_gateway.hpp"

#include <algorithm>
#include <random>

namespace arena {
namespace {
std::int64_t RandomJitter(std::int64_t upper) {
  if (upper <= 0) {
    return 0;
  }
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<std::int64_t> dist(0, upper);
  return dist(gen);
}

template <typename Queue>
typename Queue::iterator FindInterim(Queue& queue, const std::string& player_id) {
  return std::find_if(queue.begin(), queue.end(), [&](const auto& job) {
    return job.write_class == WriteClass::kInterim && job.record.player_id == player_id;
  });
}
}  // namespace

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, std::size_t attempt, std::int64_t jitter_ms) {
  const auto base = std::max<std::int64_t>(1, policy.base_delay.count());
  const auto cap = std::max<std::int64_t>(base, policy.max_delay.count());
  std::int64_t delay = base;
  for (std::size_t i = 1; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, cap) + std::max<std::int64_t>(0, jitter_ms);
  return std::chrono::milliseconds(std::min(delay, cap));
}

PersistenceGateway::PersistenceGateway(std::shared_ptr<PlayerStore> store, const RetryPolicy& policy)
    : store_(std::move(store)), policy_(policy) {
  policy_.buffer_capacity = std::max<std::size_t>(1, policy_.buffer_capacity);
  policy_.max_interim_attempts = std::max<std::size_t>(1, policy_.max_interim_attempts);
}

PersistenceGateway::~PersistenceGateway() { Shutdown(); }

void PersistenceGateway::SetObservability(std::shared_ptr<Observability> observability) {
  std::lock_guard<std::mutex> lock(mutex_);
  observability_ = std::move(observability);
}

void PersistenceGateway::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_ || stopping_) {
    return;
  }
  started_ = true;
  worker_ = std::thread([this]() { WorkerLoop(); });
}

void PersistenceGateway::Shutdown() {
  std::deque<WriteJob> orphaned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    if (!started_) {
      orphaned.swap(fresh_);
      for (auto& job : retries_) {
        orphaned.push_back(std::move(job));
      }
      retries_.clear();
    }
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  for (auto& job : orphaned) {
    Resolve(job, WriteStatus::kAborted);
  }
}

std::shared_future<WriteStatus> PersistenceGateway::UpsertPlayer(const PlayerRecord& record,
                                                                 WriteClass write_class) {
  WriteJob job;
  job.record = record;
  job.write_class = write_class;
  job.promise = std::make_shared<std::promise<WriteStatus>>();
  std::shared_future<WriteStatus> future = job.promise->get_future().share();

  std::vector<WriteJob> superseded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      job.promise->set_value(WriteStatus::kAborted);
      return future;
    }
    // 같은 플레이어의 대기 중인 중간 쓰기는 새 쓰기에 병합되고 대체된다.
    for (auto* queue : {&fresh_, &retries_}) {
      for (auto it = FindInterim(*queue, record.player_id); it != queue->end();
           it = FindInterim(*queue, record.player_id)) {
        job.record = MergePlayerRecord(it->record, job.record);
        superseded.push_back(std::move(*it));
        queue->erase(it);
      }
    }
    fresh_.push_back(std::move(job));
  }
  cv_.notify_one();
  for (auto& old : superseded) {
    Resolve(old, WriteStatus::kSuperseded);
  }
  return future;
}

LoadResult PersistenceGateway::LoadPlayer(const std::string& player_id) {
  try {
    auto record = store_->Load(player_id);
    if (!record) {
      return LoadResult{LoadStatus::kNotFound, std::nullopt};
    }
    return LoadResult{LoadStatus::kFound, record};
  } catch (const std::exception& ex) {
    LogStorage("storage.load_failed", player_id, LogLevel::kWarn, {{"error", ex.what()}});
    return LoadResult{LoadStatus::kUnavailable, std::nullopt};
  }
}

void PersistenceGateway::SaveLeaderboard(const std::string& region, std::uint64_t version,
                                         const nlohmann::json& payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    // 아직 쓰지 않은 이전 버전은 의미가 없으므로 교체한다.
    auto it = std::find_if(leaderboards_.begin(), leaderboards_.end(),
                           [&](const LeaderboardJob& job) { return job.region == region; });
    if (it != leaderboards_.end()) {
      if (it->version <= version) {
        *it = LeaderboardJob{region, version, payload};
      }
    } else {
      leaderboards_.push_back(LeaderboardJob{region, version, payload});
    }
  }
  cv_.notify_one();
}

std::size_t PersistenceGateway::CancelInterim(const std::string& player_id) {
  std::vector<WriteJob> canceled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = FindInterim(retries_, player_id); it != retries_.end(); it = FindInterim(retries_, player_id)) {
      canceled.push_back(std::move(*it));
      retries_.erase(it);
    }
  }
  for (auto& job : canceled) {
    Resolve(job, WriteStatus::kAborted);
  }
  return canceled.size();
}

std::size_t PersistenceGateway::PendingRetries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retries_.size();
}

std::size_t PersistenceGateway::PendingWrites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fresh_.size() + retries_.size();
}

bool PersistenceGateway::Running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopping_;
}

void PersistenceGateway::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (!fresh_.empty()) {
      auto job = std::move(fresh_.front());
      fresh_.pop_front();
      lock.unlock();
      if (TryWrite(job)) {
        Resolve(job, WriteStatus::kWritten);
      } else {
        ScheduleRetry(std::move(job));
      }
      lock.lock();
      continue;
    }
    if (!leaderboards_.empty()) {
      auto job = std::move(leaderboards_.front());
      leaderboards_.pop_front();
      lock.unlock();
      TryLeaderboard(job);
      lock.lock();
      continue;
    }
    if (retries_.empty()) {
      cv_.wait(lock, [this]() { return stopping_ || !fresh_.empty() || !leaderboards_.empty() || !retries_.empty(); });
      continue;
    }
    auto due = std::min_element(retries_.begin(), retries_.end(), [](const WriteJob& lhs, const WriteJob& rhs) {
      return lhs.next_attempt < rhs.next_attempt;
    });
    if (due->next_attempt > std::chrono::steady_clock::now()) {
      auto deadline = due->next_attempt;
      cv_.wait_until(lock, deadline);
      continue;
    }
    auto job = std::move(*due);
    retries_.erase(due);
    lock.unlock();
    if (TryWrite(job)) {
      Resolve(job, WriteStatus::kWritten);
    } else {
      ScheduleRetry(std::move(job));
    }
    lock.lock();
  }

  // 종료 시 남은 쓰기를 한 번씩 더 시도하고 실패하면 중단으로 확정한다.
  std::deque<WriteJob> remaining;
  remaining.swap(fresh_);
  for (auto& job : retries_) {
    remaining.push_back(std::move(job));
  }
  retries_.clear();
  std::deque<LeaderboardJob> boards;
  boards.swap(leaderboards_);
  lock.unlock();
  for (auto& job : remaining) {
    Resolve(job, TryWrite(job) ? WriteStatus::kWritten : WriteStatus::kAborted);
  }
  for (const auto& job : boards) {
    TryLeaderboard(job);
  }
}

bool PersistenceGateway::TryWrite(WriteJob& job) {
  ++job.attempts;
  try {
    store_->Upsert(job.record);
    return true;
  } catch (const std::exception& ex) {
    LogStorage("storage.write_failed", job.record.player_id, LogLevel::kWarn,
               {{"attempt", job.attempts},
                {"final", job.write_class == WriteClass::kFinal},
                {"error", ex.what()}});
    return false;
  }
}

void PersistenceGateway::TryLeaderboard(const LeaderboardJob& job) {
  try {
    store_->SaveLeaderboard(job.region, job.version, job.payload);
  } catch (const std::exception& ex) {
    LogStorage("storage.leaderboard_failed", "", LogLevel::kWarn,
               {{"region", job.region}, {"version", job.version}, {"error", ex.what()}});
  }
}

void PersistenceGateway::ScheduleRetry(WriteJob job) {
  if (job.write_class == WriteClass::kInterim && job.attempts >= policy_.max_interim_attempts) {
    Resolve(job, WriteStatus::kDropped);
    return;
  }
  auto jitter = RandomJitter(policy_.base_delay.count() / 4);
  job.next_attempt = std::chrono::steady_clock::now() + BackoffDelay(policy_, job.attempts, jitter);

  std::vector<std::pair<WriteJob, WriteStatus>> resolved;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      resolved.emplace_back(std::move(job), WriteStatus::kAborted);
    } else {
      // 재시도 중에 같은 플레이어의 더 새로운 쓰기가 들어왔다면 그쪽에 병합한다.
      auto newer = std::find_if(fresh_.begin(), fresh_.end(),
                                [&](const WriteJob& other) { return other.record.player_id == job.record.player_id; });
      if (job.write_class == WriteClass::kInterim && newer != fresh_.end()) {
        newer->record = MergePlayerRecord(job.record, newer->record);
        resolved.emplace_back(std::move(job), WriteStatus::kSuperseded);
      } else {
        if (job.write_class == WriteClass::kFinal) {
          for (auto it = FindInterim(retries_, job.record.player_id); it != retries_.end();
               it = FindInterim(retries_, job.record.player_id)) {
            job.record = MergePlayerRecord(it->record, job.record);
            resolved.emplace_back(std::move(*it), WriteStatus::kSuperseded);
            retries_.erase(it);
          }
        }
        if (retries_.size() >= policy_.buffer_capacity) {
          auto oldest = std::find_if(retries_.begin(), retries_.end(),
                                     [](const WriteJob& other) { return other.write_class == WriteClass::kInterim; });
          if (oldest != retries_.end()) {
            resolved.emplace_back(std::move(*oldest), WriteStatus::kDropped);
            retries_.erase(oldest);
            retries_.push_back(std::move(job));
          } else if (job.write_class == WriteClass::kInterim) {
            resolved.emplace_back(std::move(job), WriteStatus::kDropped);
          } else {
            // 최종 쓰기는 버퍼가 최종 쓰기로만 가득 차도 버리지 않는다.
            retries_.push_back(std::move(job));
          }
        } else {
          retries_.push_back(std::move(job));
        }
      }
    }
  }
  cv_.notify_one();
  for (auto& [dropped, status] : resolved) {
    if (status == WriteStatus::kDropped) {
      LogStorage("storage.retry_dropped", dropped.record.player_id, LogLevel::kWarn, {{"attempts", dropped.attempts}});
    }
    Resolve(dropped, status);
  }
}

void PersistenceGateway::Resolve(WriteJob& job, WriteStatus status) {
  if (job.promise) {
    job.promise->set_value(status);
    job.promise.reset();
  }
}

void PersistenceGateway::LogStorage(const std::string& name, const std::string& player_id, LogLevel level,
                                    nlohmann::json detail) {
  std::shared_ptr<Observability> observability;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observability = observability_;
  }
  if (!observability) {
    return;
  }
  if (name != "storage.retry_dropped") {
    observability->Add(Metric::kStorageFailures);
  }
  std::optional<std::string> player;
  if (!player_id.empty()) {
    player = player_id;
  }
  observability->Log(LogContext{"", player, std::nullopt, name, 0, level, std::move(detail)});
}

}  // namespace arena
