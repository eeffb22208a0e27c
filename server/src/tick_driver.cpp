/*
 * 설명: 틱 루프와 유지보수 루프를 strand 위의 steady_timer로 구동한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/tick_driver_test.cpp
 */
#include "arena/tick_driver.hpp"

#include <boost/asio/dispatch.hpp>

#include "arena/api_response.hpp"

namespace arena {

TickDriver::TickDriver(boost::asio::io_context& ioc, const TickDriverConfig& config,
                       std::shared_ptr<WorldSimulation> simulation, std::shared_ptr<SessionManager> session_manager,
                       std::shared_ptr<Broadcaster> broadcaster, std::shared_ptr<LeaderboardService> leaderboard,
                       std::shared_ptr<PersistenceGateway> gateway, std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)),
      tick_timer_(strand_),
      maintenance_timer_(strand_),
      config_(config),
      simulation_(std::move(simulation)),
      session_manager_(std::move(session_manager)),
      broadcaster_(std::move(broadcaster)),
      leaderboard_(std::move(leaderboard)),
      gateway_(std::move(gateway)),
      observability_(std::move(observability)) {}

void TickDriver::Start() {
  if (running_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(strand_, [self]() {
    self->next_deadline_ = std::chrono::steady_clock::now() + self->config_.tick_interval;
    self->ScheduleTick();
    self->ScheduleMaintenance();
  });
}

void TickDriver::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(strand_, [self]() {
    self->tick_timer_.cancel();
    self->maintenance_timer_.cancel();
  });
}

Tick TickDriver::RunTick() {
  auto started = std::chrono::steady_clock::now();
  Tick tick = tick_.load() + 1;
  auto step = simulation_->Step(tick);
  for (const auto& report : step.scores) {
    session_manager_->ReportScore(report.session_id, report.score);
  }
  auto stats = broadcaster_->Publish(tick, step.entities);
  leaderboard_->ApplyBatch(tick);
  tick_.store(tick);

  if (observability_) {
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    if (stats.encoding_faults > 0 || elapsed > config_.tick_interval.count()) {
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.name = "tick.slow";
      ctx.latency_ms = static_cast<long>(elapsed);
      ctx.level = LogLevel::kWarn;
      ctx.detail = {{"tick", tick},
                    {"entities", step.entities.size()},
                    {"full", stats.full_frames},
                    {"delta", stats.delta_frames},
                    {"dropped", stats.dropped_frames},
                    {"faults", stats.encoding_faults}};
      observability_->Log(ctx);
    }
  }
  return tick;
}

void TickDriver::RunMaintenance(std::chrono::steady_clock::time_point now) {
  auto snapshot = leaderboard_->Publish();
  if (snapshot) {
    broadcaster_->PublishLeaderboard(*snapshot);
    if (snapshot->version > saved_leaderboard_version_) {
      saved_leaderboard_version_ = snapshot->version;
      gateway_->SaveLeaderboard(config_.region, snapshot->version,
                                LeaderboardPageJson(*snapshot, 1, snapshot->entries.size()));
    }
  }
  session_manager_->Sweep(now);
}

void TickDriver::ScheduleTick() {
  tick_timer_.expires_at(next_deadline_);
  auto self = shared_from_this();
  tick_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void TickDriver::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  RunTick();
  next_deadline_ += config_.tick_interval;
  auto now = std::chrono::steady_clock::now();
  if (next_deadline_ < now) {
    // 밀린 틱을 몰아서 돌리지 않고 현재 시각 기준으로 다시 맞춘다.
    overruns_.fetch_add(1);
    next_deadline_ = now + config_.tick_interval;
  }
  ScheduleTick();
}

void TickDriver::ScheduleMaintenance() {
  maintenance_timer_.expires_after(config_.maintenance_interval);
  auto self = shared_from_this();
  maintenance_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnMaintenance(ec); });
}

void TickDriver::OnMaintenance(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  RunMaintenance(std::chrono::steady_clock::now());
  ScheduleMaintenance();
}

}  // namespace arena
