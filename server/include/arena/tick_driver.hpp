/*
 * 설명: 고정 주기 틱 루프(시뮬레이션 → 점수 보고 → 브로드캐스트 → 리더보드 배치)와
 *       별도 주기의 유지보수 루프(리더보드 게시/배포/저장, 세션 정리)를 구동한다.
 *       틱 경로에서는 네트워크/저장소 I/O를 하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/tick_driver_test.cpp, server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "arena/broadcaster.hpp"
#include "arena/leaderboard.hpp"
#include "arena/observability.hpp"
#include "arena/persistence_gateway.hpp"
#include "arena/session_manager.hpp"
#include "arena/simulation.hpp"

namespace arena {

struct TickDriverConfig {
  std::chrono::milliseconds tick_interval{std::chrono::milliseconds(50)};
  std::chrono::milliseconds maintenance_interval{std::chrono::milliseconds(1000)};
  std::string region{"default"};
};

class TickDriver : public std::enable_shared_from_this<TickDriver> {
 public:
  TickDriver(boost::asio::io_context& ioc, const TickDriverConfig& config, std::shared_ptr<WorldSimulation> simulation,
             std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Broadcaster> broadcaster,
             std::shared_ptr<LeaderboardService> leaderboard, std::shared_ptr<PersistenceGateway> gateway,
             std::shared_ptr<Observability> observability);

  void Start();
  void Stop();

  // 타이머 없이 한 틱을 동기 실행한다. 진행된 틱 번호를 돌려준다.
  Tick RunTick();
  void RunMaintenance(std::chrono::steady_clock::time_point now);

  Tick CurrentTick() const { return tick_.load(); }
  std::uint64_t OverrunCount() const { return overruns_.load(); }

 private:
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);
  void ScheduleMaintenance();
  void OnMaintenance(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer tick_timer_;
  boost::asio::steady_timer maintenance_timer_;
  TickDriverConfig config_;
  std::shared_ptr<WorldSimulation> simulation_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Broadcaster> broadcaster_;
  std::shared_ptr<LeaderboardService> leaderboard_;
  std::shared_ptr<PersistenceGateway> gateway_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point next_deadline_;
  std::atomic<Tick> tick_{0};
  std::atomic<std::uint64_t> overruns_{0};
  std::uint64_t saved_leaderboard_version_{0};
  std::atomic<bool> running_{false};
};

}  // namespace arena
