/*
 * 설명: 서버 전체 수명주기를 관리한다. 구성요소를 조립하고 리스너/틱 드라이버/영속화 워커를 시작·정지한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arena/broadcaster.hpp"
#include "arena/config.hpp"
#include "arena/http_session.hpp"
#include "arena/identity.hpp"
#include "arena/leaderboard.hpp"
#include "arena/observability.hpp"
#include "arena/persistence_gateway.hpp"
#include "arena/player_store.hpp"
#include "arena/session_manager.hpp"
#include "arena/simulation.hpp"
#include "arena/snapshot_encoder.hpp"
#include "arena/tick_driver.hpp"
#include "arena/world_history.hpp"

namespace arena {

class Listener;

class ServerApp {
 public:
  // store가 비어 있으면 설정(DB_HOST)에 따라 MariaDB 또는 메모리 저장소를 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<PlayerStore> store = nullptr,
                     std::shared_ptr<WorldSimulation> simulation = nullptr);
  ~ServerApp();

  void Run();
  void Stop();
  // Run 호출 뒤 실제로 바인딩된 포트. SERVER_PORT=0이면 임의 포트가 잡힌다.
  unsigned short BoundPort() const { return bound_port_.load(); }
  bool Running() const { return running_.load(); }

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<IdentityService> GetIdentityService() { return identity_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::shared_ptr<LeaderboardService> GetLeaderboard() { return leaderboard_; }
  std::shared_ptr<PersistenceGateway> GetGateway() { return gateway_; }
  std::shared_ptr<Broadcaster> GetBroadcaster() { return broadcaster_; }
  std::shared_ptr<TickDriver> GetTickDriver() { return tick_driver_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<PlayerStore> store_;
  std::shared_ptr<PersistenceGateway> gateway_;
  std::shared_ptr<IdentityService> identity_;
  std::shared_ptr<WorldHistory> history_;
  std::shared_ptr<SnapshotEncoder> encoder_;
  std::shared_ptr<Broadcaster> broadcaster_;
  std::shared_ptr<LeaderboardService> leaderboard_;
  std::shared_ptr<ChatGate> chat_gate_;
  std::shared_ptr<WorldSimulation> simulation_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<TickDriver> tick_driver_;
  std::shared_ptr<const ServerContext> context_;
  std::vector<std::thread> workers_;
  std::atomic<unsigned short> bound_port_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace arena
