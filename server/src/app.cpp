/*
 * 설명: 서버 구성요소 조립, 리스닝, 종료 순서(세션 종료 → 최종 기록 플러시)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/mariadb_player_store.hpp"
#include "arena/moderation.hpp"
#include "arena/trust.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServerContext> context)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), context_(std::move(context)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->context_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServerContext> context_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<PlayerStore> store,
                     std::shared_ptr<WorldSimulation> simulation)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), store_(std::move(store)),
      simulation_(std::move(simulation)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  if (!store_) {
    if (config.db_host.empty()) {
      store_ = std::make_shared<InMemoryPlayerStore>();
    } else {
      DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
      auto db_client = std::make_shared<MariaDbClient>(db_config);
      auto mariadb_store = std::make_shared<MariaDbPlayerStore>(db_client, config.db_namespace);
      try {
        mariadb_store->EnsureSchema();
      } catch (const StorageUnavailable& ex) {
        // 기동 시 DB가 없어도 서버는 뜬다. 쓰기는 재시도 버퍼가 받는다.
        LogContext ctx;
        ctx.trace_id = observability_->NextTraceId();
        ctx.name = "storage.schema_failed";
        ctx.level = LogLevel::kWarn;
        ctx.detail = {{"error", ex.what()}};
        observability_->Log(ctx);
      }
      store_ = mariadb_store;
    }
  }

  RetryPolicy policy;
  policy.buffer_capacity = config.retry_buffer_capacity;
  policy.base_delay = std::chrono::milliseconds(config.retry_base_ms);
  policy.max_delay = std::chrono::milliseconds(config.retry_max_ms);
  gateway_ = std::make_shared<PersistenceGateway>(store_, policy);
  gateway_->SetObservability(observability_);

  IdentityConfig identity_config;
  identity_config.secret = config.identity_secret;
  identity_config.token_ttl = std::chrono::seconds(config.identity_token_ttl_seconds);
  identity_ = std::make_shared<IdentityService>(identity_config);

  history_ = std::make_shared<WorldHistory>(config.history_horizon_ticks, config.field_epsilon);
  EncoderConfig encoder_config;
  encoder_config.max_baseline_age = config.max_baseline_age_ticks;
  encoder_ = std::make_shared<SnapshotEncoder>(history_, encoder_config);

  BroadcasterConfig broadcaster_config;
  broadcaster_config.queue_capacity = config.session_queue_capacity;
  broadcaster_config.critical_cap = config.critical_queue_cap;
  broadcaster_config.leaderboard_size = config.leaderboard_broadcast_size;
  broadcaster_ = std::make_shared<Broadcaster>(history_, encoder_, broadcaster_config);
  broadcaster_->SetObservability(observability_);

  leaderboard_ = std::make_shared<LeaderboardService>();

  ChatGateConfig chat_config;
  chat_config.max_length = config.chat_max_length;
  chat_config.max_messages = config.chat_rate_per_10s;
  chat_gate_ = std::make_shared<ChatGate>(
      std::make_shared<WordListFilter>(WordListFilter::ParseList(config.chat_blocklist)), chat_config);

  if (!simulation_) {
    simulation_ = std::make_shared<ArenaSimulation>();
  }

  SessionManagerConfig session_config;
  session_config.idle_timeout = std::chrono::seconds(config.idle_timeout_seconds);
  session_config.drain_grace = std::chrono::milliseconds(config.drain_grace_ms);
  session_config.interim_write_interval = std::chrono::seconds(config.interim_write_interval_seconds);
  session_config.handshake_limit = config.handshake_rate_limit_max;
  session_config.handshake_window = std::chrono::seconds(config.handshake_rate_window_seconds);
  SessionServices services{identity_,    std::make_shared<UserAgentBotClassifier>(),
                           gateway_,     leaderboard_,
                           broadcaster_, encoder_,
                           chat_gate_,   simulation_,
                           observability_};
  session_manager_ = std::make_shared<SessionManager>(std::move(services), session_config);
  broadcaster_->SetDirectory(session_manager_);

  TickDriverConfig tick_config;
  tick_config.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
  tick_config.maintenance_interval = std::chrono::milliseconds(config.leaderboard_interval_ms);
  tick_config.region = config.region;
  tick_driver_ = std::make_shared<TickDriver>(ioc_, tick_config, simulation_, session_manager_, broadcaster_,
                                              leaderboard_, gateway_, observability_);

  context_ = std::make_shared<const ServerContext>(
      ServerContext{config_, identity_, session_manager_, leaderboard_, gateway_, broadcaster_, observability_});
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    gateway_->Start();
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, context_);
    bound_port_ = listener_->Port();
    listener_->Run();
    tick_driver_->Start();
    running_ = true;
    std::cout << "서버 시작: 포트 " << bound_port_.load() << " 지역 " << config_.region << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    running_ = false;
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  running_ = false;
  tick_driver_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  // 세션을 먼저 닫아야 최종 점수 쓰기가 게이트웨이 종료 플러시에 포함된다.
  session_manager_->Shutdown();
  gateway_->Shutdown();
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.region = get_env("ARENA_REGION", "default");
  cfg.db_host = get_env("DB_HOST", "");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.db_namespace = get_env("DB_NAMESPACE", "arena");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.identity_secret = get_env("IDENTITY_SECRET", "");
  cfg.identity_token_ttl_seconds = get_size("IDENTITY_TOKEN_TTL_SECONDS", "86400");
  cfg.handshake_rate_window_seconds = get_size("HANDSHAKE_RATE_WINDOW_SECONDS", "60");
  cfg.handshake_rate_limit_max = get_size("HANDSHAKE_RATE_LIMIT_MAX", "20");
  cfg.tick_interval_ms = std::max<std::size_t>(1, get_size("TICK_INTERVAL_MS", "50"));
  cfg.history_horizon_ticks = std::max<std::size_t>(1, get_size("HISTORY_HORIZON_TICKS", "64"));
  cfg.max_baseline_age_ticks = get_size("MAX_BASELINE_AGE_TICKS", "32");
  cfg.field_epsilon = std::stof(get_env("FIELD_EPSILON", "0.001"));
  cfg.session_queue_capacity = std::max<std::size_t>(1, get_size("SESSION_QUEUE_CAPACITY", "64"));
  cfg.critical_queue_cap = std::max<std::size_t>(1, get_size("CRITICAL_QUEUE_CAP", "256"));
  cfg.idle_timeout_seconds = get_size("IDLE_TIMEOUT_SECONDS", "30");
  cfg.drain_grace_ms = get_size("DRAIN_GRACE_MS", "2000");
  cfg.leaderboard_interval_ms = std::max<std::size_t>(1, get_size("LEADERBOARD_INTERVAL_MS", "1000"));
  cfg.leaderboard_broadcast_size = get_size("LEADERBOARD_BROADCAST_SIZE", "10");
  cfg.retry_buffer_capacity = std::max<std::size_t>(1, get_size("RETRY_BUFFER_CAPACITY", "256"));
  cfg.retry_base_ms = get_size("RETRY_BASE_MS", "100");
  cfg.retry_max_ms = get_size("RETRY_MAX_MS", "5000");
  cfg.interim_write_interval_seconds = get_size("INTERIM_WRITE_INTERVAL_SECONDS", "30");
  cfg.chat_blocklist = get_env("CHAT_BLOCKLIST", "");
  cfg.chat_max_length = get_size("CHAT_MAX_LENGTH", "200");
  cfg.chat_rate_per_10s = get_size("CHAT_RATE_PER_10S", "5");
  return cfg;
}

}  // namespace arena
