/*
 * 설명: 연결 세션의 상태 기계(Connecting → Authenticated → Active → Draining → Closed), 인증,
 *       확인 틱 추적, 수신 메시지 라우팅, 유휴 정리와 종료 시 최종 점수 기록을 관리한다.
 *       세션 객체는 이 클래스만 소유하고 다른 구성요소는 SessionId로만 참조한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "arena/broadcaster.hpp"
#include "arena/entity.hpp"
#include "arena/identity.hpp"
#include "arena/leaderboard.hpp"
#include "arena/moderation.hpp"
#include "arena/observability.hpp"
#include "arena/persistence_gateway.hpp"
#include "arena/simulation.hpp"
#include "arena/snapshot_encoder.hpp"
#include "arena/trust.hpp"
#include "arena/wire_codec.hpp"

namespace arena {

enum class SessionState {
  kConnecting,
  kAuthenticated,
  kActive,
  kDraining,
  kClosed,
};

enum class CloseReason : std::uint16_t {
  kNone = 0,
  kClientLeft = 1,
  kIdleTimeout = 2,
  kProtocolViolation = 3,
  kAuthFailed = 4,
  kBackpressure = 5,
  kServerShutdown = 6,
  kConnectionLost = 7,
  kReplaced = 8,
};

// WebSocket 종료 코드는 4000 + 종료 사유다.
constexpr std::uint16_t kCloseCodeBase = 4000;

std::string_view SessionStateName(SessionState state);
std::string_view CloseReasonName(CloseReason reason);

struct Handshake {
  std::optional<std::string> token;
  std::string display_name;
  std::string team;
  std::string user_agent;
  std::string remote_address;
};

struct AuthError {
  std::string code;
  std::string message;
};

struct SessionView {
  SessionId id{0};
  SessionState state{SessionState::kConnecting};
  std::optional<std::string> player_id;
  bool ephemeral{true};
  std::string display_name;
  std::string team;
  TrustLevel trust{TrustLevel::kSuspect};
  std::uint32_t moderation_flags{0};
  Region region;
  std::uint64_t score{0};
  std::uint64_t best_score{0};
  CloseReason close_reason{CloseReason::kNone};
  std::chrono::steady_clock::time_point last_seen;
};

enum class RouteStatus {
  kHandled,
  kRejected,
  kMalformed,
  kClosed,
  kUnknownSession,
};

struct RouteResult {
  RouteStatus status{RouteStatus::kHandled};
  std::optional<InboundKind> kind;
  std::string error_code;
  std::string error_message;
};

struct SessionManagerConfig {
  std::chrono::seconds idle_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds drain_grace{std::chrono::milliseconds(2000)};
  std::chrono::seconds interim_write_interval{std::chrono::seconds(30)};
  std::size_t max_malformed_streak{3};
  std::size_t handshake_limit{20};
  std::chrono::seconds handshake_window{std::chrono::seconds(60)};
  std::size_t max_display_name{kMaxDisplayNameBytes};
};

struct SessionServices {
  std::shared_ptr<IdentityService> identity;
  std::shared_ptr<BotClassifier> classifier;
  std::shared_ptr<PersistenceGateway> gateway;
  std::shared_ptr<LeaderboardService> leaderboard;
  std::shared_ptr<Broadcaster> broadcaster;
  std::shared_ptr<SnapshotEncoder> encoder;
  std::shared_ptr<ChatGate> chat_gate;
  std::shared_ptr<WorldSimulation> simulation;
  std::shared_ptr<Observability> observability;
};

class SessionManager : public SubscriberDirectory, public std::enable_shared_from_this<SessionManager> {
 public:
  using CloseHandler = std::function<void(CloseReason)>;

  SessionManager(SessionServices services, const SessionManagerConfig& config);

  std::optional<SessionId> Open(const Handshake& handshake, AuthError& error);
  // 전송 계층이 연결되면 깨우기/종료 콜백을 등록한다.
  void BindTransport(SessionId session_id, Broadcaster::WakeHandler wake, CloseHandler closer);
  bool Subscribe(SessionId session_id, const Region& region, std::string& error_code, std::string& error_message);
  bool Close(SessionId session_id, CloseReason reason);
  RouteResult Route(SessionId session_id, std::string_view bytes);
  void ReportScore(SessionId session_id, std::uint64_t score);
  void ConnectionLost(SessionId session_id);
  void OnFrameWritten(SessionId session_id);
  std::size_t Sweep(std::chrono::steady_clock::time_point now);
  void Shutdown();

  std::optional<std::chrono::steady_clock::time_point> LastSeen(SessionId session_id) const;
  std::optional<SessionView> Find(SessionId session_id) const;
  std::vector<SessionView> ActiveSessions() const;
  std::map<SessionState, std::size_t> CountByState() const;
  std::size_t ActiveSessionCount() const;
  std::size_t OpenSessionCount() const;

  std::vector<Subscriber> Subscribers() const override;
  void OnQueueOverflow(SessionId session_id) override;

 private:
  struct Session {
    SessionId id{0};
    SessionState state{SessionState::kConnecting};
    std::optional<std::string> player_id;
    bool ephemeral{true};
    std::string display_name;
    std::string team;
    TrustLevel trust{TrustLevel::kSuspect};
    std::uint32_t moderation_flags{0};
    Region region;
    std::uint64_t score{0};
    std::uint64_t best_score{0};
    std::uint64_t persisted_best{0};
    std::size_t malformed_streak{0};
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_seen;
    std::chrono::steady_clock::time_point drain_deadline;
    std::chrono::steady_clock::time_point last_interim_write;
    CloseReason close_reason{CloseReason::kNone};
    CloseHandler closer;
  };

  SessionView ToView(const Session& session) const;
  std::string LeaderboardKey(const Session& session) const;
  PlayerRecord ToRecord(const Session& session) const;
  std::string SanitizeName(const std::string& requested, SessionId session_id) const;
  void Finalize(SessionId session_id);
  RouteResult HandleChat(SessionId session_id, const ChatRequest& request);
  void Log(const std::string& name, std::optional<SessionId> session_id, LogLevel level,
           nlohmann::json detail = nullptr) const;

  SessionServices services_;
  SessionManagerConfig config_;
  RateLimiter handshake_limiter_;
  SessionId next_session_id_{1};
  std::unordered_map<SessionId, Session> sessions_;
  std::size_t closed_total_{0};
  mutable std::mutex mutex_;
};

}  // namespace arena
