/*
 * 설명: 세션 상태 전이, 인증, 라우팅, 종료 처리를 구현한다.
 *       mutex_를 잡은 채로 다른 서비스를 호출하지 않는다(브로드캐스터 오버플로 콜백이 다시 들어온다).
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/session_manager_test.cpp
 */
#include "arena/session_manager.hpp"

#include <algorithm>
#include <utility>

namespace arena {

namespace {
bool IsLive(SessionState state) {
  return state == SessionState::kAuthenticated || state == SessionState::kActive;
}

std::int64_t UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}
}  // namespace

std::string_view SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kConnecting:
      return "connecting";
    case SessionState::kAuthenticated:
      return "authenticated";
    case SessionState::kActive:
      return "active";
    case SessionState::kDraining:
      return "draining";
    case SessionState::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string_view CloseReasonName(CloseReason reason) {
  switch (reason) {
    case CloseReason::kNone:
      return "none";
    case CloseReason::kClientLeft:
      return "client_left";
    case CloseReason::kIdleTimeout:
      return "idle_timeout";
    case CloseReason::kProtocolViolation:
      return "protocol_violation";
    case CloseReason::kAuthFailed:
      return "auth_failed";
    case CloseReason::kBackpressure:
      return "backpressure";
    case CloseReason::kServerShutdown:
      return "server_shutdown";
    case CloseReason::kConnectionLost:
      return "connection_lost";
    case CloseReason::kReplaced:
      return "replaced";
  }
  return "unknown";
}

SessionManager::SessionManager(SessionServices services, const SessionManagerConfig& config)
    : services_(std::move(services)),
      config_(config),
      handshake_limiter_(config.handshake_limit, config.handshake_window) {}

std::optional<SessionId> SessionManager::Open(const Handshake& handshake, AuthError& error) {
  auto now = std::chrono::steady_clock::now();
  if (!handshake_limiter_.Allow(handshake.remote_address, std::chrono::system_clock::now())) {
    error = {"rate_limited", "핸드셰이크 요청이 너무 많습니다"};
    if (services_.observability) {
      services_.observability->Add(Metric::kHandshakesRejected);
    }
    Log("session.rejected", std::nullopt, LogLevel::kWarn,
        {{"code", error.code}, {"remote", handshake.remote_address}});
    return std::nullopt;
  }

  SessionId session_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id = next_session_id_++;
    Session session;
    session.id = session_id;
    session.state = SessionState::kConnecting;
    session.created_at = now;
    session.last_seen = now;
    sessions_.emplace(session_id, std::move(session));
  }

  auto reject = [&](std::string code, std::string message) -> std::optional<SessionId> {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sessions_.erase(session_id);
      ++closed_total_;
    }
    error = {std::move(code), std::move(message)};
    if (services_.observability) {
      services_.observability->Add(Metric::kHandshakesRejected);
    }
    Log("session.rejected", session_id, LogLevel::kWarn, {{"code", error.code}, {"remote", handshake.remote_address}});
    return std::nullopt;
  };

  TrustLevel trust = services_.classifier
                         ? services_.classifier->Classify({handshake.user_agent, handshake.remote_address})
                         : TrustLevel::kTrusted;

  std::optional<std::string> player_id;
  bool ephemeral = true;
  std::string stored_name;
  std::uint64_t best_score = 0;
  std::uint32_t flags = 0;
  if (handshake.token && !handshake.token->empty()) {
    std::string code;
    std::string message;
    player_id = services_.identity->Validate(*handshake.token, std::chrono::system_clock::now(), code, message);
    if (!player_id) {
      return reject(code, message);
    }
    auto loaded = services_.gateway->LoadPlayer(*player_id);
    switch (loaded.status) {
      case LoadStatus::kFound:
        ephemeral = false;
        stored_name = loaded.record->display_name;
        best_score = loaded.record->best_score;
        flags = loaded.record->moderation_flags;
        break;
      case LoadStatus::kNotFound:
        ephemeral = false;
        break;
      case LoadStatus::kUnavailable:
        // 저장소 장애 시 임시 식별자로 진행하고 기록하지 않는다.
        Log("session.storage_unavailable", session_id, LogLevel::kWarn, {{"playerId", *player_id}});
        break;
    }
    if ((flags & kFlagBanned) != 0) {
      return reject("banned", "이용이 제한된 플레이어입니다");
    }
  }

  std::string requested = handshake.display_name.empty() ? stored_name : handshake.display_name;
  std::string display_name = SanitizeName(requested, session_id);

  std::vector<SessionId> replaced;
  bool new_record = false;
  PlayerRecord record;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      error = {"session_closed", "세션이 이미 종료되었습니다"};
      return std::nullopt;
    }
    auto& session = it->second;
    session.state = SessionState::kAuthenticated;
    session.player_id = player_id;
    session.ephemeral = ephemeral;
    session.display_name = display_name;
    session.team = SanitizeDisplayName(handshake.team, config_.max_display_name);
    session.trust = trust;
    session.moderation_flags = flags;
    session.best_score = best_score;
    session.persisted_best = best_score;
    session.last_interim_write = now;
    if (player_id) {
      for (const auto& [other_id, other] : sessions_) {
        if (other_id != session_id && other.player_id == player_id && IsLive(other.state)) {
          replaced.push_back(other_id);
        }
      }
    }
    new_record = !ephemeral && stored_name.empty() && best_score == 0 && trust != TrustLevel::kBot;
    record = ToRecord(session);
  }

  for (auto other : replaced) {
    Close(other, CloseReason::kReplaced);
  }
  if (new_record) {
    services_.gateway->UpsertPlayer(record, WriteClass::kInterim);
  }

  services_.broadcaster->Attach(session_id, nullptr);
  services_.broadcaster->SendNotice(
      session_id, {"session_accepted",
                   "세션이 열렸습니다",
                   {{"sessionId", session_id},
                    {"playerId", player_id ? nlohmann::json(*player_id) : nlohmann::json(nullptr)},
                    {"displayName", display_name},
                    {"ephemeral", ephemeral},
                    {"trust", std::string(TrustLevelName(trust))}}});
  Log("session.opened", session_id, LogLevel::kInfo,
      {{"trust", std::string(TrustLevelName(trust))}, {"ephemeral", ephemeral}, {"remote", handshake.remote_address}});
  return session_id;
}

void SessionManager::BindTransport(SessionId session_id, Broadcaster::WakeHandler wake, CloseHandler closer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return;
    }
    it->second.closer = std::move(closer);
  }
  services_.broadcaster->SetWakeHandler(session_id, std::move(wake));
}

bool SessionManager::Subscribe(SessionId session_id, const Region& region, std::string& error_code,
                               std::string& error_message) {
  bool first = false;
  std::string display_name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || !IsLive(it->second.state)) {
      error_code = "session_closed";
      error_message = "구독할 수 없는 세션입니다";
      return false;
    }
    auto& session = it->second;
    first = session.state == SessionState::kAuthenticated;
    session.state = SessionState::kActive;
    session.region = region;
    session.last_seen = std::chrono::steady_clock::now();
    display_name = session.display_name;
  }

  // 영역이 바뀌면 기준 스냅샷이 달라지므로 전체 스냅샷부터 다시 보낸다.
  services_.encoder->ResetBaseline(session_id);
  if (first) {
    services_.simulation->AddPlayer(session_id, display_name);
    auto snapshot = services_.leaderboard->Snapshot();
    if (snapshot) {
      services_.broadcaster->SendLeaderboard(session_id, *snapshot);
    }
  }
  Log("session.subscribed", session_id, LogLevel::kInfo,
      {{"first", first},
       {"unbounded", region.unbounded},
       {"x", region.center_x},
       {"y", region.center_y},
       {"r", region.half_extent}});
  return true;
}

bool SessionManager::Close(SessionId session_id, CloseReason reason) {
  bool immediate = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    auto& session = it->second;
    if (session.state == SessionState::kDraining) {
      // 드레인 중 연결이 끊기면 더 보낼 곳이 없다.
      if (reason != CloseReason::kConnectionLost) {
        return false;
      }
      immediate = true;
    } else if (session.state == SessionState::kClosed) {
      return false;
    } else {
      session.close_reason = reason;
      session.state = SessionState::kDraining;
      session.drain_deadline = std::chrono::steady_clock::now() + config_.drain_grace;
      immediate = reason == CloseReason::kConnectionLost || reason == CloseReason::kBackpressure;
    }
  }

  if (!immediate) {
    services_.broadcaster->SendNotice(
        session_id, {"session_closing",
                     "세션을 종료합니다",
                     {{"reason", std::string(CloseReasonName(reason))},
                      {"code", kCloseCodeBase + static_cast<std::uint16_t>(reason)}}});
    services_.broadcaster->Seal(session_id);
    if (services_.broadcaster->IsDrained(session_id)) {
      immediate = true;
    }
  }
  if (immediate) {
    Finalize(session_id);
  }
  return true;
}

void SessionManager::Finalize(SessionId session_id) {
  Session session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return;
    }
    session = std::move(it->second);
    sessions_.erase(it);
    ++closed_total_;
  }
  session.state = SessionState::kClosed;

  services_.broadcaster->Detach(session_id);
  services_.chat_gate->Forget(session_id);
  services_.simulation->RemovePlayer(session_id);
  if (session.trust != TrustLevel::kBot) {
    services_.leaderboard->RemovePlayer(LeaderboardKey(session));
  }
  if (!session.ephemeral && session.player_id && session.trust != TrustLevel::kBot) {
    services_.gateway->CancelInterim(*session.player_id);
    // 최종 기록은 게이트웨이가 끝까지 재시도하므로 결과를 기다리지 않는다.
    services_.gateway->UpsertPlayer(ToRecord(session), WriteClass::kFinal);
  }
  Log("session.closed", session_id, LogLevel::kInfo,
      {{"reason", std::string(CloseReasonName(session.close_reason))}, {"bestScore", session.best_score}});
  if (session.closer) {
    session.closer(session.close_reason);
  }
}

RouteResult SessionManager::Route(SessionId session_id, std::string_view bytes) {
  RouteResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      result.status = RouteStatus::kUnknownSession;
      return result;
    }
    if (!IsLive(it->second.state)) {
      result.status = RouteStatus::kClosed;
      return result;
    }
    it->second.last_seen = std::chrono::steady_clock::now();
  }

  std::string decode_error;
  auto message = DecodeInbound(bytes, decode_error);
  if (!message) {
    bool violation = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = sessions_.find(session_id);
      if (it != sessions_.end()) {
        violation = ++it->second.malformed_streak >= config_.max_malformed_streak;
      }
    }
    if (services_.observability) {
      services_.observability->Add(Metric::kMalformedMessages);
    }
    Log("protocol.malformed", session_id, LogLevel::kWarn, {{"error", decode_error}, {"size", bytes.size()}});
    if (violation) {
      Close(session_id, CloseReason::kProtocolViolation);
    }
    result.status = RouteStatus::kMalformed;
    result.error_code = "malformed_message";
    result.error_message = decode_error;
    return result;
  }

  bool active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      result.status = RouteStatus::kClosed;
      return result;
    }
    it->second.malformed_streak = 0;
    active = it->second.state == SessionState::kActive;
  }

  result.kind = message->kind;
  auto require_active = [&]() {
    if (active) {
      return true;
    }
    result.status = RouteStatus::kRejected;
    result.error_code = "not_subscribed";
    result.error_message = "구독 이후에만 보낼 수 있는 메시지입니다";
    return false;
  };

  switch (message->kind) {
    case InboundKind::kAck:
      if (require_active() && !services_.encoder->Acknowledge(session_id, message->ack_tick)) {
        // 오래되거나 알 수 없는 틱 확인은 무시한다.
        result.status = RouteStatus::kRejected;
        result.error_code = "stale_ack";
        result.error_message = "확인할 수 없는 틱입니다";
      }
      break;
    case InboundKind::kInput:
      if (require_active()) {
        services_.simulation->ApplyInput(session_id, message->input);
      }
      break;
    case InboundKind::kChat:
      if (require_active()) {
        auto chat_result = HandleChat(session_id, message->chat);
        chat_result.kind = message->kind;
        return chat_result;
      }
      break;
    case InboundKind::kSubscribe:
      if (!Subscribe(session_id, message->region, result.error_code, result.error_message)) {
        result.status = RouteStatus::kRejected;
      }
      break;
    case InboundKind::kLeave:
      Close(session_id, CloseReason::kClientLeft);
      break;
    case InboundKind::kPing:
      services_.broadcaster->SendNotice(session_id, {"pong", "", {{"n", message->ping_nonce}}});
      break;
  }
  return result;
}

RouteResult SessionManager::HandleChat(SessionId session_id, const ChatRequest& request) {
  RouteResult result;
  bool muted = false;
  std::string sender_name;
  std::string team;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      result.status = RouteStatus::kClosed;
      return result;
    }
    muted = (it->second.moderation_flags & kFlagMuted) != 0;
    sender_name = it->second.display_name;
    team = it->second.team;
  }

  auto decision = services_.chat_gate->Evaluate(session_id, muted, request.text, std::chrono::steady_clock::now());
  if (!decision.accepted) {
    services_.broadcaster->SendNotice(session_id, {decision.error_code, decision.error_message, nullptr});
    result.status = RouteStatus::kRejected;
    result.error_code = decision.error_code;
    result.error_message = decision.error_message;
    return result;
  }

  std::vector<SessionId> recipients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (request.scope == ChatScope::kWhisper) {
      auto target = sessions_.find(request.target);
      if (target != sessions_.end() && target->second.state == SessionState::kActive) {
        recipients.push_back(request.target);
        if (request.target != session_id) {
          recipients.push_back(session_id);
        }
      }
    } else if (request.scope != ChatScope::kTeam || !team.empty()) {
      // 팀이 없는 세션의 팀 채팅은 받을 대상이 없다.
      for (const auto& [id, session] : sessions_) {
        if (session.state != SessionState::kActive) {
          continue;
        }
        if (request.scope == ChatScope::kTeam && session.team != team) {
          continue;
        }
        recipients.push_back(id);
      }
    }
  }
  if (recipients.empty()) {
    result.status = RouteStatus::kRejected;
    result.error_code = "chat_no_recipient";
    result.error_message = "메시지를 받을 대상이 없습니다";
    services_.broadcaster->SendNotice(session_id, {result.error_code, result.error_message, nullptr});
    return result;
  }
  std::sort(recipients.begin(), recipients.end());

  if (decision.filtered && services_.observability) {
    services_.observability->Add(Metric::kChatFiltered);
  }
  services_.broadcaster->SendChat(recipients, {session_id, sender_name, request.scope, decision.text, decision.filtered});
  return result;
}

void SessionManager::ReportScore(SessionId session_id, std::uint64_t score) {
  std::string key;
  std::string name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.state != SessionState::kActive) {
      return;
    }
    auto& session = it->second;
    session.score = score;
    session.best_score = std::max(session.best_score, score);
    // 봇으로 분류된 세션은 순위에서 제외한다.
    if (session.trust == TrustLevel::kBot) {
      return;
    }
    key = LeaderboardKey(session);
    name = session.display_name;
  }
  services_.leaderboard->RecordScore(key, name, score);
}

void SessionManager::ConnectionLost(SessionId session_id) {
  Close(session_id, CloseReason::kConnectionLost);
}

void SessionManager::OnFrameWritten(SessionId session_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.state != SessionState::kDraining) {
      return;
    }
  }
  if (services_.broadcaster->IsDrained(session_id)) {
    Finalize(session_id);
  }
}

std::size_t SessionManager::Sweep(std::chrono::steady_clock::time_point now) {
  std::vector<SessionId> idle;
  std::vector<SessionId> draining;
  std::vector<PlayerRecord> interim;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, session] : sessions_) {
      if (IsLive(session.state)) {
        if (now - session.last_seen > config_.idle_timeout) {
          idle.push_back(id);
          continue;
        }
        if (!session.ephemeral && session.player_id && session.trust != TrustLevel::kBot &&
            session.best_score > session.persisted_best &&
            now - session.last_interim_write >= config_.interim_write_interval) {
          session.persisted_best = session.best_score;
          session.last_interim_write = now;
          interim.push_back(ToRecord(session));
        }
      } else if (session.state == SessionState::kDraining) {
        draining.push_back(id);
      }
    }
  }

  std::size_t closed = 0;
  for (auto id : idle) {
    if (Close(id, CloseReason::kIdleTimeout)) {
      ++closed;
    }
  }
  for (auto id : draining) {
    bool expired = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = sessions_.find(id);
      expired = it != sessions_.end() && now >= it->second.drain_deadline;
    }
    if (expired || services_.broadcaster->IsDrained(id)) {
      Finalize(id);
      ++closed;
    }
  }
  for (const auto& record : interim) {
    services_.gateway->UpsertPlayer(record, WriteClass::kInterim);
  }
  return closed;
}

void SessionManager::Shutdown() {
  std::vector<SessionId> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, session] : sessions_) {
      ids.push_back(id);
    }
  }
  for (auto id : ids) {
    Close(id, CloseReason::kServerShutdown);
  }
  // 종료 시에는 드레인을 기다리지 않고 최종 기록까지 마친다.
  for (auto id : ids) {
    Finalize(id);
  }
}

std::optional<std::chrono::steady_clock::time_point> SessionManager::LastSeen(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second.last_seen;
}

std::optional<SessionView> SessionManager::Find(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return ToView(it->second);
}

std::vector<SessionView> SessionManager::ActiveSessions() const {
  std::vector<SessionView> views;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, session] : sessions_) {
    if (session.state == SessionState::kActive) {
      views.push_back(ToView(session));
    }
  }
  std::sort(views.begin(), views.end(), [](const SessionView& a, const SessionView& b) { return a.id < b.id; });
  return views;
}

std::map<SessionState, std::size_t> SessionManager::CountByState() const {
  std::map<SessionState, std::size_t> counts{{SessionState::kConnecting, 0},
                                             {SessionState::kAuthenticated, 0},
                                             {SessionState::kActive, 0},
                                             {SessionState::kDraining, 0}};
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, session] : sessions_) {
    ++counts[session.state];
  }
  counts[SessionState::kClosed] = closed_total_;
  return counts;
}

std::size_t SessionManager::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const auto& entry) {
    return entry.second.state == SessionState::kActive;
  }));
}

std::size_t SessionManager::OpenSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<Subscriber> SessionManager::Subscribers() const {
  std::vector<Subscriber> subscribers;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, session] : sessions_) {
    if (session.state == SessionState::kActive) {
      subscribers.push_back({id, session.region});
    }
  }
  std::sort(subscribers.begin(), subscribers.end(),
            [](const Subscriber& a, const Subscriber& b) { return a.session_id < b.session_id; });
  return subscribers;
}

void SessionManager::OnQueueOverflow(SessionId session_id) {
  Log("session.backpressure", session_id, LogLevel::kWarn, nullptr);
  Close(session_id, CloseReason::kBackpressure);
}

SessionView SessionManager::ToView(const Session& session) const {
  SessionView view;
  view.id = session.id;
  view.state = session.state;
  view.player_id = session.player_id;
  view.ephemeral = session.ephemeral;
  view.display_name = session.display_name;
  view.team = session.team;
  view.trust = session.trust;
  view.moderation_flags = session.moderation_flags;
  view.region = session.region;
  view.score = session.score;
  view.best_score = session.best_score;
  view.close_reason = session.close_reason;
  view.last_seen = session.last_seen;
  return view;
}

std::string SessionManager::LeaderboardKey(const Session& session) const {
  if (session.player_id) {
    return *session.player_id;
  }
  return "guest-" + std::to_string(session.id);
}

PlayerRecord SessionManager::ToRecord(const Session& session) const {
  PlayerRecord record;
  record.player_id = session.player_id.value_or("");
  record.display_name = session.display_name;
  record.best_score = session.best_score;
  record.moderation_flags = session.moderation_flags;
  record.last_seen_unix = UnixNow();
  return record;
}

std::string SessionManager::SanitizeName(const std::string& requested, SessionId session_id) const {
  auto name = SanitizeDisplayName(requested, config_.max_display_name);
  if (name.empty()) {
    return "guest-" + std::to_string(session_id);
  }
  return name;
}

void SessionManager::Log(const std::string& name, std::optional<SessionId> session_id, LogLevel level,
                         nlohmann::json detail) const {
  if (!services_.observability) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = services_.observability->NextTraceId();
  ctx.session_id = session_id;
  ctx.name = name;
  ctx.level = level;
  ctx.detail = std::move(detail);
  services_.observability->Log(ctx);
}

}  // namespace arena
