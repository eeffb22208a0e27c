/*
 * 설명: HTTP 요청을 처리하고 상태/리더보드/플레이어/식별 발급/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "arena/http_session.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "arena/api_response.hpp"
#include "arena/websocket_session.hpp"

namespace arena {

namespace {
constexpr const char* kServerName = "arena-sync";

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || value.size() > 18) {
    return std::nullopt;
  }
  for (unsigned char c : value) {
    if (!std::isdigit(c)) {
      return std::nullopt;
    }
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

boost::beast::http::status AuthErrorStatus(const std::string& code) {
  if (code == "rate_limited") {
    return boost::beast::http::status::too_many_requests;
  }
  if (code == "banned") {
    return boost::beast::http::status::forbidden;
  }
  return boost::beast::http::status::unauthorized;
}
}  // namespace

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string UrlDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  try {
    HandleRequest();
  } catch (const std::exception& ex) {
    // 핸들러 예외가 io_context 워커까지 올라가면 서버가 멈춘다.
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.handler_failed";
    ctx.level = LogLevel::kError;
    ctx.detail = {{"error", ex.what()}};
    context_->observability->Log(ctx);
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::server, kServerName);
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    SendEnvelope(res, boost::beast::http::status::internal_server_error,
                 MakeErrorEnvelope("internal_error", "요청을 처리하지 못했습니다"));
  }
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  const auto& observability = context_->observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability->NextTraceId();
  observability->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"},
                           {"version", "v1.0.0"},
                           {"region", context_->config.region},
                           {"tick", context_->broadcaster->CurrentTick()},
                           {"sessions", SessionCounts()}};
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability->Snapshot(context_->session_manager->ActiveSessionCount(),
                                            context_->broadcaster->TotalQueueDepth());
    nlohmann::json counters = nlohmann::json::object();
    for (std::size_t i = 0; i < static_cast<std::size_t>(Metric::kCount); ++i) {
      auto metric = static_cast<Metric>(i);
      counters[std::string(MetricName(metric))] = snapshot.Get(metric);
    }
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}}},
                        {"queue", {{"depth", snapshot.queue_depth}}},
                        {"counters", counters}};
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (context_->config.ops_token.empty() || header_token != context_->config.ops_token) {
      return SendEnvelope(res, http::status::unauthorized,
                          MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability->Snapshot(context_->session_manager->ActiveSessionCount(),
                                            context_->broadcaster->TotalQueueDepth());
    nlohmann::json data{{"region", context_->config.region},
                        {"tick", context_->broadcaster->CurrentTick()},
                        {"sessions", SessionCounts()},
                        {"activeSessions", snapshot.active_sessions},
                        {"activeWebsocket", snapshot.websocket_active},
                        {"queueDepth", snapshot.queue_depth},
                        {"pendingWrites", context_->gateway->PendingWrites()},
                        {"pendingRetries", context_->gateway->PendingRetries()},
                        {"leaderboardPlayers", context_->leaderboard->PlayerCount()},
                        {"errorCount", snapshot.request_errors},
                        {"criticalOverflows", snapshot.Get(Metric::kCriticalOverflows)},
                        {"storageFailures", snapshot.Get(Metric::kStorageFailures)}};
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post && path == "/api/identity") {
    std::string display_name;
    if (!req_.body().empty()) {
      try {
        auto body_json = nlohmann::json::parse(req_.body());
        if (body_json.contains("displayName")) {
          if (!body_json["displayName"].is_string()) {
            throw std::runtime_error("displayName invalid");
          }
          display_name = body_json["displayName"].get<std::string>();
        }
      } catch (const std::exception&) {
        return SendEnvelope(res, http::status::bad_request,
                            MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
      }
    }
    display_name = SanitizeDisplayName(display_name);
    auto issued = context_->identity->Issue(std::chrono::system_clock::now());
    if (!display_name.empty()) {
      PlayerRecord record;
      record.player_id = issued.player_id;
      record.display_name = display_name;
      record.last_seen_unix =
          std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
              .count();
      context_->gateway->UpsertPlayer(record, WriteClass::kInterim);
    }
    nlohmann::json data{{"playerId", issued.player_id},
                        {"token", issued.token},
                        {"expiresAt", ToIsoString(issued.expires_at)}};
    return SendEnvelope(res, http::status::created, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/api/leaderboard") {
    std::size_t page = 1;
    std::size_t size = 10;
    auto params = ParseQueryParams(query);
    auto parse_or_flag = [&](const std::string& key, std::size_t& dest, std::size_t min, std::size_t max,
                             bool& invalid) {
      auto it = params.find(key);
      if (it == params.end()) {
        return;
      }
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed || *parsed < min || *parsed > max) {
        invalid = true;
        return;
      }
      dest = *parsed;
    };

    bool invalid = false;
    parse_or_flag("page", page, 1, std::numeric_limits<std::size_t>::max() / 100, invalid);
    parse_or_flag("size", size, 1, 50, invalid);
    if (invalid) {
      return SendEnvelope(res, http::status::bad_request,
                          MakeErrorEnvelope("leaderboard_range", "page 또는 size 값이 허용 범위를 벗어났습니다"));
    }
    auto snapshot = context_->leaderboard->Snapshot();
    LeaderboardSnapshot empty;
    return SendEnvelope(res, http::status::ok,
                        MakeSuccessEnvelope(LeaderboardPageJson(snapshot ? *snapshot : empty, page, size)));
  }

  const std::string players_prefix = "/api/players/";
  if (req_.method() == http::verb::get && path.rfind(players_prefix, 0) == 0) {
    auto player_id = UrlDecode(path.substr(players_prefix.size()));
    if (player_id.empty() || player_id.size() > 64) {
      return SendEnvelope(res, http::status::bad_request,
                          MakeErrorEnvelope("bad_request", "플레이어 식별자가 올바르지 않습니다"));
    }
    auto loaded = context_->gateway->LoadPlayer(player_id);
    if (loaded.status == LoadStatus::kUnavailable) {
      return SendEnvelope(res, http::status::service_unavailable,
                          MakeErrorEnvelope("storage_unavailable", "저장소를 사용할 수 없습니다"));
    }
    if (loaded.status == LoadStatus::kNotFound || !loaded.record) {
      return SendEnvelope(res, http::status::not_found,
                          MakeErrorEnvelope("player_not_found", "플레이어를 찾을 수 없습니다"));
    }
    auto data = ToJson(*loaded.record);
    auto snapshot = context_->leaderboard->Snapshot();
    std::optional<LeaderboardEntry> ranked;
    if (snapshot) {
      ranked = snapshot->Find(player_id);
    }
    data["rank"] = ranked ? nlohmann::json(ranked->rank) : nlohmann::json(nullptr);
    data["currentScore"] = ranked ? nlohmann::json(ranked->score) : nlohmann::json(nullptr);
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  SendEnvelope(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendEnvelope(std::shared_ptr<Response> res, boost::beast::http::status status,
                               const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto& observability = context_->observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = std::string(req_.target());
  ctx.latency_ms = static_cast<long>(latency);
  ctx.detail = {{"status", res->result_int()}};
  observability->Log(ctx);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = context_->observability->NextTraceId();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  auto qpos = target_str.find('?');
  std::string path = qpos == std::string::npos ? target_str : target_str.substr(0, qpos);
  if (path != "/ws") {
    return SendEnvelope(res, boost::beast::http::status::not_found,
                        MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  auto params = ParseQueryParams(qpos == std::string::npos ? std::string() : target_str.substr(qpos + 1));

  Handshake handshake;
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    auto bearer = ParseBearer(std::string(auth_it->value()));
    if (!bearer.empty()) {
      handshake.token = bearer;
    }
  }
  if (!handshake.token) {
    auto token_it = params.find("token");
    if (token_it != params.end() && !token_it->second.empty()) {
      handshake.token = token_it->second;
    }
  }
  if (auto it = params.find("name"); it != params.end()) {
    handshake.display_name = it->second;
  }
  if (auto it = params.find("team"); it != params.end()) {
    handshake.team = it->second;
  }
  auto ua_it = req_.find(boost::beast::http::field::user_agent);
  if (ua_it != req_.end()) {
    handshake.user_agent = std::string(ua_it->value());
  }
  handshake.remote_address = RemoteIp();

  AuthError error;
  auto session_id = context_->session_manager->Open(handshake, error);
  if (!session_id) {
    context_->observability->IncrementRequest();
    return SendEnvelope(res, AuthErrorStatus(error.code), MakeErrorEnvelope(error.code, error.message));
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
  } catch (const std::exception& ex) {
    context_->session_manager->ConnectionLost(*session_id);
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.session_id = *session_id;
    ctx.name = "ws.accept_failed";
    ctx.level = LogLevel::kWarn;
    ctx.detail = {{"error", ex.what()}};
    context_->observability->Log(ctx);
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), *session_id, context_->session_manager, context_->broadcaster,
                                     context_->observability)
      ->Run();
}

nlohmann::json HttpSession::SessionCounts() const {
  nlohmann::json counts = nlohmann::json::object();
  for (const auto& [state, count] : context_->session_manager->CountByState()) {
    counts[std::string(SessionStateName(state))] = count;
  }
  return counts;
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace arena
