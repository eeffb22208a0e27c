/*
 * 설명: HTTP 연결을 처리하고 상태/리더보드/플레이어/식별 발급/메트릭 엔드포인트와
 *       /ws WebSocket 업그레이드(핸드셰이크 인증 포함)를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/broadcaster.hpp"
#include "arena/config.hpp"
#include "arena/identity.hpp"
#include "arena/leaderboard.hpp"
#include "arena/observability.hpp"
#include "arena/persistence_gateway.hpp"
#include "arena/session_manager.hpp"

namespace arena {

// 연결마다 넘겨주는 서비스 묶음. 모두 ServerApp이 소유한다.
struct ServerContext {
  AppConfig config;
  std::shared_ptr<IdentityService> identity;
  std::shared_ptr<SessionManager> session_manager;
  std::shared_ptr<LeaderboardService> leaderboard;
  std::shared_ptr<PersistenceGateway> gateway;
  std::shared_ptr<Broadcaster> broadcaster;
  std::shared_ptr<Observability> observability;
};

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
std::string UrlDecode(const std::string& value);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void SendEnvelope(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void HandleWebSocket();
  nlohmann::json SessionCounts() const;
  std::string RemoteIp();
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServerContext> context_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace arena
