/*
 * 설명: WebSocket 연결 하나를 세션 하나에 묶는다. 수신한 이진 메시지를 연결 관리자로 라우팅하고,
 *       브로드캐스터가 깨우면 세션 큐에서 프레임을 꺼내 순서대로 전송한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/broadcaster.hpp"
#include "arena/observability.hpp"
#include "arena/session_manager.hpp"

namespace arena {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, SessionId session_id,
                   std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Broadcaster> broadcaster,
                   std::shared_ptr<Observability> observability);
  ~WebSocketSession();
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void RequestClose(CloseReason reason);
  void DoClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  SessionId session_id_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Broadcaster> broadcaster_;
  std::shared_ptr<Observability> observability_;
  std::optional<OutboundFrame> in_flight_;
  bool writing_{false};
  bool closing_{false};
  std::optional<CloseReason> close_reason_;
};

}  // namespace arena
