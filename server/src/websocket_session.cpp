/*
 * 설명: WebSocket 이진 프레임 송수신과 종료 코드 처리를 구현한다. 모든 핸들러는 연결 strand에서 돈다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/websocket_session.hpp"

#include <string>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace arena {

namespace {
constexpr std::size_t kMaxInboundMessage = 16 * 1024;
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   SessionId session_id, std::shared_ptr<SessionManager> session_manager,
                                   std::shared_ptr<Broadcaster> broadcaster,
                                   std::shared_ptr<Observability> observability)
    : ws_(std::move(ws)), session_id_(session_id), session_manager_(std::move(session_manager)),
      broadcaster_(std::move(broadcaster)), observability_(std::move(observability)) {}

WebSocketSession::~WebSocketSession() {
  if (observability_) {
    observability_->AdjustWebsocketActive(-1);
  }
  // 전송 객체가 사라졌는데 세션이 남아 있으면 연결 유실로 닫는다.
  session_manager_->ConnectionLost(session_id_);
}

void WebSocketSession::Run() {
  if (observability_) {
    observability_->AdjustWebsocketActive(1);
  }
  ws_.binary(true);
  ws_.read_message_max(kMaxInboundMessage);
  std::weak_ptr<WebSocketSession> weak = shared_from_this();
  auto executor = ws_.get_executor();
  session_manager_->BindTransport(
      session_id_,
      [weak, executor]() {
        boost::asio::post(executor, [weak]() {
          if (auto self = weak.lock()) {
            self->WriteNext();
          }
        });
      },
      [weak, executor](CloseReason reason) {
        boost::asio::post(executor, [weak, reason]() {
          if (auto self = weak.lock()) {
            self->RequestClose(reason);
          }
        });
      });
  // 핸드셰이크 직후 큐에 들어간 session_accepted 알림부터 보낸다.
  WriteNext();
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (!closing_) {
      closing_ = true;
      session_manager_->ConnectionLost(session_id_);
    }
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto result = session_manager_->Route(session_id_, data);
  if (result.status == RouteStatus::kUnknownSession) {
    return;
  }
  DoRead();
}

void WebSocketSession::WriteNext() {
  if (writing_ || closing_) {
    return;
  }
  auto frame = broadcaster_->Pop(session_id_);
  if (!frame) {
    if (close_reason_) {
      DoClose();
    }
    return;
  }
  in_flight_ = std::move(frame);
  writing_ = true;
  auto self = shared_from_this();
  ws_.async_write(boost::asio::buffer(in_flight_->bytes),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  in_flight_.reset();
  if (ec) {
    if (!closing_) {
      closing_ = true;
      session_manager_->ConnectionLost(session_id_);
    }
    return;
  }
  session_manager_->OnFrameWritten(session_id_);
  WriteNext();
}

void WebSocketSession::RequestClose(CloseReason reason) {
  if (closing_ || close_reason_) {
    return;
  }
  close_reason_ = reason;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::DoClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  auto code = static_cast<std::uint16_t>(kCloseCodeBase + static_cast<std::uint16_t>(*close_reason_));
  boost::beast::websocket::close_reason reason{code};
  reason.reason = std::string(CloseReasonName(*close_reason_));
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace arena
