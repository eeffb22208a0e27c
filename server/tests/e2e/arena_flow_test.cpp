#include <chrono>
#include <memory>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"
#include "arena/wire_codec.hpp"

namespace {

arena::AppConfig TestConfig() {
  arena::AppConfig cfg{};
  cfg.port = 0;
  cfg.region = "e2e";
  cfg.db_host = "";
  cfg.log_level = "warn";
  cfg.ops_token = "ops-secret";
  cfg.identity_secret = "e2e-secret";
  cfg.identity_token_ttl_seconds = 3600;
  cfg.handshake_rate_window_seconds = 60;
  cfg.handshake_rate_limit_max = 100;
  cfg.tick_interval_ms = 20;
  cfg.history_horizon_ticks = 64;
  cfg.max_baseline_age_ticks = 32;
  cfg.field_epsilon = 0.001f;
  cfg.session_queue_capacity = 64;
  cfg.critical_queue_cap = 256;
  cfg.idle_timeout_seconds = 30;
  cfg.drain_grace_ms = 2000;
  cfg.leaderboard_interval_ms = 100;
  cfg.leaderboard_broadcast_size = 10;
  cfg.retry_buffer_capacity = 16;
  cfg.retry_base_ms = 10;
  cfg.retry_max_ms = 100;
  cfg.interim_write_interval_seconds = 30;
  cfg.chat_blocklist = "darn";
  cfg.chat_max_length = 200;
  cfg.chat_rate_per_10s = 5;
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

struct Frame {
  arena::FrameKind kind;
  arena::Tick tick;
  nlohmann::json body;
};

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  EXPECT_EQ(body["error"]["code"], code);
}

class ArenaFlowFixture : public ::testing::Test {
 protected:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void SetUp() override {
    app_ = std::make_unique<arena::ServerApp>(TestConfig());
    server_thread_ = std::thread([this]() { app_->Run(); });
    for (int i = 0; i < 100 && app_->BoundPort() == 0; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_NE(app_->BoundPort(), 0);
    port_ = app_->BoundPort();
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target,
                             const nlohmann::json& body = nullptr) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.is_null()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body.dump();
    }
    req.prepare_payload();
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  std::pair<std::string, std::string> IssueIdentity(const std::string& display_name) {
    auto res = Request(boost::beast::http::verb::post, "/api/identity", {{"displayName", display_name}});
    EXPECT_EQ(res.status, boost::beast::http::status::created);
    return {res.body["data"]["playerId"].get<std::string>(), res.body["data"]["token"].get<std::string>()};
  }

  std::unique_ptr<WebSocket> ConnectWs(const std::string& token, const std::string& target = "/ws",
                                       boost::beast::websocket::response_type* response = nullptr) {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port_));
    ws->next_layer().connect(results);
    ws->set_option(
        boost::beast::websocket::stream_base::decorator([token](boost::beast::websocket::request_type& req) {
          req.set(boost::beast::http::field::user_agent, "ArenaClient/1.0");
          if (!token.empty()) {
            req.set(boost::beast::http::field::authorization, "Bearer " + token);
          }
        }));
    boost::beast::websocket::response_type local;
    boost::beast::error_code ec;
    ws->handshake(response ? *response : local, "localhost", target, ec);
    if (ec) {
      return nullptr;
    }
    ws->binary(true);
    return ws;
  }

  Frame ReadFrame(WebSocket& ws) {
    boost::beast::flat_buffer buffer;
    ws.read(buffer);
    auto raw = boost::beast::buffers_to_string(buffer.cdata());
    auto header = arena::DecodeFrameHeader(raw);
    EXPECT_TRUE(header.has_value());
    std::string error;
    auto body = arena::DecodeFrameBody(raw, error);
    EXPECT_TRUE(body.has_value()) << error;
    return Frame{header ? header->kind : arena::FrameKind::kNotice, header ? header->tick : 0,
                 body.value_or(nlohmann::json())};
  }

  std::optional<Frame> ReadUntil(WebSocket& ws, arena::FrameKind kind, int max_frames = 100) {
    for (int i = 0; i < max_frames; ++i) {
      auto frame = ReadFrame(ws);
      if (frame.kind == kind) {
        return frame;
      }
    }
    return std::nullopt;
  }

  void Send(WebSocket& ws, const arena::InboundMessage& message) {
    auto bytes = arena::EncodeInbound(message);
    ws.write(boost::asio::buffer(bytes));
  }

  void SendRaw(WebSocket& ws, const std::string& bytes) { ws.write(boost::asio::buffer(bytes)); }

  // 서버가 닫을 때까지 읽고 받은 종료 코드를 돌려준다.
  std::uint16_t ReadUntilClosed(WebSocket& ws) {
    for (int i = 0; i < 500; ++i) {
      boost::beast::flat_buffer buffer;
      boost::beast::error_code ec;
      ws.read(buffer, ec);
      if (ec == boost::beast::websocket::error::closed) {
        return static_cast<std::uint16_t>(ws.reason().code);
      }
      if (ec) {
        ADD_FAILURE() << "unexpected read error: " << ec.message();
        return 0;
      }
    }
    ADD_FAILURE() << "server did not close the connection";
    return 0;
  }

  std::unique_ptr<arena::ServerApp> app_;
  std::thread server_thread_;
  unsigned short port_{0};
  boost::asio::io_context ioc_;
};

}  // namespace

TEST_F(ArenaFlowFixture, SubscribeReceivesFullThenDeltaAndLeaves) {
  auto [player_id, token] = IssueIdentity("alice");
  auto ws = ConnectWs(token);
  ASSERT_NE(ws, nullptr);

  auto accepted = ReadFrame(*ws);
  ASSERT_EQ(accepted.kind, arena::FrameKind::kNotice);
  EXPECT_EQ(accepted.body["c"], "session_accepted");
  EXPECT_EQ(accepted.body["d"]["playerId"], player_id);
  EXPECT_EQ(accepted.body["d"]["trust"], "trusted");

  arena::InboundMessage subscribe;
  subscribe.kind = arena::InboundKind::kSubscribe;
  Send(*ws, subscribe);

  auto full = ReadUntil(*ws, arena::FrameKind::kFullSnapshot);
  ASSERT_TRUE(full.has_value());
  std::string error;
  auto world = arena::DecodeWorldFrame(arena::EncodeFrame(full->kind, full->tick, full->body), error);
  ASSERT_TRUE(world.has_value()) << error;
  EXPECT_FALSE(world->IsDelta());

  arena::InboundMessage ack;
  ack.kind = arena::InboundKind::kAck;
  ack.ack_tick = full->tick;
  Send(*ws, ack);
  auto delta = ReadUntil(*ws, arena::FrameKind::kDelta);
  ASSERT_TRUE(delta.has_value());
  EXPECT_GT(delta->tick, full->tick);

  arena::InboundMessage leave;
  leave.kind = arena::InboundKind::kLeave;
  Send(*ws, leave);
  EXPECT_EQ(ReadUntilClosed(*ws), arena::kCloseCodeBase + static_cast<std::uint16_t>(arena::CloseReason::kClientLeft));
}

TEST_F(ArenaFlowFixture, InvalidTokenFailsHandshake) {
  boost::beast::websocket::response_type response;
  auto ws = ConnectWs("deadbeef.1.cafe", "/ws", &response);
  EXPECT_EQ(ws, nullptr);
  EXPECT_EQ(response.result(), boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(nlohmann::json::parse(response.body()), "invalid_token");
}

TEST_F(ArenaFlowFixture, RepeatedMalformedMessagesCloseConnection) {
  auto ws = ConnectWs("", "/ws?name=mallory");
  ASSERT_NE(ws, nullptr);
  auto accepted = ReadFrame(*ws);
  EXPECT_EQ(accepted.body["d"]["displayName"], "mallory");
  EXPECT_TRUE(accepted.body["d"]["ephemeral"].get<bool>());

  for (int i = 0; i < 3; ++i) {
    SendRaw(*ws, std::string("\x7f", 1));
  }
  EXPECT_EQ(ReadUntilClosed(*ws),
            arena::kCloseCodeBase + static_cast<std::uint16_t>(arena::CloseReason::kProtocolViolation));
  EXPECT_GE(app_->GetObservability()->Get(arena::Metric::kMalformedMessages), 3u);
}

TEST_F(ArenaFlowFixture, FilteredChatReachesOtherPlayer) {
  auto alice = ConnectWs("", "/ws?name=alice");
  auto bob = ConnectWs("", "/ws?name=bob");
  ASSERT_NE(alice, nullptr);
  ASSERT_NE(bob, nullptr);
  arena::InboundMessage subscribe;
  subscribe.kind = arena::InboundKind::kSubscribe;
  Send(*alice, subscribe);
  Send(*bob, subscribe);
  ASSERT_TRUE(ReadUntil(*alice, arena::FrameKind::kFullSnapshot).has_value());
  ASSERT_TRUE(ReadUntil(*bob, arena::FrameKind::kFullSnapshot).has_value());

  arena::InboundMessage chat;
  chat.kind = arena::InboundKind::kChat;
  chat.chat.scope = arena::ChatScope::kBroadcast;
  chat.chat.text = "well darn";
  Send(*alice, chat);

  auto delivered = ReadUntil(*bob, arena::FrameKind::kChat, 400);
  ASSERT_TRUE(delivered.has_value());
  EXPECT_EQ(delivered->body["n"], "alice");
  EXPECT_EQ(delivered->body["m"], "well ****");
  EXPECT_TRUE(delivered->body["f"].get<bool>());
}

TEST_F(ArenaFlowFixture, LeaderboardAndPlayerEndpoints) {
  auto out_of_range = Request(boost::beast::http::verb::get, "/api/leaderboard?size=100");
  EXPECT_EQ(out_of_range.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(out_of_range.body, "leaderboard_range");

  auto board = Request(boost::beast::http::verb::get, "/api/leaderboard?page=1&size=5");
  ASSERT_EQ(board.status, boost::beast::http::status::ok);
  EXPECT_TRUE(board.body["data"]["items"].is_array());
  EXPECT_EQ(board.body["data"]["size"], 5);

  auto missing = Request(boost::beast::http::verb::get, "/api/players/0123abcd");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "player_not_found");

  auto [player_id, token] = IssueIdentity("carol");
  SimpleHttpResponse found{boost::beast::http::status::not_found, nullptr};
  for (int i = 0; i < 50; ++i) {
    found = Request(boost::beast::http::verb::get, "/api/players/" + player_id);
    if (found.status == boost::beast::http::status::ok) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_EQ(found.status, boost::beast::http::status::ok);
  EXPECT_EQ(found.body["data"]["displayName"], "carol");
  EXPECT_EQ(found.body["data"]["bestScore"], 0);
  EXPECT_TRUE(found.body["data"]["rank"].is_null());

  auto unknown = Request(boost::beast::http::verb::get, "/api/unknown");
  EXPECT_EQ(unknown.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(unknown.body, "not_found");
}

TEST_F(ArenaFlowFixture, MultibyteAndInvalidNamesStayServable) {
  std::string long_name = "a";
  for (int i = 0; i < 12; ++i) {
    long_name += "\xC3\xA9";
  }
  auto [long_id, long_token] = IssueIdentity(long_name);
  SimpleHttpResponse found{boost::beast::http::status::not_found, nullptr};
  for (int i = 0; i < 50; ++i) {
    found = Request(boost::beast::http::verb::get, "/api/players/" + long_id);
    if (found.status == boost::beast::http::status::ok) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_EQ(found.status, boost::beast::http::status::ok);
  // 24바이트 경계에 걸린 문자는 통째로 빠진다.
  EXPECT_EQ(found.body["data"]["displayName"], long_name.substr(0, 23));

  auto [player_id, token] = IssueIdentity("");
  auto ws = ConnectWs(token, "/ws?name=%FFbob%C3");
  ASSERT_NE(ws, nullptr);
  auto accepted = ReadFrame(*ws);
  ASSERT_EQ(accepted.kind, arena::FrameKind::kNotice);
  EXPECT_EQ(accepted.body["d"]["displayName"], "bob");

  for (int i = 0; i < 50; ++i) {
    found = Request(boost::beast::http::verb::get, "/api/players/" + player_id);
    if (found.status == boost::beast::http::status::ok) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_EQ(found.status, boost::beast::http::status::ok);
  EXPECT_EQ(found.body["data"]["displayName"], "bob");
  auto board = Request(boost::beast::http::verb::get, "/api/leaderboard");
  EXPECT_EQ(board.status, boost::beast::http::status::ok);
}
