#include <chrono>
#include <memory>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"

namespace {

arena::AppConfig TestConfig() {
  arena::AppConfig cfg{};
  cfg.port = 0;
  cfg.region = "ops";
  cfg.db_host = "";
  cfg.log_level = "warn";
  cfg.ops_token = "ops-secret";
  cfg.identity_secret = "ops-test";
  cfg.identity_token_ttl_seconds = 3600;
  cfg.handshake_rate_window_seconds = 60;
  cfg.handshake_rate_limit_max = 2;
  cfg.tick_interval_ms = 50;
  cfg.history_horizon_ticks = 64;
  cfg.max_baseline_age_ticks = 32;
  cfg.field_epsilon = 0.001f;
  cfg.session_queue_capacity = 64;
  cfg.critical_queue_cap = 256;
  cfg.idle_timeout_seconds = 30;
  cfg.drain_grace_ms = 2000;
  cfg.leaderboard_interval_ms = 200;
  cfg.leaderboard_broadcast_size = 10;
  cfg.retry_buffer_capacity = 16;
  cfg.retry_base_ms = 10;
  cfg.retry_max_ms = 100;
  cfg.interim_write_interval_seconds = 30;
  cfg.chat_max_length = 200;
  cfg.chat_rate_per_10s = 5;
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body.contains("success"));
  EXPECT_FALSE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class MetricsOpsFixture : public ::testing::Test {
 protected:
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

  SimpleHttpResponse Get(const std::string& target, const std::string& extra_header_name = "",
                         const std::string& extra_header_value = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!extra_header_name.empty()) {
      req.set(extra_header_name, extra_header_value);
    }

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  boost::beast::http::status TryWebSocket() {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws{ioc};
    ws.next_layer().connect(resolver.resolve("127.0.0.1", std::to_string(port_)));
    boost::beast::websocket::response_type response;
    boost::beast::error_code ec;
    ws.handshake(response, "localhost", "/ws", ec);
    if (!ec) {
      ws.close(boost::beast::websocket::close_code::normal, ec);
    }
    return response.result();
  }

  std::unique_ptr<arena::ServerApp> app_;
  std::thread server_thread_;
  unsigned short port_{0};
};

}  // namespace

TEST_F(MetricsOpsFixture, MetricsAndOpsEndpoints) {
  auto first = Get("/metrics");
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(first.body);
  EXPECT_TRUE(first.body["data"].contains("requests"));
  EXPECT_TRUE(first.body["data"]["counters"].contains("ticks"));
  EXPECT_TRUE(first.body["data"]["counters"].contains("criticalOverflows"));
  auto initial_total = first.body["data"]["requests"]["total"].get<std::uint64_t>();

  auto unauthorized_ops = Get("/ops/status");
  EXPECT_EQ(unauthorized_ops.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(unauthorized_ops.body, "unauthorized");

  auto wrong_token = Get("/ops/status", "X-Ops-Token", "nope");
  EXPECT_EQ(wrong_token.status, boost::beast::http::status::unauthorized);

  auto authed_ops = Get("/ops/status", "X-Ops-Token", "ops-secret");
  ASSERT_EQ(authed_ops.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(authed_ops.body);
  EXPECT_TRUE(authed_ops.body["data"].contains("activeSessions"));
  EXPECT_EQ(authed_ops.body["data"]["region"], "ops");
  EXPECT_TRUE(authed_ops.body["data"].contains("pendingRetries"));

  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");
  EXPECT_TRUE(health.body["data"]["sessions"].contains("active"));

  auto second = Get("/metrics");
  ASSERT_EQ(second.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(second.body);
  auto second_total = second.body["data"]["requests"]["total"].get<std::uint64_t>();
  EXPECT_GE(second_total, initial_total + 2);
}

TEST_F(MetricsOpsFixture, TickCounterAdvances) {
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_GT(metrics.body["data"]["counters"]["ticks"].get<std::uint64_t>(), 0u);
  auto health = Get("/api/health");
  EXPECT_GT(health.body["data"]["tick"].get<std::uint64_t>(), 0u);
}

TEST_F(MetricsOpsFixture, HandshakeRateLimitCountsRejections) {
  EXPECT_EQ(TryWebSocket(), boost::beast::http::status::switching_protocols);
  EXPECT_EQ(TryWebSocket(), boost::beast::http::status::switching_protocols);
  EXPECT_EQ(TryWebSocket(), boost::beast::http::status::too_many_requests);

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.body["data"]["counters"]["handshakesRejected"], 1);
}
