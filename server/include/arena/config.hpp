/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace arena {

struct AppConfig {
  unsigned short port;
  std::string region;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string db_namespace;
  std::string log_level;
  std::string ops_token;
  std::string identity_secret;
  std::size_t identity_token_ttl_seconds;
  std::size_t handshake_rate_window_seconds;
  std::size_t handshake_rate_limit_max;
  std::size_t tick_interval_ms;
  std::size_t history_horizon_ticks;
  std::size_t max_baseline_age_ticks;
  float field_epsilon;
  std::size_t session_queue_capacity;
  std::size_t critical_queue_cap;
  std::size_t idle_timeout_seconds;
  std::size_t drain_grace_ms;
  std::size_t leaderboard_interval_ms;
  std::size_t leaderboard_broadcast_size;
  std::size_t retry_buffer_capacity;
  std::size_t retry_base_ms;
  std::size_t retry_max_ms;
  std::size_t interim_write_interval_seconds;
  std::string chat_blocklist;
  std::size_t chat_max_length;
  std::size_t chat_rate_per_10s;
};

AppConfig LoadConfigFromEnv();

}  // namespace arena
