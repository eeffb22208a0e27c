/*
 * 설명: 플레이어 식별 토큰 발급/검증(HMAC-SHA256)과 주소별 핸드셰이크 레이트리밋을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace arena {

struct IdentityConfig {
  std::string secret;
  std::chrono::seconds token_ttl{std::chrono::seconds(86400)};
};

struct IssuedIdentity {
  std::string player_id;
  std::string token;
  std::chrono::system_clock::time_point expires_at;
};

class RateLimiter {
 public:
  RateLimiter(std::size_t max_attempts, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::system_clock::time_point now);
  std::size_t TrackedKeys() const;

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::system_clock::time_point window_start{};
  };
  void Prune(std::chrono::system_clock::time_point now);

  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_attempts_;
  std::chrono::seconds window_;
  std::uint8_t prune_counter_{0};
  mutable std::mutex mutex_;
};

std::string RandomHex(std::size_t bytes);

class IdentityService {
 public:
  explicit IdentityService(const IdentityConfig& config);

  IssuedIdentity Issue(std::chrono::system_clock::time_point now);
  IssuedIdentity IssueFor(const std::string& player_id, std::chrono::system_clock::time_point now);
  // 실패 시 error_code는 invalid_token 또는 expired_token이다.
  std::optional<std::string> Validate(const std::string& token, std::chrono::system_clock::time_point now,
                                      std::string& error_code, std::string& error_message) const;

 private:
  std::string Sign(const std::string& payload) const;

  IdentityConfig config_;
};

}  // namespace arena
