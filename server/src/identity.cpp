/*
 * 설명: HMAC 식별 토큰과 핸드셰이크 레이트리밋을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#include "arena/identity.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace arena {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool IsHex(const std::string& value) {
  for (unsigned char c : value) {
    if (!std::isxdigit(c)) {
      return false;
    }
  }
  return !value.empty();
}

bool ParseUnix(const std::string& value, std::int64_t& out) {
  if (value.empty() || value.size() > 18) {
    return false;
  }
  for (unsigned char c : value) {
    if (!std::isdigit(c)) {
      return false;
    }
  }
  out = std::stoll(value);
  return true;
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (++prune_counter_ == 0) {
    Prune(now);
  }
  auto& bucket = buckets_[key];
  if (bucket.window_start.time_since_epoch().count() == 0) {
    bucket.window_start = now;
  }
  auto elapsed = now - bucket.window_start;
  if (elapsed > window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_attempts_) {
    return false;
  }
  ++bucket.count;
  return true;
}

void RateLimiter::Prune(std::chrono::system_clock::time_point now) {
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    if (now - it->second.window_start > window_) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t RateLimiter::TrackedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

IdentityService::IdentityService(const IdentityConfig& config) : config_(config) {
  if (config_.secret.empty()) {
    // 비밀키가 없으면 프로세스 수명 동안만 유효한 키를 만든다.
    config_.secret = RandomHex(32);
  }
}

IssuedIdentity IdentityService::Issue(std::chrono::system_clock::time_point now) {
  return IssueFor(RandomHex(16), now);
}

IssuedIdentity IdentityService::IssueFor(const std::string& player_id, std::chrono::system_clock::time_point now) {
  IssuedIdentity issued;
  issued.player_id = player_id;
  issued.expires_at = now + config_.token_ttl;
  auto expiry = std::chrono::duration_cast<std::chrono::seconds>(issued.expires_at.time_since_epoch()).count();
  std::string payload = player_id + "." + std::to_string(expiry);
  issued.token = payload + "." + Sign(payload);
  return issued;
}

std::optional<std::string> IdentityService::Validate(const std::string& token,
                                                     std::chrono::system_clock::time_point now,
                                                     std::string& error_code, std::string& error_message) const {
  auto first = token.find('.');
  auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (first == std::string::npos || second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    error_code = "invalid_token";
    error_message = "식별 토큰 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  std::string player_id = token.substr(0, first);
  std::string expiry_text = token.substr(first + 1, second - first - 1);
  std::string signature = token.substr(second + 1);
  std::int64_t expiry = 0;
  if (!IsHex(player_id) || !ParseUnix(expiry_text, expiry) || !IsHex(signature)) {
    error_code = "invalid_token";
    error_message = "식별 토큰 형식이 올바르지 않습니다";
    return std::nullopt;
  }

  auto expected = Sign(token.substr(0, second));
  if (expected.size() != signature.size() ||
      CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) != 0) {
    error_code = "invalid_token";
    error_message = "식별 토큰 서명이 올바르지 않습니다";
    return std::nullopt;
  }
  auto now_unix = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  if (now_unix > expiry) {
    error_code = "expired_token";
    error_message = "식별 토큰이 만료되었습니다";
    return std::nullopt;
  }
  return player_id;
}

std::string IdentityService::Sign(const std::string& payload) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), config_.secret.data(), static_cast<int>(config_.secret.size()),
            reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest, &digest_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

}  // namespace arena
