/*
 * 설명: 플레이어 레코드와 저장소 계약. 모든 쓰기는 키 기준 병합(upsert)이라 재시도해도 안전하다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/unit/persistence_gateway_test.cpp, server/tests/it/mariadb_player_store_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace arena {

enum ModerationFlag : std::uint32_t {
  kFlagMuted = 1u << 0,
  kFlagBanned = 1u << 1,
};

struct PlayerRecord {
  std::string player_id;
  std::string display_name;
  std::uint64_t best_score{0};
  std::uint32_t moderation_flags{0};
  std::int64_t last_seen_unix{0};
  // 운영자 조치만 true로 쓴다. false면 이미 저장된 플래그를 유지한다.
  bool overwrite_flags{false};

  bool Muted() const { return (moderation_flags & kFlagMuted) != 0; }
  bool Banned() const { return (moderation_flags & kFlagBanned) != 0; }
};

bool operator==(const PlayerRecord& lhs, const PlayerRecord& rhs);

constexpr std::size_t kMaxDisplayNameBytes = 24;

// 잘못된 UTF-8 바이트와 제어 문자를 버리고 앞뒤 공백을 지운 뒤 문자 경계에서 max_bytes 이하로 자른다.
// 남는 글자가 없으면 빈 문자열을 돌려준다.
std::string SanitizeDisplayName(std::string_view requested, std::size_t max_bytes = kMaxDisplayNameBytes);

// 저장된 레코드에 새 레코드를 병합한다. 이름은 덮어쓰고 최고 점수와 마지막 접속은 큰 값을 유지한다.
// 플래그는 incoming.overwrite_flags일 때만 덮어쓴다.
PlayerRecord MergePlayerRecord(const PlayerRecord& stored, const PlayerRecord& incoming);

class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& message) : std::runtime_error(message) {}
};

class PlayerStore {
 public:
  virtual ~PlayerStore() = default;

  // 실패하면 StorageUnavailable을 던진다.
  virtual void Upsert(const PlayerRecord& record) = 0;
  virtual std::optional<PlayerRecord> Load(const std::string& player_id) = 0;
  virtual void SaveLeaderboard(const std::string& region, std::uint64_t version, const nlohmann::json& payload) = 0;
};

class InMemoryPlayerStore : public PlayerStore {
 public:
  void Upsert(const PlayerRecord& record) override;
  std::optional<PlayerRecord> Load(const std::string& player_id) override;
  void SaveLeaderboard(const std::string& region, std::uint64_t version, const nlohmann::json& payload) override;

  // 테스트용 장애 주입.
  void SetAvailable(bool available) { available_.store(available); }
  std::size_t UpsertCalls() const { return upsert_calls_.load(); }
  std::size_t RecordCount() const;
  std::optional<nlohmann::json> StoredLeaderboard(const std::string& region) const;

 private:
  void EnsureAvailable() const;

  std::atomic<bool> available_{true};
  std::atomic<std::size_t> upsert_calls_{0};
  std::unordered_map<std::string, PlayerRecord> records_;
  std::unordered_map<std::string, std::pair<std::uint64_t, nlohmann::json>> leaderboards_;
  mutable std::mutex mutex_;
};

}  // namespace arena
