/*
 * 설명: 플레이어 레코드 병합 규칙과 메모리 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/unit/persistence_gateway_test.cpp
 */
#include "arena/player_store.hpp"

#include <algorithm>

namespace arena {

bool operator==(const PlayerRecord& lhs, const PlayerRecord& rhs) {
  return lhs.player_id == rhs.player_id && lhs.display_name == rhs.display_name &&
         lhs.best_score == rhs.best_score && lhs.moderation_flags == rhs.moderation_flags &&
         lhs.last_seen_unix == rhs.last_seen_unix;
}

namespace {
// requested[pos]에서 시작하는 UTF-8 문자 하나의 길이와 코드 포인트를 읽는다. 형식이 잘못되면 0을 돌려준다.
std::size_t DecodeCodePoint(std::string_view text, std::size_t pos, std::uint32_t& code_point) {
  auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  std::uint32_t min_value = 0;
  if (lead < 0x80) {
    code_point = lead;
    return 1;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    code_point = lead & 0x1F;
    min_value = 0x80;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    code_point = lead & 0x0F;
    min_value = 0x800;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    code_point = lead & 0x07;
    min_value = 0x10000;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return 0;
    }
    code_point = (code_point << 6) | (next & 0x3F);
  }
  // 과잉 표현, 서로게이트, 범위 밖 값은 거부한다.
  if (code_point < min_value || (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
    return 0;
  }
  return length;
}
}  // namespace

std::string SanitizeDisplayName(std::string_view requested, std::size_t max_bytes) {
  std::string name;
  std::size_t pos = 0;
  while (pos < requested.size()) {
    std::uint32_t code_point = 0;
    auto length = DecodeCodePoint(requested, pos, code_point);
    if (length == 0) {
      ++pos;
      continue;
    }
    bool control = code_point < 0x20 || (code_point >= 0x7F && code_point <= 0x9F);
    if (!control) {
      name.append(requested.substr(pos, length));
    }
    pos += length;
  }

  auto begin = name.find_first_not_of(' ');
  if (begin == std::string::npos) {
    return {};
  }
  auto end = name.find_last_not_of(' ');
  name = name.substr(begin, end - begin + 1);
  if (name.size() > max_bytes) {
    // 이미 올바른 UTF-8이므로 연속 바이트가 아닌 위치까지 물러나면 문자 경계다.
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    name.resize(cut);
    auto last = name.find_last_not_of(' ');
    name.resize(last == std::string::npos ? 0 : last + 1);
  }
  return name;
}

PlayerRecord MergePlayerRecord(const PlayerRecord& stored, const PlayerRecord& incoming) {
  PlayerRecord merged = incoming;
  if (merged.display_name.empty()) {
    merged.display_name = stored.display_name;
  }
  merged.best_score = std::max(stored.best_score, incoming.best_score);
  merged.last_seen_unix = std::max(stored.last_seen_unix, incoming.last_seen_unix);
  if (!incoming.overwrite_flags) {
    merged.moderation_flags = stored.moderation_flags;
    merged.overwrite_flags = stored.overwrite_flags;
  }
  return merged;
}

void InMemoryPlayerStore::EnsureAvailable() const {
  if (!available_.load()) {
    throw StorageUnavailable("메모리 저장소가 비활성화되었습니다");
  }
}

void InMemoryPlayerStore::Upsert(const PlayerRecord& record) {
  upsert_calls_.fetch_add(1);
  EnsureAvailable();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(record.player_id);
  if (it == records_.end()) {
    it = records_.emplace(record.player_id, record).first;
  } else {
    it->second = MergePlayerRecord(it->second, record);
  }
  it->second.overwrite_flags = false;
}

std::optional<PlayerRecord> InMemoryPlayerStore::Load(const std::string& player_id) {
  EnsureAvailable();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(player_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryPlayerStore::SaveLeaderboard(const std::string& region, std::uint64_t version,
                                          const nlohmann::json& payload) {
  EnsureAvailable();
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = leaderboards_[region];
  if (version >= slot.first) {
    slot = {version, payload};
  }
}

std::size_t InMemoryPlayerStore::RecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::optional<nlohmann::json> InMemoryPlayerStore::StoredLeaderboard(const std::string& region) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = leaderboards_.find(region);
  if (it == leaderboards_.end()) {
    return std::nullopt;
  }
  return it->second.second;
}

}  // namespace arena
