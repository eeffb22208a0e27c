/*
 * 설명: JSON 응답 엔벨로프와 리더보드/플레이어 표현을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "arena/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace arena {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const LeaderboardEntry& entry) {
  return {{"rank", entry.rank},
          {"playerId", entry.player_id},
          {"displayName", entry.display_name},
          {"score", entry.score},
          {"achievedTick", entry.achieved_tick}};
}

nlohmann::json LeaderboardPageJson(const LeaderboardSnapshot& snapshot, std::size_t page, std::size_t size) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& entry : snapshot.Page(page, size)) {
    items.push_back(ToJson(entry));
  }
  return {{"version", snapshot.version},
          {"tick", snapshot.tick},
          {"page", page},
          {"size", size},
          {"total", snapshot.entries.size()},
          {"items", items}};
}

nlohmann::json ToJson(const PlayerRecord& record) {
  return {{"playerId", record.player_id},
          {"displayName", record.display_name},
          {"bestScore", record.best_score},
          {"muted", record.Muted()},
          {"banned", record.Banned()},
          {"lastSeen", record.last_seen_unix}};
}

}  // namespace arena
