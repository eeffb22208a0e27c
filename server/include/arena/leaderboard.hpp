/*
 * 설명: 틱 단위로 모은 점수 갱신을 반영하고, 순위를 지연 계산해 불변 스냅샷으로 게시한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/leaderboard_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/entity.hpp"

namespace arena {

struct LeaderboardEntry {
  std::string player_id;
  std::string display_name;
  std::uint64_t score{0};
  std::size_t rank{0};
  // 점수가 마지막으로 바뀐 틱. 동점이면 먼저 달성한 쪽이 앞선다.
  Tick achieved_tick{0};
};

struct LeaderboardSnapshot {
  std::uint64_t version{0};
  Tick tick{0};
  std::vector<LeaderboardEntry> entries;

  std::vector<LeaderboardEntry> Page(std::size_t page, std::size_t size) const;
  std::optional<LeaderboardEntry> Find(const std::string& player_id) const;
};

// 점수 내림차순, 달성 틱 오름차순, 플레이어 키 오름차순의 전순서.
bool RanksBefore(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs);

class LeaderboardService {
 public:
  LeaderboardService();

  void RecordScore(const std::string& player_id, const std::string& display_name, std::uint64_t score);
  // 현재 틱까지 쌓인 갱신을 반영하고 바뀐 플레이어 수를 돌려준다.
  std::size_t ApplyBatch(Tick tick);
  // 순위가 바뀐 경우에만 새 버전을 만든다.
  std::shared_ptr<const LeaderboardSnapshot> Publish();
  std::shared_ptr<const LeaderboardSnapshot> Snapshot() const;
  void RemovePlayer(const std::string& player_id);
  std::optional<std::uint64_t> ScoreOf(const std::string& player_id) const;
  std::size_t PlayerCount() const;

 private:
  struct PendingScore {
    std::string display_name;
    std::uint64_t score{0};
  };

  struct LiveScore {
    std::string display_name;
    std::uint64_t score{0};
    Tick achieved_tick{0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, PendingScore> pending_;
  std::unordered_map<std::string, LiveScore> scores_;
  bool dirty_{false};
  Tick last_tick_{0};

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const LeaderboardSnapshot> snapshot_;
};

}  // namespace arena
