/*
 * 설명: 리더보드 점수 배치 반영과 copy-on-write 스냅샷 게시를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/leaderboard_test.cpp
 */
#include "arena/leaderboard.hpp"

#include <algorithm>

namespace arena {
namespace {
bool SameRanking(const std::vector<LeaderboardEntry>& lhs, const std::vector<LeaderboardEntry>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (lhs[i].player_id != rhs[i].player_id || lhs[i].score != rhs[i].score ||
        lhs[i].display_name != rhs[i].display_name) {
      return false;
    }
  }
  return true;
}
}  // namespace

std::vector<LeaderboardEntry> LeaderboardSnapshot::Page(std::size_t page, std::size_t size) const {
  std::vector<LeaderboardEntry> out;
  if (page == 0 || size == 0) {
    return out;
  }
  std::size_t offset = (page - 1) * size;
  if (offset >= entries.size()) {
    return out;
  }
  auto end = std::min(entries.size(), offset + size);
  out.assign(entries.begin() + static_cast<std::ptrdiff_t>(offset), entries.begin() + static_cast<std::ptrdiff_t>(end));
  return out;
}

std::optional<LeaderboardEntry> LeaderboardSnapshot::Find(const std::string& player_id) const {
  for (const auto& entry : entries) {
    if (entry.player_id == player_id) {
      return entry;
    }
  }
  return std::nullopt;
}

bool RanksBefore(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.achieved_tick != rhs.achieved_tick) {
    return lhs.achieved_tick < rhs.achieved_tick;
  }
  return lhs.player_id < rhs.player_id;
}

LeaderboardService::LeaderboardService() : snapshot_(std::make_shared<const LeaderboardSnapshot>()) {}

void LeaderboardService::RecordScore(const std::string& player_id, const std::string& display_name,
                                     std::uint64_t score) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_[player_id] = PendingScore{display_name, score};
}

std::size_t LeaderboardService::ApplyBatch(Tick tick) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_tick_ = std::max(last_tick_, tick);
  std::size_t changed = 0;
  for (auto& [player_id, pending] : pending_) {
    auto it = scores_.find(player_id);
    if (it == scores_.end()) {
      scores_.emplace(player_id, LiveScore{pending.display_name, pending.score, tick});
      ++changed;
      continue;
    }
    auto& live = it->second;
    if (live.score != pending.score) {
      live.score = pending.score;
      live.achieved_tick = tick;
      ++changed;
    }
    if (live.display_name != pending.display_name) {
      live.display_name = pending.display_name;
      ++changed;
    }
  }
  pending_.clear();
  if (changed > 0) {
    dirty_ = true;
  }
  return changed;
}

std::shared_ptr<const LeaderboardSnapshot> LeaderboardService::Publish() {
  std::vector<LeaderboardEntry> entries;
  Tick tick = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dirty_) {
      return Snapshot();
    }
    dirty_ = false;
    tick = last_tick_;
    entries.reserve(scores_.size());
    for (const auto& [player_id, live] : scores_) {
      entries.push_back(LeaderboardEntry{player_id, live.display_name, live.score, 0, live.achieved_tick});
    }
  }

  std::sort(entries.begin(), entries.end(), RanksBefore);
  for (std::size_t i = 0; i < entries.size(); ++i) {
    entries[i].rank = i + 1;
  }

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (SameRanking(snapshot_->entries, entries)) {
    return snapshot_;
  }
  auto next = std::make_shared<LeaderboardSnapshot>();
  next->version = snapshot_->version + 1;
  next->tick = tick;
  next->entries = std::move(entries);
  snapshot_ = std::move(next);
  return snapshot_;
}

std::shared_ptr<const LeaderboardSnapshot> LeaderboardService::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

void LeaderboardService::RemovePlayer(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.erase(player_id);
  if (scores_.erase(player_id) > 0) {
    dirty_ = true;
  }
}

std::optional<std::uint64_t> LeaderboardService::ScoreOf(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = scores_.find(player_id);
  if (it == scores_.end()) {
    return std::nullopt;
  }
  return it->second.score;
}

std::size_t LeaderboardService::PlayerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scores_.size();
}

}  // namespace arena
