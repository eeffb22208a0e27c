/*
 * 설명: 월드 상태 링 버퍼와 epsilon 데드밴드 기록을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/world_history_test.cpp
 */
#include "arena/world_history.hpp"

#include <algorithm>
#include <cmath>

namespace arena {
namespace {
constexpr EntityField kNumericFields[] = {kFieldX,         kFieldY,           kFieldVelocityX,
                                          kFieldVelocityY, kFieldOrientation, kFieldHealth};
}  // namespace

WorldHistory::WorldHistory(std::size_t horizon_ticks, float epsilon)
    : horizon_ticks_(std::max<std::size_t>(1, horizon_ticks)), epsilon_(std::max(0.0f, epsilon)) {}

std::shared_ptr<const WorldState> WorldHistory::Record(Tick tick, const std::vector<EntitySnapshot>& entities) {
  auto next = MakeWorldState(entities);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ring_.empty() && tick <= ring_.back().tick) {
    return nullptr;
  }
  if (!ring_.empty() && epsilon_ > 0.0f) {
    next = ApplyDeadband(*ring_.back().state, std::move(next));
  }
  auto state = std::make_shared<const WorldState>(std::move(next));
  ring_.push_back(RecordedTick{tick, state});
  Prune(tick);
  return state;
}

WorldState WorldHistory::ApplyDeadband(const WorldState& previous, WorldState next) const {
  for (auto& entity : next) {
    const EntitySnapshot* prior = FindEntity(previous, entity.id);
    if (!prior) {
      continue;
    }
    for (auto field : kNumericFields) {
      float before = FieldValue(*prior, field);
      float after = FieldValue(entity, field);
      if (std::fabs(after - before) < epsilon_) {
        SetFieldValue(entity, field, before);
      }
    }
  }
  return next;
}

void WorldHistory::Prune(Tick latest) {
  while (!ring_.empty() && latest - ring_.front().tick > horizon_ticks_) {
    ring_.pop_front();
  }
  while (ring_.size() > horizon_ticks_ + 1) {
    ring_.pop_front();
  }
}

std::shared_ptr<const WorldState> WorldHistory::Find(Tick tick) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::lower_bound(ring_.begin(), ring_.end(), tick,
                             [](const RecordedTick& recorded, Tick value) { return recorded.tick < value; });
  if (it == ring_.end() || it->tick != tick) {
    return nullptr;
  }
  return it->state;
}

std::optional<Tick> WorldHistory::LatestTick() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ring_.empty()) {
    return std::nullopt;
  }
  return ring_.back().tick;
}

std::optional<Tick> WorldHistory::OldestTick() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ring_.empty()) {
    return std::nullopt;
  }
  return ring_.front().tick;
}

std::size_t WorldHistory::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_.size();
}

}  // namespace arena
