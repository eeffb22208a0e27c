/*
 * 설명: 결정적 기준 시뮬레이션의 입력 큐 처리와 틱 진행을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/simulation_determinism_test.cpp
 */
#include "arena/simulation.hpp"

#include <algorithm>
#include <cmath>

namespace arena {
namespace {
float Clamp(float value, float low, float high) { return std::max(low, std::min(high, value)); }

// 세션 id로 시작 위치를 정해 재실행 시 같은 결과가 나오도록 한다.
float SpawnCoordinate(SessionId session_id, std::uint64_t salt) {
  auto mixed = (session_id * 2654435761u + salt * 40503u) % 800u;
  return static_cast<float>(mixed) - 400.0f;
}
}  // namespace

ArenaSimulation::ArenaSimulation() {
  const float spacing = (2.0f * kArenaHalfSize) / static_cast<float>(kPickupGrid + 1);
  for (int gx = 1; gx <= kPickupGrid; ++gx) {
    for (int gy = 1; gy <= kPickupGrid; ++gy) {
      Pickup pickup;
      pickup.entity_id = next_entity_id_++;
      pickup.x = -kArenaHalfSize + spacing * static_cast<float>(gx);
      pickup.y = -kArenaHalfSize + spacing * static_cast<float>(gy);
      pickups_.push_back(pickup);
    }
  }
}

void ArenaSimulation::AddPlayer(SessionId session_id, const std::string& /*display_name*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (avatars_.count(session_id) > 0) {
    return;
  }
  Avatar avatar;
  avatar.entity_id = next_entity_id_++;
  avatar.x = SpawnCoordinate(session_id, 1);
  avatar.y = SpawnCoordinate(session_id, 2);
  avatars_[session_id] = avatar;
}

void ArenaSimulation::RemovePlayer(SessionId session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  avatars_.erase(session_id);
  pending_inputs_.erase(session_id);
}

void ArenaSimulation::ApplyInput(SessionId session_id, const InputCommand& input) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = avatars_.find(session_id);
  if (it == avatars_.end() || input.sequence <= it->second.last_sequence) {
    return;
  }
  auto& queue = pending_inputs_[session_id];
  if (queue.size() >= kMaxInputsPerTick) {
    return;
  }
  queue.push_back(input);
}

void ArenaSimulation::ApplyPendingInputs() {
  for (auto& [session_id, inputs] : pending_inputs_) {
    auto it = avatars_.find(session_id);
    if (it == avatars_.end()) {
      continue;
    }
    std::stable_sort(inputs.begin(), inputs.end(),
                     [](const InputCommand& lhs, const InputCommand& rhs) { return lhs.sequence < rhs.sequence; });
    for (const auto& input : inputs) {
      if (input.sequence <= it->second.last_sequence) {
        continue;
      }
      auto& avatar = it->second;
      avatar.velocity_x = Clamp(input.move_x, -1.0f, 1.0f) * kAvatarSpeed;
      avatar.velocity_y = Clamp(input.move_y, -1.0f, 1.0f) * kAvatarSpeed;
      avatar.orientation = input.aim;
      avatar.last_sequence = input.sequence;
    }
  }
  pending_inputs_.clear();
}

void ArenaSimulation::CollectPickups(Tick tick) {
  for (auto& pickup : pickups_) {
    if (pickup.respawn_at > tick) {
      continue;
    }
    for (auto& [session_id, avatar] : avatars_) {
      float dx = avatar.x - pickup.x;
      float dy = avatar.y - pickup.y;
      if (dx * dx + dy * dy <= kPickupRadius * kPickupRadius) {
        avatar.score += kPickupScore;
        pickup.respawn_at = tick + 100;
        break;
      }
    }
  }
}

StepResult ArenaSimulation::Step(Tick tick) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApplyPendingInputs();
  for (auto& [session_id, avatar] : avatars_) {
    avatar.x = Clamp(avatar.x + avatar.velocity_x, -kArenaHalfSize, kArenaHalfSize);
    avatar.y = Clamp(avatar.y + avatar.velocity_y, -kArenaHalfSize, kArenaHalfSize);
  }
  CollectPickups(tick);

  StepResult result;
  result.entities.reserve(avatars_.size() + pickups_.size());
  for (const auto& [session_id, avatar] : avatars_) {
    EntitySnapshot entity;
    entity.id = avatar.entity_id;
    entity.kind = EntityKind::kAvatar;
    entity.x = avatar.x;
    entity.y = avatar.y;
    entity.velocity_x = avatar.velocity_x;
    entity.velocity_y = avatar.velocity_y;
    entity.orientation = avatar.orientation;
    entity.health = 100.0f;
    entity.owner = static_cast<std::uint32_t>(session_id);
    result.entities.push_back(entity);
    result.scores.push_back(ScoreReport{session_id, avatar.score});
  }
  for (const auto& pickup : pickups_) {
    if (pickup.respawn_at > tick) {
      continue;
    }
    EntitySnapshot entity;
    entity.id = pickup.entity_id;
    entity.kind = EntityKind::kPickup;
    entity.x = pickup.x;
    entity.y = pickup.y;
    entity.health = 1.0f;
    result.entities.push_back(entity);
  }
  return result;
}

std::size_t ArenaSimulation::PlayerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return avatars_.size();
}

}  // namespace arena
