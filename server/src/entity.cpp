/*
 * 설명: 엔티티 비교, 정렬, 영역 필터링을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/world_history_test.cpp, server/tests/unit/snapshot_encoder_test.cpp
 */
#include "arena/entity.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>

namespace arena {
namespace {
bool SameBits(float lhs, float rhs) { return std::memcmp(&lhs, &rhs, sizeof(float)) == 0; }
}  // namespace

bool Region::Contains(const EntitySnapshot& entity) const {
  if (unbounded) {
    return true;
  }
  return std::fabs(entity.x - center_x) <= half_extent && std::fabs(entity.y - center_y) <= half_extent;
}

bool Region::operator==(const Region& other) const {
  if (unbounded || other.unbounded) {
    return unbounded == other.unbounded;
  }
  return center_x == other.center_x && center_y == other.center_y && half_extent == other.half_extent;
}

WorldState MakeWorldState(std::vector<EntitySnapshot> entities) {
  std::stable_sort(entities.begin(), entities.end(),
                   [](const EntitySnapshot& lhs, const EntitySnapshot& rhs) { return lhs.id < rhs.id; });
  // 같은 id가 여러 번 오면 마지막 값을 남긴다.
  WorldState state;
  state.reserve(entities.size());
  for (const auto& entity : entities) {
    if (!state.empty() && state.back().id == entity.id) {
      state.back() = entity;
    } else {
      state.push_back(entity);
    }
  }
  return state;
}

WorldState FilterByRegion(const WorldState& state, const Region& region) {
  if (region.unbounded) {
    return state;
  }
  WorldState filtered;
  filtered.reserve(state.size());
  std::copy_if(state.begin(), state.end(), std::back_inserter(filtered),
               [&region](const EntitySnapshot& entity) { return region.Contains(entity); });
  return filtered;
}

const EntitySnapshot* FindEntity(const WorldState& state, EntityId id) {
  auto it = std::lower_bound(state.begin(), state.end(), id,
                             [](const EntitySnapshot& entity, EntityId value) { return entity.id < value; });
  if (it == state.end() || it->id != id) {
    return nullptr;
  }
  return &*it;
}

std::uint16_t ChangedFields(const EntitySnapshot& before, const EntitySnapshot& after) {
  std::uint16_t mask = 0;
  if (before.kind != after.kind) {
    mask |= kFieldKind;
  }
  if (!SameBits(before.x, after.x)) {
    mask |= kFieldX;
  }
  if (!SameBits(before.y, after.y)) {
    mask |= kFieldY;
  }
  if (!SameBits(before.velocity_x, after.velocity_x)) {
    mask |= kFieldVelocityX;
  }
  if (!SameBits(before.velocity_y, after.velocity_y)) {
    mask |= kFieldVelocityY;
  }
  if (!SameBits(before.orientation, after.orientation)) {
    mask |= kFieldOrientation;
  }
  if (!SameBits(before.health, after.health)) {
    mask |= kFieldHealth;
  }
  if (before.owner != after.owner) {
    mask |= kFieldOwner;
  }
  return mask;
}

bool SameEntity(const EntitySnapshot& lhs, const EntitySnapshot& rhs) {
  return lhs.id == rhs.id && ChangedFields(lhs, rhs) == 0;
}

bool SameWorld(const WorldState& lhs, const WorldState& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (!SameEntity(lhs[i], rhs[i])) {
      return false;
    }
  }
  return true;
}

float FieldValue(const EntitySnapshot& entity, EntityField field) {
  switch (field) {
    case kFieldX:
      return entity.x;
    case kFieldY:
      return entity.y;
    case kFieldVelocityX:
      return entity.velocity_x;
    case kFieldVelocityY:
      return entity.velocity_y;
    case kFieldOrientation:
      return entity.orientation;
    case kFieldHealth:
      return entity.health;
    default:
      return 0.0f;
  }
}

void SetFieldValue(EntitySnapshot& entity, EntityField field, float value) {
  switch (field) {
    case kFieldX:
      entity.x = value;
      break;
    case kFieldY:
      entity.y = value;
      break;
    case kFieldVelocityX:
      entity.velocity_x = value;
      break;
    case kFieldVelocityY:
      entity.velocity_y = value;
      break;
    case kFieldOrientation:
      entity.orientation = value;
      break;
    case kFieldHealth:
      entity.health = value;
      break;
    default:
      break;
  }
}

}  // namespace arena
