/*
 * 설명: 월드 틱, 엔티티 스냅샷, 필드 마스크, 구독 영역 등 동기화 계층의 기본 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/world_history_test.cpp, server/tests/unit/snapshot_encoder_test.cpp
 */
#pragma once

#include <cstdint>
#include <vector>

namespace arena {

using Tick = std::uint64_t;
using EntityId = std::uint32_t;
using SessionId = std::uint64_t;

enum class EntityKind : std::uint8_t {
  kAvatar = 0,
  kProjectile = 1,
  kPickup = 2,
  kObstacle = 3,
};

// 필드 마스크 비트 순서가 곧 와이어 직렬화 순서다.
enum EntityField : std::uint16_t {
  kFieldKind = 1u << 0,
  kFieldX = 1u << 1,
  kFieldY = 1u << 2,
  kFieldVelocityX = 1u << 3,
  kFieldVelocityY = 1u << 4,
  kFieldOrientation = 1u << 5,
  kFieldHealth = 1u << 6,
  kFieldOwner = 1u << 7,
};

constexpr std::uint16_t kAllEntityFields = 0xFF;

struct EntitySnapshot {
  EntityId id{0};
  EntityKind kind{EntityKind::kAvatar};
  float x{0.0f};
  float y{0.0f};
  float velocity_x{0.0f};
  float velocity_y{0.0f};
  float orientation{0.0f};
  float health{0.0f};
  std::uint32_t owner{0};
};

// id 오름차순으로 정렬되고 중복 id가 없는 월드 상태.
using WorldState = std::vector<EntitySnapshot>;

struct Region {
  float center_x{0.0f};
  float center_y{0.0f};
  float half_extent{0.0f};
  bool unbounded{true};

  static Region Everything() { return Region{}; }
  bool Contains(const EntitySnapshot& entity) const;
  bool operator==(const Region& other) const;
  bool operator!=(const Region& other) const { return !(*this == other); }
};

WorldState MakeWorldState(std::vector<EntitySnapshot> entities);
WorldState FilterByRegion(const WorldState& state, const Region& region);
const EntitySnapshot* FindEntity(const WorldState& state, EntityId id);

// 두 스냅샷 사이에서 비트 단위로 달라진 필드의 마스크를 돌려준다.
std::uint16_t ChangedFields(const EntitySnapshot& before, const EntitySnapshot& after);
bool SameEntity(const EntitySnapshot& lhs, const EntitySnapshot& rhs);
bool SameWorld(const WorldState& lhs, const WorldState& rhs);

float FieldValue(const EntitySnapshot& entity, EntityField field);
void SetFieldValue(EntitySnapshot& entity, EntityField field, float value);

}  // namespace arena
