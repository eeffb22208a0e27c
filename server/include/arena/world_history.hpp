/*
 * 설명: 최근 틱의 전체 월드 상태를 고정 틱 수 범위의 링 버퍼로 보관한다.
 *       기록 시 epsilon 미만의 수치 변화는 직전 기록값을 유지해 델타 복원이 정확하도록 한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/world_history_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "arena/entity.hpp"

namespace arena {

class WorldHistory {
 public:
  WorldHistory(std::size_t horizon_ticks, float epsilon);

  // 틱이 단조 증가하지 않으면 nullptr을 돌려주고 아무것도 기록하지 않는다.
  std::shared_ptr<const WorldState> Record(Tick tick, const std::vector<EntitySnapshot>& entities);
  std::shared_ptr<const WorldState> Find(Tick tick) const;
  std::optional<Tick> LatestTick() const;
  std::optional<Tick> OldestTick() const;
  std::size_t Size() const;
  std::size_t Horizon() const { return horizon_ticks_; }
  float Epsilon() const { return epsilon_; }

 private:
  struct RecordedTick {
    Tick tick;
    std::shared_ptr<const WorldState> state;
  };

  WorldState ApplyDeadband(const WorldState& previous, WorldState next) const;
  void Prune(Tick latest);

  std::size_t horizon_ticks_;
  float epsilon_;
  std::deque<RecordedTick> ring_;
  mutable std::mutex mutex_;
};

}  // namespace arena
