/*
 * 설명: 세션별 마지막 확인 틱을 기준으로 현재 틱과의 최소 델타를 계산하고,
 *       기준 상태를 쓸 수 없으면 전체 스냅샷으로 되돌린다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/snapshot_encoder_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "arena/entity.hpp"
#include "arena/world_history.hpp"

namespace arena {

enum class FrameKind : std::uint8_t {
  kFullSnapshot = 1,
  kDelta = 2,
  kLeaderboard = 3,
  kChat = 4,
  kNotice = 5,
};

enum class FullSnapshotCause {
  kNone,
  kNoBaseline,
  kBaselineTooOld,
  kBaselineEvicted,
};

struct EntityUpdate {
  EntityId id{0};
  std::uint16_t fields{0};
  // fields에 표시된 필드만 의미가 있다.
  EntitySnapshot values;
};

struct WorldFrame {
  FrameKind kind{FrameKind::kFullSnapshot};
  Tick tick{0};
  Tick baseline_tick{0};
  std::vector<EntitySnapshot> added;
  std::vector<EntityUpdate> updated;
  std::vector<EntityId> removed;
  FullSnapshotCause cause{FullSnapshotCause::kNone};

  bool IsDelta() const { return kind == FrameKind::kDelta; }
};

WorldFrame MakeFullSnapshot(const WorldState& current, Tick tick);
WorldFrame ComputeDelta(const WorldState& baseline, Tick baseline_tick, const WorldState& current, Tick tick);

// 프레임을 기준 상태에 적용한다. 전체 스냅샷이면 baseline은 무시된다.
// 기준 상태와 맞지 않는 프레임이면 false를 돌려준다.
bool ApplyFrame(const WorldState& baseline, const WorldFrame& frame, WorldState& out);

struct EncoderConfig {
  std::size_t max_baseline_age{32};
};

class SnapshotEncoder {
 public:
  SnapshotEncoder(std::shared_ptr<WorldHistory> history, const EncoderConfig& config);

  WorldFrame Encode(SessionId session_id, Tick tick, const WorldState& current, const Region& region);
  bool Acknowledge(SessionId session_id, Tick tick);
  void ResetBaseline(SessionId session_id);
  void Forget(SessionId session_id);
  std::optional<Tick> Baseline(SessionId session_id) const;
  std::size_t TrackedSessions() const;

 private:
  struct BaselineState {
    std::optional<Tick> acked;
    std::deque<Tick> sent;
  };

  void RememberSent(BaselineState& state, Tick tick);

  std::shared_ptr<WorldHistory> history_;
  EncoderConfig config_;
  std::unordered_map<SessionId, BaselineState> baselines_;
  mutable std::mutex mutex_;
};

}  // namespace arena
