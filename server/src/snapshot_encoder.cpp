/*
 * 설명: 필드 단위 델타 계산, 전체 스냅샷 폴백, 세션별 확인 틱 추적을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/snapshot_encoder_test.cpp
 */
#include "arena/snapshot_encoder.hpp"

#include <algorithm>
#include <unordered_set>

namespace arena {

WorldFrame MakeFullSnapshot(const WorldState& current, Tick tick) {
  WorldFrame frame;
  frame.kind = FrameKind::kFullSnapshot;
  frame.tick = tick;
  frame.baseline_tick = 0;
  frame.added = current;
  return frame;
}

WorldFrame ComputeDelta(const WorldState& baseline, Tick baseline_tick, const WorldState& current, Tick tick) {
  WorldFrame frame;
  frame.kind = FrameKind::kDelta;
  frame.tick = tick;
  frame.baseline_tick = baseline_tick;

  // 두 상태 모두 id 순으로 정렬되어 있으므로 한 번의 병합 순회로 충분하다.
  auto base_it = baseline.begin();
  auto cur_it = current.begin();
  while (base_it != baseline.end() || cur_it != current.end()) {
    if (cur_it == current.end() || (base_it != baseline.end() && base_it->id < cur_it->id)) {
      frame.removed.push_back(base_it->id);
      ++base_it;
      continue;
    }
    if (base_it == baseline.end() || cur_it->id < base_it->id) {
      frame.added.push_back(*cur_it);
      ++cur_it;
      continue;
    }
    auto mask = ChangedFields(*base_it, *cur_it);
    if (mask != 0) {
      frame.updated.push_back(EntityUpdate{cur_it->id, mask, *cur_it});
    }
    ++base_it;
    ++cur_it;
  }
  return frame;
}

bool ApplyFrame(const WorldState& baseline, const WorldFrame& frame, WorldState& out) {
  if (frame.kind == FrameKind::kFullSnapshot) {
    out = MakeWorldState(frame.added);
    return out.size() == frame.added.size();
  }
  if (frame.kind != FrameKind::kDelta) {
    return false;
  }

  std::unordered_set<EntityId> removed(frame.removed.begin(), frame.removed.end());
  for (auto id : removed) {
    if (!FindEntity(baseline, id)) {
      return false;
    }
  }

  WorldState next;
  next.reserve(baseline.size() + frame.added.size());
  for (const auto& entity : baseline) {
    if (removed.count(entity.id) == 0) {
      next.push_back(entity);
    }
  }

  for (const auto& update : frame.updated) {
    auto it = std::lower_bound(next.begin(), next.end(), update.id,
                               [](const EntitySnapshot& entity, EntityId value) { return entity.id < value; });
    if (it == next.end() || it->id != update.id) {
      return false;
    }
    const auto& v = update.values;
    if (update.fields & kFieldKind) {
      it->kind = v.kind;
    }
    if (update.fields & kFieldX) {
      it->x = v.x;
    }
    if (update.fields & kFieldY) {
      it->y = v.y;
    }
    if (update.fields & kFieldVelocityX) {
      it->velocity_x = v.velocity_x;
    }
    if (update.fields & kFieldVelocityY) {
      it->velocity_y = v.velocity_y;
    }
    if (update.fields & kFieldOrientation) {
      it->orientation = v.orientation;
    }
    if (update.fields & kFieldHealth) {
      it->health = v.health;
    }
    if (update.fields & kFieldOwner) {
      it->owner = v.owner;
    }
  }

  for (const auto& entity : frame.added) {
    if (FindEntity(next, entity.id)) {
      return false;
    }
    next.push_back(entity);
  }
  out = MakeWorldState(std::move(next));
  return true;
}

SnapshotEncoder::SnapshotEncoder(std::shared_ptr<WorldHistory> history, const EncoderConfig& config)
    : history_(std::move(history)), config_(config) {}

WorldFrame SnapshotEncoder::Encode(SessionId session_id, Tick tick, const WorldState& current, const Region& region) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& state = baselines_[session_id];
  auto visible = FilterByRegion(current, region);

  FullSnapshotCause cause = FullSnapshotCause::kNoBaseline;
  if (state.acked) {
    Tick acked = *state.acked;
    if (tick < acked || tick - acked > config_.max_baseline_age) {
      cause = FullSnapshotCause::kBaselineTooOld;
    } else if (auto baseline = history_->Find(acked)) {
      auto frame = ComputeDelta(FilterByRegion(*baseline, region), acked, visible, tick);
      RememberSent(state, tick);
      return frame;
    } else {
      cause = FullSnapshotCause::kBaselineEvicted;
    }
  }

  // 기준 상태를 믿을 수 없으면 전체 스냅샷을 보내고 클라이언트가 새로 확인할 때까지 기준을 비운다.
  state.acked.reset();
  auto frame = MakeFullSnapshot(visible, tick);
  frame.cause = cause;
  RememberSent(state, tick);
  return frame;
}

void SnapshotEncoder::RememberSent(BaselineState& state, Tick tick) {
  if (state.sent.empty() || state.sent.back() < tick) {
    state.sent.push_back(tick);
  }
  while (!state.sent.empty() && tick - state.sent.front() > config_.max_baseline_age) {
    state.sent.pop_front();
  }
}

bool SnapshotEncoder::Acknowledge(SessionId session_id, Tick tick) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = baselines_.find(session_id);
  if (it == baselines_.end()) {
    return false;
  }
  auto& state = it->second;
  if (state.acked && tick <= *state.acked) {
    return false;
  }
  auto sent_it = std::lower_bound(state.sent.begin(), state.sent.end(), tick);
  if (sent_it == state.sent.end() || *sent_it != tick) {
    return false;
  }
  state.acked = tick;
  state.sent.erase(state.sent.begin(), sent_it);
  return true;
}

void SnapshotEncoder::ResetBaseline(SessionId session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = baselines_.find(session_id);
  if (it == baselines_.end()) {
    return;
  }
  it->second.acked.reset();
  it->second.sent.clear();
}

void SnapshotEncoder::Forget(SessionId session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  baselines_.erase(session_id);
}

std::optional<Tick> SnapshotEncoder::Baseline(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = baselines_.find(session_id);
  if (it == baselines_.end()) {
    return std::nullopt;
  }
  return it->second.acked;
}

std::size_t SnapshotEncoder::TrackedSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return baselines_.size();
}

}  // namespace arena
