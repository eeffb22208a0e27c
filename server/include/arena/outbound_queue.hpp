/*
 * 설명: 세션별 송신 큐. 일반 프레임은 고정 용량에서 가장 오래된 것부터 버리고,
 *       중요 프레임은 별도 상한이 있는 사이드 채널에 넣어 절대 버리지 않는다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "arena/entity.hpp"
#include "arena/snapshot_encoder.hpp"

namespace arena {

enum class FrameClass {
  kNormal,
  kCritical,
};

struct OutboundFrame {
  std::uint64_t seq{0};
  Tick tick{0};
  FrameKind kind{FrameKind::kDelta};
  FrameClass frame_class{FrameClass::kNormal};
  std::string bytes;
};

enum class PushResult {
  kQueued,
  kDroppedOldest,
  kCriticalOverflow,
  kClosed,
};

class OutboundQueue {
 public:
  OutboundQueue(std::size_t capacity, std::size_t critical_cap);

  PushResult Push(Tick tick, FrameKind kind, FrameClass frame_class, std::string bytes);
  // 두 채널을 합쳐 넣은 순서대로 꺼낸다.
  std::optional<OutboundFrame> Pop();
  void Close();
  bool Closed() const;
  bool Empty() const;
  std::size_t Size() const;
  std::size_t CriticalSize() const;
  std::uint64_t Dropped() const;
  std::size_t Capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  std::size_t critical_cap_;
  std::deque<OutboundFrame> normal_;
  std::deque<OutboundFrame> critical_;
  std::uint64_t next_seq_{1};
  std::uint64_t dropped_{0};
  bool closed_{false};
  mutable std::mutex mutex_;
};

}  // namespace arena
