/*
 * 설명: 세션별 송신 큐의 드롭 정책과 순서 보장을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#include "arena/outbound_queue.hpp"

#include <algorithm>

namespace arena {

OutboundQueue::OutboundQueue(std::size_t capacity, std::size_t critical_cap)
    : capacity_(std::max<std::size_t>(1, capacity)), critical_cap_(std::max<std::size_t>(1, critical_cap)) {}

PushResult OutboundQueue::Push(Tick tick, FrameKind kind, FrameClass frame_class, std::string bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return PushResult::kClosed;
  }
  OutboundFrame frame{next_seq_, tick, kind, frame_class, std::move(bytes)};
  if (frame_class == FrameClass::kCritical) {
    if (critical_.size() >= critical_cap_) {
      return PushResult::kCriticalOverflow;
    }
    ++next_seq_;
    critical_.push_back(std::move(frame));
    return PushResult::kQueued;
  }

  ++next_seq_;
  auto result = PushResult::kQueued;
  if (normal_.size() >= capacity_) {
    normal_.pop_front();
    ++dropped_;
    result = PushResult::kDroppedOldest;
  }
  normal_.push_back(std::move(frame));
  return result;
}

std::optional<OutboundFrame> OutboundQueue::Pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::deque<OutboundFrame>* source = nullptr;
  if (!normal_.empty() && (critical_.empty() || normal_.front().seq < critical_.front().seq)) {
    source = &normal_;
  } else if (!critical_.empty()) {
    source = &critical_;
  }
  if (!source) {
    return std::nullopt;
  }
  OutboundFrame frame = std::move(source->front());
  source->pop_front();
  return frame;
}

void OutboundQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  normal_.clear();
}

bool OutboundQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool OutboundQueue::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return normal_.empty() && critical_.empty();
}

std::size_t OutboundQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return normal_.size() + critical_.size();
}

std::size_t OutboundQueue::CriticalSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return critical_.size();
}

std::uint64_t OutboundQueue::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace arena
