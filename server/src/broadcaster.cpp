/*
 * 설명: 틱 프레임 팬아웃, 리더보드/채팅/알림 전달, 백프레셔 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#include "arena/broadcaster.hpp"

#include <algorithm>
#include <exception>

namespace arena {

Broadcaster::Broadcaster(std::shared_ptr<WorldHistory> history, std::shared_ptr<SnapshotEncoder> encoder,
                         const BroadcasterConfig& config)
    : history_(std::move(history)), encoder_(std::move(encoder)), config_(config) {}

void Broadcaster::SetDirectory(std::weak_ptr<SubscriberDirectory> directory) {
  std::lock_guard<std::mutex> lock(mutex_);
  directory_ = std::move(directory);
}

void Broadcaster::SetObservability(std::shared_ptr<Observability> observability) {
  std::lock_guard<std::mutex> lock(mutex_);
  observability_ = std::move(observability);
}

bool Broadcaster::Attach(SessionId session_id, WakeHandler wake) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (channels_.count(session_id) > 0) {
    return false;
  }
  auto channel = std::make_shared<Channel>(config_.queue_capacity, config_.critical_cap);
  channel->wake = std::move(wake);
  channels_.emplace(session_id, std::move(channel));
  return true;
}

void Broadcaster::SetWakeHandler(SessionId session_id, WakeHandler wake) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(session_id);
  if (it != channels_.end()) {
    it->second->wake = std::move(wake);
  }
}

void Broadcaster::Detach(SessionId session_id) {
  std::shared_ptr<Channel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(session_id);
    if (it == channels_.end()) {
      return;
    }
    channel = std::move(it->second);
    channels_.erase(it);
  }
  channel->queue.Close();
  encoder_->Forget(session_id);
}

void Broadcaster::Seal(SessionId session_id) {
  if (auto channel = FindChannel(session_id)) {
    channel->queue.Close();
  }
}

std::shared_ptr<Broadcaster::Channel> Broadcaster::FindChannel(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(session_id);
  if (it == channels_.end()) {
    return nullptr;
  }
  return it->second;
}

PushResult Broadcaster::Enqueue(SessionId session_id, const std::shared_ptr<Channel>& channel, Tick tick,
                                FrameKind kind, FrameClass frame_class, const FrameEncoder& encode) {
  PushResult result;
  {
    std::lock_guard<std::mutex> lock(channel->order_mutex);
    Tick stamp = std::max(tick, channel->last_tick);
    result = channel->queue.Push(stamp, kind, frame_class, encode(stamp));
    if (result != PushResult::kClosed) {
      channel->last_tick = stamp;
    }
  }
  if (result == PushResult::kCriticalOverflow) {
    ReportOverflow(session_id);
    return result;
  }
  if (result == PushResult::kClosed) {
    return result;
  }
  WakeHandler wake;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wake = channel->wake;
  }
  if (wake) {
    wake();
  }
  return result;
}

void Broadcaster::ReportOverflow(SessionId session_id) {
  std::shared_ptr<SubscriberDirectory> directory;
  std::shared_ptr<Observability> observability;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    directory = directory_.lock();
    observability = observability_;
  }
  if (observability) {
    observability->Add(Metric::kCriticalOverflows);
  }
  LogEvent("broadcast.critical_overflow", session_id, LogLevel::kWarn, nullptr);
  if (directory) {
    directory->OnQueueOverflow(session_id);
  }
}

void Broadcaster::LogEvent(const std::string& name, std::optional<SessionId> session_id, LogLevel level,
                           nlohmann::json detail) const {
  std::shared_ptr<Observability> observability;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observability = observability_;
  }
  if (!observability) {
    return;
  }
  observability->Log(LogContext{"", std::nullopt, session_id, name, 0, level, std::move(detail)});
}

PublishStats Broadcaster::Publish(Tick tick, const std::vector<EntitySnapshot>& entities) {
  PublishStats stats;
  auto state = history_->Record(tick, entities);
  if (!state) {
    LogEvent("broadcast.tick_rejected", std::nullopt, LogLevel::kWarn, {{"tick", tick}});
    return stats;
  }
  current_tick_.store(tick);

  std::shared_ptr<SubscriberDirectory> directory;
  std::shared_ptr<Observability> observability;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    directory = directory_.lock();
    observability = observability_;
  }
  if (!directory) {
    return stats;
  }

  for (const auto& subscriber : directory->Subscribers()) {
    auto channel = FindChannel(subscriber.session_id);
    if (!channel || channel->queue.Closed()) {
      continue;
    }
    try {
      auto frame = encoder_->Encode(subscriber.session_id, tick, *state, subscriber.region);
      if (frame.cause == FullSnapshotCause::kBaselineTooOld || frame.cause == FullSnapshotCause::kBaselineEvicted) {
        // 기준 상태를 잃은 경우도 인코딩 결함으로 집계하고 전체 스냅샷으로 복구한다.
        ++stats.encoding_faults;
        LogEvent("encoder.baseline_lost", subscriber.session_id, LogLevel::kDebug,
                 {{"tick", tick}, {"cause", static_cast<int>(frame.cause)}});
      }
      auto bytes = EncodeWorldFrame(frame);
      // 다른 프레임의 틱은 current_tick_을 넘지 않으므로 월드 프레임은 항상 자기 틱으로 찍힌다.
      auto result = Enqueue(subscriber.session_id, channel, tick, frame.kind, FrameClass::kNormal,
                            [&bytes](Tick) { return std::move(bytes); });
      if (result == PushResult::kDroppedOldest) {
        ++stats.dropped_frames;
      }
      if (frame.IsDelta()) {
        ++stats.delta_frames;
      } else {
        ++stats.full_frames;
      }
    } catch (const std::exception& ex) {
      ++stats.encoding_faults;
      encoder_->ResetBaseline(subscriber.session_id);
      LogEvent("encoder.fault", subscriber.session_id, LogLevel::kError, {{"tick", tick}, {"error", ex.what()}});
    }
  }

  if (observability) {
    observability->Add(Metric::kTicks);
    observability->Add(Metric::kFullFrames, stats.full_frames);
    observability->Add(Metric::kDeltaFrames, stats.delta_frames);
    observability->Add(Metric::kDroppedFrames, stats.dropped_frames);
    observability->Add(Metric::kEncodingFaults, stats.encoding_faults);
  }
  return stats;
}

std::size_t Broadcaster::PublishLeaderboard(const LeaderboardSnapshot& snapshot) {
  std::shared_ptr<SubscriberDirectory> directory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot.version <= last_leaderboard_version_) {
      return 0;
    }
    last_leaderboard_version_ = snapshot.version;
    directory = directory_.lock();
  }
  if (!directory) {
    return 0;
  }
  auto encode = [this, &snapshot](Tick tick) {
    return EncodeLeaderboardFrame(tick, snapshot, config_.leaderboard_size);
  };
  std::size_t delivered = 0;
  for (const auto& subscriber : directory->Subscribers()) {
    auto channel = FindChannel(subscriber.session_id);
    if (!channel) {
      continue;
    }
    auto result =
        Enqueue(subscriber.session_id, channel, CurrentTick(), FrameKind::kLeaderboard, FrameClass::kCritical, encode);
    if (result == PushResult::kQueued) {
      ++delivered;
    }
  }
  return delivered;
}

bool Broadcaster::SendLeaderboard(SessionId session_id, const LeaderboardSnapshot& snapshot) {
  auto channel = FindChannel(session_id);
  if (!channel) {
    return false;
  }
  return Enqueue(session_id, channel, CurrentTick(), FrameKind::kLeaderboard, FrameClass::kCritical,
                 [this, &snapshot](Tick tick) {
                   return EncodeLeaderboardFrame(tick, snapshot, config_.leaderboard_size);
                 }) == PushResult::kQueued;
}

std::size_t Broadcaster::SendChat(const std::vector<SessionId>& recipients, const ChatDelivery& chat) {
  auto encode = [&chat](Tick tick) { return EncodeChatFrame(tick, chat); };
  std::size_t delivered = 0;
  for (auto session_id : recipients) {
    auto channel = FindChannel(session_id);
    if (!channel) {
      continue;
    }
    auto result = Enqueue(session_id, channel, CurrentTick(), FrameKind::kChat, FrameClass::kNormal, encode);
    if (result == PushResult::kQueued || result == PushResult::kDroppedOldest) {
      ++delivered;
    }
  }
  return delivered;
}

bool Broadcaster::SendNotice(SessionId session_id, const Notice& notice) {
  auto channel = FindChannel(session_id);
  if (!channel) {
    return false;
  }
  return Enqueue(session_id, channel, CurrentTick(), FrameKind::kNotice, FrameClass::kCritical,
                 [&notice](Tick tick) { return EncodeNoticeFrame(tick, notice); }) == PushResult::kQueued;
}

std::optional<OutboundFrame> Broadcaster::Pop(SessionId session_id) {
  auto channel = FindChannel(session_id);
  if (!channel) {
    return std::nullopt;
  }
  return channel->queue.Pop();
}

bool Broadcaster::IsDrained(SessionId session_id) const {
  auto channel = FindChannel(session_id);
  return !channel || channel->queue.Empty();
}

std::size_t Broadcaster::QueueDepth(SessionId session_id) const {
  auto channel = FindChannel(session_id);
  return channel ? channel->queue.Size() : 0;
}

std::size_t Broadcaster::TotalQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [session_id, channel] : channels_) {
    total += channel->queue.Size();
  }
  return total;
}

std::size_t Broadcaster::AttachedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.size();
}

}  // namespace arena
