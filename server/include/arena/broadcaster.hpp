/*
 * 설명: 틱마다 구독 세션별로 프레임을 인코딩해 송신 큐에 넣고 전송 계층을 깨운다.
 *       틱 경로에서는 절대 블로킹하지 않으며, 중요 프레임 상한 초과 세션은 디렉터리에 알려 닫게 한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "arena/entity.hpp"
#include "arena/leaderboard.hpp"
#include "arena/observability.hpp"
#include "arena/outbound_queue.hpp"
#include "arena/snapshot_encoder.hpp"
#include "arena/wire_codec.hpp"
#include "arena/world_history.hpp"

namespace arena {

struct Subscriber {
  SessionId session_id{0};
  Region region;
};

// 세션 소유자(연결 관리자)가 구현한다. 브로드캐스터는 세션을 id로만 참조한다.
class SubscriberDirectory {
 public:
  virtual ~SubscriberDirectory() = default;
  virtual std::vector<Subscriber> Subscribers() const = 0;
  virtual void OnQueueOverflow(SessionId session_id) = 0;
};

struct BroadcasterConfig {
  std::size_t queue_capacity{64};
  std::size_t critical_cap{256};
  std::size_t leaderboard_size{10};
};

struct PublishStats {
  std::size_t full_frames{0};
  std::size_t delta_frames{0};
  std::size_t dropped_frames{0};
  std::size_t encoding_faults{0};
};

class Broadcaster {
 public:
  using WakeHandler = std::function<void()>;

  Broadcaster(std::shared_ptr<WorldHistory> history, std::shared_ptr<SnapshotEncoder> encoder,
              const BroadcasterConfig& config);

  void SetDirectory(std::weak_ptr<SubscriberDirectory> directory);
  void SetObservability(std::shared_ptr<Observability> observability);

  bool Attach(SessionId session_id, WakeHandler wake);
  void SetWakeHandler(SessionId session_id, WakeHandler wake);
  void Detach(SessionId session_id);
  // 세션을 닫는 중이면 더 이상 월드 프레임을 받지 않는다. 이미 넣은 중요 프레임은 유지된다.
  void Seal(SessionId session_id);

  PublishStats Publish(Tick tick, const std::vector<EntitySnapshot>& entities);
  // 순위가 바뀐 새 버전일 때만 모든 구독 세션에 보낸다.
  std::size_t PublishLeaderboard(const LeaderboardSnapshot& snapshot);
  bool SendLeaderboard(SessionId session_id, const LeaderboardSnapshot& snapshot);
  std::size_t SendChat(const std::vector<SessionId>& recipients, const ChatDelivery& chat);
  bool SendNotice(SessionId session_id, const Notice& notice);

  std::optional<OutboundFrame> Pop(SessionId session_id);
  bool IsDrained(SessionId session_id) const;
  std::size_t QueueDepth(SessionId session_id) const;
  std::size_t TotalQueueDepth() const;
  std::size_t AttachedCount() const;
  Tick CurrentTick() const { return current_tick_.load(); }

 private:
  using FrameEncoder = std::function<std::string(Tick)>;

  struct Channel {
    Channel(std::size_t capacity, std::size_t critical_cap) : queue(capacity, critical_cap) {}
    OutboundQueue queue;
    WakeHandler wake;
    // 틱 결정, 인코딩, 적재를 한 번에 묶어 세션별 헤더 틱이 줄어들지 않게 한다.
    std::mutex order_mutex;
    Tick last_tick{0};
  };

  std::shared_ptr<Channel> FindChannel(SessionId session_id) const;
  // 헤더 틱은 max(tick, 이 채널에 마지막으로 넣은 틱)이다.
  PushResult Enqueue(SessionId session_id, const std::shared_ptr<Channel>& channel, Tick tick, FrameKind kind,
                     FrameClass frame_class, const FrameEncoder& encode);
  void ReportOverflow(SessionId session_id);
  void LogEvent(const std::string& name, std::optional<SessionId> session_id, LogLevel level,
                nlohmann::json detail) const;

  std::shared_ptr<WorldHistory> history_;
  std::shared_ptr<SnapshotEncoder> encoder_;
  BroadcasterConfig config_;
  std::weak_ptr<SubscriberDirectory> directory_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<SessionId, std::shared_ptr<Channel>> channels_;
  std::atomic<Tick> current_tick_{0};
  std::uint64_t last_leaderboard_version_{0};
  mutable std::mutex mutex_;
};

}  // namespace arena
