/*
 * 설명: 외부 게임플레이 시뮬레이션과의 계약(틱마다 엔티티 목록과 점수를 생산)과
 *       서버 단독 실행을 위한 결정적 기준 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/simulation_determinism_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/entity.hpp"

namespace arena {

struct InputCommand {
  std::uint64_t sequence{0};
  float move_x{0.0f};
  float move_y{0.0f};
  float aim{0.0f};
  bool fire{false};
};

struct ScoreReport {
  SessionId session_id{0};
  std::uint32_t score{0};
};

struct StepResult {
  std::vector<EntitySnapshot> entities;
  std::vector<ScoreReport> scores;
};

class WorldSimulation {
 public:
  virtual ~WorldSimulation() = default;

  virtual void AddPlayer(SessionId session_id, const std::string& display_name) = 0;
  virtual void RemovePlayer(SessionId session_id) = 0;
  virtual void ApplyInput(SessionId session_id, const InputCommand& input) = 0;
  virtual StepResult Step(Tick tick) = 0;
};

// 아바타는 입력 방향으로 움직이고, 격자에 놓인 픽업을 먹으면 점수를 얻는다.
class ArenaSimulation : public WorldSimulation {
 public:
  static constexpr float kArenaHalfSize = 500.0f;
  static constexpr float kAvatarSpeed = 4.0f;
  static constexpr float kPickupRadius = 6.0f;
  static constexpr int kPickupGrid = 8;
  static constexpr std::uint32_t kPickupScore = 10;
  static constexpr std::size_t kMaxInputsPerTick = 4;

  ArenaSimulation();

  void AddPlayer(SessionId session_id, const std::string& display_name) override;
  void RemovePlayer(SessionId session_id) override;
  void ApplyInput(SessionId session_id, const InputCommand& input) override;
  StepResult Step(Tick tick) override;

  std::size_t PlayerCount() const;

 private:
  struct Avatar {
    EntityId entity_id{0};
    float x{0.0f};
    float y{0.0f};
    float velocity_x{0.0f};
    float velocity_y{0.0f};
    float orientation{0.0f};
    std::uint32_t score{0};
    std::uint64_t last_sequence{0};
  };

  struct Pickup {
    EntityId entity_id{0};
    float x{0.0f};
    float y{0.0f};
    Tick respawn_at{0};
  };

  void ApplyPendingInputs();
  void CollectPickups(Tick tick);

  mutable std::mutex mutex_;
  EntityId next_entity_id_{1};
  std::map<SessionId, Avatar> avatars_;
  std::vector<Pickup> pickups_;
  std::unordered_map<SessionId, std::vector<InputCommand>> pending_inputs_;
};

}  // namespace arena
