/*
 * 설명: 바이너리 WebSocket 프레임 코덱. 송신 프레임은 1바이트 종류 + 8바이트 빅엔디언 틱 + MessagePack 본문,
 *       수신 메시지는 1바이트 종류 + MessagePack 본문으로 구성된다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/wire_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "arena/entity.hpp"
#include "arena/leaderboard.hpp"
#include "arena/moderation.hpp"
#include "arena/simulation.hpp"
#include "arena/snapshot_encoder.hpp"

namespace arena {

constexpr std::size_t kFrameHeaderSize = 9;

struct FrameHeader {
  FrameKind kind{FrameKind::kFullSnapshot};
  Tick tick{0};
};

struct ChatDelivery {
  SessionId sender{0};
  std::string sender_name;
  ChatScope scope{ChatScope::kBroadcast};
  std::string text;
  bool filtered{false};
};

struct Notice {
  std::string code;
  std::string message;
  nlohmann::json detail;
};

std::string EncodeFrame(FrameKind kind, Tick tick, const nlohmann::json& body);
std::string EncodeWorldFrame(const WorldFrame& frame);
// 헤더 틱은 큐에 넣는 시점의 틱이고, 순위가 계산된 틱은 본문 "t"에 담는다.
std::string EncodeLeaderboardFrame(Tick tick, const LeaderboardSnapshot& snapshot, std::size_t limit);
std::string EncodeChatFrame(Tick tick, const ChatDelivery& chat);
std::string EncodeNoticeFrame(Tick tick, const Notice& notice);

std::optional<FrameHeader> DecodeFrameHeader(std::string_view bytes);
std::optional<nlohmann::json> DecodeFrameBody(std::string_view bytes, std::string& error);
std::optional<WorldFrame> DecodeWorldFrame(std::string_view bytes, std::string& error);

enum class InboundKind : std::uint8_t {
  kAck = 1,
  kInput = 2,
  kChat = 3,
  kSubscribe = 4,
  kLeave = 5,
  kPing = 6,
};

struct ChatRequest {
  ChatScope scope{ChatScope::kBroadcast};
  SessionId target{0};
  std::string text;
};

struct InboundMessage {
  InboundKind kind{InboundKind::kPing};
  Tick ack_tick{0};
  InputCommand input;
  ChatRequest chat;
  Region region;
  std::uint64_t ping_nonce{0};
};

// 형식이 잘못된 입력이면 std::nullopt과 함께 error에 사유를 채운다.
std::optional<InboundMessage> DecodeInbound(std::string_view bytes, std::string& error);
std::string EncodeInbound(const InboundMessage& message);

}  // namespace arena
