/*
 * 설명: 바이너리 프레임 헤더와 MessagePack 본문의 인코딩/디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/wire_codec_test.cpp
 */
#include "arena/wire_codec.hpp"

#include <bitset>
#include <cmath>
#include <iterator>
#include <limits>

namespace arena {
namespace {
// 갱신 항목의 값은 필드 마스크 비트 순서로 나열된다.
constexpr EntityField kFieldOrder[] = {kFieldKind,      kFieldX,           kFieldY,      kFieldVelocityX,
                                       kFieldVelocityY, kFieldOrientation, kFieldHealth, kFieldOwner};
constexpr std::uint8_t kMaxEntityKind = static_cast<std::uint8_t>(EntityKind::kObstacle);

void WriteTick(std::string& out, Tick tick) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((tick >> shift) & 0xFF));
  }
}

Tick ReadTick(std::string_view bytes) {
  Tick tick = 0;
  for (std::size_t i = 1; i < kFrameHeaderSize; ++i) {
    tick = (tick << 8) | static_cast<unsigned char>(bytes[i]);
  }
  return tick;
}

bool ReadUnsigned(const nlohmann::json& value, std::uint64_t& out) {
  if (value.is_number_unsigned()) {
    out = value.get<std::uint64_t>();
    return true;
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    out = static_cast<std::uint64_t>(value.get<std::int64_t>());
    return true;
  }
  return false;
}

bool ReadFloat(const nlohmann::json& value, float& out) {
  if (!value.is_number()) {
    return false;
  }
  out = value.get<float>();
  return true;
}

bool ReadFiniteFloat(const nlohmann::json& value, float& out) { return ReadFloat(value, out) && std::isfinite(out); }

bool ReadEntityId(const nlohmann::json& value, EntityId& out) {
  std::uint64_t raw = 0;
  if (!ReadUnsigned(value, raw) || raw > std::numeric_limits<EntityId>::max()) {
    return false;
  }
  out = static_cast<EntityId>(raw);
  return true;
}

bool ReadKind(const nlohmann::json& value, EntityKind& out) {
  std::uint64_t raw = 0;
  if (!ReadUnsigned(value, raw) || raw > kMaxEntityKind) {
    return false;
  }
  out = static_cast<EntityKind>(raw);
  return true;
}

bool ReadOwner(const nlohmann::json& value, std::uint32_t& out) {
  std::uint64_t raw = 0;
  if (!ReadUnsigned(value, raw) || raw > std::numeric_limits<std::uint32_t>::max()) {
    return false;
  }
  out = static_cast<std::uint32_t>(raw);
  return true;
}

nlohmann::json FieldToJson(const EntitySnapshot& entity, EntityField field) {
  switch (field) {
    case kFieldKind:
      return static_cast<std::uint8_t>(entity.kind);
    case kFieldOwner:
      return entity.owner;
    default:
      return FieldValue(entity, field);
  }
}

bool FieldFromJson(const nlohmann::json& value, EntityField field, EntitySnapshot& entity) {
  switch (field) {
    case kFieldKind:
      return ReadKind(value, entity.kind);
    case kFieldOwner:
      return ReadOwner(value, entity.owner);
    default: {
      float parsed = 0.0f;
      if (!ReadFloat(value, parsed)) {
        return false;
      }
      SetFieldValue(entity, field, parsed);
      return true;
    }
  }
}

nlohmann::json EntityToJson(const EntitySnapshot& entity) {
  nlohmann::json row = nlohmann::json::array();
  row.push_back(entity.id);
  for (auto field : kFieldOrder) {
    row.push_back(FieldToJson(entity, field));
  }
  return row;
}

bool EntityFromJson(const nlohmann::json& row, EntitySnapshot& entity) {
  if (!row.is_array() || row.size() != 1 + std::size(kFieldOrder)) {
    return false;
  }
  if (!ReadEntityId(row[0], entity.id)) {
    return false;
  }
  for (std::size_t i = 0; i < std::size(kFieldOrder); ++i) {
    if (!FieldFromJson(row[i + 1], kFieldOrder[i], entity)) {
      return false;
    }
  }
  return true;
}

nlohmann::json UpdateToJson(const EntityUpdate& update) {
  nlohmann::json row = nlohmann::json::array();
  row.push_back(update.id);
  row.push_back(update.fields);
  for (auto field : kFieldOrder) {
    if (update.fields & field) {
      row.push_back(FieldToJson(update.values, field));
    }
  }
  return row;
}

bool UpdateFromJson(const nlohmann::json& row, EntityUpdate& update) {
  if (!row.is_array() || row.size() < 2) {
    return false;
  }
  std::uint64_t mask = 0;
  if (!ReadEntityId(row[0], update.id) || !ReadUnsigned(row[1], mask) || mask == 0 || mask > kAllEntityFields) {
    return false;
  }
  update.fields = static_cast<std::uint16_t>(mask);
  if (row.size() != 2 + std::bitset<16>(mask).count()) {
    return false;
  }
  update.values.id = update.id;
  std::size_t index = 2;
  for (auto field : kFieldOrder) {
    if (!(update.fields & field)) {
      continue;
    }
    if (!FieldFromJson(row[index++], field, update.values)) {
      return false;
    }
  }
  return true;
}

const nlohmann::json* Member(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end()) {
    return nullptr;
  }
  return &*it;
}
}  // namespace

std::string EncodeFrame(FrameKind kind, Tick tick, const nlohmann::json& body) {
  std::string out;
  out.push_back(static_cast<char>(kind));
  WriteTick(out, tick);
  nlohmann::json::to_msgpack(body, out);
  return out;
}

std::string EncodeWorldFrame(const WorldFrame& frame) {
  nlohmann::json body = nlohmann::json::object();
  nlohmann::json added = nlohmann::json::array();
  for (const auto& entity : frame.added) {
    added.push_back(EntityToJson(entity));
  }
  if (frame.kind == FrameKind::kFullSnapshot) {
    body["e"] = std::move(added);
    body["c"] = static_cast<int>(frame.cause);
    return EncodeFrame(FrameKind::kFullSnapshot, frame.tick, body);
  }
  nlohmann::json updated = nlohmann::json::array();
  for (const auto& update : frame.updated) {
    updated.push_back(UpdateToJson(update));
  }
  body["b"] = frame.baseline_tick;
  body["a"] = std::move(added);
  body["u"] = std::move(updated);
  body["r"] = frame.removed;
  return EncodeFrame(FrameKind::kDelta, frame.tick, body);
}

std::string EncodeLeaderboardFrame(Tick tick, const LeaderboardSnapshot& snapshot, std::size_t limit) {
  nlohmann::json rows = nlohmann::json::array();
  for (std::size_t i = 0; i < snapshot.entries.size() && i < limit; ++i) {
    const auto& entry = snapshot.entries[i];
    rows.push_back(nlohmann::json::array({entry.rank, entry.player_id, entry.display_name, entry.score}));
  }
  nlohmann::json body{
      {"v", snapshot.version}, {"t", snapshot.tick}, {"n", snapshot.entries.size()}, {"e", std::move(rows)}};
  return EncodeFrame(FrameKind::kLeaderboard, tick, body);
}

std::string EncodeChatFrame(Tick tick, const ChatDelivery& chat) {
  nlohmann::json body{{"s", chat.sender},
                      {"n", chat.sender_name},
                      {"c", static_cast<int>(chat.scope)},
                      {"m", chat.text},
                      {"f", chat.filtered}};
  return EncodeFrame(FrameKind::kChat, tick, body);
}

std::string EncodeNoticeFrame(Tick tick, const Notice& notice) {
  nlohmann::json body{{"c", notice.code}, {"m", notice.message}, {"d", notice.detail}};
  return EncodeFrame(FrameKind::kNotice, tick, body);
}

std::optional<FrameHeader> DecodeFrameHeader(std::string_view bytes) {
  if (bytes.size() < kFrameHeaderSize) {
    return std::nullopt;
  }
  auto raw_kind = static_cast<std::uint8_t>(bytes[0]);
  if (raw_kind < static_cast<std::uint8_t>(FrameKind::kFullSnapshot) ||
      raw_kind > static_cast<std::uint8_t>(FrameKind::kNotice)) {
    return std::nullopt;
  }
  return FrameHeader{static_cast<FrameKind>(raw_kind), ReadTick(bytes)};
}

std::optional<nlohmann::json> DecodeFrameBody(std::string_view bytes, std::string& error) {
  if (!DecodeFrameHeader(bytes)) {
    error = "frame_header";
    return std::nullopt;
  }
  try {
    auto body = bytes.substr(kFrameHeaderSize);
    return nlohmann::json::from_msgpack(body.begin(), body.end());
  } catch (const nlohmann::json::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

std::optional<WorldFrame> DecodeWorldFrame(std::string_view bytes, std::string& error) {
  auto header = DecodeFrameHeader(bytes);
  if (!header || (header->kind != FrameKind::kFullSnapshot && header->kind != FrameKind::kDelta)) {
    error = "not_world_frame";
    return std::nullopt;
  }
  auto body = DecodeFrameBody(bytes, error);
  if (!body) {
    return std::nullopt;
  }
  if (!body->is_object()) {
    error = "body_not_map";
    return std::nullopt;
  }

  WorldFrame frame;
  frame.kind = header->kind;
  frame.tick = header->tick;
  const char* added_key = frame.kind == FrameKind::kFullSnapshot ? "e" : "a";
  const auto* added = Member(*body, added_key);
  if (!added || !added->is_array()) {
    error = "missing_entities";
    return std::nullopt;
  }
  for (const auto& row : *added) {
    EntitySnapshot entity;
    if (!EntityFromJson(row, entity)) {
      error = "bad_entity";
      return std::nullopt;
    }
    frame.added.push_back(entity);
  }
  if (frame.kind == FrameKind::kFullSnapshot) {
    std::uint64_t cause = 0;
    if (const auto* c = Member(*body, "c"); c && ReadUnsigned(*c, cause) &&
                                            cause <= static_cast<std::uint64_t>(FullSnapshotCause::kBaselineEvicted)) {
      frame.cause = static_cast<FullSnapshotCause>(cause);
    }
    return frame;
  }

  const auto* baseline = Member(*body, "b");
  const auto* updated = Member(*body, "u");
  const auto* removed = Member(*body, "r");
  if (!baseline || !ReadUnsigned(*baseline, frame.baseline_tick) || !updated || !updated->is_array() || !removed ||
      !removed->is_array()) {
    error = "bad_delta";
    return std::nullopt;
  }
  for (const auto& row : *updated) {
    EntityUpdate update;
    if (!UpdateFromJson(row, update)) {
      error = "bad_update";
      return std::nullopt;
    }
    frame.updated.push_back(update);
  }
  for (const auto& value : *removed) {
    EntityId id = 0;
    if (!ReadEntityId(value, id)) {
      error = "bad_removal";
      return std::nullopt;
    }
    frame.removed.push_back(id);
  }
  return frame;
}

std::optional<InboundMessage> DecodeInbound(std::string_view bytes, std::string& error) {
  if (bytes.empty()) {
    error = "empty_message";
    return std::nullopt;
  }
  auto raw_kind = static_cast<std::uint8_t>(bytes[0]);
  if (raw_kind < static_cast<std::uint8_t>(InboundKind::kAck) ||
      raw_kind > static_cast<std::uint8_t>(InboundKind::kPing)) {
    error = "unknown_kind";
    return std::nullopt;
  }

  InboundMessage message;
  message.kind = static_cast<InboundKind>(raw_kind);
  nlohmann::json body = nlohmann::json::object();
  if (bytes.size() > 1) {
    try {
      auto payload = bytes.substr(1);
      body = nlohmann::json::from_msgpack(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& ex) {
      error = ex.what();
      return std::nullopt;
    }
  }
  if (!body.is_object()) {
    error = "body_not_map";
    return std::nullopt;
  }

  switch (message.kind) {
    case InboundKind::kAck: {
      const auto* tick = Member(body, "t");
      if (!tick || !ReadUnsigned(*tick, message.ack_tick)) {
        error = "ack_tick";
        return std::nullopt;
      }
      break;
    }
    case InboundKind::kInput: {
      const auto* sequence = Member(body, "s");
      if (!sequence || !ReadUnsigned(*sequence, message.input.sequence)) {
        error = "input_sequence";
        return std::nullopt;
      }
      const auto* move_x = Member(body, "x");
      const auto* move_y = Member(body, "y");
      if ((move_x && !ReadFiniteFloat(*move_x, message.input.move_x)) ||
          (move_y && !ReadFiniteFloat(*move_y, message.input.move_y))) {
        error = "input_move";
        return std::nullopt;
      }
      if (const auto* aim = Member(body, "a"); aim && !ReadFiniteFloat(*aim, message.input.aim)) {
        error = "input_aim";
        return std::nullopt;
      }
      if (const auto* fire = Member(body, "f")) {
        if (!fire->is_boolean()) {
          error = "input_fire";
          return std::nullopt;
        }
        message.input.fire = fire->get<bool>();
      }
      break;
    }
    case InboundKind::kChat: {
      const auto* text = Member(body, "m");
      if (!text || !text->is_string()) {
        error = "chat_text";
        return std::nullopt;
      }
      message.chat.text = text->get<std::string>();
      std::uint64_t scope = 0;
      if (const auto* c = Member(body, "c")) {
        if (!ReadUnsigned(*c, scope) || scope > static_cast<std::uint64_t>(ChatScope::kWhisper)) {
          error = "chat_scope";
          return std::nullopt;
        }
      }
      message.chat.scope = static_cast<ChatScope>(scope);
      if (message.chat.scope == ChatScope::kWhisper) {
        const auto* target = Member(body, "to");
        if (!target || !ReadUnsigned(*target, message.chat.target)) {
          error = "chat_target";
          return std::nullopt;
        }
      }
      break;
    }
    case InboundKind::kSubscribe: {
      const auto* radius = Member(body, "r");
      if (!radius) {
        message.region = Region::Everything();
        break;
      }
      const auto* cx = Member(body, "x");
      const auto* cy = Member(body, "y");
      Region region;
      region.unbounded = false;
      if (!cx || !cy || !ReadFiniteFloat(*cx, region.center_x) || !ReadFiniteFloat(*cy, region.center_y) ||
          !ReadFiniteFloat(*radius, region.half_extent) || region.half_extent <= 0.0f) {
        error = "subscribe_region";
        return std::nullopt;
      }
      message.region = region;
      break;
    }
    case InboundKind::kLeave:
      break;
    case InboundKind::kPing: {
      if (const auto* nonce = Member(body, "n"); nonce && !ReadUnsigned(*nonce, message.ping_nonce)) {
        error = "ping_nonce";
        return std::nullopt;
      }
      break;
    }
  }
  return message;
}

std::string EncodeInbound(const InboundMessage& message) {
  nlohmann::json body = nlohmann::json::object();
  switch (message.kind) {
    case InboundKind::kAck:
      body["t"] = message.ack_tick;
      break;
    case InboundKind::kInput:
      body["s"] = message.input.sequence;
      body["x"] = message.input.move_x;
      body["y"] = message.input.move_y;
      body["a"] = message.input.aim;
      body["f"] = message.input.fire;
      break;
    case InboundKind::kChat:
      body["c"] = static_cast<int>(message.chat.scope);
      body["m"] = message.chat.text;
      if (message.chat.scope == ChatScope::kWhisper) {
        body["to"] = message.chat.target;
      }
      break;
    case InboundKind::kSubscribe:
      if (!message.region.unbounded) {
        body["x"] = message.region.center_x;
        body["y"] = message.region.center_y;
        body["r"] = message.region.half_extent;
      }
      break;
    case InboundKind::kLeave:
      break;
    case InboundKind::kPing:
      body["n"] = message.ping_nonce;
      break;
  }
  std::string out;
  out.push_back(static_cast<char>(message.kind));
  nlohmann::json::to_msgpack(body, out);
  return out;
}

}  // namespace arena
