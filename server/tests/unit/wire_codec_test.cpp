#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/wire_codec.hpp"

namespace {

arena::EntitySnapshot Sample(arena::EntityId id) {
  arena::EntitySnapshot entity;
  entity.id = id;
  entity.kind = arena::EntityKind::kProjectile;
  entity.x = 1.25f;
  entity.y = -3.5f;
  entity.velocity_x = 0.1f;
  entity.velocity_y = -0.2f;
  entity.orientation = 3.14159f;
  entity.health = 42.0f;
  entity.owner = 7;
  return entity;
}

std::string BodyBytes(const nlohmann::json& body) {
  std::string out;
  nlohmann::json::to_msgpack(body, out);
  return out;
}

}  // namespace

TEST(WireCodecTest, HeaderCarriesKindAndBigEndianTick) {
  auto bytes = arena::EncodeFrame(arena::FrameKind::kNotice, 0x0102030405060708ULL, nlohmann::json::object());
  ASSERT_GE(bytes.size(), arena::kFrameHeaderSize);
  EXPECT_EQ(static_cast<std::uint8_t>(bytes[0]), 5u);
  EXPECT_EQ(static_cast<std::uint8_t>(bytes[1]), 0x01u);
  EXPECT_EQ(static_cast<std::uint8_t>(bytes[8]), 0x08u);
  auto header = arena::DecodeFrameHeader(bytes);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->kind, arena::FrameKind::kNotice);
  EXPECT_EQ(header->tick, 0x0102030405060708ULL);
}

TEST(WireCodecTest, DeltaFrameKeepsOnlyMaskedFields) {
  arena::WorldFrame frame;
  frame.kind = arena::FrameKind::kDelta;
  frame.tick = 11;
  frame.baseline_tick = 10;
  arena::EntityUpdate update;
  update.id = 3;
  update.fields = arena::kFieldX | arena::kFieldHealth;
  update.values.x = 9.5f;
  update.values.health = 80.0f;
  frame.updated.push_back(update);
  frame.removed.push_back(4);

  std::string error;
  auto body = arena::DecodeFrameBody(arena::EncodeWorldFrame(frame), error);
  ASSERT_TRUE(body.has_value()) << error;
  ASSERT_EQ((*body)["u"].size(), 1u);
  // [id, mask, x, health]
  EXPECT_EQ((*body)["u"][0].size(), 4u);
  EXPECT_EQ((*body)["b"].get<std::uint64_t>(), 10u);

  auto decoded = arena::DecodeWorldFrame(arena::EncodeWorldFrame(frame), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  ASSERT_EQ(decoded->updated.size(), 1u);
  EXPECT_EQ(decoded->updated[0].fields, update.fields);
  EXPECT_EQ(decoded->updated[0].values.x, 9.5f);
  EXPECT_EQ(decoded->updated[0].values.health, 80.0f);
  EXPECT_EQ(decoded->removed, std::vector<arena::EntityId>{4});
}

TEST(WireCodecTest, FullSnapshotPreservesEntityFieldsExactly) {
  auto frame = arena::MakeFullSnapshot(arena::MakeWorldState({Sample(2), Sample(1)}), 99);
  frame.cause = arena::FullSnapshotCause::kBaselineEvicted;
  std::string error;
  auto decoded = arena::DecodeWorldFrame(arena::EncodeWorldFrame(frame), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->tick, 99u);
  EXPECT_EQ(decoded->cause, arena::FullSnapshotCause::kBaselineEvicted);
  arena::WorldState rebuilt;
  ASSERT_TRUE(arena::ApplyFrame({}, *decoded, rebuilt));
  EXPECT_TRUE(arena::SameWorld(rebuilt, arena::MakeWorldState({Sample(1), Sample(2)})));
}

TEST(WireCodecTest, RejectsTruncatedFrames) {
  auto bytes = arena::EncodeWorldFrame(arena::MakeFullSnapshot(arena::MakeWorldState({Sample(1)}), 5));
  std::string error;
  EXPECT_FALSE(arena::DecodeFrameHeader(bytes.substr(0, 4)).has_value());
  EXPECT_FALSE(arena::DecodeWorldFrame(bytes.substr(0, bytes.size() - 3), error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(WireCodecTest, LeaderboardFrameHonoursLimit) {
  arena::LeaderboardSnapshot snapshot;
  snapshot.version = 3;
  snapshot.tick = 12;
  for (std::size_t i = 0; i < 5; ++i) {
    snapshot.entries.push_back({"p" + std::to_string(i), "name", 100 - i, i + 1, 1});
  }
  std::string error;
  auto bytes = arena::EncodeLeaderboardFrame(40, snapshot, 2);
  auto header = arena::DecodeFrameHeader(bytes);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->tick, 40u);
  auto body = arena::DecodeFrameBody(bytes, error);
  ASSERT_TRUE(body.has_value()) << error;
  EXPECT_EQ((*body)["v"].get<std::uint64_t>(), 3u);
  EXPECT_EQ((*body)["t"].get<std::uint64_t>(), 12u);
  EXPECT_EQ((*body)["n"].get<std::size_t>(), 5u);
  ASSERT_EQ((*body)["e"].size(), 2u);
  EXPECT_EQ((*body)["e"][0][1], "p0");
}

TEST(WireCodecTest, DecodesInboundKinds) {
  std::string error;
  arena::InboundMessage ack;
  ack.kind = arena::InboundKind::kAck;
  ack.ack_tick = 77;
  auto decoded = arena::DecodeInbound(arena::EncodeInbound(ack), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->ack_tick, 77u);

  arena::InboundMessage whisper;
  whisper.kind = arena::InboundKind::kChat;
  whisper.chat = {arena::ChatScope::kWhisper, 12, "hi"};
  decoded = arena::DecodeInbound(arena::EncodeInbound(whisper), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->chat.scope, arena::ChatScope::kWhisper);
  EXPECT_EQ(decoded->chat.target, 12u);

  std::string leave(1, static_cast<char>(arena::InboundKind::kLeave));
  decoded = arena::DecodeInbound(leave, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->kind, arena::InboundKind::kLeave);

  std::string subscribe(1, static_cast<char>(arena::InboundKind::kSubscribe));
  decoded = arena::DecodeInbound(subscribe, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_TRUE(decoded->region.unbounded);
}

TEST(WireCodecTest, RejectsMalformedInbound) {
  std::string error;
  EXPECT_FALSE(arena::DecodeInbound("", error).has_value());
  EXPECT_EQ(error, "empty_message");

  EXPECT_FALSE(arena::DecodeInbound(std::string(1, static_cast<char>(9)), error).has_value());
  EXPECT_EQ(error, "unknown_kind");

  std::string no_tick(1, static_cast<char>(arena::InboundKind::kAck));
  no_tick += BodyBytes(nlohmann::json::object());
  EXPECT_FALSE(arena::DecodeInbound(no_tick, error).has_value());
  EXPECT_EQ(error, "ack_tick");

  std::string garbage(1, static_cast<char>(arena::InboundKind::kInput));
  garbage += "\xc1\xff";
  EXPECT_FALSE(arena::DecodeInbound(garbage, error).has_value());

  std::string not_map(1, static_cast<char>(arena::InboundKind::kPing));
  not_map += BodyBytes(nlohmann::json::array({1, 2}));
  EXPECT_FALSE(arena::DecodeInbound(not_map, error).has_value());
  EXPECT_EQ(error, "body_not_map");

  std::string bad_region(1, static_cast<char>(arena::InboundKind::kSubscribe));
  bad_region += BodyBytes({{"x", 0.0}, {"y", 0.0}, {"r", -1.0}});
  EXPECT_FALSE(arena::DecodeInbound(bad_region, error).has_value());
  EXPECT_EQ(error, "subscribe_region");
}
