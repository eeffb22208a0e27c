#include <gtest/gtest.h>

#include "arena/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = arena::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = arena::MakeErrorEnvelope("leaderboard_range", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "leaderboard_range");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, LeaderboardPageShape) {
  arena::LeaderboardSnapshot snapshot;
  snapshot.version = 4;
  snapshot.tick = 120;
  for (std::size_t i = 0; i < 3; ++i) {
    snapshot.entries.push_back({"p" + std::to_string(i), "P" + std::to_string(i), 30 - i * 10, i + 1, 7});
  }

  auto page = arena::LeaderboardPageJson(snapshot, 2, 2);
  EXPECT_EQ(page["version"], 4);
  EXPECT_EQ(page["tick"], 120);
  EXPECT_EQ(page["total"], 3);
  ASSERT_EQ(page["items"].size(), 1u);
  EXPECT_EQ(page["items"][0]["rank"], 3);
  EXPECT_EQ(page["items"][0]["playerId"], "p2");
  EXPECT_EQ(page["items"][0]["score"], 10);
  EXPECT_EQ(page["items"][0]["achievedTick"], 7);

  EXPECT_TRUE(arena::LeaderboardPageJson(snapshot, 5, 2)["items"].empty());
}

TEST(JsonEnvelopeTest, PlayerRecordShape) {
  arena::PlayerRecord record;
  record.player_id = "abc123";
  record.display_name = "alice";
  record.best_score = 500;
  record.moderation_flags = arena::kFlagMuted;
  record.last_seen_unix = 1700000000;

  auto json = arena::ToJson(record);
  EXPECT_EQ(json["playerId"], "abc123");
  EXPECT_EQ(json["bestScore"], 500);
  EXPECT_TRUE(json["muted"].get<bool>());
  EXPECT_FALSE(json["banned"].get<bool>());
  EXPECT_EQ(json["lastSeen"], 1700000000);
}

TEST(JsonEnvelopeTest, TruncatedMultibyteNameStillSerializes) {
  std::string name = "a";
  for (int i = 0; i < 12; ++i) {
    name += "\xC3\xA9";
  }
  arena::PlayerRecord record;
  record.player_id = "p1";
  record.display_name = arena::SanitizeDisplayName(name);
  EXPECT_EQ(record.display_name, name.substr(0, 23));
  EXPECT_NO_THROW(arena::MakeSuccessEnvelope(arena::ToJson(record)).dump());

  // 검증을 거치지 않은 바이트도 응답 직렬화에서는 대체 문자로 바뀐다.
  record.display_name = "bad\xFF";
  auto text = arena::MakeSuccessEnvelope(arena::ToJson(record))
                  .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  EXPECT_NE(text.find("bad\xEF\xBF\xBD"), std::string::npos);
}
