#include <cstdlib>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/mariadb_player_store.hpp"
#include "arena/persistence_gateway.hpp"

namespace {

arena::DbConfig TestDbConfig() {
  arena::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

class MariaDbPlayerStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cfg = TestDbConfig();
    if (cfg.host.empty()) {
      GTEST_SKIP() << "DB_HOST가 없어 MariaDB 통합 테스트를 건너뜁니다";
    }
    db_client_ = std::make_shared<arena::MariaDbClient>(cfg);
    store_ = std::make_shared<arena::MariaDbPlayerStore>(db_client_, "arena_it");
    store_->EnsureSchema();
    store_->ClearAll();
  }

  arena::PlayerRecord Record(std::uint64_t best_score, std::int64_t last_seen) {
    arena::PlayerRecord record;
    record.player_id = "abc123";
    record.display_name = "alice";
    record.best_score = best_score;
    record.last_seen_unix = last_seen;
    return record;
  }

  std::shared_ptr<arena::MariaDbClient> db_client_;
  std::shared_ptr<arena::MariaDbPlayerStore> store_;
};

}  // namespace

TEST_F(MariaDbPlayerStoreItTest, UpsertKeepsBestScoreAndIsIdempotent) {
  store_->Upsert(Record(500, 100));
  store_->Upsert(Record(300, 200));
  auto loaded = store_->Load("abc123");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->best_score, 500u);
  EXPECT_EQ(loaded->last_seen_unix, 200);

  store_->Upsert(*loaded);
  EXPECT_EQ(*store_->Load("abc123"), *loaded);
  EXPECT_FALSE(store_->Load("missing").has_value());
}

TEST_F(MariaDbPlayerStoreItTest, EmptyDisplayNameKeepsStoredName) {
  store_->Upsert(Record(10, 1));
  auto nameless = Record(20, 2);
  nameless.display_name.clear();
  store_->Upsert(nameless);
  EXPECT_EQ(store_->Load("abc123")->display_name, "alice");
}

TEST_F(MariaDbPlayerStoreItTest, ScoreWriteKeepsStoredFlags) {
  store_->Upsert(Record(10, 1));
  auto mute = Record(0, 1);
  mute.moderation_flags = arena::kFlagMuted;
  mute.overwrite_flags = true;
  store_->Upsert(mute);
  store_->Upsert(Record(40, 2));
  auto loaded = store_->Load("abc123");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->Muted());
  EXPECT_EQ(loaded->best_score, 40u);
}

TEST_F(MariaDbPlayerStoreItTest, NamesWithQuotesAreEscaped) {
  auto record = Record(1, 1);
  record.display_name = "o'neil \"x\"";
  store_->Upsert(record);
  EXPECT_EQ(store_->Load("abc123")->display_name, record.display_name);
}

TEST_F(MariaDbPlayerStoreItTest, OlderLeaderboardVersionDoesNotOverwrite) {
  store_->SaveLeaderboard("eu", 5, nlohmann::json{{"version", 5}});
  store_->SaveLeaderboard("eu", 3, nlohmann::json{{"version", 3}});

  std::string payload;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto rows = db_client_->Query(
        conn, "SELECT payload FROM " + store_->LeaderboardsTable() + " WHERE region='eu';", "리더보드 조회 실패");
    ASSERT_EQ(rows.size(), 1u);
    payload = rows[0].values[0];
  });
  EXPECT_EQ(nlohmann::json::parse(payload)["version"], 5);
}

TEST_F(MariaDbPlayerStoreItTest, TransientFailuresAreRetriedByClient) {
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  store_->Upsert(Record(42, 1));
  db_client_->SetTransientInjector(nullptr);
  EXPECT_EQ(store_->Load("abc123")->best_score, 42u);
}

TEST_F(MariaDbPlayerStoreItTest, GatewayWritesThroughMariaDb) {
  arena::PersistenceGateway gateway(store_, arena::RetryPolicy{});
  gateway.Start();
  auto status = gateway.UpsertPlayer(Record(77, 1), arena::WriteClass::kFinal);
  ASSERT_EQ(status.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(status.get(), arena::WriteStatus::kWritten);
  gateway.Shutdown();
  EXPECT_EQ(gateway.LoadPlayer("abc123").record->best_score, 77u);
}
