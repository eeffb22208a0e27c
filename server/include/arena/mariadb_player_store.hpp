/*
 * 설명: MariaDB 기반 플레이어 저장소. 네임스페이스 접두사가 붙은 테이블에 키 기준 upsert로 기록한다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/it/mariadb_player_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "arena/db_client.hpp"
#include "arena/player_store.hpp"

namespace arena {

class MariaDbPlayerStore : public PlayerStore {
 public:
  MariaDbPlayerStore(std::shared_ptr<MariaDbClient> db_client, std::string table_namespace);

  void EnsureSchema();
  void Upsert(const PlayerRecord& record) override;
  std::optional<PlayerRecord> Load(const std::string& player_id) override;
  void SaveLeaderboard(const std::string& region, std::uint64_t version, const nlohmann::json& payload) override;

  // 테스트 격리용.
  void ClearAll();

  const std::string& PlayersTable() const { return players_table_; }
  const std::string& LeaderboardsTable() const { return leaderboards_table_; }

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::string players_table_;
  std::string leaderboards_table_;
};

}  // namespace arena
