/*
 * 설명: MariaDB 플레이어/리더보드 테이블 upsert와 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 * 테스트: server/tests/it/mariadb_player_store_it_test.cpp
 */
#include "arena/mariadb_player_store.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace arena {
namespace {
std::string ValidateNamespace(const std::string& value) {
  if (value.empty() || value.size() > 32 ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; })) {
    throw std::invalid_argument("DB 네임스페이스는 영문자/숫자/밑줄만 허용됩니다: " + value);
  }
  return value;
}

std::uint64_t ToUnsigned(const std::string& value) { return value.empty() ? 0 : std::stoull(value); }

std::int64_t ToSigned(const std::string& value) { return value.empty() ? 0 : std::stoll(value); }

// 게이트웨이는 저장소 장애를 하나의 예외 유형으로만 받는다.
[[noreturn]] void RaiseUnavailable(const char* ctx, const DbException& ex) {
  throw StorageUnavailable(std::string(ctx) + ": " + ex.what());
}
}  // namespace

MariaDbPlayerStore::MariaDbPlayerStore(std::shared_ptr<MariaDbClient> db_client, std::string table_namespace)
    : db_client_(std::move(db_client)) {
  auto ns = ValidateNamespace(table_namespace);
  players_table_ = ns + "_players";
  leaderboards_table_ = ns + "_leaderboards";
}

void MariaDbPlayerStore::EnsureSchema() {
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream players;
      players << "CREATE TABLE IF NOT EXISTS " << players_table_
              << " (player_id VARCHAR(64) NOT NULL PRIMARY KEY, display_name VARCHAR(64) NOT NULL,"
                 " best_score BIGINT UNSIGNED NOT NULL DEFAULT 0, moderation_flags INT UNSIGNED NOT NULL DEFAULT 0,"
                 " last_seen BIGINT NOT NULL DEFAULT 0, updated_at DATETIME(6) NOT NULL) ENGINE=InnoDB;";
      db_client_->Execute(conn, players.str(), "플레이어 테이블 생성 실패");

      std::ostringstream leaderboards;
      leaderboards << "CREATE TABLE IF NOT EXISTS " << leaderboards_table_
                   << " (region VARCHAR(64) NOT NULL PRIMARY KEY, version BIGINT UNSIGNED NOT NULL,"
                      " payload LONGTEXT NOT NULL, updated_at DATETIME(6) NOT NULL) ENGINE=InnoDB;";
      db_client_->Execute(conn, leaderboards.str(), "리더보드 테이블 생성 실패");
    });
  } catch (const DbException& ex) {
    RaiseUnavailable("스키마 준비 실패", ex);
  }
}

void MariaDbPlayerStore::Upsert(const PlayerRecord& record) {
  try {
    bool committed = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO " << players_table_
          << "(player_id, display_name, best_score, moderation_flags, last_seen, updated_at) VALUES ('"
          << db_client_->Escape(conn, record.player_id) << "', '" << db_client_->Escape(conn, record.display_name)
          << "', " << record.best_score << ", " << record.moderation_flags << ", " << record.last_seen_unix
          << ", NOW(6)) ON DUPLICATE KEY UPDATE"
             " display_name = IF(VALUES(display_name) = '', display_name, VALUES(display_name)),"
             " best_score = GREATEST(best_score, VALUES(best_score)),"
          << (record.overwrite_flags ? " moderation_flags = VALUES(moderation_flags),"
                                     : " moderation_flags = moderation_flags,")
          << " last_seen = GREATEST(last_seen, VALUES(last_seen)),"
             " updated_at = NOW(6);";
      db_client_->Execute(conn, oss.str(), "플레이어 upsert 실패");
      return true;
    });
    if (!committed) {
      throw StorageUnavailable("플레이어 저장이 커밋되지 않았습니다");
    }
  } catch (const DbException& ex) {
    RaiseUnavailable("플레이어 저장 실패", ex);
  }
}

std::optional<PlayerRecord> MariaDbPlayerStore::Load(const std::string& player_id) {
  std::optional<PlayerRecord> result;
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT player_id, display_name, best_score, moderation_flags, last_seen FROM " << players_table_
          << " WHERE player_id='" << db_client_->Escape(conn, player_id) << "';";
      auto rows = db_client_->Query(conn, oss.str(), "플레이어 조회 실패");
      if (rows.empty()) {
        return;
      }
      const auto& row = rows.front();
      PlayerRecord record;
      record.player_id = row.values[0];
      record.display_name = row.values[1];
      record.best_score = ToUnsigned(row.values[2]);
      record.moderation_flags = static_cast<std::uint32_t>(ToUnsigned(row.values[3]));
      record.last_seen_unix = ToSigned(row.values[4]);
      result = record;
    });
  } catch (const DbException& ex) {
    RaiseUnavailable("플레이어 조회 실패", ex);
  }
  return result;
}

void MariaDbPlayerStore::SaveLeaderboard(const std::string& region, std::uint64_t version,
                                         const nlohmann::json& payload) {
  try {
    auto payload_text = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    bool committed = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      // payload를 version보다 먼저 갱신해야 이전 version과 비교된다.
      oss << "INSERT INTO " << leaderboards_table_ << "(region, version, payload, updated_at) VALUES ('"
          << db_client_->Escape(conn, region) << "', " << version << ", '" << db_client_->Escape(conn, payload_text)
          << "', NOW(6)) ON DUPLICATE KEY UPDATE"
             " payload = IF(VALUES(version) >= version, VALUES(payload), payload),"
             " updated_at = IF(VALUES(version) >= version, NOW(6), updated_at),"
             " version = GREATEST(version, VALUES(version));";
      db_client_->Execute(conn, oss.str(), "리더보드 저장 실패");
      return true;
    });
    if (!committed) {
      throw StorageUnavailable("리더보드 저장이 커밋되지 않았습니다");
    }
  } catch (const DbException& ex) {
    RaiseUnavailable("리더보드 저장 실패", ex);
  }
}

void MariaDbPlayerStore::ClearAll() {
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      db_client_->Execute(conn, "DELETE FROM " + players_table_ + ";", "플레이어 정리 실패");
      db_client_->Execute(conn, "DELETE FROM " + leaderboards_table_ + ";", "리더보드 정리 실패");
    });
  } catch (const DbException& ex) {
    RaiseUnavailable("테이블 정리 실패", ex);
  }
}

}  // namespace arena
