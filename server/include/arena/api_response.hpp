/*
 * 설명: REST 응답 엔벨로프와 리더보드/플레이어 JSON 표현 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

#include "arena/leaderboard.hpp"
#include "arena/player_store.hpp"

namespace arena {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

nlohmann::json ToJson(const LeaderboardEntry& entry);
// page는 1부터 시작한다. 저장용 전체 스냅샷은 size에 entries 크기를 넘긴다.
nlohmann::json LeaderboardPageJson(const LeaderboardSnapshot& snapshot, std::size_t page, std::size_t size);
nlohmann::json ToJson(const PlayerRecord& record);

}  // namespace arena
