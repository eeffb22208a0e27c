/*
 * 설명: User-Agent 문자열 기반 봇 분류 휴리스틱을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/session_manager_test.cpp
 */
#include "arena/trust.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace arena {
namespace {
constexpr std::array<std::string_view, 9> kBotMarkers = {"bot",     "crawler", "spider",       "headless", "python-requests",
                                                          "curl/",   "wget/",   "go-http-client", "scrapy"};
}  // namespace

std::string_view TrustLevelName(TrustLevel level) {
  switch (level) {
    case TrustLevel::kTrusted:
      return "trusted";
    case TrustLevel::kSuspect:
      return "suspect";
    case TrustLevel::kBot:
      return "bot";
  }
  return "unknown";
}

TrustLevel UserAgentBotClassifier::Classify(const ConnectionMetadata& metadata) const {
  std::string agent = metadata.user_agent;
  std::transform(agent.begin(), agent.end(), agent.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (agent.empty()) {
    return TrustLevel::kSuspect;
  }
  for (auto marker : kBotMarkers) {
    if (agent.find(marker) != std::string::npos) {
      return TrustLevel::kBot;
    }
  }
  // 실제 브라우저와 게임 클라이언트는 보통 제품/버전 토큰을 가진다.
  if (agent.find('/') == std::string::npos) {
    return TrustLevel::kSuspect;
  }
  return TrustLevel::kTrusted;
}

}  // namespace arena
