/*
 * 설명: 핸드셰이크 시점의 연결 메타데이터로 신뢰 등급을 매기는 봇 분류기 계약과 UA 휴리스틱 구현.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/session_manager_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace arena {

enum class TrustLevel {
  kTrusted,
  kSuspect,
  kBot,
};

struct ConnectionMetadata {
  std::string user_agent;
  std::string remote_address;
};

std::string_view TrustLevelName(TrustLevel level);

class BotClassifier {
 public:
  virtual ~BotClassifier() = default;
  virtual TrustLevel Classify(const ConnectionMetadata& metadata) const = 0;
};

class UserAgentBotClassifier : public BotClassifier {
 public:
  TrustLevel Classify(const ConnectionMetadata& metadata) const override;
};

}  // namespace arena
