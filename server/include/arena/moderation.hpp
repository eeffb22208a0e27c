/*
 * 설명: 채팅 모더레이션 필터 계약과 금칙어 마스킹 구현, 채팅 속도/길이/음소거 게이트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/chat_moderation_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/entity.hpp"

namespace arena {

enum class ChatScope : std::uint8_t {
  kBroadcast = 0,
  kTeam = 1,
  kWhisper = 2,
};

struct ModerationVerdict {
  bool allowed{true};
  std::string filtered_text;
};

class ModerationFilter {
 public:
  virtual ~ModerationFilter() = default;
  virtual ModerationVerdict Review(const std::string& text) const = 0;
};

// 대소문자를 구분하지 않고 금칙어를 같은 길이의 '*'로 가린다.
class WordListFilter : public ModerationFilter {
 public:
  explicit WordListFilter(std::vector<std::string> blocked_terms);

  ModerationVerdict Review(const std::string& text) const override;

  static std::vector<std::string> ParseList(const std::string& comma_separated);

 private:
  std::vector<std::string> blocked_terms_;
};

struct ChatGateConfig {
  std::size_t max_length{200};
  std::size_t max_messages{5};
  std::chrono::seconds window{std::chrono::seconds(10)};
};

struct ChatDecision {
  bool accepted{false};
  std::string error_code;
  std::string error_message;
  std::string text;
  bool filtered{false};
};

class ChatGate {
 public:
  ChatGate(std::shared_ptr<ModerationFilter> filter, const ChatGateConfig& config);

  ChatDecision Evaluate(SessionId sender, bool muted, const std::string& raw_text,
                        std::chrono::steady_clock::time_point now);
  void Forget(SessionId sender);

 private:
  std::shared_ptr<ModerationFilter> filter_;
  ChatGateConfig config_;
  std::unordered_map<SessionId, std::deque<std::chrono::steady_clock::time_point>> recent_;
  std::mutex mutex_;
};

}  // namespace arena
