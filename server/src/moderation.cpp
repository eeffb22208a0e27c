/*
 * 설명: 금칙어 마스킹 필터와 채팅 게이트를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/unit/chat_moderation_test.cpp
 */
#include "arena/moderation.hpp"

#include <algorithm>
#include <cctype>

namespace arena {
namespace {
std::string ToLower(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string Trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}
}  // namespace

WordListFilter::WordListFilter(std::vector<std::string> blocked_terms) {
  for (auto& term : blocked_terms) {
    auto lowered = ToLower(Trim(term));
    if (!lowered.empty()) {
      blocked_terms_.push_back(std::move(lowered));
    }
  }
}

ModerationVerdict WordListFilter::Review(const std::string& text) const {
  ModerationVerdict verdict;
  verdict.filtered_text = text;
  auto lowered = ToLower(text);
  for (const auto& term : blocked_terms_) {
    std::size_t pos = lowered.find(term);
    while (pos != std::string::npos) {
      std::fill(verdict.filtered_text.begin() + static_cast<std::ptrdiff_t>(pos),
                verdict.filtered_text.begin() + static_cast<std::ptrdiff_t>(pos + term.size()), '*');
      verdict.allowed = false;
      pos = lowered.find(term, pos + term.size());
    }
  }
  return verdict;
}

std::vector<std::string> WordListFilter::ParseList(const std::string& comma_separated) {
  std::vector<std::string> terms;
  std::size_t pos = 0;
  while (pos <= comma_separated.size()) {
    auto comma = comma_separated.find(',', pos);
    auto term = Trim(comma_separated.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
    if (!term.empty()) {
      terms.push_back(term);
    }
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }
  return terms;
}

ChatGate::ChatGate(std::shared_ptr<ModerationFilter> filter, const ChatGateConfig& config)
    : filter_(std::move(filter)), config_(config) {}

ChatDecision ChatGate::Evaluate(SessionId sender, bool muted, const std::string& raw_text,
                                std::chrono::steady_clock::time_point now) {
  ChatDecision decision;
  if (muted) {
    decision.error_code = "chat_muted";
    decision.error_message = "채팅이 금지된 플레이어입니다";
    return decision;
  }
  auto text = Trim(raw_text);
  if (text.empty()) {
    decision.error_code = "chat_empty";
    decision.error_message = "빈 메시지는 보낼 수 없습니다";
    return decision;
  }
  if (text.size() > config_.max_length) {
    decision.error_code = "chat_too_long";
    decision.error_message = "메시지가 너무 깁니다";
    return decision;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& recent = recent_[sender];
    while (!recent.empty() && now - recent.front() >= config_.window) {
      recent.pop_front();
    }
    if (recent.size() >= config_.max_messages) {
      decision.error_code = "chat_rate_limited";
      decision.error_message = "채팅 전송 속도 제한을 초과했습니다";
      return decision;
    }
    recent.push_back(now);
  }

  // 필터가 없으면 원문을 그대로 내보낼 수 없으므로 거부한다.
  if (!filter_) {
    decision.error_code = "chat_unavailable";
    decision.error_message = "채팅 필터를 사용할 수 없습니다";
    return decision;
  }
  auto verdict = filter_->Review(text);
  decision.accepted = true;
  decision.filtered = !verdict.allowed;
  decision.text = verdict.allowed ? text : verdict.filtered_text;
  return decision;
}

void ChatGate::Forget(SessionId sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  recent_.erase(sender);
}

}  // namespace arena
