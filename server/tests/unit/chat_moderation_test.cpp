#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "arena/moderation.hpp"
#include "arena/trust.hpp"

namespace {

std::shared_ptr<arena::ChatGate> MakeGate(std::size_t max_messages = 5) {
  arena::ChatGateConfig config;
  config.max_length = 16;
  config.max_messages = max_messages;
  auto filter = std::make_shared<arena::WordListFilter>(arena::WordListFilter::ParseList(" darn , heck,,"));
  return std::make_shared<arena::ChatGate>(filter, config);
}

}  // namespace

TEST(WordListFilterTest, MasksBlockedTermsCaseInsensitively) {
  arena::WordListFilter filter({"darn"});
  auto verdict = filter.Review("Oh DARN it, darn");
  EXPECT_FALSE(verdict.allowed);
  EXPECT_EQ(verdict.filtered_text, "Oh **** it, ****");

  auto clean = filter.Review("hello");
  EXPECT_TRUE(clean.allowed);
  EXPECT_EQ(clean.filtered_text, "hello");
}

TEST(WordListFilterTest, ParseListSkipsBlanks) {
  auto terms = arena::WordListFilter::ParseList(" darn , heck,,");
  ASSERT_EQ(terms.size(), 2u);
  EXPECT_EQ(terms[0], "darn");
  EXPECT_EQ(terms[1], "heck");
  EXPECT_TRUE(arena::WordListFilter::ParseList("").empty());
}

TEST(ChatGateTest, FilteredTextNeverCarriesOriginalTerm) {
  auto gate = MakeGate();
  auto decision = gate->Evaluate(1, false, "  what the heck ", std::chrono::steady_clock::now());
  ASSERT_TRUE(decision.accepted);
  EXPECT_TRUE(decision.filtered);
  EXPECT_EQ(decision.text, "what the ****");
  EXPECT_EQ(decision.text.find("heck"), std::string::npos);
}

TEST(ChatGateTest, RejectsMutedEmptyAndLongMessages) {
  auto gate = MakeGate();
  auto now = std::chrono::steady_clock::now();
  EXPECT_EQ(gate->Evaluate(1, true, "hi", now).error_code, "chat_muted");
  EXPECT_EQ(gate->Evaluate(1, false, "   ", now).error_code, "chat_empty");
  EXPECT_EQ(gate->Evaluate(1, false, "this message is far too long", now).error_code, "chat_too_long");
}

TEST(ChatGateTest, RateLimitIsPerSenderAndSliding) {
  auto gate = MakeGate(2);
  auto now = std::chrono::steady_clock::now();
  EXPECT_TRUE(gate->Evaluate(1, false, "a", now).accepted);
  EXPECT_TRUE(gate->Evaluate(1, false, "b", now).accepted);
  EXPECT_EQ(gate->Evaluate(1, false, "c", now).error_code, "chat_rate_limited");
  EXPECT_TRUE(gate->Evaluate(2, false, "d", now).accepted);
  EXPECT_TRUE(gate->Evaluate(1, false, "e", now + std::chrono::seconds(10)).accepted);

  gate->Forget(2);
  EXPECT_TRUE(gate->Evaluate(2, false, "f", now).accepted);
}

TEST(ChatGateTest, MissingFilterRejectsInsteadOfPassingRawText) {
  arena::ChatGate gate(nullptr, arena::ChatGateConfig{});
  auto decision = gate.Evaluate(1, false, "hello", std::chrono::steady_clock::now());
  EXPECT_FALSE(decision.accepted);
  EXPECT_EQ(decision.error_code, "chat_unavailable");
}

TEST(BotClassifierTest, ClassifiesUserAgents) {
  arena::UserAgentBotClassifier classifier;
  EXPECT_EQ(classifier.Classify({"Mozilla/5.0 (X11; Linux x86_64)", "10.0.0.1"}), arena::TrustLevel::kTrusted);
  EXPECT_EQ(classifier.Classify({"ArenaClient/1.2", "10.0.0.1"}), arena::TrustLevel::kTrusted);
  EXPECT_EQ(classifier.Classify({"Googlebot/2.1", "10.0.0.1"}), arena::TrustLevel::kBot);
  EXPECT_EQ(classifier.Classify({"curl/8.0", "10.0.0.1"}), arena::TrustLevel::kBot);
  EXPECT_EQ(classifier.Classify({"", "10.0.0.1"}), arena::TrustLevel::kSuspect);
  EXPECT_EQ(classifier.Classify({"something", "10.0.0.1"}), arena::TrustLevel::kSuspect);
}
