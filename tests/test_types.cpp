#include <gtest/gtest.h>

#include "clawcore/core/errors.hpp"
#include "clawcore/core/message.hpp"
#include "clawcore/core/truncate.hpp"
#include "clawcore/core/types.hpp"

using namespace clawcore;

// ============================================================================
// Enum mappings
// ============================================================================

TEST(StopReasonTest, BackendSpellings) {
  EXPECT_EQ(stop_reason_from_string("end_turn"), StopReason::EndTurn);
  EXPECT_EQ(stop_reason_from_string("stop"), StopReason::EndTurn);
  EXPECT_EQ(stop_reason_from_string("tool_use"), StopReason::ToolUse);
  EXPECT_EQ(stop_reason_from_string("tool_calls"), StopReason::ToolUse);
  EXPECT_EQ(stop_reason_from_string("length"), StopReason::MaxTokens);
  EXPECT_EQ(stop_reason_from_string("max_tokens"), StopReason::MaxTokens);
  EXPECT_EQ(stop_reason_from_string("something_new"), StopReason::EndTurn);
  EXPECT_EQ(to_string(StopReason::ToolUse), "tool_use");
}

TEST(ToolCategoryTest, NamesRoundTrip) {
  for (auto category : {ToolCategory::Coding, ToolCategory::System, ToolCategory::Browser, ToolCategory::Search, ToolCategory::Memory,
                        ToolCategory::Comms, ToolCategory::Meta}) {
    auto parsed = tool_category_from_string(to_string(category));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, category);
  }
  EXPECT_FALSE(tool_category_from_string("network").has_value());
  EXPECT_FALSE(tool_category_from_string("Coding").has_value());
}

TEST(ProviderErrorTest, KindForStatus) {
  EXPECT_EQ(ProviderError::kind_for_status(401), ProviderError::Kind::Auth);
  EXPECT_EQ(ProviderError::kind_for_status(403), ProviderError::Kind::Auth);
  EXPECT_EQ(ProviderError::kind_for_status(429), ProviderError::Kind::RateLimit);
  EXPECT_EQ(ProviderError::kind_for_status(400), ProviderError::Kind::BadRequest);
  EXPECT_EQ(ProviderError::kind_for_status(500), ProviderError::Kind::Server);
  EXPECT_EQ(ProviderError::kind_for_status(503), ProviderError::Kind::Server);
}

TEST(ProviderErrorTest, MessageCarriesProvider) {
  ProviderError err(ProviderError::Kind::Auth, "anthropic", "invalid x-api-key", 401);
  EXPECT_EQ(err.provider(), "anthropic");
  EXPECT_EQ(err.status(), 401);
  EXPECT_NE(std::string(err.what()).find("[anthropic]"), std::string::npos);
}

// ============================================================================
// CompletionResponse
// ============================================================================

TEST(CompletionResponseTest, NormalizePromotesToolUse) {
  CompletionResponse response;
  response.content.push_back(TextBlock{"Let me look."});
  response.content.push_back(ToolUseBlock{"call_1", "read", {{"path", "a.txt"}}});
  response.stop_reason = StopReason::EndTurn;

  response.normalize();
  EXPECT_EQ(response.stop_reason, StopReason::ToolUse);
  EXPECT_TRUE(response.has_tool_use());
  EXPECT_EQ(response.text(), "Let me look.");
}

TEST(CompletionResponseTest, NormalizeDemotesEmptyToolUse) {
  CompletionResponse response;
  response.content.push_back(TextBlock{"done"});
  response.stop_reason = StopReason::ToolUse;

  response.normalize();
  EXPECT_EQ(response.stop_reason, StopReason::EndTurn);
  EXPECT_FALSE(response.has_tool_use());
}

TEST(CompletionResponseTest, NormalizeKeepsMaxTokens) {
  CompletionResponse response;
  response.content.push_back(TextBlock{"partial"});
  response.stop_reason = StopReason::MaxTokens;

  response.normalize();
  EXPECT_EQ(response.stop_reason, StopReason::MaxTokens);
}

TEST(CompletionResponseTest, ToMessagePreservesOrder) {
  CompletionResponse response;
  response.content.push_back(TextBlock{"first"});
  response.content.push_back(ToolUseBlock{"c1", "bash", {{"command", "ls"}}});
  response.content.push_back(ToolUseBlock{"c2", "read", {{"path", "x"}}});

  auto msg = response.to_message();
  EXPECT_EQ(msg.role(), Role::Assistant);
  ASSERT_EQ(msg.parts().size(), 3u);
  auto calls = msg.tool_calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0]->id, "c1");
  EXPECT_EQ(calls[1]->name, "read");
}

TEST(MessageTest, ToolResultParts) {
  auto msg = Message::user("");
  EXPECT_TRUE(msg.parts().empty());
  msg.add_tool_result("c1", "bash", "denied", true);

  auto results = msg.tool_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0]->tool_call_id, "c1");
  EXPECT_TRUE(results[0]->is_error);
}

// ============================================================================
// UTF-8 sanitizing and truncation
// ============================================================================

TEST(SanitizeTest, ValidTextUnchanged) {
  std::string text = "h\xC3\xA9llo \xE4\xB8\x96\xE7\x95\x8C \xF0\x9F\x98\x80";
  EXPECT_EQ(sanitize_utf8(text), text);
}

TEST(SanitizeTest, InvalidBytesReplaced) {
  EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(sanitize_utf8("a\xC3"), "a\xEF\xBF\xBD");
  // Overlong encoding of '/'
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TruncateTest, NoTruncationNeeded) {
  auto result = Truncate::output("Hello, world!");
  EXPECT_FALSE(result.truncated);
  EXPECT_EQ(result.content, "Hello, world!");
}

TEST(TruncateTest, CapsAndAppendsMarker) {
  std::string text(2048, 'x');
  auto result = Truncate::output(text, 1024);
  EXPECT_TRUE(result.truncated);
  EXPECT_EQ(result.content, std::string(1024, 'x') + "\n[Output truncated at 1KB]");
}

TEST(TruncateTest, MarkerInBytesForOddCaps) {
  EXPECT_EQ(Truncate::marker(100), "\n[Output truncated at 100 bytes]");
  EXPECT_EQ(Truncate::marker(), "\n[Output truncated at 30KB]");
}

TEST(TruncateTest, Idempotent) {
  std::string text(5000, 'y');
  auto once = Truncate::output(text, 1024);
  auto twice = Truncate::output(once.content, 1024);
  EXPECT_TRUE(twice.truncated);
  EXPECT_EQ(twice.content, once.content);
}

TEST(TruncateTest, DoesNotSplitMultibyteSequence) {
  // 3-byte characters; a 10-byte cap falls inside the fourth one
  std::string text;
  for (int i = 0; i < 10; ++i) text += "\xE4\xB8\x96";

  auto result = Truncate::output(text, 10);
  ASSERT_TRUE(result.truncated);
  std::string kept = result.content.substr(0, result.content.size() - Truncate::marker(10).size());
  EXPECT_EQ(kept.size(), 9u);
  EXPECT_EQ(sanitize_utf8(kept), kept);
}
