#include "clawcore/core/types.hpp"

namespace clawcore {

std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::EndTurn:
      return "end_turn";
    case StopReason::ToolUse:
      return "tool_use";
    case StopReason::MaxTokens:
      return "max_tokens";
    case StopReason::Error:
      return "error";
  }
  return "end_turn";
}

StopReason stop_reason_from_string(const std::string &str) {
  if (str == "end_turn" || str == "stop" || str == "stop_sequence") return StopReason::EndTurn;
  if (str == "tool_use" || str == "tool_calls" || str == "function_call") return StopReason::ToolUse;
  if (str == "max_tokens" || str == "length") return StopReason::MaxTokens;
  if (str == "error" || str == "content_filter") return StopReason::Error;
  return StopReason::EndTurn;
}

std::string to_string(ToolCategory category) {
  switch (category) {
    case ToolCategory::Coding:
      return "coding";
    case ToolCategory::System:
      return "system";
    case ToolCategory::Browser:
      return "browser";
    case ToolCategory::Search:
      return "search";
    case ToolCategory::Memory:
      return "memory";
    case ToolCategory::Comms:
      return "comms";
    case ToolCategory::Meta:
      return "meta";
  }
  return "meta";
}

std::optional<ToolCategory> tool_category_from_string(const std::string &str) {
  if (str == "coding") return ToolCategory::Coding;
  if (str == "system") return ToolCategory::System;
  if (str == "browser") return ToolCategory::Browser;
  if (str == "search") return ToolCategory::Search;
  if (str == "memory") return ToolCategory::Memory;
  if (str == "comms") return ToolCategory::Comms;
  if (str == "meta") return ToolCategory::Meta;
  return std::nullopt;
}

namespace {

constexpr const char *kReplacementChar = "\xEF\xBF\xBD";  // U+FFFD

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    auto c = static_cast<unsigned char>(input[i]);

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      // Invalid leading byte
      output.append(kReplacementChar);
      i++;
      continue;
    }

    if (i + len > input.size()) {
      output.append(kReplacementChar);
      i++;
      continue;
    }

    bool valid = true;
    for (size_t k = 1; k < len; ++k) {
      auto next = static_cast<unsigned char>(input[i + k]);
      if (!is_continuation(next)) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (next & 0x3F);
    }

    if (!valid) {
      output.append(kReplacementChar);
      i++;
      continue;
    }

    // Reject overlong encodings, surrogates and out-of-range code points
    if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      output.append(kReplacementChar);
    } else {
      output.append(input, i, len);
    }
    i += len;
  }

  return output;
}

}  // namespace clawcore
