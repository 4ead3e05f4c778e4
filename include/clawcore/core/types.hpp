#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace clawcore {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using ToolCallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_write_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_write_tokens += other.cache_write_tokens;
    return *this;
  }
};

// Why a completion stopped, shared by every provider adapter
enum class StopReason {
  EndTurn,    // Natural completion
  ToolUse,    // Model requested one or more tools
  MaxTokens,  // Token limit reached
  Error       // Backend reported an error condition
};

std::string to_string(StopReason reason);

StopReason stop_reason_from_string(const std::string &str);

// Fixed tool categories used by policies
enum class ToolCategory { Coding, System, Browser, Search, Memory, Comms, Meta };

std::string to_string(ToolCategory category);

std::optional<ToolCategory> tool_category_from_string(const std::string &str);

// Provider configuration
struct ProviderConfig {
  std::string name;
  std::string api_key;
  std::string base_url;
  std::string model;
  std::map<std::string, std::string> headers;
};

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &input);

}  // namespace clawcore
