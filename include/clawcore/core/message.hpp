#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "clawcore/core/types.hpp"

namespace clawcore {

// Message part types
struct TextPart {
  std::string text;
};

struct ToolCallPart {
  std::string id;
  std::string name;
  json arguments;
};

struct ToolResultPart {
  std::string tool_call_id;
  std::string tool_name;
  std::string output;
  bool is_error = false;
};

using MessagePart = std::variant<TextPart, ToolCallPart, ToolResultPart>;

// Message role
enum class Role { System, User, Assistant };

std::string to_string(Role role);

// One entry of a conversation
class Message {
 public:
  Message() = default;
  Message(Role role, const std::string& content);

  static Message system(const std::string& content);
  static Message user(const std::string& content);
  static Message assistant(const std::string& content);

  Role role() const {
    return role_;
  }

  const std::vector<MessagePart>& parts() const {
    return parts_;
  }

  void add_text(const std::string& text);
  void add_tool_call(const std::string& id, const std::string& name, const json& args);
  void add_tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error = false);

  // Concatenated text parts
  std::string text() const;

  std::vector<const ToolCallPart*> tool_calls() const;
  std::vector<const ToolResultPart*> tool_results() const;

 private:
  Role role_ = Role::User;
  std::vector<MessagePart> parts_;
};

// Tool schema handed to a provider: {name, description, input_schema}
struct ToolDefinition {
  std::string name;
  std::string description;
  json input_schema = json::object();

  json to_json() const;
};

// Normalized completion content
struct TextBlock {
  std::string text;
};

struct ToolUseBlock {
  std::string id;
  std::string name;
  json input = json::object();
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock>;

struct CompletionRequest {
  std::string model;
  std::vector<Message> messages;
  std::string system_prompt;
  std::vector<ToolDefinition> tools;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
};

struct CompletionResponse {
  std::vector<ContentBlock> content;
  StopReason stop_reason = StopReason::EndTurn;
  TokenUsage usage;
  std::string model;

  std::string text() const;
  std::vector<ToolUseBlock> tool_uses() const;
  bool has_tool_use() const;

  // Enforce stop_reason == ToolUse <=> at least one ToolUse block.
  // Adapters call this once before handing a response out.
  void normalize();

  // Assistant message carrying this response, for folding into the next request
  Message to_message() const;
};

}  // namespace clawcore
