#include "clawcore/core/message.hpp"

namespace clawcore {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Message::Message(Role role, const std::string &content) : role_(role) {
  if (!content.empty()) {
    parts_.push_back(TextPart{content});
  }
}

Message Message::system(const std::string &content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

void Message::add_text(const std::string &text) {
  parts_.push_back(TextPart{text});
}

void Message::add_tool_call(const std::string &id, const std::string &name, const json &args) {
  parts_.push_back(ToolCallPart{id, name, args});
}

void Message::add_tool_result(const std::string &call_id, const std::string &name, const std::string &output, bool is_error) {
  parts_.push_back(ToolResultPart{call_id, name, output, is_error});
}

std::string Message::text() const {
  std::string result;
  for (const auto &part : parts_) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    }
  }
  return result;
}

std::vector<const ToolCallPart *> Message::tool_calls() const {
  std::vector<const ToolCallPart *> result;
  for (const auto &part : parts_) {
    if (auto *tc = std::get_if<ToolCallPart>(&part)) {
      result.push_back(tc);
    }
  }
  return result;
}

std::vector<const ToolResultPart *> Message::tool_results() const {
  std::vector<const ToolResultPart *> result;
  for (const auto &part : parts_) {
    if (auto *tr = std::get_if<ToolResultPart>(&part)) {
      result.push_back(tr);
    }
  }
  return result;
}

json ToolDefinition::to_json() const {
  return {{"name", name}, {"description", description}, {"input_schema", input_schema}};
}

std::string CompletionResponse::text() const {
  std::string result;
  for (const auto &block : content) {
    if (auto *text = std::get_if<TextBlock>(&block)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    }
  }
  return result;
}

std::vector<ToolUseBlock> CompletionResponse::tool_uses() const {
  std::vector<ToolUseBlock> result;
  for (const auto &block : content) {
    if (auto *tu = std::get_if<ToolUseBlock>(&block)) {
      result.push_back(*tu);
    }
  }
  return result;
}

bool CompletionResponse::has_tool_use() const {
  for (const auto &block : content) {
    if (std::holds_alternative<ToolUseBlock>(block)) return true;
  }
  return false;
}

void CompletionResponse::normalize() {
  if (has_tool_use()) {
    stop_reason = StopReason::ToolUse;
  } else if (stop_reason == StopReason::ToolUse) {
    // Backend claimed tool use but sent no decodable call
    stop_reason = StopReason::EndTurn;
  }
}

Message CompletionResponse::to_message() const {
  Message msg(Role::Assistant, "");
  for (const auto &block : content) {
    if (auto *text = std::get_if<TextBlock>(&block)) {
      msg.add_text(text->text);
    } else if (auto *tu = std::get_if<ToolUseBlock>(&block)) {
      msg.add_tool_call(tu->id, tu->name, tu->input);
    }
  }
  return msg;
}

}  // namespace clawcore
