#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clawcore/core/message.hpp"
#include "clawcore/llm/provider.hpp"
#include "clawcore/tool/dispatcher.hpp"
#include "clawcore/tool/registry.hpp"

namespace clawcore {

enum class LoopState { Idle, Running, Completed, Failed, Cancelled };

std::string to_string(LoopState state);

struct AgentLoopOptions {
  std::string model;
  std::string system_prompt;
  std::optional<int> max_tokens;
  std::optional<double> temperature;

  // Upper bound on provider round trips per prompt
  int max_steps = 25;

  std::filesystem::path workspace = std::filesystem::current_path();

  size_t max_output_bytes = Truncate::kDefaultMaxBytes;
};

struct TurnResult {
  LoopState state = LoopState::Idle;
  std::string text;
  StopReason stop_reason = StopReason::EndTurn;
  TokenUsage usage;
  int steps = 0;
  std::optional<std::string> error;

  bool ok() const {
    return state == LoopState::Completed;
  }
};

// Drives one conversation: provider call, gated tool dispatch, fold results
// back, repeat until the model stops asking for tools
class AgentLoop {
 public:
  AgentLoop(std::shared_ptr<llm::Provider> provider, const ToolRegistry &tools, AgentLoopOptions options);

  const SessionId &id() const {
    return id_;
  }

  // Blocking; a ProviderError ends the turn as Failed
  TurnResult prompt(const std::string &text);

  // Stops before the next provider call and kills running skill processes
  void cancel();

  const std::vector<Message> &messages() const {
    return messages_;
  }

  // Callbacks
  void on_tool_call(std::function<void(const ToolUseBlock &)> callback) {
    on_tool_call_ = std::move(callback);
  }

  void on_tool_result(std::function<void(const ToolCallOutcome &)> callback) {
    on_tool_result_ = std::move(callback);
  }

 private:
  CompletionRequest build_request() const;

  SessionId id_;
  std::shared_ptr<llm::Provider> provider_;
  const ToolRegistry &tools_;
  AgentLoopOptions options_;
  ToolDispatcher dispatcher_;

  std::vector<Message> messages_;
  std::shared_ptr<std::atomic<bool>> abort_signal_;

  std::function<void(const ToolUseBlock &)> on_tool_call_;
  std::function<void(const ToolCallOutcome &)> on_tool_result_;
};

}  // namespace clawcore
