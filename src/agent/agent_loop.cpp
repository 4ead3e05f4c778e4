#include "clawcore/agent/agent_loop.hpp"

#include <spdlog/spdlog.h>

#include "clawcore/core/uuid.hpp"

namespace clawcore {

std::string to_string(LoopState state) {
  switch (state) {
    case LoopState::Idle:
      return "idle";
    case LoopState::Running:
      return "running";
    case LoopState::Completed:
      return "completed";
    case LoopState::Failed:
      return "failed";
    case LoopState::Cancelled:
      return "cancelled";
  }
  return "idle";
}

AgentLoop::AgentLoop(std::shared_ptr<llm::Provider> provider, const ToolRegistry &tools, AgentLoopOptions options)
    : id_(UUID::with_prefix("ses")),
      provider_(std::move(provider)),
      tools_(tools),
      options_(std::move(options)),
      dispatcher_(tools, options_.max_output_bytes),
      abort_signal_(std::make_shared<std::atomic<bool>>(false)) {}

void AgentLoop::cancel() {
  abort_signal_->store(true);
}

CompletionRequest AgentLoop::build_request() const {
  CompletionRequest request;
  request.model = options_.model;
  request.messages = messages_;
  request.system_prompt = options_.system_prompt;
  request.tools = tools_.filtered_definitions();
  request.max_tokens = options_.max_tokens;
  request.temperature = options_.temperature;
  return request;
}

TurnResult AgentLoop::prompt(const std::string &text) {
  TurnResult result;

  if (!provider_) {
    result.state = LoopState::Failed;
    result.error = "No LLM provider configured";
    return result;
  }

  abort_signal_->store(false);
  messages_.push_back(Message::user(text));
  result.state = LoopState::Running;

  ToolContext ctx;
  ctx.session_id = id_;
  ctx.workspace = options_.workspace;
  ctx.abort_signal = abort_signal_;

  spdlog::debug("[Session {}] Starting run loop with provider {}", id_, provider_->name());

  while (result.state == LoopState::Running) {
    if (abort_signal_->load()) {
      result.state = LoopState::Cancelled;
      break;
    }

    if (result.steps >= options_.max_steps) {
      spdlog::warn("[Session {}] Reached max steps ({})", id_, options_.max_steps);
      result.state = LoopState::Failed;
      result.error = "Reached maximum of " + std::to_string(options_.max_steps) + " steps";
      break;
    }
    result.steps++;

    CompletionResponse response;
    try {
      response = provider_->complete(build_request()).get();
    } catch (const ProviderError &e) {
      spdlog::error("[Session {}] Provider error: {}", id_, e.what());
      result.state = LoopState::Failed;
      result.error = e.what();
      break;
    }

    result.usage += response.usage;
    result.stop_reason = response.stop_reason;
    messages_.push_back(response.to_message());

    spdlog::debug("[Session {}] Step {}: stop_reason={}, blocks={}", id_, result.steps, to_string(response.stop_reason), response.content.size());

    if (response.stop_reason != StopReason::ToolUse) {
      result.text = response.text();
      result.state = response.stop_reason == StopReason::Error ? LoopState::Failed : LoopState::Completed;
      if (response.stop_reason == StopReason::Error) {
        result.error = "Provider reported an error stop condition";
      }
      break;
    }

    auto calls = response.tool_uses();
    if (on_tool_call_) {
      for (const auto &call : calls) on_tool_call_(call);
    }

    Message results_msg(Role::User, "");
    for (const auto &outcome : dispatcher_.run(calls, ctx)) {
      if (on_tool_result_) on_tool_result_(outcome);
      results_msg.add_tool_result(outcome.call_id, outcome.tool_name, outcome.result.output, outcome.result.is_error);
    }
    messages_.push_back(std::move(results_msg));
  }

  spdlog::debug("[Session {}] Run loop finished: state={}, steps={}", id_, to_string(result.state), result.steps);
  return result;
}

}  // namespace clawcore
