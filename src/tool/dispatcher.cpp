#include "clawcore/tool/dispatcher.hpp"

#include <spdlog/spdlog.h>

namespace clawcore {

ToolDispatcher::ToolDispatcher(const ToolRegistry &registry, size_t max_output_bytes) : registry_(registry), max_output_bytes_(max_output_bytes) {}

std::vector<ToolCallOutcome> ToolDispatcher::run(const std::vector<ToolUseBlock> &calls, const ToolContext &ctx) const {
  std::vector<std::future<ToolResult>> futures;
  futures.reserve(calls.size());

  // Start all, then collect in order
  for (const auto &call : calls) {
    spdlog::debug("[ToolDispatcher] Dispatching {} (id={})", call.name, call.id);
    futures.push_back(registry_.execute(call.name, call.input, ctx));
  }

  std::vector<ToolCallOutcome> outcomes;
  outcomes.reserve(calls.size());

  for (size_t i = 0; i < calls.size(); ++i) {
    ToolResult result = futures[i].get();
    result.output = Truncate::output(result.output, max_output_bytes_).content;
    if (result.is_error) {
      spdlog::debug("[ToolDispatcher] {} failed: {}", calls[i].name, result.output);
    }
    outcomes.push_back(ToolCallOutcome{calls[i].id, calls[i].name, std::move(result)});
  }

  return outcomes;
}

}  // namespace clawcore
