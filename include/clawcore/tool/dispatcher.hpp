#pragma once

#include <string>
#include <vector>

#include "clawcore/tool/registry.hpp"

namespace clawcore {

struct ToolCallOutcome {
  ToolCallId call_id;
  std::string tool_name;
  ToolResult result;
};

// Runs the tool calls of one completion concurrently through the registry's
// authorization gate. Outcomes come back in request order.
class ToolDispatcher {
 public:
  explicit ToolDispatcher(const ToolRegistry &registry, size_t max_output_bytes = Truncate::kDefaultMaxBytes);

  std::vector<ToolCallOutcome> run(const std::vector<ToolUseBlock> &calls, const ToolContext &ctx) const;

 private:
  const ToolRegistry &registry_;
  size_t max_output_bytes_;
};

}  // namespace clawcore
