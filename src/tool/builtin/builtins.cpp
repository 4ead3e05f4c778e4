#include <spdlog/spdlog.h>

#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

void register_builtins(ToolRegistry& registry, const skill::SkillRegistry& skills, const SandboxSettings& settings) {
  spdlog::debug("[ToolRegistry] Initializing built-in tools");

  registry.register_tool(std::make_shared<ReadTool>());
  registry.register_tool(std::make_shared<WriteTool>());
  registry.register_tool(std::make_shared<EditTool>());
  registry.register_tool(std::make_shared<BashTool>(settings));
  registry.register_tool(std::make_shared<SkillTool>(skills, settings));
}

}  // namespace clawcore::tools
