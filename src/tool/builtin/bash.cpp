#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "clawcore/sandbox/process.hpp"
#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

namespace {

constexpr double kMaxTimeoutMs = 10 * 60 * 1000;

// Requested timeout in ms; non-positive or missing values use the default
int resolve_timeout(const json& args, int default_ms) {
  auto it = args.find("timeout");
  if (it == args.end() || !it->is_number()) return default_ms;
  double requested = it->get<double>();
  if (!(requested > 0)) return default_ms;
  return static_cast<int>(std::ceil(std::min(requested, kMaxTimeoutMs)));
}

}  // namespace

// ============================================================================
// BashTool
// ============================================================================

BashTool::BashTool(SandboxSettings settings)
    : SimpleTool("bash", "Executes a bash command in the workspace directory with a timeout.", ToolCategory::System), settings_(settings) {}

std::vector<ParameterSchema> BashTool::parameters() const {
  return {{"command", "string", "The bash command to execute", true, std::nullopt, std::nullopt},
          {"timeout", "number", "Timeout in milliseconds", false, json(settings_.timeout_ms), std::nullopt}};
}

std::future<ToolResult> BashTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx, settings = settings_]() -> ToolResult {
    std::string command = args.value("command", "");
    int timeout_ms = resolve_timeout(args, settings.timeout_ms);

    if (command.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "Command is required");
    }

    if (ctx.aborted()) {
      spdlog::warn("[BashTool] Execution cancelled");
      return ToolResult::error(ToolErrorKind::Cancelled, "Cancelled");
    }

    spdlog::debug("[BashTool] Executing: command=\"{}\", workdir=\"{}\", timeout={}ms", command, ctx.workspace.string(), timeout_ms);

    sandbox::ProcessOptions options;
    options.argv = {"bash", "-c", command};
    options.working_dir = ctx.workspace;
    options.timeout = std::chrono::milliseconds(timeout_ms);
    options.kill_grace = std::chrono::milliseconds(settings.kill_grace_ms);
    options.max_output_bytes = settings.max_output_bytes;
    options.abort_signal = ctx.abort_signal;

    auto run = sandbox::run_process(options);

    if (run.spawn_failed) {
      return ToolResult::error(ToolErrorKind::SandboxSpawnFailure, run.error);
    }
    if (run.cancelled) {
      return ToolResult::error(ToolErrorKind::Cancelled, "Cancelled");
    }

    std::string output = run.output;
    if (!run.error.empty()) {
      if (!output.empty() && output.back() != '\n') output += "\n";
      output += run.error;
    }

    if (run.timed_out) {
      spdlog::warn("[BashTool] Command timed out after {}ms", timeout_ms);
      auto result = ToolResult::error(ToolErrorKind::SandboxTimeout, output + "\n[Timed out after " + std::to_string(timeout_ms / 1000) + "s]");
      result.metadata["exit_code"] = run.exit_code;
      return result;
    }

    if (run.exit_code != 0) {
      spdlog::debug("[BashTool] Command failed with exit code {}", run.exit_code);
      auto result = ToolResult::error(ToolErrorKind::ExecutionFailed, output + "\n[Exit code: " + std::to_string(run.exit_code) + "]");
      result.title = "Command failed";
      result.metadata["exit_code"] = run.exit_code;
      return result;
    }

    spdlog::debug("[BashTool] Command succeeded, output length: {} bytes", output.size());
    auto result = ToolResult::with_title(output, "Executed: " + command.substr(0, 50));
    result.metadata["exit_code"] = 0;
    return result;
  });
}

}  // namespace clawcore::tools
