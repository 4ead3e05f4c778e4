#include <spdlog/spdlog.h>

#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

// ============================================================================
// SkillTool
// ============================================================================

SkillTool::SkillTool(const skill::SkillRegistry& skills, SandboxSettings settings)
    : SimpleTool("skill", "Execute a skill by name. Skills provide specialized capabilities for common tasks.", ToolCategory::Meta),
      skills_(skills),
      settings_(settings) {}

std::string SkillTool::description() const {
  auto available = skills_.available();
  if (available.empty()) {
    return description_ + " No skills are currently available.";
  }

  std::string desc = description_ + "\n\n<available_skills>\n";
  for (const auto& s : available) {
    desc += "  <skill>\n";
    desc += "    <name>" + s.name + "</name>\n";
    desc += "    <description>" + s.description + "</description>\n";
    if (s.scripts.size() > 1) {
      std::string actions;
      for (const auto& [action, _] : s.scripts) {
        if (!actions.empty()) actions += ", ";
        actions += action;
      }
      desc += "    <actions>" + actions + "</actions>\n";
    }
    desc += "  </skill>\n";
  }
  desc += "</available_skills>";
  return desc;
}

std::vector<ParameterSchema> SkillTool::parameters() const {
  return {{"skill", "string", "The name of the skill to execute (from available_skills)", true, std::nullopt, std::nullopt},
          {"args", "string", "Optional arguments for the skill, preferably a JSON object", false, std::nullopt, std::nullopt},
          {"action", "string", "Script action to run (default: run)", false, json("run"), std::nullopt}};
}

std::future<ToolResult> SkillTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [this, args, ctx]() -> ToolResult {
    std::string name = args.value("skill", "");
    if (name.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "Skill name is required");
    }

    skill::SkillExecuteOptions options;
    options.action = args.value("action", "run");
    options.args = skill_args_from_string(args.value("args", ""));
    options.workspace = ctx.workspace;
    options.session_id = ctx.session_id;
    options.timeout = std::chrono::milliseconds(settings_.timeout_ms);
    options.kill_grace = std::chrono::milliseconds(settings_.kill_grace_ms);
    options.max_output_bytes = settings_.max_output_bytes;
    options.abort_signal = ctx.abort_signal;

    spdlog::debug("[SkillTool] Executing skill {} action={}", name, options.action);
    auto result = skills_.execute_skill(name, options);

    if (!result.success) {
      std::string message = result.error.value_or("Skill execution failed");
      if (result.failure == ToolErrorKind::SkillNotFound && !result.suggestions.empty()) {
        std::string suggestions;
        for (const auto& s : result.suggestions) {
          if (!suggestions.empty()) suggestions += ", ";
          suggestions += s;
        }
        message += ". Did you mean: " + suggestions + "?";
      }
      if (result.failure == ToolErrorKind::SandboxTimeout && !result.output.empty()) {
        message += "\nOutput before timeout:\n" + result.output;
      }
      auto tool_result = ToolResult::error(result.failure.value_or(ToolErrorKind::ExecutionFailed), message);
      tool_result.metadata["exit_code"] = result.exit_code;
      return tool_result;
    }

    auto info = skills_.get(name);
    std::string fallback = info ? info->body : "";
    bool raw_output = info && info->raw_output;
    return interpret_skill_output(name, result.output, fallback, raw_output);
  });
}

ToolResult interpret_skill_output(const std::string& skill_name, const std::string& output, const std::string& fallback, bool raw_output) {
  if (!raw_output && !output.empty()) {
    auto parsed = json::parse(output, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.value("dispatch", json()) == "tool") {
      json tool_json = parsed.value("tool", json(""));
      std::string tool = tool_json.is_string() ? tool_json.get<std::string>() : tool_json.dump();

      std::string dispatch_args;
      if (parsed.contains("args") && !parsed["args"].is_null()) {
        dispatch_args = parsed["args"].is_string() ? parsed["args"].get<std::string>() : parsed["args"].dump();
      }

      std::string text = "[Skill \"" + skill_name + "\" requires invoking tool \"" + tool + "\"";
      if (!dispatch_args.empty()) {
        text += " with args: " + dispatch_args;
      }
      text += ". Please invoke that tool now.]";

      auto result = ToolResult::success(text);
      result.metadata["dispatch"] = {{"tool", tool}, {"args", dispatch_args}};
      return result;
    }
  }

  return ToolResult::success(output.empty() ? fallback : output);
}

json skill_args_from_string(const std::string& args) {
  if (args.empty()) {
    return json::object();
  }
  auto parsed = json::parse(args, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object()) {
    return parsed;
  }
  return {{"input", args}};
}

}  // namespace clawcore::tools
