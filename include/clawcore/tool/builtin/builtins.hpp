#pragma once

#include "clawcore/core/config.hpp"
#include "clawcore/skill/skill.hpp"
#include "clawcore/tool/registry.hpp"
#include "clawcore/tool/tool.hpp"

namespace clawcore::tools {

// Bash tool - execute shell commands through the process sandbox
class BashTool : public SimpleTool {
 public:
  explicit BashTool(SandboxSettings settings = {});

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  SandboxSettings settings_;
};

// Read tool - read file contents
class ReadTool : public SimpleTool {
 public:
  ReadTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// Write tool - write file contents inside the workspace
class WriteTool : public SimpleTool {
 public:
  WriteTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// Edit tool - find/replace inside a workspace file
class EditTool : public SimpleTool {
 public:
  EditTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// Skill tool - run a registered skill and translate its dispatch envelope
class SkillTool : public SimpleTool {
 public:
  SkillTool(const skill::SkillRegistry &skills, SandboxSettings settings = {});

  // Lists the available skills
  std::string description() const override;

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  const skill::SkillRegistry &skills_;
  SandboxSettings settings_;
};

// Turn a successful skill output into the tool's final result. A JSON object
// with dispatch == "tool" becomes an instruction to invoke that tool unless
// raw_output is set; anything else is returned verbatim, or fallback when empty.
ToolResult interpret_skill_output(const std::string &skill_name, const std::string &output, const std::string &fallback, bool raw_output);

// SKILL_ARGS object for the skill tool's string argument: a JSON object is
// passed through, any other text is wrapped as {"input": text}
json skill_args_from_string(const std::string &args);

// Register read, write, edit, bash and skill
void register_builtins(ToolRegistry &registry, const skill::SkillRegistry &skills, const SandboxSettings &settings = {});

}  // namespace clawcore::tools
