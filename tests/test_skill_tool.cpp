#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "clawcore/tool/builtin/builtins.hpp"

using namespace clawcore;
using namespace clawcore::tools;

namespace fs = std::filesystem;

class SkillToolTest : public ::testing::Test {
 protected:
  fs::path root_;
  fs::path workspace_;
  skill::SkillRegistry skills_;
  ToolRegistry tools_;
  ToolContext ctx_;

  void SetUp() override {
    root_ = fs::canonical(fs::temp_directory_path()) / "clawcore_skill_tool_test";
    workspace_ = root_ / "workspace";
    fs::create_directories(root_ / "skills");
    fs::create_directories(workspace_);

    add_skill("commit-style", "", "Use the imperative mood.\n");
    add_skill("dispatcher", "scripts:\n  run: run\n", "Hands off to bash.\n",
              R"(echo '{"dispatch":"tool","tool":"bash","args":"{\"command\":\"ls -la\"}"}')");
    add_skill("raw-json", "scripts:\n  run: run\nraw-output: true\n", "Emits JSON.\n",
              R"(echo '{"dispatch":"tool","tool":"bash"}')");
    add_skill("echo-args", "scripts:\n  run: run\n", "Echoes args.\n", R"(printf '%s' "$SKILL_ARGS")");
    add_skill("quiet", "scripts:\n  run: run\n", "Nothing to say.\n", "true");
    add_skill("gated", "requires-env: CLAWCORE_TEST_UNSET_VARIABLE\n", "Never runs.\n");
    skills_.load_directory(root_ / "skills");

    SandboxSettings settings;
    settings.timeout_ms = 10000;
    settings.kill_grace_ms = 500;
    register_builtins(tools_, skills_, settings);

    ctx_.workspace = workspace_;
    ctx_.session_id = "ses_skill_tool";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void add_skill(const std::string &name, const std::string &extra, const std::string &body, const std::string &script = "") {
    auto dir = root_ / "skills" / name;
    fs::create_directories(dir);
    std::ofstream(dir / "SKILL.md") << "---\nname: " << name << "\ndescription: The " << name << " skill\n" << extra << "---\n" << body;
    if (!script.empty()) {
      std::ofstream(dir / "run") << "#!/bin/sh\n" << script << "\n";
      fs::permissions(dir / "run", fs::perms::owner_all, fs::perm_options::add);
    }
  }

  ToolResult run(const json &args) {
    return tools_.execute("skill", args, ctx_).get();
  }
};

TEST_F(SkillToolTest, RegisteredAsMetaTool) {
  auto tool = tools_.get("skill");
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->category(), ToolCategory::Meta);
  for (const char *name : {"read", "write", "edit", "bash"}) {
    EXPECT_TRUE(tools_.has(name)) << name;
  }
}

TEST_F(SkillToolTest, DescriptionListsAvailableSkills) {
  auto description = tools_.get("skill")->description();
  EXPECT_NE(description.find("<name>commit-style</name>"), std::string::npos);
  EXPECT_NE(description.find("The dispatcher skill"), std::string::npos);
  EXPECT_EQ(description.find("gated"), std::string::npos);
}

TEST_F(SkillToolTest, InformationalSkillReturnsBody) {
  auto result = run({{"skill", "commit-style"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "Use the imperative mood.\n");
}

TEST_F(SkillToolTest, NotFoundWithSuggestions) {
  auto result = run({{"skill", "commit"}});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::SkillNotFound);
  EXPECT_EQ(result.output, "Skill not found: commit. Did you mean: commit-style?");
}

TEST_F(SkillToolTest, UnavailableSkill) {
  auto result = run({{"skill", "gated"}});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::SkillUnavailable);
  EXPECT_EQ(result.output.rfind("Skill \"gated\" is not available: ", 0), 0u);
}

TEST_F(SkillToolTest, DispatchEnvelopeBecomesInstruction) {
  auto result = run({{"skill", "dispatcher"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, R"([Skill "dispatcher" requires invoking tool "bash" with args: {"command":"ls -la"}. Please invoke that tool now.])");
  ASSERT_TRUE(result.metadata.contains("dispatch"));
  EXPECT_EQ(result.metadata["dispatch"]["tool"], "bash");
  EXPECT_EQ(result.metadata["dispatch"]["args"], R"({"command":"ls -la"})");
}

TEST_F(SkillToolTest, RawOutputSkipsDispatch) {
  auto result = run({{"skill", "raw-json"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, R"({"dispatch":"tool","tool":"bash"})" "\n");
  EXPECT_FALSE(result.metadata.contains("dispatch"));
}

TEST_F(SkillToolTest, EmptyOutputFallsBackToBody) {
  auto result = run({{"skill", "quiet"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "Nothing to say.\n");
}

TEST_F(SkillToolTest, JsonArgsPassThrough) {
  auto result = run({{"skill", "echo-args"}, {"args", R"({"path":"notes.md"})"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(json::parse(result.output), json({{"path", "notes.md"}}));
}

TEST_F(SkillToolTest, PlainArgsWrapped) {
  auto result = run({{"skill", "echo-args"}, {"args", "hello there"}});
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(json::parse(result.output), json({{"input", "hello there"}}));
}

TEST_F(SkillToolTest, MissingSkillArgumentIsInvalid) {
  auto result = run(json::object());
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::InvalidArguments);
}

TEST_F(SkillToolTest, DeniedByPolicy) {
  tools_.set_policy(ToolPolicy::deny({}, {ToolCategory::Meta}));
  auto result = run({{"skill", "commit-style"}});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::AuthorizationDenied);
}

TEST(SkillArgsTest, FromString) {
  EXPECT_EQ(skill_args_from_string(""), json::object());
  EXPECT_EQ(skill_args_from_string(R"({"a":1})"), json({{"a", 1}}));
  EXPECT_EQ(skill_args_from_string("[1,2]"), json({{"input", "[1,2]"}}));
  EXPECT_EQ(skill_args_from_string("plain"), json({{"input", "plain"}}));
}

TEST(InterpretSkillOutputTest, DispatchWithoutArgs) {
  auto result = interpret_skill_output("s", R"({"dispatch":"tool","tool":"read"})", "", false);
  EXPECT_EQ(result.output, R"([Skill "s" requires invoking tool "read". Please invoke that tool now.])");
}

TEST(InterpretSkillOutputTest, OtherDispatchValuesAreText) {
  auto result = interpret_skill_output("s", R"({"dispatch":"agent","tool":"read"})", "", false);
  EXPECT_EQ(result.output, R"({"dispatch":"agent","tool":"read"})");
}

TEST(InterpretSkillOutputTest, ObjectArgsAreSerialized) {
  auto result = interpret_skill_output("s", R"({"dispatch":"tool","tool":"bash","args":{"command":"pwd"}})", "", false);
  EXPECT_EQ(result.metadata["dispatch"]["args"], R"({"command":"pwd"})");
}
