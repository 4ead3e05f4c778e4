#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "clawcore/skill/skill.hpp"

using namespace clawcore;
using namespace clawcore::skill;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

// ============================================================================
// Skill name validation tests
// ============================================================================

TEST(SkillNameTest, ValidNames) {
  EXPECT_TRUE(validate_skill_name("write-file"));
  EXPECT_TRUE(validate_skill_name("a"));
  EXPECT_TRUE(validate_skill_name("abc123"));
  EXPECT_TRUE(validate_skill_name("a1-b2-c3"));
  EXPECT_TRUE(validate_skill_name(std::string(64, 'a')));
}

TEST(SkillNameTest, InvalidNames) {
  EXPECT_FALSE(validate_skill_name(""));
  EXPECT_FALSE(validate_skill_name("-start"));
  EXPECT_FALSE(validate_skill_name("end-"));
  EXPECT_FALSE(validate_skill_name("double--dash"));
  EXPECT_FALSE(validate_skill_name("UPPER"));
  EXPECT_FALSE(validate_skill_name("has_underscore"));
  EXPECT_FALSE(validate_skill_name("has/slash"));
  EXPECT_FALSE(validate_skill_name(std::string(65, 'a')));
}

// ============================================================================
// Fixture: skills written into a temporary directory
// ============================================================================

class SkillTest : public ::testing::Test {
 protected:
  fs::path root_;
  fs::path skills_dir_;
  fs::path workspace_;

  void SetUp() override {
    root_ = fs::canonical(fs::temp_directory_path()) / "clawcore_skill_test";
    skills_dir_ = root_ / "skills";
    workspace_ = root_ / "workspace";
    fs::create_directories(skills_dir_);
    fs::create_directories(workspace_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path write_skill(const std::string &dir_name, const std::string &frontmatter, const std::string &body = "Body text.\n",
                       const fs::path &base = {}) {
    auto dir = (base.empty() ? skills_dir_ : base) / dir_name;
    fs::create_directories(dir);
    std::ofstream(dir / "SKILL.md") << "---\n" << frontmatter << "---\n" << body;
    return dir / "SKILL.md";
  }

  void write_script(const std::string &dir_name, const std::string &file, const std::string &content) {
    auto path = skills_dir_ / dir_name / file;
    std::ofstream(path) << content;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
  }

  SkillExecuteOptions options() const {
    SkillExecuteOptions opts;
    opts.workspace = workspace_;
    opts.session_id = "ses_test";
    opts.timeout = 10s;
    opts.kill_grace = 1s;
    return opts;
  }
};

// ============================================================================
// SKILL.md parsing
// ============================================================================

TEST_F(SkillTest, ParseInformationalSkill) {
  auto path = write_skill("commit-style", "name: commit-style\ndescription: Commit conventions\n", "# Rules\nBe brief.\n");
  auto result = parse_skill_file(path);
  ASSERT_TRUE(result.ok()) << result.error.value_or("");

  const auto &skill = *result.skill;
  EXPECT_EQ(skill.name, "commit-style");
  EXPECT_EQ(skill.description, "Commit conventions");
  EXPECT_EQ(skill.body, "# Rules\nBe brief.\n");
  EXPECT_FALSE(skill.has_scripts());
  EXPECT_TRUE(skill.available);
}

TEST_F(SkillTest, ParseScriptsAndRequirements) {
  auto path = write_skill("deploy",
                          "name: deploy\n"
                          "description: \"Deploy the app\"\n"
                          "scripts:\n"
                          "  run: run.sh\n"
                          "  status: status.py\n"
                          "requires-bins: [sh, env]\n"
                          "requires-env: HOME\n"
                          "raw-output: true\n");
  write_script("deploy", "run.sh", "#!/bin/sh\necho ok\n");
  write_script("deploy", "status.py", "print('ok')\n");

  auto result = parse_skill_file(path);
  ASSERT_TRUE(result.ok()) << result.error.value_or("");

  const auto &skill = *result.skill;
  EXPECT_EQ(skill.description, "Deploy the app");
  ASSERT_EQ(skill.scripts.size(), 2u);
  EXPECT_EQ(skill.scripts.at("run"), skill.dir() / "run.sh");
  EXPECT_EQ(skill.requires_bins, (std::vector<std::string>{"sh", "env"}));
  EXPECT_EQ(skill.requires_env, (std::vector<std::string>{"HOME"}));
  EXPECT_TRUE(skill.raw_output);
  EXPECT_TRUE(skill.available) << skill.unavailable_reason;
}

TEST_F(SkillTest, ParseRejectsBadFiles) {
  EXPECT_FALSE(parse_skill_file(write_skill("no-desc", "name: no-desc\n")).ok());
  EXPECT_FALSE(parse_skill_file(write_skill("mismatch", "name: other\ndescription: x\n")).ok());
  EXPECT_FALSE(parse_skill_file(write_skill("Bad_Name", "name: Bad_Name\ndescription: x\n")).ok());

  auto no_frontmatter = skills_dir_ / "plain" / "SKILL.md";
  fs::create_directories(no_frontmatter.parent_path());
  std::ofstream(no_frontmatter) << "# Just markdown\n";
  EXPECT_FALSE(parse_skill_file(no_frontmatter).ok());

  EXPECT_FALSE(parse_skill_file(skills_dir_ / "missing" / "SKILL.md").ok());
}

TEST_F(SkillTest, UnavailableWhenRequirementsMissing) {
  auto path = write_skill("needs-stuff",
                          "name: needs-stuff\n"
                          "description: x\n"
                          "scripts:\n"
                          "  run: run.sh\n"
                          "requires-bins: clawcore-no-such-binary\n"
                          "requires-env: CLAWCORE_TEST_UNSET_VARIABLE\n");

  auto result = parse_skill_file(path);
  ASSERT_TRUE(result.ok());
  const auto &skill = *result.skill;
  EXPECT_FALSE(skill.available);
  EXPECT_NE(skill.unavailable_reason.find("clawcore-no-such-binary"), std::string::npos);
  EXPECT_NE(skill.unavailable_reason.find("CLAWCORE_TEST_UNSET_VARIABLE"), std::string::npos);
  EXPECT_NE(skill.unavailable_reason.find("run.sh"), std::string::npos);
}

TEST(FindExecutableTest, SearchesPath) {
  EXPECT_TRUE(find_executable("sh").has_value());
  EXPECT_TRUE(find_executable("/bin/sh").has_value());
  EXPECT_FALSE(find_executable("clawcore-no-such-binary").has_value());
  EXPECT_FALSE(find_executable("/nonexistent/bin/tool").has_value());
}

// ============================================================================
// Registry
// ============================================================================

TEST_F(SkillTest, LoadDirectorySkipsInvalid) {
  write_skill("alpha", "name: alpha\ndescription: first\n");
  write_skill("beta", "name: beta\ndescription: second\n");
  write_skill("broken", "name: not-broken\ndescription: x\n");
  fs::create_directories(skills_dir_ / "empty-dir");

  SkillRegistry registry;
  EXPECT_EQ(registry.load_directory(skills_dir_), 2u);
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_TRUE(registry.get("alpha").has_value());
  EXPECT_FALSE(registry.get("broken").has_value());

  auto all = registry.all();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].name, "alpha");
  EXPECT_EQ(all[1].name, "beta");
}

TEST_F(SkillTest, MissingDirectoryLoadsNothing) {
  SkillRegistry registry;
  EXPECT_EQ(registry.load_directory(root_ / "does-not-exist"), 0u);
}

TEST_F(SkillTest, FirstRegistrationWins) {
  auto other = root_ / "other-skills";
  write_skill("alpha", "name: alpha\ndescription: project copy\n");
  write_skill("alpha", "name: alpha\ndescription: global copy\n", "Body\n", other);

  SkillRegistry registry;
  EXPECT_EQ(registry.load_directory(skills_dir_), 1u);
  EXPECT_EQ(registry.load_directory(other), 0u);
  EXPECT_EQ(registry.get("alpha")->description, "project copy");
}

TEST_F(SkillTest, AvailableFiltersUnavailable) {
  write_skill("ok", "name: ok\ndescription: fine\n");
  write_skill("gated", "name: gated\ndescription: gated\nrequires-env: CLAWCORE_TEST_UNSET_VARIABLE\n");

  SkillRegistry registry;
  registry.load_directory(skills_dir_);
  auto available = registry.available();
  ASSERT_EQ(available.size(), 1u);
  EXPECT_EQ(available[0].name, "ok");
}

TEST(SkillRegistryTest, Suggestions) {
  SkillRegistry registry;
  for (const char *name : {"read-file", "write-file", "file", "bash", "filesystem-index"}) {
    SkillInfo info;
    info.name = name;
    info.description = "x";
    registry.register_skill(info);
  }

  EXPECT_EQ(registry.suggest("FILE"), (std::vector<std::string>{"file", "filesystem-index", "read-file"}));
  EXPECT_EQ(registry.suggest("write-file-now"), (std::vector<std::string>{"file", "write-file"}));
  EXPECT_TRUE(registry.suggest("python").empty());
  EXPECT_TRUE(registry.suggest("").empty());
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(SkillTest, ExecuteUnknownSkillSuggests) {
  write_skill("write-file", "name: write-file\ndescription: x\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto result = registry.execute_skill("write", options());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::SkillNotFound);
  EXPECT_EQ(result.suggestions, (std::vector<std::string>{"write-file"}));
}

TEST_F(SkillTest, ExecuteUnavailableSkill) {
  write_skill("gated", "name: gated\ndescription: x\nrequires-bins: clawcore-no-such-binary\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto result = registry.execute_skill("gated", options());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::SkillUnavailable);
  EXPECT_NE(result.error->find("clawcore-no-such-binary"), std::string::npos);
}

TEST_F(SkillTest, ExecuteInformationalReturnsBody) {
  write_skill("commit-style", "name: commit-style\ndescription: x\n", "Use the imperative mood.\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto result = registry.execute_skill("commit-style", options());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "Use the imperative mood.\n");
}

TEST_F(SkillTest, ExecuteScriptSeesEnvironment) {
  write_skill("echo-env", "name: echo-env\ndescription: x\nscripts:\n  run: run\n");
  write_script("echo-env", "run", "#!/bin/sh\nprintf '%s|%s|%s|%s' \"$SKILL_ARGS\" \"$SKILL_CWD\" \"$SKILL_SESSION_ID\" \"$(pwd)\"\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto opts = options();
  opts.args = {{"path", "a.txt"}};
  auto result = registry.execute_skill("echo-env", opts);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.output, R"({"path":"a.txt"})" "|" + workspace_.string() + "|ses_test|" + workspace_.string());
}

TEST_F(SkillTest, ExecuteScriptJsonOverrides) {
  write_skill("reporter", "name: reporter\ndescription: x\nscripts:\n  run: run\n");
  write_script("reporter", "run", "#!/bin/sh\necho '{\"success\": false, \"error\": \"disk full\", \"exitCode\": 5}'\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto result = registry.execute_skill("reporter", options());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::ExecutionFailed);
  EXPECT_EQ(result.error, "disk full");
  EXPECT_EQ(result.exit_code, 5);
}

TEST_F(SkillTest, ExecuteScriptNonZeroExit) {
  write_skill("failing", "name: failing\ndescription: x\nscripts:\n  run: run\n");
  write_script("failing", "run", "#!/bin/sh\necho 'partial'\necho 'bad input' 1>&2\nexit 2\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto result = registry.execute_skill("failing", options());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_EQ(result.output, "partial\n");
  EXPECT_EQ(result.error, "bad input");
}

TEST_F(SkillTest, ExecuteUnknownAction) {
  write_skill("one-action", "name: one-action\ndescription: x\nscripts:\n  run: run\n");
  write_script("one-action", "run", "#!/bin/sh\necho hi\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto opts = options();
  opts.action = "deploy";
  auto result = registry.execute_skill("one-action", opts);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::InvalidArguments);
  EXPECT_NE(result.error->find("run"), std::string::npos);
}

TEST_F(SkillTest, ExecuteTimeout) {
  write_skill("slow", "name: slow\ndescription: x\nscripts:\n  run: run\n");
  write_script("slow", "run", "#!/bin/sh\necho working\nsleep 30\n");
  SkillRegistry registry;
  registry.load_directory(skills_dir_);

  auto opts = options();
  opts.timeout = 300ms;
  opts.kill_grace = 200ms;
  auto result = registry.execute_skill("slow", opts);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::SandboxTimeout);
  EXPECT_EQ(result.exit_code, 124);
  EXPECT_EQ(result.output, "working\n");
}

// ============================================================================
// Script output interpretation
// ============================================================================

TEST(InterpretScriptOutputTest, PlainTextKeptVerbatim) {
  auto result = interpret_script_output("  hello world\n", "", 0);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "  hello world\n");
  EXPECT_FALSE(result.failure.has_value());
}

TEST(InterpretScriptOutputTest, EnvelopeWithoutOutputPassesThrough) {
  std::string envelope = R"({"dispatch":"tool","tool":"bash","args":"{\"command\":\"ls\"}"})";
  auto result = interpret_script_output("\n" + envelope + "\n", "", 0);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "\n" + envelope + "\n");
}

TEST(InterpretScriptOutputTest, StderrTrimmed) {
  auto result = interpret_script_output("done\n", "  warning: slow disk\n", 0);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "done\n");
  EXPECT_EQ(result.error, "warning: slow disk");
}

TEST(InterpretScriptOutputTest, OutputFieldWins) {
  auto result = interpret_script_output(R"({"success":true,"output":"Wrote 5 bytes","exitCode":0})", "", 1);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "Wrote 5 bytes");
  EXPECT_EQ(result.exit_code, 0);
}

TEST(InterpretScriptOutputTest, JsonArrayIsRawText) {
  auto result = interpret_script_output("[1,2,3]", "", 0);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "[1,2,3]");
}

TEST(InterpretScriptOutputTest, FailureWithoutMessage) {
  auto result = interpret_script_output("", "", 9);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ToolErrorKind::ExecutionFailed);
  EXPECT_EQ(result.error, "Script exited with code 9");
}
