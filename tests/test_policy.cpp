#include <gtest/gtest.h>

#include "clawcore/tool/policy.hpp"
#include "clawcore/tool/registry.hpp"

using namespace clawcore;

namespace {

// Minimal tool that echoes its "text" argument
class EchoTool : public SimpleTool {
 public:
  EchoTool(std::string name, ToolCategory category) : SimpleTool(std::move(name), "Echo text", category) {}

  std::vector<ParameterSchema> parameters() const override {
    return {{"text", "string", "Text to echo", true, std::nullopt, std::nullopt}};
  }

  std::future<ToolResult> execute(const json &args, const ToolContext &) override {
    return ready_result(ToolResult::success(args.value("text", "")));
  }
};

class ThrowingTool : public SimpleTool {
 public:
  ThrowingTool() : SimpleTool("explode", "Always throws", ToolCategory::System) {}

  std::vector<ParameterSchema> parameters() const override {
    return {};
  }

  std::future<ToolResult> execute(const json &, const ToolContext &) override {
    throw std::runtime_error("boom");
  }
};

}  // namespace

// ============================================================================
// ToolPolicy
// ============================================================================

TEST(ToolPolicyTest, AllowlistByNameOrCategory) {
  auto policy = ToolPolicy::allow({"read"}, {ToolCategory::Search});
  EXPECT_TRUE(policy.permits("read", ToolCategory::Coding));
  EXPECT_TRUE(policy.permits("web_search", ToolCategory::Search));
  EXPECT_FALSE(policy.permits("write", ToolCategory::Coding));
  EXPECT_FALSE(policy.permits("bash", ToolCategory::System));
}

TEST(ToolPolicyTest, DenylistByNameOrCategory) {
  auto policy = ToolPolicy::deny({"write"}, {ToolCategory::System});
  EXPECT_TRUE(policy.permits("read", ToolCategory::Coding));
  EXPECT_FALSE(policy.permits("write", ToolCategory::Coding));
  EXPECT_FALSE(policy.permits("bash", ToolCategory::System));
}

TEST(ToolPolicyTest, EmptyAllowlistPermitsNothing) {
  ToolPolicy policy = ToolPolicy::allow({});
  EXPECT_FALSE(policy.permits("read", ToolCategory::Coding));
}

TEST(ToolPolicyTest, ModeNames) {
  EXPECT_EQ(policy_mode_from_string("allowlist"), PolicyMode::Allowlist);
  EXPECT_EQ(policy_mode_from_string("deny"), PolicyMode::Denylist);
  EXPECT_FALSE(policy_mode_from_string("maybe").has_value());
}

// ============================================================================
// ToolRegistry gate
// ============================================================================

class ToolRegistryTest : public ::testing::Test {
 protected:
  ToolRegistry registry_;
  ToolContext ctx_;

  void SetUp() override {
    registry_.register_tool(std::make_shared<EchoTool>("read", ToolCategory::Coding));
    registry_.register_tool(std::make_shared<EchoTool>("write", ToolCategory::Coding));
    registry_.register_tool(std::make_shared<EchoTool>("bash", ToolCategory::System));
    registry_.register_tool(std::make_shared<EchoTool>("skill", ToolCategory::Meta));
  }

  std::vector<std::string> visible_names() const {
    std::vector<std::string> names;
    for (const auto &def : registry_.filtered_definitions()) names.push_back(def.name);
    return names;
  }
};

TEST_F(ToolRegistryTest, NoPolicyAllowsEverything) {
  EXPECT_EQ(registry_.policy(), nullptr);
  EXPECT_TRUE(registry_.is_allowed("bash"));
  EXPECT_EQ(visible_names(), (std::vector<std::string>{"read", "write", "bash", "skill"}));
}

TEST_F(ToolRegistryTest, UnregisteredNeverAllowed) {
  EXPECT_FALSE(registry_.is_allowed("browser"));
  registry_.set_policy(ToolPolicy::deny({}));
  EXPECT_FALSE(registry_.is_allowed("browser"));
}

TEST_F(ToolRegistryTest, ReplaceKeepsPosition) {
  registry_.register_tool(std::make_shared<EchoTool>("read", ToolCategory::Search));
  EXPECT_EQ(registry_.size(), 4u);
  EXPECT_EQ(registry_.all().front()->category(), ToolCategory::Search);
}

TEST_F(ToolRegistryTest, AllowlistFiltersDefinitions) {
  registry_.set_policy(ToolPolicy::allow({"read"}, {ToolCategory::Meta}));
  EXPECT_EQ(visible_names(), (std::vector<std::string>{"read", "skill"}));
}

TEST_F(ToolRegistryTest, DenylistFiltersDefinitions) {
  registry_.set_policy(ToolPolicy::deny({}, {ToolCategory::System}));
  EXPECT_EQ(visible_names(), (std::vector<std::string>{"read", "write", "skill"}));
  registry_.clear_policy();
  EXPECT_TRUE(registry_.is_allowed("bash"));
}

TEST_F(ToolRegistryTest, DeniedExecutionFailsWithoutRunning) {
  registry_.set_policy(ToolPolicy::deny({"bash"}));
  auto result = registry_.execute("bash", {{"text", "hi"}}, ctx_).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::AuthorizationDenied);
  EXPECT_NE(result.output.find("not allowed"), std::string::npos);
}

TEST_F(ToolRegistryTest, UnknownToolIsDenied) {
  auto result = registry_.execute("nope", json::object(), ctx_).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::AuthorizationDenied);
}

TEST_F(ToolRegistryTest, MissingArgumentIsInvalid) {
  auto result = registry_.execute("read", json::object(), ctx_).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::InvalidArguments);
}

TEST_F(ToolRegistryTest, AllowedExecutionRuns) {
  auto result = registry_.execute("read", {{"text", "hello"}}, ctx_).get();
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "hello");
}

TEST_F(ToolRegistryTest, ThrowingToolBecomesFailedResult) {
  registry_.register_tool(std::make_shared<ThrowingTool>());
  auto result = registry_.execute("explode", json::object(), ctx_).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.error_kind, ToolErrorKind::ExecutionFailed);
  EXPECT_NE(result.output.find("boom"), std::string::npos);
}

// ============================================================================
// Groups and config
// ============================================================================

TEST_F(ToolRegistryTest, StandardGroupsRegistered) {
  auto fs = registry_.get_group("fs");
  ASSERT_TRUE(fs.has_value());
  EXPECT_EQ(fs->tools, (std::vector<std::string>{"read", "write", "edit"}));
  EXPECT_TRUE(registry_.get_group("all-coding").has_value());

  // "edit" is not registered here
  EXPECT_EQ(registry_.group_tools("fs").size(), 2u);
}

TEST_F(ToolRegistryTest, PolicyFromGroups) {
  auto policy = registry_.policy_from_groups(PolicyMode::Allowlist, {"fs", "missing"});
  EXPECT_EQ(policy.tools, (std::set<std::string>{"read", "write", "edit"}));
  registry_.set_policy(policy);
  EXPECT_FALSE(registry_.is_allowed("bash"));
  EXPECT_TRUE(registry_.is_allowed("write"));
}

TEST_F(ToolRegistryTest, PolicyFromConfig) {
  ToolPolicyConfig config{"denylist", {"write"}, {"system"}, {}};
  auto policy = registry_.policy_from_config(config);
  ASSERT_TRUE(policy.ok());
  EXPECT_EQ(policy.value->mode, PolicyMode::Denylist);
  EXPECT_TRUE(policy.value->tools.count("write"));
  EXPECT_TRUE(policy.value->categories.count(ToolCategory::System));
}

TEST_F(ToolRegistryTest, PolicyFromConfigRejectsUnknowns) {
  EXPECT_TRUE(registry_.policy_from_config({"sometimes", {}, {}, {}}).failed());
  EXPECT_TRUE(registry_.policy_from_config({"allowlist", {}, {"network"}, {}}).failed());
  EXPECT_TRUE(registry_.policy_from_config({"allowlist", {}, {}, {"nope"}}).failed());
}
