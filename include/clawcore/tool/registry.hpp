#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "clawcore/core/config.hpp"
#include "clawcore/tool/policy.hpp"
#include "clawcore/tool/tool.hpp"

namespace clawcore {

// Tools, groups and the active policy. Owned by the application and passed
// by reference; every method is thread-safe.
class ToolRegistry {
 public:
  // Starts with the standard groups registered
  ToolRegistry();

  // Register a tool; a same-named tool is replaced in place
  void register_tool(std::shared_ptr<Tool> tool);

  bool unregister_tool(const std::string &name);

  std::shared_ptr<Tool> get(const std::string &name) const;

  bool has(const std::string &name) const;

  // All tools, in registration order
  std::vector<std::shared_ptr<Tool>> all() const;

  std::vector<std::shared_ptr<Tool>> by_category(ToolCategory category) const;

  // Categories with at least one registered tool
  std::vector<ToolCategory> categories() const;

  size_t size() const;

  void clear();

  // ---- Policy ----

  void set_policy(ToolPolicy policy);

  void clear_policy();

  // Current snapshot; nullptr when no policy is set
  std::shared_ptr<const ToolPolicy> policy() const;

  // Unregistered names are never allowed
  bool is_allowed(const std::string &name) const;

  std::vector<std::shared_ptr<Tool>> filtered_tools() const;

  std::vector<ToolDefinition> filtered_definitions() const;

  // ---- Groups ----

  void register_group(ToolGroup group);

  std::optional<ToolGroup> get_group(const std::string &id) const;

  std::vector<ToolGroup> all_groups() const;

  // Members of a group that are registered and currently allowed
  std::vector<std::shared_ptr<Tool>> group_tools(const std::string &id) const;

  // Name-based policy from the members of the given groups; unknown ids are skipped
  ToolPolicy policy_from_groups(PolicyMode mode, const std::vector<std::string> &group_ids) const;

  // Policy from the config file section; fails on an unknown mode, category or group
  Result<ToolPolicy> policy_from_config(const ToolPolicyConfig &config) const;

  // ---- Execution ----

  // Authorization gate plus dispatch. Denied or unknown tools, invalid
  // arguments and exceptions thrown by the tool all yield a failed ToolResult.
  std::future<ToolResult> execute(const std::string &name, const json &args, const ToolContext &ctx) const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Tool>> tools_;
  std::vector<ToolGroup> groups_;
  std::shared_ptr<const ToolPolicy> policy_;
};

}  // namespace clawcore
