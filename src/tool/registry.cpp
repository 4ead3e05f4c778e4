#include "clawcore/tool/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace clawcore {

namespace {

template <typename Container, typename Key>
auto find_named(Container &items, const Key &name) {
  return std::find_if(items.begin(), items.end(), [&](const auto &item) { return item->name() == name; });
}

}  // namespace

ToolRegistry::ToolRegistry() : groups_(standard_groups()) {}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) return;

  auto name = tool->name();
  std::lock_guard lock(mutex_);
  auto it = find_named(tools_, name);
  if (it != tools_.end()) {
    spdlog::warn("[ToolRegistry] Replacing existing tool: {}", name);
    *it = std::move(tool);
    return;
  }
  spdlog::debug("[ToolRegistry] Registered tool: {} ({})", name, to_string(tool->category()));
  tools_.push_back(std::move(tool));
}

bool ToolRegistry::unregister_tool(const std::string &name) {
  std::lock_guard lock(mutex_);
  auto it = find_named(tools_, name);
  if (it == tools_.end()) return false;
  tools_.erase(it);
  return true;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = find_named(tools_, name);
  return it != tools_.end() ? *it : nullptr;
}

bool ToolRegistry::has(const std::string &name) const {
  return get(name) != nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  return tools_;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::by_category(ToolCategory category) const {
  std::vector<std::shared_ptr<Tool>> result;
  for (const auto &tool : all()) {
    if (tool->category() == category) result.push_back(tool);
  }
  return result;
}

std::vector<ToolCategory> ToolRegistry::categories() const {
  std::vector<ToolCategory> result;
  for (const auto &tool : all()) {
    if (std::find(result.begin(), result.end(), tool->category()) == result.end()) {
      result.push_back(tool->category());
    }
  }
  return result;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

void ToolRegistry::clear() {
  std::lock_guard lock(mutex_);
  tools_.clear();
}

// ============================================================
// Policy
// ============================================================

void ToolRegistry::set_policy(ToolPolicy policy) {
  auto snapshot = std::make_shared<const ToolPolicy>(std::move(policy));
  spdlog::info("[ToolRegistry] Policy set: {} ({} tools, {} categories)", to_string(snapshot->mode), snapshot->tools.size(), snapshot->categories.size());
  std::lock_guard lock(mutex_);
  policy_ = std::move(snapshot);
}

void ToolRegistry::clear_policy() {
  std::lock_guard lock(mutex_);
  policy_.reset();
  spdlog::info("[ToolRegistry] Policy cleared");
}

std::shared_ptr<const ToolPolicy> ToolRegistry::policy() const {
  std::lock_guard lock(mutex_);
  return policy_;
}

bool ToolRegistry::is_allowed(const std::string &name) const {
  std::shared_ptr<Tool> tool;
  std::shared_ptr<const ToolPolicy> policy;
  {
    std::lock_guard lock(mutex_);
    auto it = find_named(tools_, name);
    if (it == tools_.end()) return false;
    tool = *it;
    policy = policy_;
  }

  return !policy || policy->permits(name, tool->category());
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::filtered_tools() const {
  std::vector<std::shared_ptr<Tool>> tools;
  std::shared_ptr<const ToolPolicy> policy;
  {
    std::lock_guard lock(mutex_);
    tools = tools_;
    policy = policy_;
  }

  if (!policy) return tools;

  std::vector<std::shared_ptr<Tool>> result;
  for (const auto &tool : tools) {
    if (policy->permits(tool->name(), tool->category())) result.push_back(tool);
  }
  return result;
}

std::vector<ToolDefinition> ToolRegistry::filtered_definitions() const {
  std::vector<ToolDefinition> result;
  for (const auto &tool : filtered_tools()) {
    result.push_back(tool->definition());
  }
  return result;
}

// ============================================================
// Groups
// ============================================================

void ToolRegistry::register_group(ToolGroup group) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(groups_.begin(), groups_.end(), [&](const auto &g) { return g.id == group.id; });
  if (it != groups_.end()) {
    *it = std::move(group);
  } else {
    groups_.push_back(std::move(group));
  }
}

std::optional<ToolGroup> ToolRegistry::get_group(const std::string &id) const {
  std::lock_guard lock(mutex_);
  for (const auto &group : groups_) {
    if (group.id == id) return group;
  }
  return std::nullopt;
}

std::vector<ToolGroup> ToolRegistry::all_groups() const {
  std::lock_guard lock(mutex_);
  return groups_;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::group_tools(const std::string &id) const {
  std::vector<std::shared_ptr<Tool>> result;
  auto group = get_group(id);
  if (!group) return result;

  for (const auto &name : group->tools) {
    // Members that were never registered resolve to nothing
    if (!is_allowed(name)) continue;
    if (auto tool = get(name)) result.push_back(tool);
  }
  return result;
}

ToolPolicy ToolRegistry::policy_from_groups(PolicyMode mode, const std::vector<std::string> &group_ids) const {
  ToolPolicy policy;
  policy.mode = mode;
  for (const auto &id : group_ids) {
    auto group = get_group(id);
    if (!group) {
      spdlog::warn("[ToolRegistry] Unknown tool group: {}", id);
      continue;
    }
    policy.tools.insert(group->tools.begin(), group->tools.end());
  }
  return policy;
}

Result<ToolPolicy> ToolRegistry::policy_from_config(const ToolPolicyConfig &config) const {
  auto mode = policy_mode_from_string(config.mode);
  if (!mode) {
    return Result<ToolPolicy>::failure("Unknown policy mode: " + config.mode);
  }

  for (const auto &id : config.groups) {
    if (!get_group(id)) {
      return Result<ToolPolicy>::failure("Unknown tool group: " + id);
    }
  }

  ToolPolicy policy = policy_from_groups(*mode, config.groups);
  policy.tools.insert(config.tools.begin(), config.tools.end());

  for (const auto &name : config.categories) {
    auto category = tool_category_from_string(name);
    if (!category) {
      return Result<ToolPolicy>::failure("Unknown tool category: " + name);
    }
    policy.categories.insert(*category);
  }

  return Result<ToolPolicy>::success(std::move(policy));
}

// ============================================================
// Execution
// ============================================================

std::future<ToolResult> ToolRegistry::execute(const std::string &name, const json &args, const ToolContext &ctx) const {
  auto tool = get(name);
  if (!tool) {
    spdlog::warn("[ToolRegistry] Unknown tool requested: {}", name);
    return ready_result(ToolResult::error(ToolErrorKind::AuthorizationDenied, "Unknown tool: " + name));
  }

  if (!is_allowed(name)) {
    spdlog::warn("[ToolRegistry] Tool denied by policy: {}", name);
    return ready_result(ToolResult::error(ToolErrorKind::AuthorizationDenied, "Tool \"" + name + "\" is not allowed by the current policy"));
  }

  auto validated = tool->validate_args(args);
  if (!validated.ok()) {
    return ready_result(ToolResult::error(ToolErrorKind::InvalidArguments, validated.error.value_or("Invalid arguments")));
  }

  spdlog::debug("[ToolRegistry] Executing tool: {} args={}", name, args.dump());
  return std::async(std::launch::async, [tool, args, ctx, name]() -> ToolResult {
    try {
      return tool->execute(args, ctx).get();
    } catch (const std::exception &e) {
      spdlog::error("[ToolRegistry] Tool {} threw: {}", name, e.what());
      return ToolResult::error(ToolErrorKind::ExecutionFailed, "Tool \"" + name + "\" failed: " + e.what());
    }
  });
}

}  // namespace clawcore
