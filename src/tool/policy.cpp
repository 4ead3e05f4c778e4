#include "clawcore/tool/policy.hpp"

namespace clawcore {

std::string to_string(PolicyMode mode) {
  return mode == PolicyMode::Allowlist ? "allowlist" : "denylist";
}

std::optional<PolicyMode> policy_mode_from_string(const std::string &str) {
  if (str == "allowlist" || str == "allow") return PolicyMode::Allowlist;
  if (str == "denylist" || str == "deny") return PolicyMode::Denylist;
  return std::nullopt;
}

bool ToolPolicy::permits(const std::string &name, ToolCategory category) const {
  bool listed = tools.count(name) > 0 || categories.count(category) > 0;
  return mode == PolicyMode::Allowlist ? listed : !listed;
}

ToolPolicy ToolPolicy::allow(std::set<std::string> tools, std::set<ToolCategory> categories) {
  return ToolPolicy{PolicyMode::Allowlist, std::move(tools), std::move(categories)};
}

ToolPolicy ToolPolicy::deny(std::set<std::string> tools, std::set<ToolCategory> categories) {
  return ToolPolicy{PolicyMode::Denylist, std::move(tools), std::move(categories)};
}

const std::vector<ToolGroup> &standard_groups() {
  static const std::vector<ToolGroup> groups = {
      {"fs", "File System", "Read, write and edit files", {"read", "write", "edit"}},
      {"dev", "Development", "File operations plus shell commands", {"read", "write", "edit", "bash"}},
      {"web", "Web", "Browser automation and web search", {"browser", "web_search"}},
      {"all-coding", "All Coding", "Every coding tool", {"read", "write", "edit", "bash", "browser"}},
  };
  return groups;
}

}  // namespace clawcore
