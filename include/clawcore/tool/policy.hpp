#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "clawcore/core/types.hpp"

namespace clawcore {

enum class PolicyMode { Allowlist, Denylist };

std::string to_string(PolicyMode mode);

std::optional<PolicyMode> policy_mode_from_string(const std::string &str);

// Allow/deny rule over tool names and categories.
//   allowlist: permitted iff named or its category is listed
//   denylist:  permitted iff neither named nor its category is listed
struct ToolPolicy {
  PolicyMode mode = PolicyMode::Allowlist;
  std::set<std::string> tools;
  std::set<ToolCategory> categories;

  bool permits(const std::string &name, ToolCategory category) const;

  static ToolPolicy allow(std::set<std::string> tools, std::set<ToolCategory> categories = {});
  static ToolPolicy deny(std::set<std::string> tools, std::set<ToolCategory> categories = {});
};

// Named bundle of tools, expanded into a name-based policy
struct ToolGroup {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> tools;
};

// fs, dev, web, all-coding
const std::vector<ToolGroup> &standard_groups();

}  // namespace clawcore
