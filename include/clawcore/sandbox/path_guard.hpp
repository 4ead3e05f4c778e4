#pragma once

#include <filesystem>
#include <string>

namespace clawcore::sandbox {

struct PathValidation {
  bool valid = false;
  std::filesystem::path resolved;
  std::string reason;
};

// Check that target may be modified:
//   1. resolve it (relative to workspace_root) and normalize lexically
//   2. it must lie inside workspace_root, component-wise
//   3. it must not lie inside a system directory
//   4. the nearest existing ancestor of its parent must resolve, through
//      symlinks, to a location inside the canonical workspace root
//   5. if target is itself a symlink (dangling or not), the end of its chain
//      must lie inside the canonical workspace root
PathValidation validate_path(const std::string &target, const std::filesystem::path &workspace_root);

// Component-wise containment of normalized absolute paths; a path is within itself
bool is_within(const std::filesystem::path &path, const std::filesystem::path &root);

}  // namespace clawcore::sandbox
