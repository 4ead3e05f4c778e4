#include "clawcore/sandbox/path_guard.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace clawcore::sandbox {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxSymlinkHops = 40;

constexpr const char *kBlockedDirs[] = {"/etc", "/boot", "/sys", "/proc", "/dev", "/bin", "/sbin", "/usr"};

// Lexically normalized, without a trailing separator
fs::path normalize(const fs::path &p) {
  fs::path result = p.lexically_normal();
  if (!result.has_filename() && result.has_relative_path()) {
    result = result.parent_path();
  }
  return result;
}

bool exists_no_follow(const fs::path &p) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(p, ec));
}

// Canonical form of a path that may not exist yet
fs::path resolve_existing(const fs::path &p) {
  std::error_code ec;
  auto canonical = fs::weakly_canonical(p, ec);
  return ec ? p : normalize(canonical);
}

// Follow a chain of symlinks, dangling ones included, to the final location
std::optional<fs::path> follow_links(fs::path p) {
  std::error_code ec;
  for (int hops = 0; hops < kMaxSymlinkHops; ++hops) {
    if (!fs::is_symlink(fs::symlink_status(p, ec))) {
      return resolve_existing(p);
    }
    fs::path target = fs::read_symlink(p, ec);
    if (ec) return std::nullopt;
    p = target.is_absolute() ? target : resolve_existing(p.parent_path()) / target;
  }
  return std::nullopt;
}

}  // namespace

bool is_within(const fs::path &path, const fs::path &root) {
  auto p = path.begin();
  for (auto r = root.begin(); r != root.end(); ++r, ++p) {
    if (r->empty()) continue;  // trailing separator
    if (p == path.end() || *p != *r) return false;
  }
  return true;
}

PathValidation validate_path(const std::string &target, const fs::path &workspace_root) {
  PathValidation result;

  std::error_code ec;
  fs::path root = normalize(fs::absolute(workspace_root, ec));
  if (ec) {
    result.reason = "Cannot resolve workspace root: " + ec.message();
    return result;
  }

  fs::path candidate(target);
  fs::path resolved = normalize(candidate.is_absolute() ? candidate : root / candidate);
  result.resolved = resolved;

  if (!is_within(resolved, root)) {
    result.reason = "Path escapes workspace";
    return result;
  }

  for (const char *dir : kBlockedDirs) {
    if (is_within(resolved, dir)) {
      result.reason = std::string("Cannot write to system directory: ") + dir;
      return result;
    }
  }

  // Walk up from the parent to the nearest entry that exists
  fs::path ancestor = resolved.parent_path();
  while (!ancestor.empty() && !exists_no_follow(ancestor) && ancestor != ancestor.root_path()) {
    ancestor = ancestor.parent_path();
  }

  // Only entries below the workspace root can redirect a write elsewhere
  if (!ancestor.empty() && is_within(ancestor, root) && ancestor != root) {
    fs::path real_root = resolve_existing(root);
    fs::path real_ancestor = resolve_existing(ancestor);
    if (!is_within(real_ancestor, real_root)) {
      spdlog::warn("[PathGuard] {} resolves to {} outside {}", ancestor.string(), real_ancestor.string(), real_root.string());
      result.reason = "Parent symlink escapes workspace";
      return result;
    }
  }

  std::error_code link_ec;
  if (fs::is_symlink(fs::symlink_status(resolved, link_ec))) {
    auto real_target = follow_links(resolved);
    if (!real_target || !is_within(*real_target, resolve_existing(root))) {
      spdlog::warn("[PathGuard] Symlink {} points outside the workspace", resolved.string());
      result.reason = "Symlink escapes workspace";
      return result;
    }
  }

  result.valid = true;
  return result;
}

}  // namespace clawcore::sandbox
