#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "clawcore/core/errors.hpp"
#include "clawcore/core/truncate.hpp"
#include "clawcore/core/types.hpp"

namespace clawcore::skill {

// A skill loaded from <dir>/SKILL.md. Read-only once registered.
struct SkillInfo {
  std::string name;
  std::string description;

  // Markdown body; returned as-is when the skill has no script
  std::string body;

  std::filesystem::path source_path;

  // action -> absolute script path
  std::map<std::string, std::filesystem::path> scripts;

  std::vector<std::string> requires_bins;
  std::vector<std::string> requires_env;

  // Output is never interpreted as a dispatch envelope
  bool raw_output = false;

  bool available = true;
  std::string unavailable_reason;

  std::filesystem::path dir() const {
    return source_path.parent_path();
  }

  bool has_scripts() const {
    return !scripts.empty();
  }
};

struct ParseResult {
  std::optional<SkillInfo> skill;
  std::optional<std::string> error;

  bool ok() const {
    return skill.has_value();
  }
};

// ^[a-z0-9]+(-[a-z0-9]+)*$, at most 64 characters
bool validate_skill_name(const std::string &name);

// Parse SKILL.md; the name must match the containing directory
ParseResult parse_skill_file(const std::filesystem::path &path);

// Fill available/unavailable_reason from declared requirements and scripts
void check_availability(SkillInfo &skill);

// Absolute path of an executable, searching PATH for bare names
std::optional<std::filesystem::path> find_executable(const std::string &bin);

struct SkillExecuteOptions {
  std::string action = "run";

  // Exported to the script as SKILL_ARGS
  json args = json::object();

  // Exported as SKILL_CWD; also the script's working directory
  std::filesystem::path workspace;

  SessionId session_id;

  std::chrono::milliseconds timeout{60000};
  std::chrono::milliseconds kill_grace{5000};
  size_t max_output_bytes = Truncate::kDefaultMaxBytes;

  std::shared_ptr<std::atomic<bool>> abort_signal;
};

struct SkillExecutionResult {
  bool success = false;

  // May itself be a JSON dispatch envelope
  std::string output;
  std::optional<std::string> error;
  int exit_code = 0;

  // Set when the skill could not run or its script failed
  std::optional<ToolErrorKind> failure;

  // Close matches, filled on SkillNotFound
  std::vector<std::string> suggestions;
};

// Skills by name. Owned by the application; thread-safe.
class SkillRegistry {
 public:
  // Scan dir/*/SKILL.md; returns the number of skills registered
  size_t load_directory(const std::filesystem::path &dir);

  // First registration wins; false for a duplicate
  bool register_skill(SkillInfo skill);

  std::optional<SkillInfo> get(const std::string &name) const;

  // Sorted by name
  std::vector<SkillInfo> all() const;

  std::vector<SkillInfo> available() const;

  size_t size() const;

  void clear();

  // Up to limit names where either string contains the other, case-insensitively
  std::vector<std::string> suggest(const std::string &name, size_t limit = 3) const;

  // Lookup, availability check, then run the action's script through the
  // sandbox, or return the static body when the skill has no script
  SkillExecutionResult execute_skill(const std::string &name, const SkillExecuteOptions &options) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, SkillInfo> skills_;
};

// Interpret a finished script run: a JSON object on stdout overrides the
// process-level success, output, error and exit code
SkillExecutionResult interpret_script_output(const std::string &stdout_text, const std::string &stderr_text, int exit_code);

}  // namespace clawcore::skill
