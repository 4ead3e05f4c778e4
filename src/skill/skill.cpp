#include "clawcore/skill/skill.hpp"

#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include "clawcore/sandbox/process.hpp"

namespace clawcore::skill {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  size_t end = s.find_last_not_of(" \t\r\n");
  return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string unquote(const std::string &value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// ============================================================================
// SKILL.md parser
// ============================================================================

// Extract YAML frontmatter between --- delimiters
// Returns: {frontmatter_string, body_string}
std::pair<std::string, std::string> split_frontmatter(const std::string &content) {
  if (content.substr(0, 3) != "---") {
    return {"", content};
  }

  auto end_pos = content.find("\n---", 3);
  if (end_pos == std::string::npos) {
    return {"", content};
  }

  size_t fm_start = (content.size() > 3 && content[3] == '\n') ? 4 : 3;
  std::string frontmatter = content.substr(fm_start, end_pos - fm_start);

  size_t body_start = end_pos + 4;
  while (body_start < content.size() && (content[body_start] == '\r' || content[body_start] == '\n')) {
    body_start++;
  }
  std::string body = (body_start < content.size()) ? content.substr(body_start) : "";

  return {frontmatter, body};
}

// Top-level keys; indented lines continue the previous value (joined with a
// space) unless the key opens a nested block
std::map<std::string, std::string> parse_flat_yaml(const std::string &yaml) {
  std::map<std::string, std::string> result;
  std::istringstream stream(yaml);
  std::string line;
  std::string current_key;
  std::string current_value;

  auto save_current = [&]() {
    if (!current_key.empty()) {
      result[current_key] = unquote(current_value);
    }
  };

  while (std::getline(stream, line)) {
    auto trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;

    if (line[0] == ' ' || line[0] == '\t') {
      if (!current_key.empty()) {
        if (!current_value.empty()) current_value += " ";
        current_value += trimmed;
      }
      continue;
    }

    save_current();
    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      current_key.clear();
      continue;
    }
    current_key = trim(line.substr(0, colon_pos));
    current_value = trim(line.substr(colon_pos + 1));
  }

  save_current();
  return result;
}

// Indented key-value pairs under "<block>:"
std::map<std::string, std::string> parse_nested_block(const std::string &yaml, const std::string &block) {
  std::map<std::string, std::string> result;
  std::istringstream stream(yaml);
  std::string line;
  bool in_block = false;

  while (std::getline(stream, line)) {
    if (trim(line).empty()) continue;

    bool indented = line[0] == ' ' || line[0] == '\t';
    if (!indented) {
      in_block = trim(line) == block + ":";
      continue;
    }
    if (!in_block) continue;

    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) continue;

    std::string key = trim(line.substr(0, colon_pos));
    std::string value = unquote(trim(line.substr(colon_pos + 1)));
    if (!key.empty()) {
      result[key] = value;
    }
  }

  return result;
}

// "a, b", "a b", "[a, b]" or a "- a - b" block list
std::vector<std::string> parse_list(const std::string &value) {
  std::string cleaned = value;
  std::replace_if(cleaned.begin(), cleaned.end(), [](char c) { return c == ',' || c == '[' || c == ']'; }, ' ');

  std::vector<std::string> items;
  std::istringstream stream(cleaned);
  std::string item;
  while (stream >> item) {
    item = unquote(item);
    if (item == "-" || item.empty()) continue;
    items.push_back(item);
  }
  return items;
}

bool parse_bool(const std::string &value) {
  auto v = to_lower(trim(value));
  return v == "true" || v == "yes" || v == "1";
}

std::string join(const std::vector<std::string> &items, const std::string &sep) {
  std::string result;
  for (const auto &item : items) {
    if (!result.empty()) result += sep;
    result += item;
  }
  return result;
}

SkillExecutionResult failed(ToolErrorKind kind, const std::string &message, int exit_code = 1) {
  SkillExecutionResult result;
  result.success = false;
  result.failure = kind;
  result.error = message;
  result.exit_code = exit_code;
  return result;
}

}  // namespace

// ============================================================================
// Name validation
// ============================================================================

bool validate_skill_name(const std::string &name) {
  if (name.empty() || name.size() > 64) return false;

  static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
  return std::regex_match(name, pattern);
}

ParseResult parse_skill_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {std::nullopt, "Cannot open file: " + path.string()};
  }

  std::ostringstream ss;
  ss << file.rdbuf();
  std::string content = ss.str();

  auto [frontmatter, body] = split_frontmatter(content);
  if (frontmatter.empty()) {
    return {std::nullopt, "Missing YAML frontmatter in: " + path.string()};
  }

  auto fields = parse_flat_yaml(frontmatter);

  auto name_it = fields.find("name");
  if (name_it == fields.end() || name_it->second.empty()) {
    return {std::nullopt, "Missing required 'name' field in: " + path.string()};
  }

  auto desc_it = fields.find("description");
  if (desc_it == fields.end() || desc_it->second.empty()) {
    return {std::nullopt, "Missing required 'description' field in: " + path.string()};
  }

  if (!validate_skill_name(name_it->second)) {
    return {std::nullopt, "Invalid skill name '" + name_it->second + "' in: " + path.string()};
  }

  auto parent_dir = path.parent_path().filename().string();
  if (parent_dir != name_it->second) {
    return {std::nullopt, "Skill name '" + name_it->second + "' does not match directory '" + parent_dir + "' in: " + path.string()};
  }

  if (desc_it->second.size() > 1024) {
    return {std::nullopt, "Description exceeds 1024 characters in: " + path.string()};
  }

  SkillInfo skill;
  skill.name = name_it->second;
  skill.description = desc_it->second;
  skill.body = body;

  std::error_code ec;
  skill.source_path = fs::canonical(path, ec);
  if (ec) {
    skill.source_path = fs::absolute(path);
  }

  for (const auto &[action, script] : parse_nested_block(frontmatter, "scripts")) {
    if (script.empty()) continue;
    fs::path script_path(script);
    skill.scripts[action] = script_path.is_absolute() ? script_path : (skill.dir() / script_path).lexically_normal();
  }

  if (auto it = fields.find("requires-bins"); it != fields.end()) {
    skill.requires_bins = parse_list(it->second);
  }
  if (auto it = fields.find("requires-env"); it != fields.end()) {
    skill.requires_env = parse_list(it->second);
  }
  if (auto it = fields.find("raw-output"); it != fields.end()) {
    skill.raw_output = parse_bool(it->second);
  }

  check_availability(skill);
  return {std::move(skill), std::nullopt};
}

std::optional<fs::path> find_executable(const std::string &bin) {
  if (bin.empty()) return std::nullopt;

  if (bin.find('/') != std::string::npos) {
    if (access(bin.c_str(), X_OK) == 0 && !fs::is_directory(bin)) return fs::path(bin);
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::istringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    fs::path candidate = fs::path(dir) / bin;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

void check_availability(SkillInfo &skill) {
  std::vector<std::string> missing;

  for (const auto &bin : skill.requires_bins) {
    if (!find_executable(bin)) missing.push_back("binary '" + bin + "'");
  }

  for (const auto &var : skill.requires_env) {
    const char *value = std::getenv(var.c_str());
    if (!value || !*value) missing.push_back("environment variable " + var);
  }

  for (const auto &[action, script] : skill.scripts) {
    std::error_code ec;
    if (!fs::exists(script, ec)) missing.push_back("script '" + script.string() + "' for action " + action);
  }

  skill.available = missing.empty();
  skill.unavailable_reason = missing.empty() ? "" : "Missing " + join(missing, ", ");
}

// ============================================================================
// SkillRegistry
// ============================================================================

size_t SkillRegistry::load_directory(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    spdlog::debug("[SkillRegistry] Skipping missing skill directory {}", dir.string());
    return 0;
  }

  // Directory iteration order is unspecified; sort so first-wins is deterministic
  std::vector<fs::path> candidates;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_directory(ec) && fs::exists(entry.path() / "SKILL.md", ec)) {
      candidates.push_back(entry.path() / "SKILL.md");
    }
  }
  std::sort(candidates.begin(), candidates.end());

  size_t loaded = 0;
  for (const auto &skill_md : candidates) {
    auto result = parse_skill_file(skill_md);
    if (!result.ok()) {
      spdlog::warn("[SkillRegistry] Failed to load skill from {}: {}", skill_md.string(), result.error.value_or("unknown error"));
      continue;
    }
    if (!result.skill->available) {
      spdlog::info("[SkillRegistry] Skill '{}' is unavailable: {}", result.skill->name, result.skill->unavailable_reason);
    }
    if (register_skill(std::move(*result.skill))) {
      ++loaded;
    }
  }

  spdlog::info("[SkillRegistry] Loaded {} skills from {}", loaded, dir.string());
  return loaded;
}

bool SkillRegistry::register_skill(SkillInfo skill) {
  std::lock_guard lock(mutex_);
  auto it = skills_.find(skill.name);
  if (it != skills_.end()) {
    spdlog::debug("[SkillRegistry] Skill '{}' already registered (from {}), skipping duplicate from {}", skill.name, it->second.source_path.string(),
                  skill.source_path.string());
    return false;
  }

  spdlog::info("[SkillRegistry] Registered skill '{}' from {}", skill.name, skill.source_path.string());
  auto name = skill.name;
  skills_.emplace(std::move(name), std::move(skill));
  return true;
}

std::optional<SkillInfo> SkillRegistry::get(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = skills_.find(name);
  if (it != skills_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<SkillInfo> SkillRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<SkillInfo> result;
  result.reserve(skills_.size());
  for (const auto &[name, skill] : skills_) {
    result.push_back(skill);
  }
  return result;
}

std::vector<SkillInfo> SkillRegistry::available() const {
  std::vector<SkillInfo> result;
  for (auto &skill : all()) {
    if (skill.available) result.push_back(std::move(skill));
  }
  return result;
}

size_t SkillRegistry::size() const {
  std::lock_guard lock(mutex_);
  return skills_.size();
}

void SkillRegistry::clear() {
  std::lock_guard lock(mutex_);
  skills_.clear();
}

std::vector<std::string> SkillRegistry::suggest(const std::string &name, size_t limit) const {
  std::vector<std::string> result;
  auto query = to_lower(trim(name));
  if (query.empty()) return result;

  std::lock_guard lock(mutex_);
  for (const auto &[skill_name, skill] : skills_) {
    if (result.size() >= limit) break;
    auto candidate = to_lower(skill_name);
    if (candidate.find(query) != std::string::npos || query.find(candidate) != std::string::npos) {
      result.push_back(skill_name);
    }
  }
  return result;
}

SkillExecutionResult SkillRegistry::execute_skill(const std::string &name, const SkillExecuteOptions &options) const {
  auto skill = get(name);
  if (!skill) {
    auto result = failed(ToolErrorKind::SkillNotFound, "Skill not found: " + name);
    result.suggestions = suggest(name);
    return result;
  }

  if (!skill->available) {
    return failed(ToolErrorKind::SkillUnavailable, "Skill \"" + name + "\" is not available: " + skill->unavailable_reason);
  }

  // Informational skill
  if (!skill->has_scripts()) {
    SkillExecutionResult result;
    result.success = true;
    result.output = skill->body;
    return result;
  }

  auto action = options.action.empty() ? std::string("run") : options.action;
  auto script_it = skill->scripts.find(action);
  if (script_it == skill->scripts.end()) {
    std::vector<std::string> actions;
    for (const auto &[a, _] : skill->scripts) actions.push_back(a);
    return failed(ToolErrorKind::InvalidArguments,
                  "No script for action \"" + action + "\" in skill \"" + name + "\". Available actions: " + join(actions, ", "));
  }

  sandbox::ProcessOptions process;
  process.argv = sandbox::script_command(script_it->second);
  process.working_dir = options.workspace;
  process.env["SKILL_ARGS"] = options.args.dump();
  process.env["SKILL_CWD"] = options.workspace.string();
  process.env["SKILL_SESSION_ID"] = options.session_id;
  process.timeout = options.timeout;
  process.kill_grace = options.kill_grace;
  process.max_output_bytes = options.max_output_bytes;
  process.abort_signal = options.abort_signal;

  spdlog::debug("[SkillRegistry] Executing skill '{}' action '{}': {}", name, action, script_it->second.string());
  auto run = sandbox::run_process(process);

  if (run.spawn_failed) {
    return failed(ToolErrorKind::SandboxSpawnFailure, "Skill \"" + name + "\" could not be started: " + run.error, run.exit_code);
  }

  if (run.cancelled) {
    auto result = failed(ToolErrorKind::Cancelled, "Skill \"" + name + "\" was cancelled", run.exit_code);
    result.output = run.output;
    return result;
  }

  if (run.timed_out) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count();
    auto result = failed(ToolErrorKind::SandboxTimeout, "Skill \"" + name + "\" timed out after " + std::to_string(seconds) + "s", run.exit_code);
    result.output = run.output;
    return result;
  }

  return interpret_script_output(run.output, run.error, run.exit_code);
}

SkillExecutionResult interpret_script_output(const std::string &stdout_text, const std::string &stderr_text, int exit_code) {
  SkillExecutionResult result;
  std::string err = trim(stderr_text);

  result.success = exit_code == 0;
  result.output = stdout_text;
  result.exit_code = exit_code;
  if (!err.empty()) {
    result.error = err;
  }

  auto j = json::parse(trim(stdout_text), nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    if (j.contains("success") && j["success"].is_boolean()) {
      result.success = j["success"].get<bool>();
    }
    if (j.contains("output") && j["output"].is_string()) {
      result.output = j["output"].get<std::string>();
    }
    if (j.contains("error") && j["error"].is_string()) {
      result.error = j["error"].get<std::string>();
    }
    if (j.contains("exitCode") && j["exitCode"].is_number_integer()) {
      result.exit_code = j["exitCode"].get<int>();
    }
  }

  if (!result.success) {
    result.failure = ToolErrorKind::ExecutionFailed;
    if (!result.error) {
      result.error = "Script exited with code " + std::to_string(result.exit_code);
    }
  }

  return result;
}

}  // namespace clawcore::skill
