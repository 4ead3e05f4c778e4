#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace clawcore {

// Tool policy as written in the config file; converted to a ToolPolicy by
// ToolRegistry::policy_from_config once tools and groups are known
struct ToolPolicyConfig {
  std::string mode;  // "allowlist" or "denylist"
  std::vector<std::string> tools;
  std::vector<std::string> categories;
  std::vector<std::string> groups;
};

// Limits applied to out-of-process skill executions
struct SandboxSettings {
  int timeout_ms = 60000;
  int kill_grace_ms = 5000;
  size_t max_output_bytes = 30 * 1024;
};

// Application configuration
struct Config {
  // Provider configs, keyed by provider name
  std::map<std::string, ProviderConfig> providers;

  // Preferred provider; empty means first available
  std::string default_provider;

  // Root of all file-mutating operations
  std::filesystem::path workspace = std::filesystem::current_path();

  // Directories scanned for */SKILL.md
  std::vector<std::filesystem::path> skill_paths;

  std::optional<ToolPolicyConfig> tool_policy;

  SandboxSettings sandbox;

  // Upper bound on provider round trips per prompt
  int max_steps = 25;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file; a missing or malformed file yields defaults
  static Config load(const std::filesystem::path& path);

  // Project config, then global config, then environment
  static Config load_default();

  // Overlay environment variables on top of base:
  //   ANTHROPIC_API_KEY, ANTHROPIC_BASE_URL, OPENAI_API_KEY, OPENAI_BASE_URL,
  //   GROQ_API_KEY, OPENROUTER_API_KEY, XAI_API_KEY, MOONSHOT_API_KEY,
  //   OLLAMA_BASE_URL, CLAWCORE_WORKSPACE, CLAWCORE_LOG_LEVEL
  static Config from_env(Config base);

  std::optional<ProviderConfig> get_provider(const std::string& name) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

// ~/.config/clawcore
std::filesystem::path config_dir();

std::filesystem::path default_config_file();

// ./.clawcore/config.json
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace clawcore
