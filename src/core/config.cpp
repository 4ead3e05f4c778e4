#include "clawcore/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace clawcore {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
  std::vector<std::string> result;
  if (j.contains(key) && j[key].is_array()) {
    for (const auto& item : j[key]) {
      if (item.is_string()) {
        result.push_back(item.get<std::string>());
      }
    }
  }
  return result;
}

const char* env_or_null(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

// Hosted providers configured from <PREFIX>_API_KEY, in registration order
struct EnvProvider {
  const char* name;
  const char* key_var;
  const char* url_var;
};

constexpr EnvProvider kEnvProviders[] = {
    {"anthropic", "ANTHROPIC_API_KEY", "ANTHROPIC_BASE_URL"},
    {"openai", "OPENAI_API_KEY", "OPENAI_BASE_URL"},
    {"groq", "GROQ_API_KEY", nullptr},
    {"openrouter", "OPENROUTER_API_KEY", nullptr},
    {"xai", "XAI_API_KEY", nullptr},
    {"moonshot", "MOONSHOT_API_KEY", nullptr},
};

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("providers")) {
      for (auto& [name, provider_json] : j["providers"].items()) {
        ProviderConfig provider;
        provider.name = name;
        provider.api_key = provider_json.value("api_key", "");
        provider.base_url = provider_json.value("base_url", "");
        provider.model = provider_json.value("model", "");
        if (provider_json.contains("headers")) {
          for (auto& [k, v] : provider_json["headers"].items()) {
            provider.headers[k] = v.get<std::string>();
          }
        }
        config.providers[name] = provider;
      }
    }

    config.default_provider = j.value("default_provider", "");

    if (j.contains("workspace")) {
      config.workspace = j["workspace"].get<std::string>();
    }

    for (const auto& p : string_list(j, "skill_paths")) {
      config.skill_paths.emplace_back(p);
    }

    if (j.contains("tool_policy")) {
      const auto& policy_json = j["tool_policy"];
      ToolPolicyConfig policy;
      policy.mode = policy_json.value("mode", "allowlist");
      policy.tools = string_list(policy_json, "tools");
      policy.categories = string_list(policy_json, "categories");
      policy.groups = string_list(policy_json, "groups");
      config.tool_policy = policy;
    }

    if (j.contains("sandbox")) {
      const auto& sb = j["sandbox"];
      config.sandbox.timeout_ms = sb.value("timeout_ms", config.sandbox.timeout_ms);
      config.sandbox.kill_grace_ms = sb.value("kill_grace_ms", config.sandbox.kill_grace_ms);
      config.sandbox.max_output_bytes = sb.value("max_output_bytes", config.sandbox.max_output_bytes);
    }

    config.max_steps = j.value("max_steps", config.max_steps);
    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("[Config] Ignoring malformed config {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return from_env(load(project_config));
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return from_env(load(global_config));
  }

  return from_env(Config{});
}

Config Config::from_env(Config base) {
  Config config = std::move(base);

  for (const auto& entry : kEnvProviders) {
    const char* key = env_or_null(entry.key_var);
    if (!key) continue;

    auto& provider = config.providers[entry.name];
    provider.name = entry.name;
    provider.api_key = key;
    if (entry.url_var) {
      if (const char* url = env_or_null(entry.url_var)) {
        provider.base_url = url;
      }
    }
  }

  if (const char* ollama_url = env_or_null("OLLAMA_BASE_URL")) {
    auto& provider = config.providers["ollama"];
    provider.name = "ollama";
    provider.base_url = ollama_url;
  }

  if (const char* workspace = env_or_null("CLAWCORE_WORKSPACE")) {
    config.workspace = workspace;
  }

  if (const char* level = env_or_null("CLAWCORE_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

std::optional<ProviderConfig> Config::get_provider(const std::string& name) const {
  auto it = providers.find(name);
  if (it != providers.end()) {
    return it->second;
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "clawcore";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".clawcore" / "config.json";
}

}  // namespace config_paths

}  // namespace clawcore
