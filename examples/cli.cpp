// clawcore-cli: one-shot prompt against the configured provider with the
// built-in tools and skills
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "clawcore/clawcore.hpp"
#include "clawcore/log/log.h"

using namespace clawcore;

namespace {

std::atomic<AgentLoop *> g_loop{nullptr};

// Takes effect at the next step or tool call; a provider request already in
// flight runs until it returns or hits its HTTP timeout
void on_sigint(int) {
  if (auto *loop = g_loop.load()) loop->cancel();
}

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " [options] PROMPT\n"
            << "\n"
            << "Options:\n"
            << "  --config PATH       config file (default ./.clawcore/config.json, then ~/.config/clawcore/config.json)\n"
            << "  --provider NAME     provider to use (default: configured default, else first available)\n"
            << "  --workspace DIR     workspace root for file tools\n"
            << "  --skills DIR        additional skills directory (repeatable)\n"
            << "  --allow LIST        allowlist of tools/categories/group:<id>, comma separated\n"
            << "  --deny LIST         denylist of tools/categories/group:<id>, comma separated\n"
            << "  --log-level LEVEL   trace, debug, info, warn, err, critical, off\n"
            << "  --version           print version\n"
            << "  -h, --help          show this help\n";
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string::npos) end = value.size();
    auto item = value.substr(start, end - start);
    if (!item.empty()) out.push_back(item);
    start = end + 1;
  }
  return out;
}

// Entries are tool names, category names or "group:<id>"
ToolPolicyConfig policy_from_list(const std::string &mode, const std::string &list) {
  ToolPolicyConfig policy;
  policy.mode = mode;
  for (const auto &item : split_list(list)) {
    if (item.rfind("group:", 0) == 0) {
      policy.groups.push_back(item.substr(6));
    } else if (tool_category_from_string(item)) {
      policy.categories.push_back(item);
    } else {
      policy.tools.push_back(item);
    }
  }
  return policy;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string provider_name;
  std::string workspace;
  std::string log_level;
  std::vector<std::string> skill_dirs;
  std::optional<ToolPolicyConfig> policy;
  std::string prompt;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const char *flag) -> std::string {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        std::exit(2);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << "clawcore " << version() << "\n";
      return 0;
    } else if (arg == "--config") {
      config_path = next("--config");
    } else if (arg == "--provider") {
      provider_name = next("--provider");
    } else if (arg == "--workspace") {
      workspace = next("--workspace");
    } else if (arg == "--skills") {
      skill_dirs.push_back(next("--skills"));
    } else if (arg == "--allow") {
      policy = policy_from_list("allowlist", next("--allow"));
    } else if (arg == "--deny") {
      policy = policy_from_list("denylist", next("--deny"));
    } else if (arg == "--log-level") {
      log_level = next("--log-level");
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    } else {
      if (!prompt.empty()) prompt += " ";
      prompt += arg;
    }
  }

  if (prompt.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  Config config = config_path.empty() ? Config::load_default() : Config::from_env(Config::load(config_path));
  if (!workspace.empty()) config.workspace = std::filesystem::absolute(workspace);
  if (!log_level.empty()) config.log_level = log_level;
  for (const auto &dir : skill_dirs) config.skill_paths.emplace_back(dir);
  if (policy) config.tool_policy = policy;

  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("[CLI] clawcore {} workspace={}", version(), config.workspace.string());

  Runtime runtime(config);
  runtime.init();

  auto provider = runtime.select_provider(provider_name);
  if (!provider || !provider->is_available()) {
    std::cerr << "No available provider"
              << (provider_name.empty() ? std::string() : " named '" + provider_name + "'")
              << ". Set an API key (e.g. ANTHROPIC_API_KEY) or configure one in the config file.\n";
    return 1;
  }

  auto loop = runtime.create_loop(provider, runtime.default_loop_options());
  loop->on_tool_call([](const ToolUseBlock &call) { std::cerr << "[tool] " << call.name << " " << call.input.dump() << "\n"; });
  loop->on_tool_result([](const ToolCallOutcome &outcome) {
    std::cerr << "[tool] " << outcome.tool_name << (outcome.result.is_error ? " failed" : " done") << "\n";
  });

  g_loop.store(loop.get());
  std::signal(SIGINT, on_sigint);

  auto result = loop->prompt(prompt);
  std::signal(SIGINT, SIG_DFL);
  g_loop.store(nullptr);

  if (!result.text.empty()) {
    std::cout << result.text << "\n";
  }

  std::cerr << "[" << to_string(result.state) << "] steps=" << result.steps << " tokens=" << result.usage.total() << "\n";
  if (result.error) {
    std::cerr << "Error: " << *result.error << "\n";
  }
  return result.ok() ? 0 : 1;
}
