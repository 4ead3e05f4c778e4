#include "clawcore/runtime.hpp"

#include <spdlog/spdlog.h>

#include "clawcore/clawcore.hpp"

namespace clawcore {

std::string version() {
  return CLAWCORE_VERSION_STRING;
}

Runtime::Runtime(Config config)
    : config_(std::move(config)), work_guard_(asio::make_work_guard(io_ctx_)), http_client_(std::make_shared<net::HttpClient>(io_ctx_)) {
  io_thread_ = std::thread([this]() { io_ctx_.run(); });
}

Runtime::~Runtime() {
  work_guard_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

void Runtime::init() {
  // Providers in a stable order so "first available" is predictable
  static constexpr const char *kProviderOrder[] = {"anthropic", "openai", "groq", "openrouter", "xai", "moonshot", "ollama"};

  for (const char *name : kProviderOrder) {
    auto cfg = config_.get_provider(name);
    if (!cfg) continue;
    cfg->name = name;
    if (auto provider = llm::create_provider(*cfg, http_client_)) {
      providers_.register_provider(provider);
    }
  }
  for (const auto &[name, cfg] : config_.providers) {
    if (providers_.has(name)) continue;
    ProviderConfig named = cfg;
    named.name = name;
    if (auto provider = llm::create_provider(named, http_client_)) {
      providers_.register_provider(provider);
    }
  }

  for (const auto &dir : config_.skill_paths) {
    skills_.load_directory(dir.is_absolute() ? dir : config_.workspace / dir);
  }

  tools::register_builtins(tools_, skills_, config_.sandbox);

  if (config_.tool_policy) {
    auto policy = tools_.policy_from_config(*config_.tool_policy);
    if (policy.ok()) {
      tools_.set_policy(std::move(*policy.value));
    } else {
      spdlog::warn("[Runtime] Ignoring tool policy: {}", policy.error.value_or("invalid policy"));
    }
  }

  spdlog::info("[Runtime] Initialized: {} providers, {} tools, {} skills", providers_.size(), tools_.size(), skills_.size());
}

std::shared_ptr<llm::Provider> Runtime::select_provider(const std::string &name) const {
  if (!name.empty()) {
    return providers_.get(name);
  }
  if (!config_.default_provider.empty()) {
    auto provider = providers_.get(config_.default_provider);
    if (provider && provider->is_available()) return provider;
    spdlog::warn("[Runtime] Default provider {} is not available", config_.default_provider);
  }
  return providers_.get_default();
}

AgentLoopOptions Runtime::default_loop_options() const {
  AgentLoopOptions options;
  options.max_steps = config_.max_steps;
  options.workspace = config_.workspace;
  options.max_output_bytes = config_.sandbox.max_output_bytes;
  return options;
}

std::unique_ptr<AgentLoop> Runtime::create_loop(std::shared_ptr<llm::Provider> provider, AgentLoopOptions options) const {
  return std::make_unique<AgentLoop>(std::move(provider), tools_, std::move(options));
}

}  // namespace clawcore
