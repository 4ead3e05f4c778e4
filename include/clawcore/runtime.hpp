#pragma once

#include <asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "clawcore/agent/agent_loop.hpp"
#include "clawcore/core/config.hpp"
#include "clawcore/llm/registry.hpp"
#include "clawcore/net/http_client.hpp"
#include "clawcore/skill/skill.hpp"
#include "clawcore/tool/registry.hpp"

namespace clawcore {

// Owns the registries, the HTTP transport and the io_context thread that
// drives it. Everything else borrows from here.
class Runtime {
 public:
  explicit Runtime(Config config);

  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  // Register providers from config, load skills, register built-in tools and
  // apply the configured tool policy
  void init();

  const Config &config() const {
    return config_;
  }

  llm::ProviderRegistry &providers() {
    return providers_;
  }

  ToolRegistry &tools() {
    return tools_;
  }

  skill::SkillRegistry &skills() {
    return skills_;
  }

  // Named provider, else the configured default, else the first available one
  std::shared_ptr<llm::Provider> select_provider(const std::string &name = "") const;

  std::unique_ptr<AgentLoop> create_loop(std::shared_ptr<llm::Provider> provider, AgentLoopOptions options) const;

  // Loop options filled from config
  AgentLoopOptions default_loop_options() const;

 private:
  Config config_;

  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  std::shared_ptr<net::HttpClient> http_client_;

  llm::ProviderRegistry providers_;
  ToolRegistry tools_;
  skill::SkillRegistry skills_;
};

}  // namespace clawcore
