#pragma once

#include "clawcore/llm/provider.hpp"

namespace clawcore::llm {

// Anthropic Messages API
class AnthropicProvider : public HttpProvider {
 public:
  AnthropicProvider(const ProviderConfig &config, std::shared_ptr<net::Transport> transport);

  std::string name() const override {
    return "anthropic";
  }

  bool is_available() const override {
    return !config_.api_key.empty();
  }

  std::future<CompletionResponse> complete(const CompletionRequest &request) override;

 private:
  std::string base_url_ = "https://api.anthropic.com";
  std::string api_version_ = "2023-06-01";
  std::string default_model_ = "claude-sonnet-4-20250514";
};

}  // namespace clawcore::llm
