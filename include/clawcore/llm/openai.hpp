#pragma once

#include "clawcore/llm/provider.hpp"

namespace clawcore::llm {

// Backend speaking the OpenAI chat completions protocol
struct OpenAICompatibleSpec {
  std::string name;
  std::string base_url;
  std::string default_model;
};

// Known OpenAI-compatible backends: openai, groq, openrouter, xai, moonshot
std::optional<OpenAICompatibleSpec> openai_compatible_spec(const std::string &name);

class OpenAIProvider : public HttpProvider {
 public:
  OpenAIProvider(const ProviderConfig &config, std::shared_ptr<net::Transport> transport, OpenAICompatibleSpec spec);

  // Plain OpenAI
  OpenAIProvider(const ProviderConfig &config, std::shared_ptr<net::Transport> transport);

  std::string name() const override {
    return spec_.name;
  }

  bool is_available() const override {
    return !config_.api_key.empty();
  }

  std::future<CompletionResponse> complete(const CompletionRequest &request) override;

 private:
  OpenAICompatibleSpec spec_;
};

}  // namespace clawcore::llm
