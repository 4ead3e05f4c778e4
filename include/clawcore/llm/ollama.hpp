#pragma once

#include "clawcore/llm/provider.hpp"

namespace clawcore::llm {

// Local Ollama server, native /api/chat endpoint. Needs no key; it is
// available once a base URL has been configured.
class OllamaProvider : public HttpProvider {
 public:
  OllamaProvider(const ProviderConfig &config, std::shared_ptr<net::Transport> transport);

  std::string name() const override {
    return "ollama";
  }

  bool is_available() const override {
    return !config_.base_url.empty();
  }

  std::future<CompletionResponse> complete(const CompletionRequest &request) override;

 private:
  std::string default_model_ = "llama3.2";
};

}  // namespace clawcore::llm
