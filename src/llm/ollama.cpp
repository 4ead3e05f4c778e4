#include "clawcore/llm/ollama.hpp"

#include <spdlog/spdlog.h>

namespace clawcore::llm {

OllamaProvider::OllamaProvider(const ProviderConfig& config, std::shared_ptr<net::Transport> transport) : HttpProvider(config, std::move(transport)) {
  if (!config.model.empty()) {
    default_model_ = config.model;
  }
}

std::future<CompletionResponse> OllamaProvider::complete(const CompletionRequest& request) {
  CompletionRequest req = request;
  if (req.model.empty()) {
    req.model = default_model_;
  }

  std::string base_url = config_.base_url;
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }

  spdlog::debug("[Ollama] complete: model={}, messages={}, tools={}", req.model, req.messages.size(), req.tools.size());
  return post_json(base_url + "/api/chat", to_ollama_format(req), {}, parse_ollama_response);
}

}  // namespace clawcore::llm
