#include "clawcore/llm/anthropic.hpp"

#include <spdlog/spdlog.h>

namespace clawcore::llm {

AnthropicProvider::AnthropicProvider(const ProviderConfig& config, std::shared_ptr<net::Transport> transport)
    : HttpProvider(config, std::move(transport)) {
  if (!config.base_url.empty()) {
    base_url_ = config.base_url;
  }
  if (!config.model.empty()) {
    default_model_ = config.model;
  }
}

std::future<CompletionResponse> AnthropicProvider::complete(const CompletionRequest& request) {
  CompletionRequest req = request;
  if (req.model.empty()) {
    req.model = default_model_;
  }

  std::map<std::string, std::string> headers = {{"x-api-key", config_.api_key}, {"anthropic-version", api_version_}};

  spdlog::debug("[Anthropic] complete: model={}, messages={}, tools={}", req.model, req.messages.size(), req.tools.size());
  return post_json(base_url_ + "/v1/messages", to_anthropic_format(req), std::move(headers), parse_anthropic_response);
}

}  // namespace clawcore::llm
