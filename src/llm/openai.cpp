#include "clawcore/llm/openai.hpp"

#include <spdlog/spdlog.h>

namespace clawcore::llm {

std::optional<OpenAICompatibleSpec> openai_compatible_spec(const std::string& name) {
  static const OpenAICompatibleSpec specs[] = {
      {"openai", "https://api.openai.com/v1", "gpt-4o"},
      {"groq", "https://api.groq.com/openai/v1", "llama-3.3-70b-versatile"},
      {"openrouter", "https://openrouter.ai/api/v1", "anthropic/claude-3.5-sonnet"},
      {"xai", "https://api.x.ai/v1", "grok-4"},
      {"moonshot", "https://api.moonshot.ai/v1", "kimi-k2.5"},
  };

  for (const auto& spec : specs) {
    if (spec.name == name) return spec;
  }
  return std::nullopt;
}

OpenAIProvider::OpenAIProvider(const ProviderConfig& config, std::shared_ptr<net::Transport> transport, OpenAICompatibleSpec spec)
    : HttpProvider(config, std::move(transport)), spec_(std::move(spec)) {
  if (!config.base_url.empty()) {
    spec_.base_url = config.base_url;
  }
  if (!config.model.empty()) {
    spec_.default_model = config.model;
  }
}

OpenAIProvider::OpenAIProvider(const ProviderConfig& config, std::shared_ptr<net::Transport> transport)
    : OpenAIProvider(config, std::move(transport), *openai_compatible_spec("openai")) {}

std::future<CompletionResponse> OpenAIProvider::complete(const CompletionRequest& request) {
  CompletionRequest req = request;
  if (req.model.empty()) {
    req.model = spec_.default_model;
  }

  std::map<std::string, std::string> headers = {{"Authorization", "Bearer " + config_.api_key}};

  spdlog::debug("[OpenAI] {} complete: model={}, messages={}, tools={}", spec_.name, req.model, req.messages.size(), req.tools.size());
  return post_json(spec_.base_url + "/chat/completions", to_openai_format(req), std::move(headers), parse_openai_response);
}

}  // namespace clawcore::llm
