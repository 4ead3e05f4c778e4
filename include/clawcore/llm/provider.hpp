#pragma once

#include <functional>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "clawcore/core/errors.hpp"
#include "clawcore/core/message.hpp"
#include "clawcore/core/types.hpp"
#include "clawcore/net/http_client.hpp"

namespace clawcore::llm {

// Abstract LLM provider interface
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // True iff the credentials this backend needs are present. Never touches the network.
  virtual bool is_available() const = 0;

  // Non-streaming completion. The future rethrows ProviderError on failure.
  virtual std::future<CompletionResponse> complete(const CompletionRequest &request) = 0;
};

// Shared plumbing for adapters that speak JSON over HTTP
class HttpProvider : public Provider {
 public:
  HttpProvider(ProviderConfig config, std::shared_ptr<net::Transport> transport);

  const ProviderConfig &config() const {
    return config_;
  }

 protected:
  using ResponseParser = std::function<CompletionResponse(const json &)>;

  // POST body to url; maps transport and HTTP failures to ProviderError and
  // runs parser on the decoded JSON body
  std::future<CompletionResponse> post_json(const std::string &url, const json &body, std::map<std::string, std::string> headers, ResponseParser parser);

  ProviderConfig config_;
  std::shared_ptr<net::Transport> transport_;
};

// Error raised for a transport or HTTP failure; message is taken from the
// backend's {"error": {"message": ...}} body when present
ProviderError error_from_response(const std::string &provider, const net::HttpResponse &response);

// Request encodings
json to_anthropic_format(const CompletionRequest &request);
json to_openai_format(const CompletionRequest &request);
json to_ollama_format(const CompletionRequest &request);

// Response decodings; each result is normalized
CompletionResponse parse_anthropic_response(const json &body);
CompletionResponse parse_openai_response(const json &body);
CompletionResponse parse_ollama_response(const json &body);

// Decode a tool call's arguments, which arrive either as a JSON object or as
// a JSON-encoded string. A payload that does not decode becomes a TextBlock
// carrying the raw text and an error note.
ContentBlock decode_tool_call(const std::string &id, const std::string &name, const json &arguments);

// Create an adapter by provider name (anthropic, openai, groq, openrouter,
// xai, moonshot, ollama); nullptr for an unknown name
std::shared_ptr<Provider> create_provider(const ProviderConfig &config, std::shared_ptr<net::Transport> transport);

}  // namespace clawcore::llm
