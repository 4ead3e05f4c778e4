#include "clawcore/llm/provider.hpp"

#include <spdlog/spdlog.h>

#include "clawcore/core/uuid.hpp"
#include "clawcore/llm/anthropic.hpp"
#include "clawcore/llm/ollama.hpp"
#include "clawcore/llm/openai.hpp"

namespace clawcore::llm {

namespace {

json openai_tool_schema(const ToolDefinition& tool) {
  json func = {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.input_schema}};
  return {{"type", "function"}, {"function", func}};
}

void append_usage(TokenUsage& usage, const json& j, const char* input_key, const char* output_key) {
  if (j.contains(input_key) && j[input_key].is_number()) usage.input_tokens = j[input_key].get<int64_t>();
  if (j.contains(output_key) && j[output_key].is_number()) usage.output_tokens = j[output_key].get<int64_t>();
}

// OpenAI and Ollama share one message layout; they differ only in how
// tool-call arguments travel (string vs object)
json chat_messages(const CompletionRequest& request, bool arguments_as_string) {
  json msgs = json::array();

  if (!request.system_prompt.empty()) {
    msgs.push_back({{"role", "system"}, {"content", request.system_prompt}});
  }

  for (const auto& msg : request.messages) {
    // Tool results become separate role="tool" messages
    auto tool_results = msg.tool_results();
    if (!tool_results.empty()) {
      auto text = msg.text();
      if (!text.empty()) {
        msgs.push_back({{"role", "user"}, {"content", text}});
      }
      for (const auto* tr : tool_results) {
        json tool_msg = {{"role", "tool"}, {"content", tr->output}};
        if (arguments_as_string) {
          tool_msg["tool_call_id"] = tr->tool_call_id;
        } else {
          tool_msg["tool_name"] = tr->tool_name;
        }
        msgs.push_back(tool_msg);
      }
      continue;
    }

    json m = {{"role", to_string(msg.role())}, {"content", msg.text()}};

    auto tool_calls = msg.tool_calls();
    if (!tool_calls.empty()) {
      json calls = json::array();
      for (const auto* tc : tool_calls) {
        json function = {{"name", tc->name}};
        function["arguments"] = arguments_as_string ? json(tc->arguments.dump()) : tc->arguments;
        json call = {{"function", function}};
        if (arguments_as_string) {
          call["id"] = tc->id;
          call["type"] = "function";
        }
        calls.push_back(call);
      }
      m["tool_calls"] = calls;
      if (arguments_as_string && m["content"].get<std::string>().empty()) {
        m["content"] = nullptr;
      }
    }

    msgs.push_back(m);
  }

  return msgs;
}

}  // namespace

// ============================================================
// HttpProvider
// ============================================================

HttpProvider::HttpProvider(ProviderConfig config, std::shared_ptr<net::Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

std::future<CompletionResponse> HttpProvider::post_json(const std::string& url, const json& body, std::map<std::string, std::string> headers,
                                                        ResponseParser parser) {
  headers["Content-Type"] = "application/json";
  for (const auto& [key, value] : config_.headers) {
    headers[key] = value;
  }

  net::HttpOptions options;
  options.method = "POST";
  options.body = body.dump();
  options.headers = std::move(headers);

  auto pending = std::make_shared<std::future<net::HttpResponse>>(transport_->request(url, options));
  std::string provider = name();

  return std::async(std::launch::async, [pending, provider, parser = std::move(parser)]() -> CompletionResponse {
    net::HttpResponse response = pending->get();

    if (!response.error.empty() || !response.ok()) {
      auto error = error_from_response(provider, response);
      spdlog::error("[Provider] {} request failed: {} (kind={}, status={})", provider, error.what(), to_string(error.kind()), error.status());
      throw error;
    }

    json j;
    try {
      j = json::parse(response.body);
    } catch (const json::parse_error& e) {
      spdlog::error("[Provider] {} returned invalid JSON: {}", provider, e.what());
      throw ProviderError(ProviderError::Kind::Parse, provider, std::string("Invalid JSON response: ") + e.what(), response.status_code);
    }

    try {
      return parser(j);
    } catch (const json::exception& e) {
      spdlog::error("[Provider] {} response has unexpected shape: {}", provider, e.what());
      throw ProviderError(ProviderError::Kind::Parse, provider, std::string("Unexpected response shape: ") + e.what(), response.status_code);
    }
  });
}

ProviderError error_from_response(const std::string& provider, const net::HttpResponse& response) {
  if (response.timed_out) {
    return ProviderError(ProviderError::Kind::Timeout, provider, response.error.empty() ? "Request timed out" : response.error);
  }

  if (response.status_code == 0) {
    return ProviderError(ProviderError::Kind::Network, provider, "Network error: " + response.error);
  }

  std::string message = "HTTP error: " + std::to_string(response.status_code);
  if (!response.body.empty()) {
    auto err = json::parse(response.body, nullptr, false);
    if (!err.is_discarded() && err.is_object() && err.contains("error")) {
      const auto& e = err["error"];
      if (e.is_object() && e.contains("message") && e["message"].is_string()) {
        message = e["message"].get<std::string>();
      } else if (e.is_string()) {
        message = e.get<std::string>();
      }
    } else {
      message += " - " + response.body;
    }
  }

  return ProviderError(ProviderError::kind_for_status(response.status_code), provider, message, response.status_code);
}

// ============================================================
// Request encodings
// ============================================================

json to_anthropic_format(const CompletionRequest& request) {
  json body;
  body["model"] = request.model;
  body["max_tokens"] = request.max_tokens.value_or(8192);

  if (request.temperature) {
    body["temperature"] = *request.temperature;
  }

  // System-role messages join the dedicated system field
  std::string system = request.system_prompt;

  json msgs = json::array();
  for (const auto& msg : request.messages) {
    if (msg.role() == Role::System) {
      if (!system.empty()) system += "\n\n";
      system += msg.text();
      continue;
    }

    json content = json::array();
    for (const auto& part : msg.parts()) {
      if (auto* text = std::get_if<TextPart>(&part)) {
        content.push_back({{"type", "text"}, {"text", text->text}});
      } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
        content.push_back({{"type", "tool_use"}, {"id", tc->id}, {"name", tc->name}, {"input", tc->arguments}});
      } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
        content.push_back({{"type", "tool_result"}, {"tool_use_id", tr->tool_call_id}, {"content", tr->output}, {"is_error", tr->is_error}});
      }
    }

    json m = {{"role", msg.role() == Role::User ? "user" : "assistant"}};
    if (content.size() == 1 && content[0]["type"] == "text") {
      m["content"] = content[0]["text"];
    } else {
      m["content"] = content;
    }
    msgs.push_back(m);
  }
  body["messages"] = msgs;

  if (!system.empty()) {
    body["system"] = system;
  }

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto& tool : request.tools) {
      tools.push_back(tool.to_json());
    }
    body["tools"] = tools;
  }

  return body;
}

json to_openai_format(const CompletionRequest& request) {
  json body;
  body["model"] = request.model;
  body["messages"] = chat_messages(request, true);

  if (request.max_tokens) {
    body["max_tokens"] = *request.max_tokens;
  }
  if (request.temperature) {
    body["temperature"] = *request.temperature;
  }

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto& tool : request.tools) {
      tools.push_back(openai_tool_schema(tool));
    }
    body["tools"] = tools;
  }

  return body;
}

json to_ollama_format(const CompletionRequest& request) {
  json body;
  body["model"] = request.model;
  body["messages"] = chat_messages(request, false);
  body["stream"] = false;

  json options = json::object();
  if (request.max_tokens) {
    options["num_predict"] = *request.max_tokens;
  }
  if (request.temperature) {
    options["temperature"] = *request.temperature;
  }
  if (!options.empty()) {
    body["options"] = options;
  }

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto& tool : request.tools) {
      tools.push_back(openai_tool_schema(tool));
    }
    body["tools"] = tools;
  }

  return body;
}

// ============================================================
// Response decodings
// ============================================================

ContentBlock decode_tool_call(const std::string& id, const std::string& name, const json& arguments) {
  std::string call_id = id.empty() ? UUID::with_prefix("call") : id;

  if (arguments.is_null()) {
    return ToolUseBlock{call_id, name, json::object()};
  }
  if (arguments.is_object()) {
    return ToolUseBlock{call_id, name, arguments};
  }

  if (arguments.is_string()) {
    const auto& raw = arguments.get_ref<const std::string&>();
    if (raw.empty()) {
      return ToolUseBlock{call_id, name, json::object()};
    }
    auto decoded = json::parse(raw, nullptr, false);
    if (!decoded.is_discarded() && decoded.is_object()) {
      return ToolUseBlock{call_id, name, decoded};
    }
    spdlog::warn("[Provider] Undecodable arguments for tool call {}: {}", name, raw);
    return TextBlock{"[Error: could not decode arguments for tool call \"" + name + "\"] " + raw};
  }

  spdlog::warn("[Provider] Unexpected argument type for tool call {}: {}", name, arguments.type_name());
  return TextBlock{"[Error: could not decode arguments for tool call \"" + name + "\"] " + arguments.dump()};
}

CompletionResponse parse_anthropic_response(const json& body) {
  CompletionResponse result;
  result.model = body.value("model", "");

  if (body.contains("content") && body["content"].is_array()) {
    for (const auto& content : body["content"]) {
      std::string type = content.value("type", "");
      if (type == "text") {
        result.content.push_back(TextBlock{content.value("text", "")});
      } else if (type == "tool_use") {
        result.content.push_back(decode_tool_call(content.value("id", ""), content.value("name", ""), content.value("input", json::object())));
      }
    }
  }

  auto stop = body.value("stop_reason", json());
  result.stop_reason = stop.is_string() ? stop_reason_from_string(stop.get<std::string>()) : StopReason::EndTurn;

  if (body.contains("usage")) {
    const auto& usage = body["usage"];
    append_usage(result.usage, usage, "input_tokens", "output_tokens");
    result.usage.cache_read_tokens = usage.value("cache_read_input_tokens", 0);
    result.usage.cache_write_tokens = usage.value("cache_creation_input_tokens", 0);
  }

  result.normalize();
  return result;
}

CompletionResponse parse_openai_response(const json& body) {
  CompletionResponse result;
  result.model = body.value("model", "");

  // Throws json::out_of_range when choices is missing or empty
  const auto& choice = body.at("choices").at(0);
  const auto& message = choice.at("message");

  if (message.contains("content") && message["content"].is_string()) {
    auto text = message["content"].get<std::string>();
    if (!text.empty()) {
      result.content.push_back(TextBlock{text});
    }
  }

  if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
    for (const auto& call : message["tool_calls"]) {
      const auto& function = call.at("function");
      result.content.push_back(decode_tool_call(call.value("id", ""), function.value("name", ""), function.value("arguments", json())));
    }
  }

  auto finish = choice.value("finish_reason", json());
  result.stop_reason = finish.is_string() ? stop_reason_from_string(finish.get<std::string>()) : StopReason::EndTurn;

  if (body.contains("usage") && body["usage"].is_object()) {
    append_usage(result.usage, body["usage"], "prompt_tokens", "completion_tokens");
  }

  result.normalize();
  return result;
}

CompletionResponse parse_ollama_response(const json& body) {
  CompletionResponse result;
  result.model = body.value("model", "");

  if (body.contains("message") && body["message"].is_object()) {
    const auto& message = body["message"];
    auto text = message.value("content", "");
    if (!text.empty()) {
      result.content.push_back(TextBlock{text});
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
      for (const auto& call : message["tool_calls"]) {
        const auto& function = call.at("function");
        result.content.push_back(decode_tool_call(call.value("id", ""), function.value("name", ""), function.value("arguments", json())));
      }
    }
  }

  result.stop_reason = body.value("done_reason", "") == "length" ? StopReason::MaxTokens : StopReason::EndTurn;
  append_usage(result.usage, body, "prompt_eval_count", "eval_count");

  result.normalize();
  return result;
}

// ============================================================
// Factory
// ============================================================

std::shared_ptr<Provider> create_provider(const ProviderConfig& config, std::shared_ptr<net::Transport> transport) {
  if (config.name == "anthropic") {
    return std::make_shared<AnthropicProvider>(config, std::move(transport));
  }
  if (config.name == "ollama") {
    return std::make_shared<OllamaProvider>(config, std::move(transport));
  }
  if (auto spec = openai_compatible_spec(config.name)) {
    return std::make_shared<OpenAIProvider>(config, std::move(transport), *spec);
  }
  spdlog::warn("[Provider] Unknown provider: {}", config.name);
  return nullptr;
}

}  // namespace clawcore::llm
