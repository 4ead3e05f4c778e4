#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "clawcore/core/errors.hpp"
#include "clawcore/core/message.hpp"
#include "clawcore/core/truncate.hpp"
#include "clawcore/core/types.hpp"

namespace clawcore {

// Tool execution context
struct ToolContext {
  SessionId session_id;

  // Root of all file-mutating operations
  std::filesystem::path workspace;

  // Abort signal
  std::shared_ptr<std::atomic<bool>> abort_signal;

  // Progress callback
  std::function<void(const std::string &status)> on_progress;

  bool aborted() const {
    return abort_signal && abort_signal->load();
  }
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata = json::object();
  bool is_error = false;
  std::optional<ToolErrorKind> error_kind;

  // Factory methods
  static ToolResult success(const std::string &output) {
    return ToolResult{output, std::nullopt, json::object(), false, std::nullopt};
  }

  static ToolResult error(const std::string &message) {
    return error(ToolErrorKind::ExecutionFailed, message);
  }

  static ToolResult error(ToolErrorKind kind, const std::string &message) {
    return ToolResult{message, std::nullopt, json::object(), true, kind};
  }

  static ToolResult with_title(const std::string &output, const std::string &title) {
    return ToolResult{output, title, json::object(), false, std::nullopt};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// A named capability the model may invoke
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  virtual ToolCategory category() const = 0;

  virtual std::vector<ParameterSchema> parameters() const = 0;

  virtual std::future<ToolResult> execute(const json &args, const ToolContext &ctx) = 0;

  // {name, description, input_schema} as handed to a provider
  ToolDefinition definition() const;

  // Checks required parameters and their JSON types
  Result<json> validate_args(const json &args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description, ToolCategory category);

  std::string name() const override {
    return name_;
  }

  std::string description() const override {
    return description_;
  }

  ToolCategory category() const override {
    return category_;
  }

 protected:
  std::string name_;
  std::string description_;
  ToolCategory category_;
};

// Already-completed future, for results known before any work starts
std::future<ToolResult> ready_result(ToolResult result);

}  // namespace clawcore
