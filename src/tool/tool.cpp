#include "clawcore/tool/tool.hpp"

namespace clawcore {

namespace {

bool matches_type(const json &value, const std::string &type) {
  if (type == "string") return value.is_string();
  if (type == "number") return value.is_number();
  if (type == "integer") return value.is_number_integer();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

}  // namespace

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

ToolDefinition Tool::definition() const {
  json properties = json::object();
  json required_props = json::array();

  for (const auto &param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  return ToolDefinition{name(), description(), {{"type", "object"}, {"properties", properties}, {"required", required_props}}};
}

Result<json> Tool::validate_args(const json &args) const {
  if (!args.is_object()) {
    return Result<json>::failure("Arguments must be a JSON object");
  }

  for (const auto &param : parameters()) {
    if (!args.contains(param.name) || args[param.name].is_null()) {
      if (param.required) {
        return Result<json>::failure("Missing required parameter: " + param.name);
      }
      continue;
    }
    if (!matches_type(args[param.name], param.type)) {
      return Result<json>::failure("Parameter '" + param.name + "' must be of type " + param.type);
    }
  }

  return Result<json>::success(args);
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string name, std::string description, ToolCategory category)
    : name_(std::move(name)), description_(std::move(description)), category_(category) {}

std::future<ToolResult> ready_result(ToolResult result) {
  std::promise<ToolResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

}  // namespace clawcore
