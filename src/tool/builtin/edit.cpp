#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "clawcore/sandbox/path_guard.hpp"
#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

namespace fs = std::filesystem;

// ============================================================================
// EditTool
// ============================================================================

EditTool::EditTool() : SimpleTool("edit", "Performs exact string replacements in a workspace file.", ToolCategory::Coding) {}

std::vector<ParameterSchema> EditTool::parameters() const {
  return {{"path", "string", "Path to the file to edit", true, std::nullopt, std::nullopt},
          {"find", "string", "Text to find", true, std::nullopt, std::nullopt},
          {"replace", "string", "Text to replace with", true, std::nullopt, std::nullopt},
          {"all", "boolean", "Replace all occurrences (default false)", false, json(false), std::nullopt}};
}

std::future<ToolResult> EditTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("path", "");
    std::string find = args.value("find", "");
    std::string replace = args.value("replace", "");
    bool replace_all = args.value("all", false);

    if (file_path.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "path is required");
    }
    if (find.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "find must not be empty");
    }

    auto check = sandbox::validate_path(file_path, ctx.workspace);
    if (!check.valid) {
      spdlog::warn("[EditTool] Rejected {}: {}", file_path, check.reason);
      return ToolResult::error(ToolErrorKind::PathValidation, check.reason + ": " + file_path);
    }
    const fs::path& path = check.resolved;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return ToolResult::error("File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      return ToolResult::error("Failed to open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    file.close();

    size_t count = 0;
    for (size_t pos = content.find(find); pos != std::string::npos; pos = content.find(find, pos + find.size())) {
      count++;
    }

    if (count == 0) {
      return ToolResult::error("Text not found in " + path.string());
    }

    if (count > 1 && !replace_all) {
      return ToolResult::error("Text found " + std::to_string(count) + " times in " + path.string() +
                               ". Use all=true to replace every occurrence, or include more context to make it unique.");
    }

    std::string new_content;
    size_t pos = 0;
    size_t replaced = 0;
    while (true) {
      size_t found = content.find(find, pos);
      if (found == std::string::npos || (replaced > 0 && !replace_all)) {
        new_content += content.substr(pos);
        break;
      }
      new_content += content.substr(pos, found - pos);
      new_content += replace;
      pos = found + find.size();
      replaced++;
    }

    std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
    if (!out_file.is_open()) {
      return ToolResult::error("Failed to write file: " + path.string());
    }
    out_file << new_content;

    auto result = ToolResult::with_title("Replaced " + std::to_string(replaced) + " occurrence(s) in " + path.string(), "Edited " + path.filename().string());
    result.metadata["replacements"] = replaced;
    return result;
  });
}

}  // namespace clawcore::tools
