#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "clawcore/sandbox/path_guard.hpp"
#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

namespace fs = std::filesystem;

// ============================================================================
// WriteTool
// ============================================================================

WriteTool::WriteTool() : SimpleTool("write", "Writes content to a file inside the workspace, creating parent directories.", ToolCategory::Coding) {}

std::vector<ParameterSchema> WriteTool::parameters() const {
  return {{"path", "string", "Absolute or relative path to the file to write", true, std::nullopt, std::nullopt},
          {"content", "string", "Content to write to the file", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> WriteTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("path", "");
    std::string content = args.value("content", "");

    if (file_path.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "path is required");
    }

    auto check = sandbox::validate_path(file_path, ctx.workspace);
    if (!check.valid) {
      spdlog::warn("[WriteTool] Rejected {}: {}", file_path, check.reason);
      return ToolResult::error(ToolErrorKind::PathValidation, check.reason + ": " + file_path);
    }
    const fs::path& path = check.resolved;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return ToolResult::error("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return ToolResult::error("Failed to open file for writing: " + path.string());
    }

    file << content;
    file.close();
    if (file.fail()) {
      return ToolResult::error("Failed to write file: " + path.string());
    }

    auto result = ToolResult::with_title("Wrote " + std::to_string(content.size()) + " bytes to " + path.string(), "Wrote " + path.filename().string());
    result.metadata["path"] = path.string();
    result.metadata["bytes"] = content.size();
    return result;
  });
}

}  // namespace clawcore::tools
