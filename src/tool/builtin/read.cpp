#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "clawcore/tool/builtin/builtins.hpp"

namespace clawcore::tools {

namespace fs = std::filesystem;

// ============================================================================
// ReadTool
// ============================================================================

ReadTool::ReadTool() : SimpleTool("read", "Reads a file. Returns the file content with line numbers.", ToolCategory::Coding) {}

std::vector<ParameterSchema> ReadTool::parameters() const {
  return {{"path", "string", "Absolute or relative path to the file to read", true, std::nullopt, std::nullopt},
          {"startLine", "integer", "Starting line number (1-indexed, optional)", false, std::nullopt, std::nullopt},
          {"endLine", "integer", "Ending line number (1-indexed, inclusive, optional)", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ReadTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("path", "");
    int start_line = std::max(1, args.value("startLine", 1));
    int end_line = args.value("endLine", 0);

    if (file_path.empty()) {
      return ToolResult::error(ToolErrorKind::InvalidArguments, "path is required");
    }

    fs::path path = file_path;
    if (!path.is_absolute()) {
      path = ctx.workspace / path;
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return ToolResult::error("File not found: " + path.string());
    }

    if (fs::is_directory(path, ec)) {
      return ToolResult::error("Path is a directory, not a file: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
      return ToolResult::error("Failed to open file: " + path.string());
    }

    std::ostringstream output;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
      line_num++;

      if (line_num < start_line) continue;
      if (end_line > 0 && line_num > end_line) break;

      output << std::setw(5) << line_num << "\t" << line << "\n";
    }

    auto result = ToolResult::with_title(output.str(), path.filename().string());
    result.metadata["path"] = path.string();
    return result;
  });
}

}  // namespace clawcore::tools
