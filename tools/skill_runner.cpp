// clawcore-skill: file helpers for the bundled skill scripts.
//
// Reads SKILL_ARGS (JSON) and SKILL_CWD from the environment and prints one
// JSON object {success, output, error?, exitCode} on stdout.
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "clawcore/sandbox/path_guard.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int emit(bool success, const std::string &output, const std::string &error = "") {
  int exit_code = success ? 0 : 1;
  json out = {{"success", success}, {"output", output}, {"exitCode", exit_code}};
  if (!error.empty()) out["error"] = error;
  std::cout << out.dump() << std::endl;
  return exit_code;
}

std::string env_or(const char *name, const std::string &fallback) {
  const char *value = std::getenv(name);
  return value && *value ? value : fallback;
}

int write_file(const json &args, const fs::path &cwd) {
  std::string target = args.value("path", "");
  if (target.empty()) return emit(false, "", "path is required");
  if (!args.contains("content") || !args["content"].is_string()) return emit(false, "", "content must be a string");

  auto check = clawcore::sandbox::validate_path(target, cwd);
  if (!check.valid) return emit(false, "", check.reason + ": " + target);

  std::error_code ec;
  fs::create_directories(check.resolved.parent_path(), ec);
  if (ec) return emit(false, "", "Failed to create directory: " + ec.message());

  const auto content = args["content"].get<std::string>();
  std::ofstream file(check.resolved, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return emit(false, "", "Failed to open " + check.resolved.string());
  file << content;
  file.close();
  if (file.fail()) return emit(false, "", "Failed to write " + check.resolved.string());

  return emit(true, "Wrote " + std::to_string(content.size()) + " bytes to " + check.resolved.string());
}

int read_file(const json &args, const fs::path &cwd) {
  std::string target = args.value("path", "");
  if (target.empty()) return emit(false, "", "path is required");

  fs::path path = fs::path(target).is_absolute() ? fs::path(target) : cwd / target;
  path = path.lexically_normal();
  if (!clawcore::sandbox::is_within(path, cwd.lexically_normal())) {
    return emit(false, "", "Path escapes workspace: " + target);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return emit(false, "", "File not found: " + path.string());
  std::ostringstream ss;
  ss << file.rdbuf();
  return emit(true, ss.str());
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " write-file|read-file\n";
    return 2;
  }
  std::string command = argv[1];

  json args = json::parse(env_or("SKILL_ARGS", "{}"), nullptr, false);
  if (args.is_discarded() || !args.is_object()) {
    return emit(false, "", "SKILL_ARGS is not a JSON object");
  }
  fs::path cwd = fs::absolute(env_or("SKILL_CWD", fs::current_path().string()));

  if (command == "write-file") return write_file(args, cwd);
  if (command == "read-file") return read_file(args, cwd);
  return emit(false, "", "Unknown command: " + command);
}
