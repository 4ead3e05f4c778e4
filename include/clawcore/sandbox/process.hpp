#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "clawcore/core/truncate.hpp"

namespace clawcore::sandbox {

// Exit codes reported for outcomes that have no real process status
constexpr int kExitTimeout = 124;
constexpr int kExitNotExecutable = 126;
constexpr int kExitNotFound = 127;
constexpr int kExitCancelled = 130;

struct ProcessOptions {
  // Program followed by its arguments; the program is looked up on PATH
  std::vector<std::string> argv;

  // Empty means inherit
  std::filesystem::path working_dir;

  // Added to (or overriding) the inherited environment
  std::map<std::string, std::string> env;

  std::chrono::milliseconds timeout{60000};

  // Time between SIGTERM and SIGKILL after a timeout
  std::chrono::milliseconds kill_grace{5000};

  // Independent cap for stdout and for stderr
  size_t max_output_bytes = Truncate::kDefaultMaxBytes;

  std::shared_ptr<std::atomic<bool>> abort_signal;
};

struct SandboxedProcessResult {
  bool success = false;
  std::string output;  // stdout, capped
  std::string error;   // stderr, capped, or the spawn failure message
  int exit_code = -1;

  bool killed = false;
  bool timed_out = false;
  bool cancelled = false;
  bool spawn_failed = false;

  std::chrono::milliseconds duration{0};
};

// Spawn the process in its own process group and supervise it until it
// exits, times out, or is cancelled. Never throws for child failures.
SandboxedProcessResult run_process(const ProcessOptions &options);

std::future<SandboxedProcessResult> run_process_async(ProcessOptions options);

// Interpreter argv for a script, by extension:
//   .sh -> bash, .py -> python3, .js -> node, .ts -> npx tsx
// Empty for anything else (executed directly).
std::vector<std::string> interpreter_for(const std::filesystem::path &script);

// Interpreter followed by the script path
std::vector<std::string> script_command(const std::filesystem::path &script);

}  // namespace clawcore::sandbox
