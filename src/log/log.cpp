#include "clawcore/log/log.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "clawcore/core/config.hpp"

namespace clawcore {

namespace {

namespace fs = std::filesystem;

// clawcore.log -> clawcore.0.log -> ... -> clawcore.{max_files-1}.log, oldest dropped
void rotate_logs_on_startup(const fs::path& log_dir, const std::string& stem, size_t max_files) {
  std::error_code ec;
  fs::path current_log = log_dir / (stem + ".log");
  if (!fs::exists(current_log, ec) || max_files == 0) {
    return;
  }

  auto numbered = [&](size_t i) { return log_dir / (stem + "." + std::to_string(i) + ".log"); };

  fs::remove(numbered(max_files - 1), ec);
  for (size_t i = max_files - 1; i > 0; --i) {
    if (fs::exists(numbered(i - 1), ec)) {
      fs::rename(numbered(i - 1), numbered(i), ec);
    }
  }
  fs::rename(current_log, numbered(0), ec);
}

spdlog::level::level_enum parse_level(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; keep info for typos instead
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "clawcore.log" : fs::path(log_path);
    fs::path log_dir = actual_path.parent_path();

    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(log_dir, actual_path.stem().string(), max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("clawcore", file_sink);

    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("clawcore");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // SPDLOG_LEVEL=debug etc.
    spdlog::cfg::load_env_levels();

    spdlog::info("=== clawcore started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace clawcore
