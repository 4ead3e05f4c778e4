#ifndef CLAWCORE_LOG_H
#define CLAWCORE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace clawcore {

/**
 * Initialize logging.
 *
 * Rotation happens once per process start:
 * - the previous clawcore.log is renamed to clawcore.0.log
 * - older logs shift up: clawcore.0.log -> clawcore.1.log -> ... -> clawcore.{max_files-1}.log
 * - the oldest one is deleted
 *
 * SPDLOG_LEVEL in the environment overrides @p level.
 *
 * @param log_path  log file path (default ~/.config/clawcore/log/clawcore.log)
 * @param max_files number of rotated logs kept
 * @param level     trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace clawcore

#endif  // CLAWCORE_LOG_H
