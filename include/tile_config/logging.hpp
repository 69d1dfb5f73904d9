#pragma once

#include <memory>
#include <string>

// Logging for the builder and its tools: one process-wide "tile_config"
// logger writing to the console and to a rotating JSON-lines file.
//
// spdlog is included with its own fmt selection; an inherited
// SPDLOG_FMT_EXTERNAL must not leak into it from the including unit.
#ifdef SPDLOG_FMT_EXTERNAL
#undef SPDLOG_FMT_EXTERNAL
#endif

#include <spdlog/logger.h>

namespace tile_config {

/** @brief Create the shared logger on first call; later calls return it unchanged. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error before initialize_logger has run. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Standalone stderr logger for diagnostic cache sinks; never registered globally. */
std::shared_ptr<spdlog::logger> make_stderr_logger(const std::string& name);

}  // namespace tile_config
