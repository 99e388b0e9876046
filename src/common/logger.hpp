#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rlevel {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, early startup messages, tests).
// Safe to call more than once; later calls only adjust the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-database logger.
//   location – database directory, embedded in every log line as [db:<location>]
//   level    – initial log level
std::shared_ptr<spdlog::logger> make_db_logger(
    const std::string& location,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names a level parse_log_level() understands.
bool is_log_level(const std::string& s);

} // namespace rlevel
