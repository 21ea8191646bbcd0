#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace respc {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (used by the CLI and by connections
// that were not given a logger of their own).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named connection logger.
//   name   – embedded in every log line as [<name>], e.g. "conn-127.0.0.1:6379"
//   level  – initial log level
std::shared_ptr<spdlog::logger> make_connection_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names a level parse_log_level() understands.
[[nodiscard]] bool is_known_log_level(const std::string& s);

} // namespace respc
