#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace hookstack::core {

// Initialize logging. Console output goes to stderr because stdout carries
// the hook decision. An optional log file is added when `log_file` is set.
void init_logger(const std::string& log_file = "");

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("debug", "info", ...); `fallback` if unknown.
spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback);

} // namespace hookstack::core
