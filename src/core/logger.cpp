#include "core/logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace hookstack::core {

void init_logger(const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works; report and carry on.
            spdlog::warn("Cannot open log file {}: {}", log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hookstack", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [pid %P] %v");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback) {
    if (name.empty()) return fallback;
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"; only honour it when asked for.
    if (level == spdlog::level::off && name != "off") {
        return fallback;
    }
    return level;
}

} // namespace hookstack::core
