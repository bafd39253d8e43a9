#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hookstack::core::config {

// Split one `.env` line into key and value. Blank lines, comments and lines
// without `=` yield nullopt. An `export ` prefix and matching quotes around
// the value are stripped.
std::optional<std::pair<std::string, std::string>> parse_env_line(std::string_view line);

// Export the entries of `<project_dir>/.env`. Variables already present in
// the environment win. Returns the number of variables set.
size_t load_dotenv(const std::filesystem::path& project_dir);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

} // namespace hookstack::core::config
