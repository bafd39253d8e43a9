#include "core/config.hpp"
#include <cstdlib>
#include <fstream>

namespace hookstack::core::config {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string_view unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_env_line(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') return std::nullopt;

    constexpr std::string_view export_prefix = "export ";
    if (line.substr(0, export_prefix.size()) == export_prefix) {
        line = trim(line.substr(export_prefix.size()));
    }

    auto eq = line.find('=');
    if (eq == std::string_view::npos) return std::nullopt;

    auto key = trim(line.substr(0, eq));
    if (key.empty()) return std::nullopt;
    auto value = unquote(trim(line.substr(eq + 1)));
    return std::make_pair(std::string(key), std::string(value));
}

size_t load_dotenv(const std::filesystem::path& project_dir) {
    std::ifstream file(project_dir / ".env");
    if (!file) return 0;

    size_t exported = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = parse_env_line(line);
        if (!entry || std::getenv(entry->first.c_str()) != nullptr) continue;
        if (::setenv(entry->first.c_str(), entry->second.c_str(), 0) == 0) ++exported;
    }
    return exported;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

} // namespace hookstack::core::config
