#include "core/paths.hpp"
#include "core/config.hpp"
#include <cctype>

namespace hookstack::core::paths {

std::filesystem::path project_dir() {
    auto dir = config::get_env("HOOKSTACK_PROJECT_DIR");
    if (dir.empty()) {
        dir = config::get_env("CLAUDE_PROJECT_DIR");
    }
    if (!dir.empty()) {
        return std::filesystem::path(dir);
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path hookstack_dir(const std::filesystem::path& project) {
    return project / kHookstackDirName;
}

std::filesystem::path session_dir(const std::filesystem::path& project,
                                  const std::string& session_id) {
    return hookstack_dir(project) / "sessions" / sanitize_session_id(session_id);
}

std::string sanitize_session_id(const std::string& session_id) {
    std::string out;
    out.reserve(session_id.size());
    for (char c : session_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    // Never allow "." or ".." as a component.
    if (out.empty() || out.find_first_not_of('.') == std::string::npos) {
        return "default";
    }
    return out;
}

std::filesystem::path resolve(const std::filesystem::path& project,
                              const std::string& relative) {
    std::filesystem::path p(relative);
    if (p.is_absolute()) {
        return p;
    }
    return project / p;
}

} // namespace hookstack::core::paths
