#pragma once
#include <filesystem>
#include <string>

namespace hookstack::core::paths {

// Name of the engine's directory under the project root.
inline constexpr const char* kHookstackDirName = ".hookstack";

// Project root: HOOKSTACK_PROJECT_DIR, then CLAUDE_PROJECT_DIR, then the
// current working directory.
std::filesystem::path project_dir();

// <project>/.hookstack
std::filesystem::path hookstack_dir(const std::filesystem::path& project);

// <project>/.hookstack/sessions/<sanitized id>
std::filesystem::path session_dir(const std::filesystem::path& project,
                                  const std::string& session_id);

// Map a host session id onto a safe single path component.
// Empty ids become "default".
std::string sanitize_session_id(const std::string& session_id);

// Resolve `relative` against the project root unless already absolute.
std::filesystem::path resolve(const std::filesystem::path& project,
                              const std::string& relative);

} // namespace hookstack::core::paths
