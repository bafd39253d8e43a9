#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "core/util.hpp"

namespace hookstack::hooks {

// Host lifecycle events the engine handles.
enum class HookKind {
    SESSION_START,
    SESSION_STOP,
    PRE_TOOL_USE,
    POST_TOOL_USE,
    USER_PROMPT_SUBMIT
};

inline std::string hook_kind_to_string(HookKind kind) {
    switch (kind) {
        case HookKind::SESSION_START:      return "SessionStart";
        case HookKind::SESSION_STOP:       return "SessionStop";
        case HookKind::PRE_TOOL_USE:       return "PreToolUse";
        case HookKind::POST_TOOL_USE:      return "PostToolUse";
        case HookKind::USER_PROMPT_SUBMIT: return "UserPromptSubmit";
        default: return "Unknown";
    }
}

// Accepts the host's "Stop" / "SubagentStop" names for SessionStop.
inline std::optional<HookKind> hook_kind_from_string(const std::string& str) {
    if (str == "SessionStart")     return HookKind::SESSION_START;
    if (str == "SessionStop" || str == "Stop" || str == "SubagentStop" || str == "SessionEnd")
        return HookKind::SESSION_STOP;
    if (str == "PreToolUse")       return HookKind::PRE_TOOL_USE;
    if (str == "PostToolUse")      return HookKind::POST_TOOL_USE;
    if (str == "UserPromptSubmit") return HookKind::USER_PROMPT_SUBMIT;
    return std::nullopt;
}

// The host sent something that is not a hook event we understand.
class EventParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One host invocation. Immutable after parse_hook_event().
struct HookEvent {
    HookKind kind = HookKind::USER_PROMPT_SUBMIT;
    std::string session_id;
    nlohmann::json payload;            // the raw event object
    std::string text;                  // free text scanned for mentions
    std::string tool_name;
    nlohmann::json tool_input;
    std::string source;                // SessionStart source ("startup", "compact", ...)
    core::TimePoint timestamp;
    std::optional<double> context_usage;   // fraction of the context window in use
    bool context_limit_approaching = false;
    uint64_t sequence = 0;             // stable across redelivery of the same event

    // Write-type tools are gated by the quality gate and fail closed.
    bool is_write_gating() const;
    bool is_mcp_tool() const;
    bool is_agent_task() const;
};

// Tool names that write file content.
bool is_write_tool(const std::string& tool_name);

// True for a raw PreToolUse object naming a write tool, whether or not the
// rest of it parses.
bool is_write_gating_payload(const nlohmann::json& j);

// Parse a host event object. `now` is used when the event carries no
// timestamp. Throws EventParseError.
HookEvent parse_hook_event(const nlohmann::json& j, core::TimePoint now);

// (timestamp_ms << 16) | low 16 bits of a digest over kind, session and payload.
uint64_t event_sequence(HookKind kind, const std::string& session_id,
                        const nlohmann::json& payload, core::TimePoint timestamp);

} // namespace hookstack::hooks
