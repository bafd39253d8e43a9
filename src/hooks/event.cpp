#include "hooks/event.hpp"
#include <algorithm>
#include <array>
#include <cmath>

using json = nlohmann::json;

namespace hookstack::hooks {

namespace {

constexpr std::array<const char*, 4> kWriteTools = {"Write", "Edit", "MultiEdit", "NotebookEdit"};

constexpr uint64_t kSecondsCutoff = 100000000000ULL;   // smaller values are epoch seconds
constexpr int64_t kMaxEpochMs = 4102444799999LL;        // 2099-12-31T23:59:59.999Z

// Timestamps arrive either as epoch milliseconds or as epoch seconds. Values
// outside [1970, 2099] are clamped.
std::optional<core::TimePoint> parse_timestamp(const json& j) {
    if (!j.contains("timestamp")) return std::nullopt;
    const auto& ts = j["timestamp"];
    if (ts.is_number_integer()) {
        uint64_t v = 0;
        if (ts.is_number_unsigned()) {
            v = ts.get<uint64_t>();
        } else if (ts.get<int64_t>() > 0) {
            v = static_cast<uint64_t>(ts.get<int64_t>());
        }
        if (v < kSecondsCutoff) v *= 1000;
        v = std::min<uint64_t>(v, static_cast<uint64_t>(kMaxEpochMs));
        return core::from_epoch_ms(static_cast<int64_t>(v));
    }
    if (ts.is_number_float()) {
        double ms = ts.get<double>() * 1000.0;
        if (std::isnan(ms)) return std::nullopt;
        ms = std::clamp(ms, 0.0, static_cast<double>(kMaxEpochMs));
        return core::from_epoch_ms(static_cast<int64_t>(ms));
    }
    return std::nullopt;
}

std::optional<double> number_field(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

std::string string_field(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

// Text that may carry routing directives for this kind of event.
std::string extract_text(HookKind kind, const json& j, const json& tool_input) {
    if (kind == HookKind::USER_PROMPT_SUBMIT) {
        auto prompt = string_field(j, "prompt");
        return prompt.empty() ? string_field(j, "user_prompt") : prompt;
    }
    if (kind == HookKind::PRE_TOOL_USE) {
        auto prompt = string_field(tool_input, "prompt");
        if (!prompt.empty()) return prompt;
        return string_field(tool_input, "description");
    }
    return {};
}

} // namespace

bool is_write_tool(const std::string& tool_name) {
    for (const char* t : kWriteTools) {
        if (tool_name == t) return true;
    }
    return false;
}

bool is_write_gating_payload(const json& j) {
    if (!j.is_object()) return false;
    auto name = string_field(j, "hook_event_name");
    if (name.empty()) name = string_field(j, "event");
    auto kind = hook_kind_from_string(name);
    return kind == HookKind::PRE_TOOL_USE && is_write_tool(string_field(j, "tool_name"));
}

bool HookEvent::is_write_gating() const {
    return kind == HookKind::PRE_TOOL_USE && is_write_tool(tool_name);
}

bool HookEvent::is_mcp_tool() const {
    return tool_name.rfind("mcp__", 0) == 0;
}

bool HookEvent::is_agent_task() const {
    return tool_name == "Task";
}

uint64_t event_sequence(HookKind kind, const std::string& session_id,
                        const json& payload, core::TimePoint timestamp) {
    uint64_t digest = core::fnv1a64(hook_kind_to_string(kind));
    digest = core::fnv1a64(session_id, digest);
    digest = core::fnv1a64(payload.dump(), digest);
    auto ms = static_cast<uint64_t>(core::to_epoch_ms(timestamp));
    return (ms << 16) | (digest & 0xffffULL);
}

HookEvent parse_hook_event(const json& j, core::TimePoint now) {
    if (!j.is_object()) {
        throw EventParseError("hook event must be a JSON object");
    }

    std::string name = string_field(j, "hook_event_name");
    if (name.empty()) {
        name = string_field(j, "event");
    }
    auto kind = hook_kind_from_string(name);
    if (!kind) {
        throw EventParseError("unsupported hook event '" + name + "'");
    }

    HookEvent event;
    event.kind = *kind;
    event.session_id = string_field(j, "session_id");
    if (event.session_id.empty()) {
        event.session_id = "default";
    }
    event.payload = j;
    event.tool_name = string_field(j, "tool_name");
    event.tool_input = (j.contains("tool_input") && j["tool_input"].is_object())
        ? j["tool_input"] : json::object();
    event.source = string_field(j, "source");
    event.text = extract_text(event.kind, j, event.tool_input);
    event.timestamp = parse_timestamp(j).value_or(now);

    if (auto usage = number_field(j, "context_usage")) {
        event.context_usage = usage;
    } else if (j.contains("context_window") && j["context_window"].is_object()) {
        const auto& cw = j["context_window"];
        double used = number_field(cw, "used_tokens").value_or(0.0);
        double limit = number_field(cw, "limit_tokens").value_or(0.0);
        if (limit > 0.0) {
            event.context_usage = used / limit;
        }
    }
    if (j.contains("context_limit_approaching") && j["context_limit_approaching"].is_boolean()) {
        event.context_limit_approaching = j["context_limit_approaching"].get<bool>();
    }

    event.sequence = event_sequence(event.kind, event.session_id, j, event.timestamp);
    return event;
}

} // namespace hookstack::hooks
