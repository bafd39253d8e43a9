#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookstack::engine {

// Lifecycle of one event through the pipeline. BLOCKED short-circuits the
// remaining stages.
enum class Stage {
    RECEIVED,
    PARSED,
    ROUTED,
    GATED,
    QUALITY_CHECKED,
    PERSISTED,
    COMPLETE,
    BLOCKED
};

inline const char* stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::RECEIVED:        return "received";
        case Stage::PARSED:          return "parsed";
        case Stage::ROUTED:          return "routed";
        case Stage::GATED:           return "gated";
        case Stage::QUALITY_CHECKED: return "quality_checked";
        case Stage::PERSISTED:       return "persisted";
        case Stage::COMPLETE:        return "complete";
        case Stage::BLOCKED:         return "blocked";
        default: return "unknown";
    }
}

// The single answer returned to the host for one event.
struct Decision {
    bool admit = true;
    std::string message;
    std::vector<std::string> side_effects;
    std::optional<nlohmann::json> plan;
    Stage stage = Stage::RECEIVED;
    bool internal_fault = false;

    // Append to the message, one line per note.
    void note(const std::string& line);

    nlohmann::json to_json() const;
};

} // namespace hookstack::engine
