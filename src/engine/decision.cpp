#include "engine/decision.hpp"

namespace hookstack::engine {

void Decision::note(const std::string& line) {
    if (line.empty()) return;
    if (!message.empty()) message += "\n";
    message += line;
}

nlohmann::json Decision::to_json() const {
    nlohmann::json j = {
        {"admit", admit},
        {"stage", stage_to_string(stage)}
    };
    if (!message.empty()) {
        j["message"] = message;
    }
    if (!side_effects.empty()) {
        j["side_effects"] = side_effects;
    }
    if (plan) {
        j["plan"] = *plan;
    }
    if (internal_fault) {
        j["internal_fault"] = true;
    }
    return j;
}

} // namespace hookstack::engine
