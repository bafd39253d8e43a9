#pragma once
#include <optional>
#include <string>

namespace hookstack::core {

// Cost/capability class an agent invocation runs at.
enum class ModelTier {
    DEFAULT,
    FAST,
    POWERFUL
};

inline const char* model_tier_to_string(ModelTier tier) {
    switch (tier) {
        case ModelTier::FAST:     return "fast";
        case ModelTier::POWERFUL: return "powerful";
        default: return "default";
    }
}

// Accepts the tier names and the host's model family names as aliases.
inline std::optional<ModelTier> model_tier_from_string(const std::string& str) {
    if (str == "default" || str == "sonnet") return ModelTier::DEFAULT;
    if (str == "fast" || str == "haiku")     return ModelTier::FAST;
    if (str == "powerful" || str == "opus")  return ModelTier::POWERFUL;
    return std::nullopt;
}

} // namespace hookstack::core
