#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/model_tier.hpp"

namespace hookstack::hooks {

// Capability profile an event can be routed to.
struct AgentInfo {
    std::string id;                        // as written after "@agent-"
    std::string display_name;
    std::string description;
    std::vector<std::string> keywords;     // may contain multi-word phrases
    std::vector<std::string> depends_on;   // agents that must run first
    core::ModelTier default_tier = core::ModelTier::DEFAULT;
    int priority = 0;                      // higher wins ties in inferred routing

    nlohmann::json to_json() const;
    static AgentInfo from_json(const std::string& id, const nlohmann::json& j);
};

// Static mapping of agent identifiers to their declared capabilities.
class AgentRegistry {
public:
    AgentRegistry() = default;

    // The stock set of agent profiles shipped with the installer.
    static AgentRegistry builtin();

    // {"agents": {"<id>": {"name", "description", "keywords", "depends_on",
    //                      "default_tier", "priority"}}}
    static AgentRegistry from_json(const nlohmann::json& j);

    // Registry file if present, built-in registry otherwise. A file that
    // cannot be parsed is logged and ignored.
    static AgentRegistry load(const std::filesystem::path& path);

    void add(AgentInfo info);
    bool contains(const std::string& id) const;
    const AgentInfo* find(const std::string& id) const;

    // Sorted by identifier.
    std::vector<const AgentInfo*> all() const;
    size_t size() const { return agents_.size(); }

private:
    std::map<std::string, AgentInfo> agents_;
};

} // namespace hookstack::hooks
