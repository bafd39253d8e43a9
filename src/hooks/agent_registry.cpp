#include "hooks/agent_registry.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace hookstack::hooks {

json AgentInfo::to_json() const {
    return json{
        {"name", display_name},
        {"description", description},
        {"keywords", keywords},
        {"depends_on", depends_on},
        {"default_tier", core::model_tier_to_string(default_tier)},
        {"priority", priority}
    };
}

AgentInfo AgentInfo::from_json(const std::string& id, const json& j) {
    AgentInfo info;
    info.id = id;
    info.display_name = j.value("name", id);
    info.description = j.value("description", "");
    if (j.contains("keywords") && j["keywords"].is_array()) {
        info.keywords = j["keywords"].get<std::vector<std::string>>();
    }
    if (j.contains("depends_on") && j["depends_on"].is_array()) {
        info.depends_on = j["depends_on"].get<std::vector<std::string>>();
    }
    std::string tier = j.value("default_tier", "default");
    auto parsed = core::model_tier_from_string(tier);
    if (!parsed) {
        spdlog::warn("Agent {}: unknown default_tier '{}', using default", id, tier);
    }
    info.default_tier = parsed.value_or(core::ModelTier::DEFAULT);
    info.priority = j.value("priority", 0);
    return info;
}

AgentRegistry AgentRegistry::builtin() {
    using core::ModelTier;
    struct Row {
        const char* id;
        const char* name;
        const char* description;
        std::vector<std::string> keywords;
        std::vector<std::string> depends_on;
        ModelTier tier;
        int priority;
    };

    static const std::vector<Row> rows = {
        {"orchestrator", "Master Orchestrator", "Project coordination and planning",
         {"project setup", "architecture", "planning"}, {}, ModelTier::POWERFUL, 100},
        {"frontend", "Frontend Architect", "UI/UX implementation and React development",
         {"ui", "frontend", "react", "component"}, {"backend"}, ModelTier::DEFAULT, 10},
        {"backend", "Backend Services Engineer", "API development and server-side logic",
         {"api", "backend", "server", "endpoint"}, {"database"}, ModelTier::DEFAULT, 10},
        {"database", "Database Architect", "Database design and optimization",
         {"database", "schema", "query", "migration"}, {}, ModelTier::DEFAULT, 10},
        {"devops", "DevOps Engineer", "Deployment and infrastructure",
         {"deploy", "docker", "ci/cd", "infrastructure"}, {"testing"}, ModelTier::FAST, 5},
        {"security", "Security Specialist", "Security analysis and implementation",
         {"security", "auth", "encryption", "vulnerability"}, {}, ModelTier::POWERFUL, 20},
        {"testing", "Testing Specialist", "Test implementation and quality assurance",
         {"test", "testing", "qa", "quality"}, {"backend", "frontend"}, ModelTier::FAST, 5},
        {"performance", "Performance Engineer", "Performance optimization and monitoring",
         {"performance", "optimize", "speed", "benchmark"}, {"backend"}, ModelTier::DEFAULT, 5},
        {"mobile", "Mobile Developer", "Mobile app development",
         {"mobile", "ios", "android", "react native"}, {}, ModelTier::DEFAULT, 0},
        {"ai", "AI/ML Engineer", "AI integration and machine learning",
         {"ai", "ml", "machine learning", "neural"}, {}, ModelTier::DEFAULT, 0},
        {"cloud", "Cloud Architect", "Cloud services and architecture",
         {"aws", "azure", "gcp", "cloud"}, {}, ModelTier::DEFAULT, 0},
        {"data", "Data Engineer", "Data pipelines and analytics",
         {"etl", "data pipeline", "analytics", "warehouse"}, {}, ModelTier::DEFAULT, 0},
        {"blockchain", "Blockchain Developer", "Blockchain and smart contracts",
         {"blockchain", "smart contract", "web3", "crypto"}, {}, ModelTier::DEFAULT, 0},
        {"game", "Game Developer", "Game development and engines",
         {"game", "unity", "unreal", "gaming"}, {}, ModelTier::DEFAULT, 0},
        {"iot", "IoT Engineer", "IoT devices and embedded systems",
         {"iot", "embedded", "sensor", "device"}, {}, ModelTier::DEFAULT, 0},
        {"ar", "AR/VR Developer", "Augmented and Virtual Reality",
         {"ar", "vr", "augmented", "virtual reality"}, {}, ModelTier::DEFAULT, 0},
        {"desktop", "Desktop App Developer", "Desktop application development",
         {"desktop", "electron", "native app"}, {}, ModelTier::DEFAULT, 0},
        {"embedded", "Embedded Systems Engineer", "Embedded systems and firmware",
         {"embedded", "firmware", "microcontroller"}, {}, ModelTier::DEFAULT, 0},
        {"network", "Network Engineer", "Network architecture and protocols",
         {"network", "tcp/ip", "routing", "protocol"}, {}, ModelTier::DEFAULT, 0},
        {"graphics", "Graphics Programmer", "Graphics programming and shaders",
         {"graphics", "shader", "opengl", "rendering"}, {}, ModelTier::DEFAULT, 0},
        {"audio", "Audio Engineer", "Audio processing and synthesis",
         {"audio", "sound", "music", "synthesis"}, {}, ModelTier::DEFAULT, 0},
        {"video", "Video Engineer", "Video processing and streaming",
         {"video", "streaming", "encoding", "codec"}, {}, ModelTier::DEFAULT, 0},
        {"compiler", "Compiler Engineer", "Compiler design and optimization",
         {"compiler", "parser", "ast", "optimization"}, {}, ModelTier::POWERFUL, 0},
        {"os", "OS Developer", "Operating system development",
         {"os", "kernel", "driver", "system"}, {}, ModelTier::POWERFUL, 0},
        {"quantum", "Quantum Computing Engineer", "Quantum algorithms and computing",
         {"quantum", "qubit", "quantum computing"}, {}, ModelTier::POWERFUL, 0},
        {"robotics", "Robotics Engineer", "Robotics and automation",
         {"robot", "robotics", "automation", "ros"}, {}, ModelTier::DEFAULT, 0},
        {"bioinformatics", "Bioinformatics Engineer", "Computational biology and genomics",
         {"bioinformatics", "genomics", "dna", "protein"}, {}, ModelTier::DEFAULT, 0},
        {"fintech", "FinTech Developer", "Financial technology and trading",
         {"fintech", "trading", "payment", "banking"}, {}, ModelTier::DEFAULT, 0},
    };

    AgentRegistry registry;
    for (const auto& row : rows) {
        AgentInfo info;
        info.id = row.id;
        info.display_name = row.name;
        info.description = row.description;
        info.keywords = row.keywords;
        info.depends_on = row.depends_on;
        info.default_tier = row.tier;
        info.priority = row.priority;
        registry.add(std::move(info));
    }
    return registry;
}

AgentRegistry AgentRegistry::from_json(const json& j) {
    AgentRegistry registry;
    if (!j.contains("agents") || !j["agents"].is_object()) {
        throw std::invalid_argument("registry must contain an \"agents\" object");
    }
    for (auto& [id, body] : j["agents"].items()) {
        if (!body.is_object()) {
            spdlog::warn("Registry entry {} is not an object, skipping", id);
            continue;
        }
        registry.add(AgentInfo::from_json(id, body));
    }

    // Dependencies on unknown agents are dropped so routing never waits on them.
    for (auto& [id, info] : registry.agents_) {
        auto& deps = info.depends_on;
        for (auto it = deps.begin(); it != deps.end(); ) {
            if (registry.agents_.count(*it) == 0) {
                spdlog::warn("Agent {} depends on unknown agent {}, ignoring", id, *it);
                it = deps.erase(it);
            } else {
                ++it;
            }
        }
    }
    return registry;
}

AgentRegistry AgentRegistry::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return builtin();
    }

    try {
        std::ifstream file(path);
        json j = json::parse(file);
        auto registry = from_json(j);
        spdlog::debug("Loaded {} agents from {}", registry.size(), path.string());
        return registry;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load agent registry {}: {} (using built-in registry)",
                      path.string(), e.what());
        return builtin();
    }
}

void AgentRegistry::add(AgentInfo info) {
    std::string id = info.id;
    agents_[id] = std::move(info);
}

bool AgentRegistry::contains(const std::string& id) const {
    return agents_.count(id) > 0;
}

const AgentInfo* AgentRegistry::find(const std::string& id) const {
    auto it = agents_.find(id);
    return (it != agents_.end()) ? &it->second : nullptr;
}

std::vector<const AgentInfo*> AgentRegistry::all() const {
    std::vector<const AgentInfo*> out;
    out.reserve(agents_.size());
    for (const auto& [id, info] : agents_) {
        out.push_back(&info);
    }
    return out;
}

} // namespace hookstack::hooks
