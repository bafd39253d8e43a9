#include "engine/engine_config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

using json = nlohmann::json;

namespace hookstack::engine {

namespace {

hooks::RoutingConfig routing_from_json(const json& config) {
    hooks::RoutingConfig routing;
    if (!config.contains("routing") || !config["routing"].is_object()) {
        return routing;
    }
    const auto& r = config["routing"];
    routing.min_confidence = r.value("min_confidence", routing.min_confidence);
    routing.max_inferred_agents = r.value("max_inferred_agents", routing.max_inferred_agents);
    routing.coordinator = r.value("coordinator", routing.coordinator);
    if (r.contains("service_keywords") && r["service_keywords"].is_object()) {
        routing.service_keywords.clear();
        for (auto& [service, phrases] : r["service_keywords"].items()) {
            if (!phrases.is_array()) continue;
            for (const auto& phrase : phrases) {
                if (phrase.is_string()) {
                    routing.service_keywords[service].push_back(phrase.get<std::string>());
                }
            }
        }
    }
    if (r.contains("agent_services") && r["agent_services"].is_object()) {
        routing.agent_services.clear();
        for (auto& [agent, service] : r["agent_services"].items()) {
            if (service.is_string()) {
                routing.agent_services[agent] = service.get<std::string>();
            }
        }
    }
    return routing;
}

SessionConfig session_from_json(const json& config) {
    SessionConfig session;
    if (!config.contains("session") || !config["session"].is_object()) {
        return session;
    }
    const auto& s = config["session"];
    auto& retention = session.retention;
    retention.decision_retention = s.value("decision_retention", retention.decision_retention);
    retention.plan_retention = s.value("plan_retention", retention.plan_retention);
    retention.sequence_retention = s.value("sequence_retention", retention.sequence_retention);
    retention.snapshot_retention = s.value("snapshot_retention", retention.snapshot_retention);
    session.snapshot_tail = s.value("snapshot_tail", session.snapshot_tail);
    session.snapshot_threshold = s.value("snapshot_threshold", session.snapshot_threshold);
    if (s.contains("lock_timeout_ms")) {
        session.lock_timeout = std::chrono::milliseconds(s["lock_timeout_ms"].get<int64_t>());
    }
    return session;
}

} // namespace

EngineConfig EngineConfig::from_json(const json& config) {
    EngineConfig result;
    result.routing = routing_from_json(config);
    result.gateway = gateway::GatewayConfig::from_json(config);
    result.session = session_from_json(config);
    result.quality_rules = quality::QualityGate::rules_from_json(config);
    result.quality_limits = quality::QualityLimits::from_json(config);
    result.usage = usage::UsageConfig::from_json(config);
    result.usage.lock_timeout = result.session.lock_timeout;
    return result;
}

std::filesystem::path config_path(const std::filesystem::path& project_dir) {
    return core::paths::hookstack_dir(project_dir) / "config.json";
}

std::filesystem::path agents_path(const std::filesystem::path& project_dir) {
    return core::paths::hookstack_dir(project_dir) / "agents.json";
}

EngineConfig load_engine_config(const std::filesystem::path& project_dir) {
    const auto path = config_path(project_dir);
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No config at {}, using defaults", path.string());
        return EngineConfig{};
    }

    try {
        json config = json::parse(file);
        if (!config.is_object()) {
            spdlog::warn("Ignoring {}: top-level value is not an object", path.string());
            return EngineConfig{};
        }
        spdlog::debug("Loaded config from {}", path.string());
        return EngineConfig::from_json(config);
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring {}: {}", path.string(), e.what());
        return EngineConfig{};
    }
}

} // namespace hookstack::engine
