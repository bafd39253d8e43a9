#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "gateway/service_policy.hpp"
#include "hooks/router.hpp"
#include "quality/quality_gate.hpp"
#include "state/session_state.hpp"
#include "usage/usage_tracker.hpp"

namespace hookstack::engine {

// Session persistence and context-snapshot settings
struct SessionConfig {
    state::RetentionPolicy retention;
    size_t snapshot_tail = 10;              // decisions captured per snapshot
    double snapshot_threshold = 0.8;        // context_usage that triggers a snapshot
    std::chrono::milliseconds lock_timeout{2000};
};

// Everything the dispatcher needs, with built-in defaults for every field
struct EngineConfig {
    hooks::RoutingConfig routing;
    gateway::GatewayConfig gateway = gateway::GatewayConfig::defaults();
    SessionConfig session;
    std::vector<quality::QualityRule> quality_rules = quality::QualityGate::default_rules();
    quality::QualityLimits quality_limits;
    usage::UsageConfig usage;

    static EngineConfig from_json(const nlohmann::json& config);
};

// <project>/.hookstack/config.json
std::filesystem::path config_path(const std::filesystem::path& project_dir);

// <project>/.hookstack/agents.json
std::filesystem::path agents_path(const std::filesystem::path& project_dir);

// Defaults if the file is missing. A file that cannot be parsed is logged
// and ignored.
EngineConfig load_engine_config(const std::filesystem::path& project_dir);

} // namespace hookstack::engine
