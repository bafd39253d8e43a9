#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookstack::gateway {

// A regular expression a payload must not match.
struct SensitivePattern {
    std::string name;
    std::string expression;
    bool icase = false;
};

// Limits and content rules for one allowlisted service.
struct ServicePolicy {
    std::string name;
    uint32_t limit = 60;                                // admissions per window
    std::chrono::milliseconds window{60000};
    std::vector<std::string> blocked_substrings;         // matched case-insensitively
    std::vector<SensitivePattern> sensitive_patterns;    // in addition to the global ones
    size_t max_payload_bytes = 0;                        // 0 = unlimited
};

struct GatewayConfig {
    std::map<std::string, ServicePolicy> services;      // the allowlist
    uint32_t max_concurrent_services = 5;
    std::chrono::milliseconds lease_ttl{120000};
    std::vector<SensitivePattern> sensitive_patterns;
    std::chrono::milliseconds lock_timeout{2000};

    // Built-in allowlist and patterns.
    static GatewayConfig defaults();

    // Overlay the "gateway" and "services" sections of config.json onto the
    // defaults. A service entry with "enabled": false removes it.
    static GatewayConfig from_json(const nlohmann::json& config);
};

ServicePolicy service_policy_from_json(const std::string& name, const nlohmann::json& j,
                                       ServicePolicy base);

} // namespace hookstack::gateway
