#include "gateway/service_policy.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace hookstack::gateway {

namespace {

std::vector<SensitivePattern> patterns_from_json(const json& arr) {
    std::vector<SensitivePattern> out;
    if (!arr.is_array()) {
        return out;
    }
    for (const auto& item : arr) {
        if (item.is_string()) {
            out.push_back({item.get<std::string>(), item.get<std::string>(), false});
        } else if (item.is_object() && item.contains("pattern")) {
            SensitivePattern p;
            p.expression = item["pattern"].get<std::string>();
            p.name = item.value("name", p.expression);
            p.icase = item.value("icase", false);
            out.push_back(std::move(p));
        }
    }
    return out;
}

ServicePolicy make_policy(const std::string& name, uint32_t limit) {
    ServicePolicy p;
    p.name = name;
    p.limit = limit;
    return p;
}

} // namespace

ServicePolicy service_policy_from_json(const std::string& name, const json& j, ServicePolicy base) {
    base.name = name;
    base.limit = j.value("limit", base.limit);
    if (j.contains("window_seconds")) {
        base.window = std::chrono::milliseconds(
            static_cast<int64_t>(j["window_seconds"].get<double>() * 1000));
    }
    if (j.contains("blocked") && j["blocked"].is_array()) {
        base.blocked_substrings = j["blocked"].get<std::vector<std::string>>();
    }
    if (j.contains("sensitive_patterns")) {
        base.sensitive_patterns = patterns_from_json(j["sensitive_patterns"]);
    }
    base.max_payload_bytes = j.value("max_payload_bytes", base.max_payload_bytes);
    if (base.limit == 0 || base.window.count() <= 0) {
        spdlog::warn("Service '{}' has a non-positive limit or window; it will deny every call", name);
    }
    return base;
}

GatewayConfig GatewayConfig::defaults() {
    GatewayConfig config;

    auto playwright = make_policy("playwright", 10);
    playwright.blocked_substrings = {"file://", "chrome://", "about:", "javascript:"};

    auto obsidian = make_policy("obsidian", 30);
    obsidian.max_payload_bytes = 10 * 1024 * 1024;

    auto search = make_policy("web-search", 5);
    search.sensitive_patterns = {
        {"ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", false},
        {"card-number", R"(\b\d{16}\b)", false},
        {"long-token", R"(\b[A-Za-z0-9+/]{40,}\b)", false},
    };

    for (auto* p : {&playwright, &obsidian, &search}) {
        config.services[p->name] = *p;
    }
    config.services["filesystem"] = make_policy("filesystem", 60);
    config.services["git"] = make_policy("git", 60);
    config.services["github"] = make_policy("github", 30);
    config.services["memory"] = make_policy("memory", 60);
    config.services["context7"] = make_policy("context7", 20);

    config.sensitive_patterns = {
        {"password-assignment", R"(password\s*[:=])", true},
        {"aws-access-key", R"(AKIA[0-9A-Z]{16})", false},
        {"private-key", R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)", false},
        {"github-token", R"(gh[pousr]_[A-Za-z0-9]{36,})", false},
        {"api-secret-key", R"(\bsk-[A-Za-z0-9]{20,})", false},
    };
    return config;
}

GatewayConfig GatewayConfig::from_json(const json& config) {
    GatewayConfig result = defaults();

    if (config.contains("gateway") && config["gateway"].is_object()) {
        const auto& g = config["gateway"];
        result.max_concurrent_services = g.value("max_concurrent_services", result.max_concurrent_services);
        if (g.contains("lease_ttl_seconds")) {
            result.lease_ttl = std::chrono::milliseconds(
                static_cast<int64_t>(g["lease_ttl_seconds"].get<double>() * 1000));
        }
        if (g.contains("lock_timeout_ms")) {
            result.lock_timeout = std::chrono::milliseconds(g["lock_timeout_ms"].get<int64_t>());
        }
        if (g.contains("sensitive_patterns")) {
            result.sensitive_patterns = patterns_from_json(g["sensitive_patterns"]);
        }
    }

    if (config.contains("services") && config["services"].is_object()) {
        for (auto& [name, entry] : config["services"].items()) {
            if (!entry.is_object()) {
                spdlog::warn("Ignoring service '{}': entry is not an object", name);
                continue;
            }
            if (!entry.value("enabled", true)) {
                result.services.erase(name);
                continue;
            }
            auto it = result.services.find(name);
            ServicePolicy base = it != result.services.end() ? it->second : make_policy(name, 60);
            result.services[name] = service_policy_from_json(name, entry, base);
        }
    }
    return result;
}

} // namespace hookstack::gateway
