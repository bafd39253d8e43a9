#include "gateway/gateway.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace hookstack::gateway {

namespace {

constexpr size_t kMaxScannedLine = 16384;

std::vector<std::pair<std::string, std::regex>> compile(const std::vector<SensitivePattern>& patterns) {
    std::vector<std::pair<std::string, std::regex>> out;
    for (const auto& p : patterns) {
        try {
            auto flags = std::regex::ECMAScript;
            if (p.icase) flags |= std::regex::icase;
            out.emplace_back(p.name, std::regex(p.expression, flags));
        } catch (const std::regex_error& e) {
            spdlog::warn("Gateway: invalid pattern '{}': {}", p.expression, e.what());
        }
    }
    return out;
}

// Remove expired leases. Returns true if anything changed.
bool purge_leases(json& in_flight, int64_t now_ms) {
    bool changed = false;
    for (auto it = in_flight.begin(); it != in_flight.end();) {
        auto& leases = it.value();
        if (!leases.is_array()) {
            it = in_flight.erase(it);
            changed = true;
            continue;
        }
        json live = json::array();
        for (const auto& lease : leases) {
            if (lease.is_object() && lease.value("expires_ms", int64_t{0}) > now_ms) {
                live.push_back(lease);
            }
        }
        if (live.size() != leases.size()) {
            changed = true;
        }
        if (live.empty()) {
            it = in_flight.erase(it);
        } else {
            leases = std::move(live);
            ++it;
        }
    }
    return changed;
}

json& ensure_object(json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_object()) {
        doc[key] = json::object();
    }
    return doc[key];
}

} // namespace

json GatewayDecision::to_json() const {
    json j = {
        {"allowed", allowed},
        {"remaining", remaining}
    };
    if (!allowed) {
        j["reason"] = deny_reason_to_string(reason);
        j["message"] = message;
    }
    if (reason == DenyReason::RATE_LIMIT_EXCEEDED) {
        j["retry_after_ms"] = retry_after.count();
    }
    return j;
}

Gateway::Gateway(GatewayConfig config, std::filesystem::path ledger_path)
    : config_(std::move(config))
    , ledger_(std::move(ledger_path), config_.lock_timeout) {
    for (auto& [name, re] : compile(config_.sensitive_patterns)) {
        global_patterns_.push_back({name, std::move(re)});
    }
    for (const auto& [service, policy] : config_.services) {
        auto& compiled = service_patterns_[service];
        for (auto& [name, re] : compile(policy.sensitive_patterns)) {
            compiled.push_back({name, std::move(re)});
        }
    }
}

std::string Gateway::policy_violation(const ServicePolicy& policy, const MCPRequest& request) const {
    if (policy.max_payload_bytes > 0 && request.payload_text.size() > policy.max_payload_bytes) {
        return "max-payload-bytes";
    }

    const std::string lowered = core::to_lower(request.payload_text);
    for (const auto& blocked : policy.blocked_substrings) {
        if (!blocked.empty() && lowered.find(core::to_lower(blocked)) != std::string::npos) {
            return "blocked:" + blocked;
        }
    }

    auto service_it = service_patterns_.find(policy.name);
    const std::string& text = request.payload_text;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        // Longer lines are not handed to std::regex.
        if (end - start > kMaxScannedLine) {
            return "max-field-bytes";
        }
        auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
        auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
        for (const auto& p : global_patterns_) {
            if (std::regex_search(first, last, p.re)) return p.name;
        }
        if (service_it != service_patterns_.end()) {
            for (const auto& p : service_it->second) {
                if (std::regex_search(first, last, p.re)) return p.name;
            }
        }
        start = end + 1;
    }
    return "";
}

bool Gateway::evaluate(json& doc, const MCPRequest& request, const ServicePolicy& policy,
                       const std::string& violation, int64_t now_ms, bool commit,
                       GatewayDecision& decision) const {
    decision = GatewayDecision{};
    const int64_t window_ms = policy.window.count();
    bool changed = false;

    json& windows = ensure_object(doc, "windows");
    json& in_flight = ensure_object(doc, "in_flight");
    changed |= purge_leases(in_flight, now_ms);

    const bool already_in_flight = in_flight.contains(request.service);
    if (!already_in_flight && in_flight.size() >= config_.max_concurrent_services) {
        decision.reason = DenyReason::TOOL_BUDGET_EXCEEDED;
        decision.message = "Concurrent tool budget of " +
            std::to_string(config_.max_concurrent_services) + " services exhausted";
        return changed;
    }

    json& window = windows[request.service];
    if (!window.is_object()) {
        window = json::object();
    }
    int64_t window_start = window.value("window_start_ms", int64_t{0});
    uint32_t count = window.value("count", 0u);
    if (!window.contains("window_start_ms") || now_ms - window_start >= window_ms ||
        now_ms < window_start) {
        window_start = now_ms;
        count = 0;
        changed = true;
    }
    window["window_start_ms"] = window_start;
    window["count"] = count;
    window["limit"] = policy.limit;
    window["window_ms"] = window_ms;

    if (count >= policy.limit) {
        decision.reason = DenyReason::RATE_LIMIT_EXCEEDED;
        decision.retry_after = std::chrono::milliseconds(
            std::max<int64_t>(1, window_start + window_ms - now_ms));
        decision.message = "Rate limit for '" + request.service + "' reached (" +
            std::to_string(policy.limit) + " per " + std::to_string(window_ms / 1000) +
            "s); retry in " + std::to_string((decision.retry_after.count() + 999) / 1000) + "s";
        return changed;
    }

    if (!violation.empty()) {
        decision.reason = DenyReason::POLICY_VIOLATION;
        decision.message = "Request to '" + request.service + "' violates policy '" + violation + "'";
        decision.remaining = policy.limit - count;
        spdlog::warn("Gateway policy violation {} on {} (payload {})",
                     violation, request.service, request.payload_digest);
        return changed;
    }

    decision.allowed = true;
    if (!commit) {
        decision.remaining = policy.limit - count;
        return changed;
    }
    window["count"] = count + 1;
    in_flight[request.service].push_back(json{
        {"expires_ms", now_ms + config_.lease_ttl.count()},
        {"digest", request.payload_digest}
    });
    decision.remaining = policy.limit - (count + 1);
    return true;
}

GatewayDecision Gateway::admit(const MCPRequest& request, core::TimePoint now) {
    GatewayDecision decision;

    auto policy_it = config_.services.find(request.service);
    if (policy_it == config_.services.end()) {
        decision.reason = DenyReason::SERVICE_NOT_ALLOWED;
        decision.message = "Service '" + request.service + "' is not on the allowlist";
        spdlog::info("Gateway deny {}: not allowed", request.service);
        return decision;
    }
    const ServicePolicy& policy = policy_it->second;
    const int64_t now_ms = core::to_epoch_ms(now);

    // Content rules are pure; evaluate before taking the lock, report in order.
    const std::string violation = policy_violation(policy, request);

    ledger_.update([&](json& doc) {
        return evaluate(doc, request, policy, violation, now_ms, true, decision);
    });

    if (decision.allowed) {
        spdlog::debug("Gateway allow {}.{} ({} remaining)", request.service, request.operation,
                      decision.remaining);
    } else if (decision.reason != DenyReason::POLICY_VIOLATION) {
        spdlog::info("Gateway deny {}: {}", request.service, deny_reason_to_string(decision.reason));
    }
    return decision;
}

GatewayDecision Gateway::preview(const MCPRequest& request, core::TimePoint now) const {
    GatewayDecision decision;

    auto policy_it = config_.services.find(request.service);
    if (policy_it == config_.services.end()) {
        decision.reason = DenyReason::SERVICE_NOT_ALLOWED;
        decision.message = "Service '" + request.service + "' is not on the allowlist";
        return decision;
    }
    const int64_t now_ms = core::to_epoch_ms(now);
    const std::string violation = policy_violation(policy_it->second, request);

    json doc = json::object();
    try {
        doc = ledger_.read().value_or(json::object());
        evaluate(doc, request, policy_it->second, violation, now_ms, false, decision);
        return decision;
    } catch (const state::PersistenceError& e) {
        spdlog::error("PersistenceError: {}", e.what());
    } catch (const json::exception& e) {
        spdlog::error("PersistenceError: {}: malformed content: {}", ledger_.path().string(), e.what());
    }
    // The next admit() reinitializes a corrupt ledger; judge against an empty one.
    doc = json::object();
    evaluate(doc, request, policy_it->second, violation, now_ms, false, decision);
    return decision;
}

bool Gateway::release(const std::string& service, core::TimePoint now) {
    const int64_t now_ms = core::to_epoch_ms(now);
    bool released = false;

    ledger_.update([&](json& doc) {
        released = false;
        json& in_flight = ensure_object(doc, "in_flight");
        bool changed = purge_leases(in_flight, now_ms);
        if (!in_flight.contains(service)) {
            return changed;
        }

        auto& leases = in_flight[service];
        auto oldest = std::min_element(leases.begin(), leases.end(), [](const json& a, const json& b) {
            return a.value("expires_ms", int64_t{0}) < b.value("expires_ms", int64_t{0});
        });
        leases.erase(oldest);
        if (leases.empty()) {
            in_flight.erase(service);
        }
        released = true;
        return true;
    });

    if (!released) {
        spdlog::debug("Gateway release {}: no live lease", service);
    }
    return released;
}

json Gateway::status(core::TimePoint now) const {
    const int64_t now_ms = core::to_epoch_ms(now);
    json windows = json::object();
    json in_flight = json::object();
    try {
        json doc = ledger_.read().value_or(json::object());
        windows = doc.value("windows", json::object());
        in_flight = doc.value("in_flight", json::object());
        if (!windows.is_object()) windows = json::object();
        if (!in_flight.is_object()) in_flight = json::object();
        purge_leases(in_flight, now_ms);
        for (auto it = windows.begin(); it != windows.end(); ++it) {
            json& window = it.value();
            if (!window.is_object() || !window.value("count", json()).is_number_unsigned() ||
                !window.value("window_start_ms", json()).is_number_integer()) {
                window = json::object();
            }
        }
    } catch (const state::PersistenceError& e) {
        spdlog::error("PersistenceError: {}", e.what());
    } catch (const json::exception& e) {
        spdlog::error("PersistenceError: {}: malformed content: {}", ledger_.path().string(), e.what());
        windows = json::object();
        in_flight = json::object();
    }

    json services = json::object();
    for (const auto& [name, policy] : config_.services) {
        const int64_t window_ms = policy.window.count();
        uint32_t used = 0;
        int64_t resets_in = 0;
        if (windows.contains(name) && windows[name].is_object()) {
            int64_t start = windows[name].value("window_start_ms", int64_t{0});
            if (now_ms >= start && now_ms - start < window_ms) {
                used = windows[name].value("count", 0u);
                resets_in = start + window_ms - now_ms;
            }
        }
        services[name] = {
            {"limit", policy.limit},
            {"window_seconds", window_ms / 1000},
            {"used", used},
            {"remaining", used >= policy.limit ? 0u : policy.limit - used},
            {"resets_in_ms", resets_in},
            {"in_flight", in_flight.contains(name) ? in_flight[name].size() : 0}
        };
    }

    return json{
        {"services", services},
        {"in_flight_services", in_flight.size()},
        {"max_concurrent_services", config_.max_concurrent_services}
    };
}

} // namespace hookstack::gateway
