#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/util.hpp"
#include "gateway/mcp_request.hpp"
#include "gateway/service_policy.hpp"
#include "state/json_file.hpp"

namespace hookstack::gateway {

enum class DenyReason {
    NONE,
    SERVICE_NOT_ALLOWED,
    TOOL_BUDGET_EXCEEDED,
    RATE_LIMIT_EXCEEDED,
    POLICY_VIOLATION
};

inline const char* deny_reason_to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::SERVICE_NOT_ALLOWED:  return "ServiceNotAllowed";
        case DenyReason::TOOL_BUDGET_EXCEEDED: return "ToolBudgetExceeded";
        case DenyReason::RATE_LIMIT_EXCEEDED:  return "RateLimitExceeded";
        case DenyReason::POLICY_VIOLATION:     return "PolicyViolation";
        default: return "None";
    }
}

struct GatewayDecision {
    bool allowed = false;
    DenyReason reason = DenyReason::NONE;
    std::string message;
    std::chrono::milliseconds retry_after{0};   // set for RATE_LIMIT_EXCEEDED
    uint32_t remaining = 0;                     // admissions left in the window

    nlohmann::json to_json() const;
};

// Admission control for external tool services. Window counters and
// in-flight leases live in one ledger file shared by every hook process.
class Gateway {
public:
    static constexpr const char* kFileName = "rate_limit_state.json";

    Gateway(GatewayConfig config, std::filesystem::path ledger_path);

    // Never waits for quota. On allow, the window count and a lease are
    // recorded in the same locked write.
    GatewayDecision admit(const MCPRequest& request, core::TimePoint now);

    // The decision admit() would make now, without counting the call or
    // taking a lease. Used for steps a plan expects to run later.
    GatewayDecision preview(const MCPRequest& request, core::TimePoint now) const;

    // Drop the oldest live lease held by `service`. False if none was held.
    bool release(const std::string& service, core::TimePoint now);

    // Per-service usage, without mutating the ledger.
    nlohmann::json status(core::TimePoint now) const;

    const GatewayConfig& config() const { return config_; }

private:
    struct CompiledPattern {
        std::string name;
        std::regex re;
    };

    GatewayConfig config_;
    state::JsonFile ledger_;
    std::vector<CompiledPattern> global_patterns_;
    std::map<std::string, std::vector<CompiledPattern>> service_patterns_;

    // Name of the violated rule, or empty.
    std::string policy_violation(const ServicePolicy& policy, const MCPRequest& request) const;

    // Concurrency, window and policy checks against `doc`. With `commit`, an
    // allowed call is counted and leased. Returns true if `doc` changed.
    bool evaluate(nlohmann::json& doc, const MCPRequest& request, const ServicePolicy& policy,
                  const std::string& violation, int64_t now_ms, bool commit,
                  GatewayDecision& decision) const;
};

} // namespace hookstack::gateway
