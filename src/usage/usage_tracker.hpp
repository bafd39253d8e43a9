#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "core/model_tier.hpp"
#include "core/util.hpp"
#include "state/json_file.hpp"

namespace hookstack::usage {

struct UsageConfig {
    std::map<core::ModelTier, double> unit_costs = {
        {core::ModelTier::FAST, 0.02},
        {core::ModelTier::DEFAULT, 0.12},
        {core::ModelTier::POWERFUL, 0.60},
    };
    double report_threshold = 1.00;   // savings since the last report
    std::chrono::milliseconds lock_timeout{2000};

    double unit_cost(core::ModelTier tier) const;

    // "usage": {"unit_costs": {"fast": 0.02, ...}, "report_threshold": 1.0}
    static UsageConfig from_json(const nlohmann::json& config);
};

// Totals across every (date, tier) row.
struct UsageSummary {
    uint64_t total_calls = 0;
    double actual_cost = 0.0;
    double powerful_cost = 0.0;   // the same calls, all at the powerful tier
    double savings = 0.0;
    double baseline = 0.0;        // savings at the last emitted report
    uint64_t reports_emitted = 0;
    std::map<std::string, uint64_t> calls_by_tier;

    nlohmann::json to_json() const;
};

// Result of recording one completed agent invocation.
struct UsageReport {
    std::string date;
    core::ModelTier tier = core::ModelTier::DEFAULT;
    uint64_t row_calls = 0;
    double row_cost = 0.0;
    bool report_due = false;      // savings crossed the threshold on this call
    UsageSummary totals;

    // Human-readable savings report; meaningful when report_due is set.
    std::string message() const;
    nlohmann::json to_json() const;
};

// Per-day, per-tier call counts in model_usage.json.
class UsageTracker {
public:
    static constexpr const char* kFileName = "model_usage.json";

    UsageTracker(UsageConfig config, std::filesystem::path usage_path);

    UsageReport record(core::ModelTier tier, core::TimePoint now);

    UsageSummary summary() const;

private:
    UsageConfig config_;
    state::JsonFile file_;

    UsageSummary summarize(const nlohmann::json& doc) const;
};

} // namespace hookstack::usage
