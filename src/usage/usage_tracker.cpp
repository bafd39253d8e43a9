#include "usage/usage_tracker.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>

using json = nlohmann::json;

namespace hookstack::usage {

namespace {

// Absorbs floating point drift in accumulated costs.
constexpr double kEpsilon = 1e-9;

std::string format_money(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.2f", value);
    return buf;
}

} // namespace

double UsageConfig::unit_cost(core::ModelTier tier) const {
    auto it = unit_costs.find(tier);
    return it != unit_costs.end() ? it->second : 0.0;
}

UsageConfig UsageConfig::from_json(const json& config) {
    UsageConfig result;
    if (!config.contains("usage") || !config["usage"].is_object()) {
        return result;
    }
    const auto& u = config["usage"];
    result.report_threshold = u.value("report_threshold", result.report_threshold);
    if (u.contains("unit_costs") && u["unit_costs"].is_object()) {
        for (auto& [name, cost] : u["unit_costs"].items()) {
            auto tier = core::model_tier_from_string(name);
            if (!tier || !cost.is_number()) {
                spdlog::warn("Ignoring unit cost for '{}'", name);
                continue;
            }
            result.unit_costs[*tier] = cost.get<double>();
        }
    }
    return result;
}

json UsageSummary::to_json() const {
    return json{
        {"total_calls", total_calls},
        {"actual_cost", actual_cost},
        {"powerful_cost", powerful_cost},
        {"savings", savings},
        {"baseline", baseline},
        {"reports_emitted", reports_emitted},
        {"calls_by_tier", calls_by_tier}
    };
}

std::string UsageReport::message() const {
    return "Model usage: " + std::to_string(totals.total_calls) + " agent calls cost " +
           format_money(totals.actual_cost) + " vs " + format_money(totals.powerful_cost) +
           " at the powerful tier (saved " + format_money(totals.savings) + ")";
}

json UsageReport::to_json() const {
    json j = {
        {"date", date},
        {"tier", core::model_tier_to_string(tier)},
        {"call_count", row_calls},
        {"estimated_cost", row_cost},
        {"report_due", report_due},
        {"totals", totals.to_json()}
    };
    if (report_due) {
        j["report"] = message();
    }
    return j;
}

UsageTracker::UsageTracker(UsageConfig config, std::filesystem::path usage_path)
    : config_(std::move(config))
    , file_(std::move(usage_path), config_.lock_timeout) {}

UsageSummary UsageTracker::summarize(const json& doc) const {
    UsageSummary s;
    s.baseline = doc.value("baseline_savings", 0.0);
    s.reports_emitted = doc.value("reports_emitted", uint64_t{0});

    const json rows = doc.value("rows", json::object());
    for (auto& [date, tiers] : rows.items()) {
        if (!tiers.is_object()) continue;
        for (auto& [tier_name, row] : tiers.items()) {
            auto tier = core::model_tier_from_string(tier_name);
            if (!tier || !row.is_object()) continue;
            uint64_t calls = row.value("call_count", uint64_t{0});
            s.total_calls += calls;
            s.calls_by_tier[core::model_tier_to_string(*tier)] += calls;
            s.actual_cost += row.value("estimated_cost", 0.0);
        }
    }
    s.powerful_cost = static_cast<double>(s.total_calls) * config_.unit_cost(core::ModelTier::POWERFUL);
    s.savings = s.powerful_cost - s.actual_cost;
    return s;
}

UsageReport UsageTracker::record(core::ModelTier tier, core::TimePoint now) {
    UsageReport report;
    report.date = core::utc_date(now);
    report.tier = tier;

    file_.update([&](json& doc) {
        report.report_due = false;
        if (!doc.contains("rows") || !doc["rows"].is_object()) {
            doc["rows"] = json::object();
        }
        json& row = doc["rows"][report.date][core::model_tier_to_string(tier)];
        if (!row.is_object()) {
            row = json::object();
        }
        report.row_calls = row.value("call_count", uint64_t{0}) + 1;
        report.row_cost = static_cast<double>(report.row_calls) * config_.unit_cost(tier);
        row["call_count"] = report.row_calls;
        row["estimated_cost"] = report.row_cost;

        report.totals = summarize(doc);
        if (report.totals.savings - report.totals.baseline + kEpsilon >= config_.report_threshold) {
            report.report_due = true;
            report.totals.baseline = report.totals.savings;
            report.totals.reports_emitted += 1;
            doc["baseline_savings"] = report.totals.baseline;
            doc["reports_emitted"] = report.totals.reports_emitted;
        }
        return true;
    });

    if (report.report_due) {
        spdlog::info("{}", report.message());
    }
    return report;
}

UsageSummary UsageTracker::summary() const {
    try {
        return summarize(file_.read().value_or(json::object()));
    } catch (const state::PersistenceError& e) {
        spdlog::error("PersistenceError: {}", e.what());
        return summarize(json::object());
    } catch (const json::exception& e) {
        spdlog::error("PersistenceError: {}: malformed content: {}", file_.path().string(), e.what());
        return summarize(json::object());
    }
}

} // namespace hookstack::usage
