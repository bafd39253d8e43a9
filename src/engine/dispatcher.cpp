#include "engine/dispatcher.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace hookstack::engine {

namespace {

std::string string_field(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

// File path and proposed content of a write-type tool call.
std::pair<std::string, std::string> write_target(const hooks::HookEvent& event) {
    const json& input = event.tool_input;
    if (event.tool_name == "NotebookEdit") {
        return {string_field(input, "notebook_path"), string_field(input, "new_source")};
    }
    if (event.tool_name == "Edit") {
        return {string_field(input, "file_path"), string_field(input, "new_string")};
    }
    if (event.tool_name == "MultiEdit") {
        std::string content;
        if (input.contains("edits") && input["edits"].is_array()) {
            for (const auto& edit : input["edits"]) {
                if (!content.empty()) content += "\n";
                content += string_field(edit, "new_string");
            }
        }
        return {string_field(input, "file_path"), content};
    }
    return {string_field(input, "file_path"), string_field(input, "content")};
}

state::SessionDelta delta_for(const hooks::HookEvent& event) {
    state::SessionDelta delta;
    delta.sequence = event.sequence;
    delta.timestamp_ms = core::to_epoch_ms(event.timestamp);
    return delta;
}

std::string route_error_lines(const std::vector<hooks::RouteError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "\n";
        out += "Route error: " + e.detail;
    }
    return out;
}

} // namespace

std::string plan_id_for(uint64_t sequence) {
    return "plan-" + core::to_hex(sequence);
}

Dispatcher::Dispatcher(EngineConfig config, hooks::AgentRegistry registry,
                       std::filesystem::path project_dir)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , project_dir_(std::move(project_dir))
    , parser_(registry_)
    , router_(registry_, config_.routing)
    , quality_(config_.quality_rules, config_.quality_limits)
    , store_(core::paths::hookstack_dir(project_dir_) / "sessions",
             config_.session.retention, config_.session.lock_timeout) {}

gateway::Gateway Dispatcher::gateway_for(const std::string& session_id) const {
    return gateway::Gateway(config_.gateway,
                            core::paths::session_dir(project_dir_, session_id) / gateway::Gateway::kFileName);
}

usage::UsageTracker Dispatcher::usage_for(const std::string& session_id) const {
    return usage::UsageTracker(config_.usage,
                               core::paths::session_dir(project_dir_, session_id) / usage::UsageTracker::kFileName);
}

Decision Dispatcher::dispatch(const hooks::HookEvent& event) {
    try {
        Decision decision = run(event);
        spdlog::debug("{} {} -> {} ({})", hooks::hook_kind_to_string(event.kind), event.session_id,
                      decision.admit ? "admit" : "block", stage_to_string(decision.stage));
        return decision;
    } catch (const std::exception& e) {
        spdlog::error("Internal fault handling {} for {}: {}",
                      hooks::hook_kind_to_string(event.kind), event.session_id, e.what());
        Decision decision;
        decision.internal_fault = true;
        if (event.is_write_gating()) {
            decision.admit = false;
            decision.stage = Stage::BLOCKED;
            decision.message = std::string("Write blocked: internal error in hookstack: ") + e.what();
        } else {
            decision.admit = true;
            decision.stage = Stage::COMPLETE;
            decision.message = std::string("Warning: hookstack internal error: ") + e.what();
        }
        return decision;
    }
}

Decision Dispatcher::run(const hooks::HookEvent& event) {
    Decision decision;
    decision.stage = Stage::RECEIVED;

    switch (event.kind) {
        case hooks::HookKind::SESSION_START:      return on_session_start(event, std::move(decision));
        case hooks::HookKind::SESSION_STOP:       return on_session_stop(event, std::move(decision));
        case hooks::HookKind::USER_PROMPT_SUBMIT: return on_prompt(event, std::move(decision));
        case hooks::HookKind::PRE_TOOL_USE:       return on_pre_tool(event, std::move(decision));
        case hooks::HookKind::POST_TOOL_USE:      return on_post_tool(event, std::move(decision));
    }
    decision.stage = Stage::COMPLETE;
    return decision;
}

Decision Dispatcher::on_session_start(const hooks::HookEvent& event, Decision decision) {
    const int64_t now_ms = core::to_epoch_ms(event.timestamp);
    decision.stage = Stage::ROUTED;

    if (store_.ensure(event.session_id, now_ms)) {
        decision.side_effects.push_back("session:initialized");
    }

    if (event.source == "compact" || event.source == "resume") {
        auto token = store_.latest_snapshot(event.session_id);
        std::optional<state::SessionState> restored;
        if (token) {
            restored = store_.restore(*token);
        }
        if (restored) {
            state::SessionDelta delta = delta_for(event);
            for (const auto& agent : restored->active_agents()) {
                delta.agents_added.push_back(agent);
            }
            delta.decisions = restored->recent_decisions;
            delta.attributes["restored_from"] = *token;
            persist(event, std::move(delta), "restored snapshot " + *token, true, decision);
            decision.side_effects.push_back("restored:" + *token);
            decision.note("Restored " + std::to_string(restored->active_agents().size()) +
                          " active agents from snapshot " + *token);
            maybe_snapshot(event, decision);
            decision.stage = Stage::COMPLETE;
            return decision;
        }
    }

    persist(event, delta_for(event), "session start (" +
            (event.source.empty() ? std::string("startup") : event.source) + ")", true, decision);
    maybe_snapshot(event, decision);
    decision.stage = Stage::COMPLETE;
    return decision;
}

Decision Dispatcher::on_session_stop(const hooks::HookEvent& event, Decision decision) {
    decision.stage = Stage::ROUTED;
    state::SessionDelta delta = delta_for(event);
    if (auto current = store_.load(event.session_id)) {
        for (const auto& agent : current->active_agents()) {
            delta.agents_removed.push_back(agent);
        }
    }
    persist(event, std::move(delta), "session stop", true, decision);

    auto totals = usage_for(event.session_id).summary();
    if (totals.total_calls > 0) {
        decision.side_effects.push_back("usage:" + std::to_string(totals.total_calls) + " calls");
    }
    decision.stage = Stage::COMPLETE;
    return decision;
}

Decision Dispatcher::on_prompt(const hooks::HookEvent& event, Decision decision) {
    hooks::ParseResult parsed = parser_.parse(event.text);
    return route_and_persist(event, std::move(parsed), std::move(decision));
}

Decision Dispatcher::route_and_persist(const hooks::HookEvent& event, hooks::ParseResult parsed,
                                       Decision decision) {
    decision.stage = Stage::PARSED;
    for (const auto& error : parsed.errors) {
        spdlog::warn("Mention parse error at {}: {}", error.position, error.detail);
    }

    hooks::RoutingPlan plan = router_.plan(parsed, event.text, {}, plan_id_for(event.sequence),
                                           core::to_epoch_ms(event.timestamp));
    decision.stage = Stage::ROUTED;

    if (!plan.errors.empty()) {
        decision.note(route_error_lines(plan.errors));
        if (event.is_write_gating()) {
            decision.admit = false;
            decision.stage = Stage::BLOCKED;
            return decision;
        }
    }

    if (plan.empty()) {
        if (plan.errors.empty()) {
            maybe_snapshot(event, decision);
            decision.stage = Stage::COMPLETE;
            return decision;
        }
    } else {
        decision.plan = plan.to_json();
        decision.note("Routing " + std::string(plan.is_explicit() ? "(explicit)" : "(inferred)") +
                      ": " + plan.summary());
    }

    // Planned tool steps are checked, not counted; each call is admitted by
    // its own PreToolUse event.
    if (!plan.tool_steps.empty()) {
        auto gw = gateway_for(event.session_id);
        for (const auto& step : plan.tool_steps) {
            auto verdict = gw.preview(step, event.timestamp);
            if (!verdict.allowed) {
                decision.side_effects.push_back("deferred:" + step.service);
                decision.note("Planned " + step.service + " step: " +
                              gateway::deny_reason_to_string(verdict.reason) + ": " + verdict.message);
            }
        }
        decision.stage = Stage::GATED;
    }

    state::SessionDelta delta = delta_for(event);
    delta.agents_added = plan.agent_names();
    if (!plan.empty()) {
        delta.plans.push_back({plan.plan_id, event.sequence, plan.created_ms, plan.to_json()});
        delta.attributes["last_plan"] = plan.plan_id;
    }
    std::string summary = plan.empty() ? "no agents routed" : "routed " + plan.summary();
    persist(event, std::move(delta), summary, decision.admit, decision);

    maybe_snapshot(event, decision);
    decision.stage = Stage::COMPLETE;
    return decision;
}

Decision Dispatcher::on_pre_tool(const hooks::HookEvent& event, Decision decision) {
    if (event.is_mcp_tool()) {
        auto request = gateway::mcp_request_from_tool(event.tool_name, event.tool_input);
        if (!request) {
            decision.stage = Stage::COMPLETE;
            return decision;
        }
        decision.stage = Stage::PARSED;

        // A redelivered call was admitted the first time; it takes no new slot.
        if (already_recorded(event)) {
            spdlog::debug("Duplicate {} for {} already admitted", event.tool_name, event.session_id);
            decision.stage = Stage::COMPLETE;
            return decision;
        }

        hooks::RoutingPlan plan = router_.plan(hooks::ParseResult{}, "", {*request},
                                               plan_id_for(event.sequence),
                                               core::to_epoch_ms(event.timestamp));
        decision.stage = Stage::ROUTED;

        auto gw = gateway_for(event.session_id);
        for (const auto& step : plan.tool_steps) {
            auto verdict = gw.admit(step, event.timestamp);
            if (!verdict.allowed) {
                decision.admit = false;
                decision.stage = Stage::BLOCKED;
                decision.note(std::string(gateway::deny_reason_to_string(verdict.reason)) + ": " +
                              verdict.message);
                return decision;
            }
            decision.side_effects.push_back("lease:" + step.service);
        }
        decision.stage = Stage::GATED;

        persist(event, delta_for(event), "mcp " + request->service + "." + request->operation +
                " admitted", true, decision);
        maybe_snapshot(event, decision);
        decision.stage = Stage::COMPLETE;
        return decision;
    }

    if (event.is_write_gating()) {
        decision.stage = Stage::PARSED;
        hooks::ParseResult parsed = parser_.parse(event.text);
        hooks::RoutingPlan plan = router_.plan(parsed, event.text, {}, plan_id_for(event.sequence),
                                               core::to_epoch_ms(event.timestamp));
        decision.stage = Stage::ROUTED;
        if (!plan.errors.empty()) {
            decision.admit = false;
            decision.stage = Stage::BLOCKED;
            decision.note(route_error_lines(plan.errors));
            return decision;
        }

        auto [file_path, content] = write_target(event);
        if (auto violation = quality_.check(file_path, content)) {
            decision.admit = false;
            decision.stage = Stage::BLOCKED;
            decision.note("Quality gate '" + violation->rule + "' failed for " +
                          violation->file_path + ": " + violation->detail);
            return decision;
        }
        decision.stage = Stage::QUALITY_CHECKED;

        persist(event, delta_for(event), event.tool_name + " " + file_path + " passed quality gate",
                true, decision);
        maybe_snapshot(event, decision);
        decision.stage = Stage::COMPLETE;
        return decision;
    }

    if (event.is_agent_task()) {
        hooks::ParseResult parsed = parser_.parse(event.text);
        const std::string subagent = string_field(event.tool_input, "subagent_type");
        if (parsed.mentions.empty() && registry_.contains(subagent)) {
            hooks::AgentMention mention;
            mention.agent_name = subagent;
            auto model = string_field(event.tool_input, "model");
            if (!model.empty()) {
                mention.model_hint = core::model_tier_from_string(model);
            }
            parsed.mentions.push_back(std::move(mention));
        }
        return route_and_persist(event, std::move(parsed), std::move(decision));
    }

    maybe_snapshot(event, decision);
    decision.stage = Stage::COMPLETE;
    return decision;
}

Decision Dispatcher::on_post_tool(const hooks::HookEvent& event, Decision decision) {
    decision.stage = Stage::PARSED;

    if (event.is_mcp_tool()) {
        auto request = gateway::mcp_request_from_tool(event.tool_name, event.tool_input);
        if (request) {
            bool first = persist(event, delta_for(event), "mcp " + request->service + "." +
                                 request->operation + " completed", true, decision);
            if (first && gateway_for(event.session_id).release(request->service, event.timestamp)) {
                decision.side_effects.push_back("released:" + request->service);
            }
        }
        maybe_snapshot(event, decision);
        decision.stage = Stage::COMPLETE;
        return decision;
    }

    if (event.is_agent_task()) {
        const std::string agent = string_field(event.tool_input, "subagent_type");
        const core::ModelTier tier = tier_for(agent, event.tool_input);
        decision.stage = Stage::ROUTED;

        state::SessionDelta delta = delta_for(event);
        if (!agent.empty()) {
            delta.agents_removed.push_back(agent);
        }
        bool first = persist(event, std::move(delta), "completed " +
                             (agent.empty() ? std::string("task") : agent) +
                             " (" + core::model_tier_to_string(tier) + ")", true, decision);

        if (first) {
            auto report = usage_for(event.session_id).record(tier, event.timestamp);
            if (report.report_due) {
                decision.side_effects.push_back("usage-report");
                decision.note(report.message());
            }
        }
        maybe_snapshot(event, decision);
        decision.stage = Stage::COMPLETE;
        return decision;
    }

    maybe_snapshot(event, decision);
    decision.stage = Stage::COMPLETE;
    return decision;
}

core::ModelTier Dispatcher::tier_for(const std::string& agent, const json& tool_input) const {
    auto model = string_field(tool_input, "model");
    if (!model.empty()) {
        if (auto tier = core::model_tier_from_string(model)) {
            return *tier;
        }
    }
    if (const auto* info = registry_.find(agent)) {
        return info->default_tier;
    }
    return core::ModelTier::DEFAULT;
}

bool Dispatcher::persist(const hooks::HookEvent& event, state::SessionDelta delta,
                         const std::string& summary, bool admitted, Decision& decision) {
    state::DecisionRecord record;
    record.sequence = event.sequence;
    record.ordinal = static_cast<uint32_t>(delta.decisions.size());
    record.timestamp_ms = delta.timestamp_ms;
    record.event = hooks::hook_kind_to_string(event.kind);
    record.summary = summary;
    record.admitted = admitted;
    delta.decisions.push_back(std::move(record));

    auto result = store_.merge(event.session_id, delta);
    if (result.recovered) {
        decision.side_effects.push_back("session:recovered");
    }
    if (!result.applied) {
        spdlog::debug("Event {} already recorded for {}", event.sequence, event.session_id);
    }
    decision.stage = Stage::PERSISTED;
    return result.applied;
}

bool Dispatcher::already_recorded(const hooks::HookEvent& event) const {
    auto current = store_.load(event.session_id);
    return current && current->has_applied(event.sequence);
}

void Dispatcher::maybe_snapshot(const hooks::HookEvent& event, Decision& decision) {
    bool near_limit = event.context_limit_approaching ||
        (event.context_usage && *event.context_usage >= config_.session.snapshot_threshold);
    if (!near_limit) {
        return;
    }
    auto token = store_.snapshot(event.session_id, config_.session.snapshot_tail,
                                 core::to_epoch_ms(event.timestamp));
    decision.side_effects.push_back("snapshot:" + token);
}

json Dispatcher::status(const std::string& session_id, core::TimePoint now) const {
    json out = {
        {"project_dir", project_dir_.string()},
        {"session_id", session_id},
        {"agents_registered", registry_.size()},
        {"gateway", gateway_for(session_id).status(now)},
        {"usage", usage_for(session_id).summary().to_json()}
    };

    if (auto state = store_.load(session_id)) {
        out["session"] = {
            {"active_agents", state->active_agents()},
            {"decisions", state->recent_decisions.size()},
            {"plans", state->plans.size()},
            {"last_updated", core::iso8601(core::from_epoch_ms(state->last_updated_ms))}
        };
    } else {
        out["session"] = nullptr;
    }
    if (auto token = store_.latest_snapshot(session_id)) {
        out["latest_snapshot"] = *token;
    }
    return out;
}

} // namespace hookstack::engine
