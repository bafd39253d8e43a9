#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/decision.hpp"
#include "engine/engine_config.hpp"
#include "gateway/gateway.hpp"
#include "hooks/agent_registry.hpp"
#include "hooks/event.hpp"
#include "hooks/mention_parser.hpp"
#include "hooks/router.hpp"
#include "quality/quality_gate.hpp"
#include "state/session_store.hpp"
#include "usage/usage_tracker.hpp"

namespace hookstack::engine {

/**
 * Event Dispatcher
 *
 * Runs one host event through parse, route, gate, quality check, persist
 * and usage accounting, and produces exactly one Decision. State files live
 * under <project>/.hookstack/sessions/<session>/.
 */
class Dispatcher {
public:
    Dispatcher(EngineConfig config, hooks::AgentRegistry registry,
               std::filesystem::path project_dir);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Never throws. Internal faults fail open for read-path events and
    // closed for write-gating events.
    Decision dispatch(const hooks::HookEvent& event);

    // Gateway, usage and session overview for `--status`.
    nlohmann::json status(const std::string& session_id, core::TimePoint now) const;

    const EngineConfig& config() const { return config_; }
    const hooks::AgentRegistry& registry() const { return registry_; }

private:
    EngineConfig config_;
    hooks::AgentRegistry registry_;
    std::filesystem::path project_dir_;
    hooks::MentionParser parser_;
    hooks::Router router_;
    quality::QualityGate quality_;
    state::SessionStore store_;

    Decision run(const hooks::HookEvent& event);

    Decision on_session_start(const hooks::HookEvent& event, Decision decision);
    Decision on_session_stop(const hooks::HookEvent& event, Decision decision);
    Decision on_prompt(const hooks::HookEvent& event, Decision decision);
    Decision on_pre_tool(const hooks::HookEvent& event, Decision decision);
    Decision on_post_tool(const hooks::HookEvent& event, Decision decision);

    // Route a parsed text and persist the plan. Shared by prompts and Task calls.
    Decision route_and_persist(const hooks::HookEvent& event, hooks::ParseResult parsed,
                               Decision decision);

    // Record a single decision line for the event. False when the event was
    // already applied by an earlier delivery.
    bool persist(const hooks::HookEvent& event, state::SessionDelta delta,
                 const std::string& summary, bool admitted, Decision& decision);

    // True when an earlier delivery of this event was persisted.
    bool already_recorded(const hooks::HookEvent& event) const;

    // Take a snapshot if the event reports the context window nearly full.
    void maybe_snapshot(const hooks::HookEvent& event, Decision& decision);

    core::ModelTier tier_for(const std::string& agent, const nlohmann::json& tool_input) const;

    gateway::Gateway gateway_for(const std::string& session_id) const;
    usage::UsageTracker usage_for(const std::string& session_id) const;
};

// "plan-<hex sequence>"
std::string plan_id_for(uint64_t sequence);

} // namespace hookstack::engine
