#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/model_tier.hpp"
#include "gateway/mcp_request.hpp"
#include "hooks/agent_registry.hpp"
#include "hooks/mention_parser.hpp"

namespace hookstack::hooks {

struct RoutingConfig {
    double min_confidence = 0.2;
    size_t max_inferred_agents = 3;
    std::string coordinator = "orchestrator";   // empty disables coordination

    // External-tool services a plan is expected to call, by prompt phrase
    // and by selected agent. Each becomes a planned tool step.
    std::map<std::string, std::vector<std::string>> service_keywords = {
        {"web-search", {"search", "research", "find", "current", "latest", "trends"}},
        {"playwright", {"browser", "automate", "e2e", "test browser", "web scraping"}},
        {"obsidian",   {"document", "note", "knowledge", "wiki", "markdown"}}
    };
    std::map<std::string, std::string> agent_services = {
        {"testing", "playwright"}
    };
};

struct PlannedAgent {
    std::string name;
    core::ModelTier tier = core::ModelTier::DEFAULT;
};

// Agents that may run concurrently. Group N runs after groups 0..N-1.
struct ExecutionGroup {
    size_t index = 0;
    std::vector<PlannedAgent> agents;
};

struct RouteError {
    std::string agent;
    std::string detail;
};

struct ScoredCandidate {
    std::string agent;
    double score = 0.0;
    int priority = 0;
    std::vector<std::string> matched_keywords;
};

struct ExplicitRouting {
    std::vector<AgentMention> mentions;
};

struct InferredRouting {
    std::vector<ScoredCandidate> candidates;
};

// Explicit always wins over inference when both could apply.
using RoutingStrategy = std::variant<ExplicitRouting, InferredRouting>;

struct RoutingPlan {
    std::string plan_id;
    RoutingStrategy strategy;
    std::vector<ExecutionGroup> groups;
    std::vector<gateway::MCPRequest> tool_steps;
    std::vector<RouteError> errors;
    int64_t created_ms = 0;

    bool empty() const { return groups.empty() && tool_steps.empty(); }
    bool is_explicit() const { return std::holds_alternative<ExplicitRouting>(strategy); }
    std::vector<std::string> agent_names() const;

    // "[database] -> [backend, frontend] + tools: github"
    std::string summary() const;
    nlohmann::json to_json() const;
};

// Builds execution plans from parsed mentions or, without mentions, from
// keyword overlap with the registry. Services the plan will likely need are
// added as planned tool steps (operation "planned").
class Router {
public:
    Router(const AgentRegistry& registry, RoutingConfig config);

    RoutingPlan plan(const ParseResult& parsed, const std::string& text,
                     std::vector<gateway::MCPRequest> tool_steps,
                     std::string plan_id, int64_t created_ms) const;

    // Services from `service_keywords` found in `text` plus those mapped
    // from `agents`, sorted and unique.
    std::vector<std::string> detect_services(const std::string& text,
                                             const std::vector<std::string>& agents) const;

    // Keyword scores above the confidence threshold, best first.
    std::vector<ScoredCandidate> score(const std::string& text) const;

    // Lower-cased tokens; '/', '+' and '#' stay inside tokens ("ci/cd", "c++").
    static std::vector<std::string> tokenize(const std::string& text);

private:
    const AgentRegistry& registry_;
    RoutingConfig config_;

    std::vector<ExecutionGroup> group(const std::vector<PlannedAgent>& selected,
                                      std::vector<RouteError>& errors) const;
};

} // namespace hookstack::hooks
