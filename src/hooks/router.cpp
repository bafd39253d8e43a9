#include "hooks/router.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

using json = nlohmann::json;

namespace hookstack::hooks {

namespace {

bool contains_sequence(const std::vector<std::string>& haystack,
                       const std::vector<std::string>& needle) {
    if (needle.empty() || needle.size() > haystack.size()) return false;
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
}

void add_unique(std::vector<PlannedAgent>& selected, PlannedAgent agent) {
    bool seen = std::any_of(selected.begin(), selected.end(), [&](const PlannedAgent& a) {
        return a.name == agent.name && a.tier == agent.tier;
    });
    if (!seen) {
        selected.push_back(std::move(agent));
    }
}

} // namespace

std::vector<std::string> RoutingPlan::agent_names() const {
    std::vector<std::string> names;
    for (const auto& g : groups) {
        for (const auto& a : g.agents) {
            if (std::find(names.begin(), names.end(), a.name) == names.end()) {
                names.push_back(a.name);
            }
        }
    }
    return names;
}

std::string RoutingPlan::summary() const {
    std::string out;
    for (const auto& g : groups) {
        if (!out.empty()) out += " -> ";
        out += "[";
        for (size_t i = 0; i < g.agents.size(); ++i) {
            if (i > 0) out += ", ";
            out += g.agents[i].name;
        }
        out += "]";
    }
    if (!tool_steps.empty()) {
        out += out.empty() ? "tools: " : " + tools: ";
        for (size_t i = 0; i < tool_steps.size(); ++i) {
            if (i > 0) out += ", ";
            out += tool_steps[i].service;
        }
    }
    return out;
}

json RoutingPlan::to_json() const {
    json groups_json = json::array();
    for (const auto& g : groups) {
        json agents = json::array();
        for (const auto& a : g.agents) {
            agents.push_back({{"agent", a.name}, {"tier", core::model_tier_to_string(a.tier)}});
        }
        groups_json.push_back({{"index", g.index}, {"parallel", g.agents.size() > 1}, {"agents", agents}});
    }

    json strategy_json;
    if (const auto* ex = std::get_if<ExplicitRouting>(&strategy)) {
        json mentions = json::array();
        for (const auto& m : ex->mentions) {
            json mj = {{"agent", m.agent_name}, {"position", m.position}};
            if (m.model_hint) mj["hint"] = core::model_tier_to_string(*m.model_hint);
            mentions.push_back(mj);
        }
        strategy_json = {{"type", "explicit"}, {"mentions", mentions}};
    } else if (const auto* inf = std::get_if<InferredRouting>(&strategy)) {
        json candidates = json::array();
        for (const auto& c : inf->candidates) {
            candidates.push_back({{"agent", c.agent}, {"score", c.score}, {"matched", c.matched_keywords}});
        }
        strategy_json = {{"type", "inferred"}, {"candidates", candidates}};
    }

    json tools = json::array();
    for (const auto& t : tool_steps) {
        tools.push_back(t.to_json());
    }

    json errors_json = json::array();
    for (const auto& e : errors) {
        errors_json.push_back({{"agent", e.agent}, {"detail", e.detail}});
    }

    return json{
        {"plan_id", plan_id},
        {"strategy", strategy_json},
        {"groups", groups_json},
        {"tool_steps", tools},
        {"errors", errors_json},
        {"created_ms", created_ms}
    };
}

Router::Router(const AgentRegistry& registry, RoutingConfig config)
    : registry_(registry)
    , config_(std::move(config)) {}

std::vector<std::string> Router::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '/' || c == '+' || c == '#') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::vector<std::string> Router::detect_services(const std::string& text,
                                                 const std::vector<std::string>& agents) const {
    std::set<std::string> found;
    auto tokens = tokenize(text);
    for (const auto& [service, phrases] : config_.service_keywords) {
        for (const auto& phrase : phrases) {
            if (contains_sequence(tokens, tokenize(phrase))) {
                found.insert(service);
                break;
            }
        }
    }
    for (const auto& agent : agents) {
        auto it = config_.agent_services.find(agent);
        if (it != config_.agent_services.end()) {
            found.insert(it->second);
        }
    }
    return {found.begin(), found.end()};
}

std::vector<ScoredCandidate> Router::score(const std::string& text) const {
    std::vector<ScoredCandidate> out;
    auto tokens = tokenize(text);
    if (tokens.empty()) return out;

    for (const auto* info : registry_.all()) {
        if (info->keywords.empty()) continue;

        ScoredCandidate candidate;
        candidate.agent = info->id;
        candidate.priority = info->priority;
        for (const auto& keyword : info->keywords) {
            if (contains_sequence(tokens, tokenize(keyword))) {
                candidate.matched_keywords.push_back(keyword);
            }
        }
        if (candidate.matched_keywords.empty()) continue;

        candidate.score = static_cast<double>(candidate.matched_keywords.size()) /
                          static_cast<double>(info->keywords.size());
        if (candidate.score >= config_.min_confidence) {
            out.push_back(std::move(candidate));
        }
    }

    std::sort(out.begin(), out.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.agent < b.agent;
    });
    return out;
}

RoutingPlan Router::plan(const ParseResult& parsed, const std::string& text,
                         std::vector<gateway::MCPRequest> tool_steps,
                         std::string plan_id, int64_t created_ms) const {
    RoutingPlan plan;
    plan.plan_id = std::move(plan_id);
    plan.tool_steps = std::move(tool_steps);
    plan.created_ms = created_ms;

    std::vector<PlannedAgent> selected;

    if (!parsed.mentions.empty()) {
        ExplicitRouting explicit_routing;
        for (const auto& mention : parsed.mentions) {
            if (mention.unresolved) {
                plan.errors.push_back({mention.agent_name,
                                       "unknown agent '@agent-" + mention.agent_name + "'"});
                continue;
            }
            const auto* info = registry_.find(mention.agent_name);
            add_unique(selected, {mention.agent_name,
                                  mention.model_hint.value_or(info->default_tier)});
            explicit_routing.mentions.push_back(mention);
        }
        plan.strategy = std::move(explicit_routing);
    } else {
        InferredRouting inferred;
        inferred.candidates = score(text);

        if (inferred.candidates.size() > 2 && !config_.coordinator.empty() &&
            registry_.contains(config_.coordinator)) {
            bool present = std::any_of(inferred.candidates.begin(), inferred.candidates.end(),
                [&](const ScoredCandidate& c) { return c.agent == config_.coordinator; });
            if (!present) {
                ScoredCandidate coordinator;
                coordinator.agent = config_.coordinator;
                coordinator.score = 1.0;
                coordinator.priority = registry_.find(config_.coordinator)->priority;
                inferred.candidates.insert(inferred.candidates.begin(), coordinator);
            }
        }
        if (inferred.candidates.size() > config_.max_inferred_agents) {
            inferred.candidates.resize(config_.max_inferred_agents);
        }

        for (const auto& candidate : inferred.candidates) {
            const auto* info = registry_.find(candidate.agent);
            add_unique(selected, {candidate.agent, info->default_tier});
        }
        plan.strategy = std::move(inferred);
    }

    plan.groups = group(selected, plan.errors);

    for (const auto& service : detect_services(text, plan.agent_names())) {
        bool present = std::any_of(plan.tool_steps.begin(), plan.tool_steps.end(),
            [&](const gateway::MCPRequest& step) { return step.service == service; });
        if (present) continue;
        gateway::MCPRequest step;
        step.service = service;
        step.operation = "planned";
        plan.tool_steps.push_back(std::move(step));
    }

    spdlog::debug("Plan {}: {} ({} tool steps, {} errors)", plan.plan_id,
                  plan.summary().empty() ? "<no agents>" : plan.summary(),
                  plan.tool_steps.size(), plan.errors.size());
    return plan;
}

std::vector<ExecutionGroup> Router::group(const std::vector<PlannedAgent>& selected,
                                          std::vector<RouteError>& errors) const {
    std::vector<std::string> order;
    for (const auto& a : selected) {
        if (std::find(order.begin(), order.end(), a.name) == order.end()) {
            order.push_back(a.name);
        }
    }
    std::set<std::string> names(order.begin(), order.end());

    // Edges restricted to the selected agents. The coordinator precedes
    // everything else it was selected with.
    std::map<std::string, std::set<std::string>> deps;
    for (const auto& name : order) {
        auto& d = deps[name];
        if (const auto* info = registry_.find(name)) {
            for (const auto& dep : info->depends_on) {
                if (dep != name && names.count(dep)) d.insert(dep);
            }
        }
        if (!config_.coordinator.empty() && name != config_.coordinator &&
            names.count(config_.coordinator)) {
            d.insert(config_.coordinator);
        }
    }

    std::map<std::string, size_t> level;
    std::set<std::string> placed;
    size_t current = 0;
    while (placed.size() < order.size()) {
        std::vector<std::string> layer;
        for (const auto& name : order) {
            if (placed.count(name)) continue;
            bool ready = std::all_of(deps[name].begin(), deps[name].end(),
                [&](const std::string& d) { return placed.count(d) > 0; });
            if (ready) layer.push_back(name);
        }

        if (layer.empty()) {
            // Whatever is left sits on a dependency cycle.
            for (const auto& name : order) {
                if (placed.count(name)) continue;
                errors.push_back({name, "dependency cycle involving '" + name + "'"});
                layer.push_back(name);
            }
        }

        for (const auto& name : layer) {
            level[name] = current;
            placed.insert(name);
        }
        ++current;
    }

    std::vector<ExecutionGroup> groups(current);
    for (size_t i = 0; i < groups.size(); ++i) {
        groups[i].index = i;
    }
    for (const auto& agent : selected) {
        groups[level[agent.name]].agents.push_back(agent);
    }
    return groups;
}

} // namespace hookstack::hooks
