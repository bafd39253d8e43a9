#include "state/session_state.hpp"
#include <algorithm>
#include <tuple>

using json = nlohmann::json;

namespace hookstack::state {

namespace {

bool mark_newer(int64_t ms, uint64_t seq, int64_t other_ms, uint64_t other_seq) {
    return std::tie(ms, seq) > std::tie(other_ms, other_seq);
}

bool decision_before(const DecisionRecord& a, const DecisionRecord& b) {
    return std::tie(a.timestamp_ms, a.sequence, a.ordinal) <
           std::tie(b.timestamp_ms, b.sequence, b.ordinal);
}

void set_agent(SessionState& state, const std::string& name, bool active,
               int64_t ms, uint64_t seq) {
    // Equal (ms, seq) only happens inside one delta, where later entries win.
    auto it = state.agents.find(name);
    if (it == state.agents.end() ||
        !mark_newer(it->second.updated_ms, it->second.sequence, ms, seq)) {
        state.agents[name] = AgentMark{active, ms, seq};
    }
}

} // namespace

json DecisionRecord::to_json() const {
    return json{
        {"sequence", sequence},
        {"ordinal", ordinal},
        {"timestamp_ms", timestamp_ms},
        {"event", event},
        {"summary", summary},
        {"admitted", admitted}
    };
}

DecisionRecord DecisionRecord::from_json(const json& j) {
    DecisionRecord r;
    r.sequence = j.value("sequence", uint64_t{0});
    r.ordinal = j.value("ordinal", uint32_t{0});
    r.timestamp_ms = j.value("timestamp_ms", int64_t{0});
    r.event = j.value("event", "");
    r.summary = j.value("summary", "");
    r.admitted = j.value("admitted", true);
    return r;
}

std::set<std::string> SessionState::active_agents() const {
    std::set<std::string> out;
    for (const auto& [name, mark] : agents) {
        if (mark.active) out.insert(name);
    }
    return out;
}

bool SessionState::has_applied(uint64_t sequence) const {
    return std::binary_search(applied_sequences.begin(), applied_sequences.end(), sequence);
}

json SessionState::to_json() const {
    json agents_json = json::object();
    for (const auto& [name, mark] : agents) {
        agents_json[name] = {
            {"active", mark.active},
            {"updated_ms", mark.updated_ms},
            {"sequence", mark.sequence}
        };
    }

    json decisions_json = json::array();
    for (const auto& d : recent_decisions) {
        decisions_json.push_back(d.to_json());
    }

    json attributes_json = json::object();
    for (const auto& [key, attr] : attributes) {
        attributes_json[key] = {
            {"value", attr.value},
            {"updated_ms", attr.updated_ms},
            {"sequence", attr.sequence}
        };
    }

    json plans_json = json::array();
    for (const auto& p : plans) {
        plans_json.push_back({
            {"plan_id", p.plan_id},
            {"sequence", p.sequence},
            {"timestamp_ms", p.timestamp_ms},
            {"body", p.body}
        });
    }

    return json{
        {"session_id", session_id},
        {"agents", agents_json},
        {"recent_decisions", decisions_json},
        {"attributes", attributes_json},
        {"plans", plans_json},
        {"applied_sequences", applied_sequences},
        {"last_updated_ms", last_updated_ms}
    };
}

SessionState SessionState::from_json(const json& j) {
    SessionState s;
    s.session_id = j.value("session_id", "");
    s.last_updated_ms = j.value("last_updated_ms", int64_t{0});

    if (j.contains("agents") && j["agents"].is_object()) {
        for (auto& [name, m] : j["agents"].items()) {
            s.agents[name] = AgentMark{
                m.value("active", false),
                m.value("updated_ms", int64_t{0}),
                m.value("sequence", uint64_t{0})
            };
        }
    }

    if (j.contains("recent_decisions") && j["recent_decisions"].is_array()) {
        for (const auto& d : j["recent_decisions"]) {
            s.recent_decisions.push_back(DecisionRecord::from_json(d));
        }
    }

    if (j.contains("attributes") && j["attributes"].is_object()) {
        for (auto& [key, a] : j["attributes"].items()) {
            s.attributes[key] = AttributeValue{
                a.value("value", ""),
                a.value("updated_ms", int64_t{0}),
                a.value("sequence", uint64_t{0})
            };
        }
    }

    if (j.contains("plans") && j["plans"].is_array()) {
        for (const auto& p : j["plans"]) {
            PlanRecord r;
            r.plan_id = p.value("plan_id", "");
            r.sequence = p.value("sequence", uint64_t{0});
            r.timestamp_ms = p.value("timestamp_ms", int64_t{0});
            r.body = p.value("body", json::object());
            s.plans.push_back(std::move(r));
        }
    }

    if (j.contains("applied_sequences") && j["applied_sequences"].is_array()) {
        s.applied_sequences = j["applied_sequences"].get<std::vector<uint64_t>>();
        std::sort(s.applied_sequences.begin(), s.applied_sequences.end());
    }
    return s;
}

bool SessionDelta::empty() const {
    return agents_added.empty() && agents_removed.empty() && decisions.empty() &&
           attributes.empty() && plans.empty();
}

bool apply_delta(SessionState& state, const SessionDelta& delta, const RetentionPolicy& policy) {
    if (state.has_applied(delta.sequence)) {
        return false;
    }

    const int64_t ms = delta.timestamp_ms;
    const uint64_t seq = delta.sequence;

    for (const auto& name : delta.agents_added) {
        set_agent(state, name, true, ms, seq);
    }
    for (const auto& name : delta.agents_removed) {
        set_agent(state, name, false, ms, seq);
    }

    for (const auto& [key, value] : delta.attributes) {
        auto it = state.attributes.find(key);
        if (it == state.attributes.end() ||
            mark_newer(ms, seq, it->second.updated_ms, it->second.sequence)) {
            state.attributes[key] = AttributeValue{value, ms, seq};
        }
    }

    for (const auto& decision : delta.decisions) {
        bool seen = std::any_of(state.recent_decisions.begin(), state.recent_decisions.end(),
            [&](const DecisionRecord& d) {
                return d.sequence == decision.sequence && d.ordinal == decision.ordinal;
            });
        if (seen) continue;
        auto pos = std::upper_bound(state.recent_decisions.begin(), state.recent_decisions.end(),
                                    decision, decision_before);
        state.recent_decisions.insert(pos, decision);
    }
    if (state.recent_decisions.size() > policy.decision_retention) {
        auto excess = state.recent_decisions.size() - policy.decision_retention;
        state.recent_decisions.erase(state.recent_decisions.begin(),
                                     state.recent_decisions.begin() + excess);
    }

    for (const auto& plan : delta.plans) {
        bool seen = std::any_of(state.plans.begin(), state.plans.end(),
            [&](const PlanRecord& p) { return p.plan_id == plan.plan_id; });
        if (seen) continue;
        auto pos = std::upper_bound(state.plans.begin(), state.plans.end(), plan,
            [](const PlanRecord& a, const PlanRecord& b) {
                return std::tie(a.timestamp_ms, a.sequence) < std::tie(b.timestamp_ms, b.sequence);
            });
        state.plans.insert(pos, plan);
    }
    if (state.plans.size() > policy.plan_retention) {
        auto excess = state.plans.size() - policy.plan_retention;
        state.plans.erase(state.plans.begin(), state.plans.begin() + excess);
    }

    auto pos = std::lower_bound(state.applied_sequences.begin(), state.applied_sequences.end(), seq);
    state.applied_sequences.insert(pos, seq);
    if (state.applied_sequences.size() > policy.sequence_retention) {
        auto excess = state.applied_sequences.size() - policy.sequence_retention;
        state.applied_sequences.erase(state.applied_sequences.begin(),
                                      state.applied_sequences.begin() + excess);
    }

    state.last_updated_ms = std::max(state.last_updated_ms, ms);
    return true;
}

} // namespace hookstack::state
