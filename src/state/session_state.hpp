#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookstack::state {

// Bounds applied when merging deltas and taking snapshots.
struct RetentionPolicy {
    size_t decision_retention = 50;
    size_t plan_retention = 20;
    size_t sequence_retention = 256;
    size_t snapshot_retention = 5;
};

struct DecisionRecord {
    uint64_t sequence = 0;
    uint32_t ordinal = 0;        // position inside the delta that produced it
    int64_t timestamp_ms = 0;
    std::string event;           // hook kind name
    std::string summary;
    bool admitted = true;

    nlohmann::json to_json() const;
    static DecisionRecord from_json(const nlohmann::json& j);
};

// Last-write-wins register. Ties are broken by sequence number.
struct AgentMark {
    bool active = false;
    int64_t updated_ms = 0;
    uint64_t sequence = 0;
};

struct AttributeValue {
    std::string value;
    int64_t updated_ms = 0;
    uint64_t sequence = 0;
};

struct PlanRecord {
    std::string plan_id;
    uint64_t sequence = 0;
    int64_t timestamp_ms = 0;
    nlohmann::json body;
};

struct SessionState {
    std::string session_id;
    std::map<std::string, AgentMark> agents;
    std::vector<DecisionRecord> recent_decisions;   // ordered by (timestamp, sequence, ordinal)
    std::map<std::string, AttributeValue> attributes;
    std::vector<PlanRecord> plans;                  // ordered by (timestamp, sequence)
    std::vector<uint64_t> applied_sequences;        // ascending
    int64_t last_updated_ms = 0;

    std::set<std::string> active_agents() const;
    bool has_applied(uint64_t sequence) const;

    nlohmann::json to_json() const;
    static SessionState from_json(const nlohmann::json& j);
};

// One invocation's contribution to a session. Identified by `sequence`.
struct SessionDelta {
    uint64_t sequence = 0;
    int64_t timestamp_ms = 0;
    std::vector<std::string> agents_added;
    std::vector<std::string> agents_removed;
    std::vector<DecisionRecord> decisions;
    std::map<std::string, std::string> attributes;
    std::vector<PlanRecord> plans;

    bool empty() const;
};

// Merge `delta` into `state`. Commutative across distinct deltas and a no-op
// for a delta whose sequence is already applied. Returns false for no-ops.
bool apply_delta(SessionState& state, const SessionDelta& delta, const RetentionPolicy& policy);

} // namespace hookstack::state
