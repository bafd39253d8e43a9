#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "state/session_state.hpp"

namespace hookstack::state {

// Bounded copy of a session taken ahead of host-side context truncation.
struct Snapshot {
    std::string token;
    std::string session_id;
    int64_t created_ms = 0;
    std::set<std::string> active_agents;
    std::vector<DecisionRecord> recent_decisions;

    nlohmann::json to_json() const;
    static Snapshot from_json(const nlohmann::json& j);
};

struct MergeResult {
    bool applied = false;
    bool recovered = false;   // the persisted file was corrupt and replaced
    SessionState state;
};

// Durable per-session state: <sessions_root>/<session>/session_state.json.
// Corrupt files never escape as errors; they are logged and treated as
// missing, and the next write replaces them.
class SessionStore {
public:
    static constexpr const char* kFileName = "session_state.json";

    SessionStore(std::filesystem::path sessions_root, RetentionPolicy policy,
                 std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(2000));

    // nullopt means NotFound (missing or unreadable).
    std::optional<SessionState> load(const std::string& session_id) const;

    // Create an empty persisted state if none (or a corrupt one) exists.
    // Returns true if a new state was written.
    bool ensure(const std::string& session_id, int64_t now_ms);

    MergeResult merge(const std::string& session_id, const SessionDelta& delta);

    // Capture active agents and the last `tail` decisions. Returns the token.
    std::string snapshot(const std::string& session_id, size_t tail, int64_t now_ms);

    std::optional<SessionState> restore(const std::string& token) const;
    std::optional<std::string> latest_snapshot(const std::string& session_id) const;

    std::filesystem::path state_file(const std::string& session_id) const;

private:
    std::filesystem::path sessions_root_;
    RetentionPolicy policy_;
    std::chrono::milliseconds lock_timeout_;

    std::optional<nlohmann::json> read_document(const std::string& session_id) const;
};

} // namespace hookstack::state
