#include "state/session_store.hpp"
#include "state/json_file.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace hookstack::state {

namespace {

constexpr int kDocumentVersion = 1;

// Parse the "state" member; a malformed one is reported as PersistenceError.
SessionState state_from_document(const json& doc, const std::string& session_id) {
    if (!doc.contains("state")) {
        SessionState fresh;
        fresh.session_id = session_id;
        return fresh;
    }
    try {
        return SessionState::from_json(doc.at("state"));
    } catch (const json::exception& e) {
        throw PersistenceError(std::string("malformed session state: ") + e.what());
    }
}

// Token of a snapshot entry, empty if the entry is malformed.
std::string entry_token(const json& entry) {
    if (!entry.is_object() || !entry.contains("token") || !entry["token"].is_string()) {
        return {};
    }
    return entry["token"].get<std::string>();
}

} // namespace

json Snapshot::to_json() const {
    json decisions = json::array();
    for (const auto& d : recent_decisions) {
        decisions.push_back(d.to_json());
    }
    return json{
        {"token", token},
        {"session_id", session_id},
        {"created_ms", created_ms},
        {"active_agents", active_agents},
        {"recent_decisions", decisions}
    };
}

Snapshot Snapshot::from_json(const json& j) {
    Snapshot s;
    s.token = j.value("token", "");
    s.session_id = j.value("session_id", "");
    s.created_ms = j.value("created_ms", int64_t{0});
    if (j.contains("active_agents") && j["active_agents"].is_array()) {
        for (const auto& a : j["active_agents"]) {
            s.active_agents.insert(a.get<std::string>());
        }
    }
    if (j.contains("recent_decisions") && j["recent_decisions"].is_array()) {
        for (const auto& d : j["recent_decisions"]) {
            s.recent_decisions.push_back(DecisionRecord::from_json(d));
        }
    }
    return s;
}

SessionStore::SessionStore(std::filesystem::path sessions_root, RetentionPolicy policy,
                           std::chrono::milliseconds lock_timeout)
    : sessions_root_(std::move(sessions_root))
    , policy_(policy)
    , lock_timeout_(lock_timeout) {}

std::filesystem::path SessionStore::state_file(const std::string& session_id) const {
    return sessions_root_ / core::paths::sanitize_session_id(session_id) / kFileName;
}

std::optional<json> SessionStore::read_document(const std::string& session_id) const {
    JsonFile file(state_file(session_id), lock_timeout_);
    try {
        return file.read();
    } catch (const PersistenceError& e) {
        spdlog::error("PersistenceError: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SessionState> SessionStore::load(const std::string& session_id) const {
    auto doc = read_document(session_id);
    if (!doc || !doc->contains("state")) {
        return std::nullopt;
    }
    try {
        return state_from_document(*doc, session_id);
    } catch (const PersistenceError& e) {
        spdlog::error("PersistenceError: {}", e.what());
        return std::nullopt;
    }
}

bool SessionStore::ensure(const std::string& session_id, int64_t now_ms) {
    JsonFile file(state_file(session_id), lock_timeout_);
    bool created = false;

    auto result = file.update([&](json& doc) {
        bool valid = doc.contains("state");
        if (valid) {
            try {
                state_from_document(doc, session_id);
            } catch (const PersistenceError& e) {
                spdlog::error("PersistenceError: {} (reinitializing)", e.what());
                valid = false;
            }
        }
        if (valid) {
            return false;
        }
        SessionState fresh;
        fresh.session_id = session_id;
        fresh.last_updated_ms = now_ms;
        doc = json::object();
        doc["version"] = kDocumentVersion;
        doc["state"] = fresh.to_json();
        created = true;
        return true;
    });

    if (created) {
        spdlog::info("Initialized session state for {}", session_id);
    }
    return created || result.recovered;
}

MergeResult SessionStore::merge(const std::string& session_id, const SessionDelta& delta) {
    JsonFile file(state_file(session_id), lock_timeout_);
    MergeResult result;

    auto update = file.update([&](json& doc) {
        SessionState state;
        try {
            state = state_from_document(doc, session_id);
        } catch (const PersistenceError& e) {
            spdlog::error("PersistenceError: {} (reinitializing)", e.what());
            doc = json::object();
            state = SessionState{};
            result.recovered = true;
        }
        if (state.session_id.empty()) {
            state.session_id = session_id;
        }

        result.applied = apply_delta(state, delta, policy_);
        result.state = state;
        if (!result.applied && !result.recovered && doc.contains("state")) {
            spdlog::debug("Delta {} already applied to session {}", delta.sequence, session_id);
            return false;
        }

        doc["version"] = kDocumentVersion;
        doc["state"] = state.to_json();
        return true;
    });

    result.recovered = result.recovered || update.recovered;
    return result;
}

std::string SessionStore::snapshot(const std::string& session_id, size_t tail, int64_t now_ms) {
    JsonFile file(state_file(session_id), lock_timeout_);
    std::string token;

    file.update([&](json& doc) {
        SessionState state;
        try {
            state = state_from_document(doc, session_id);
        } catch (const PersistenceError& e) {
            spdlog::error("PersistenceError: {} (snapshotting empty state)", e.what());
            doc = json::object();
            state = SessionState{};
            state.session_id = session_id;
            doc["state"] = state.to_json();
        }

        uint64_t counter = 1;
        if (doc.contains("snapshot_counter") && doc["snapshot_counter"].is_number_unsigned()) {
            counter += doc["snapshot_counter"].get<uint64_t>();
        }
        token = core::paths::sanitize_session_id(session_id) + "@" +
                std::to_string(now_ms) + "-" + std::to_string(counter);

        Snapshot snap;
        snap.token = token;
        snap.session_id = session_id;
        snap.created_ms = now_ms;
        snap.active_agents = state.active_agents();

        const auto& decisions = state.recent_decisions;
        size_t keep = std::min(tail, decisions.size());
        snap.recent_decisions.assign(decisions.end() - static_cast<std::ptrdiff_t>(keep), decisions.end());

        json snapshots = json::array();
        if (doc.contains("snapshots") && doc["snapshots"].is_array()) {
            for (const auto& entry : doc["snapshots"]) {
                if (!entry_token(entry).empty()) {
                    snapshots.push_back(entry);
                }
            }
        }
        snapshots.push_back(snap.to_json());
        while (snapshots.size() > policy_.snapshot_retention) {
            snapshots.erase(snapshots.begin());
        }
        doc["snapshots"] = std::move(snapshots);

        doc["version"] = kDocumentVersion;
        doc["snapshot_counter"] = counter;
        return true;
    });

    spdlog::info("Snapshot {} taken for session {}", token, session_id);
    return token;
}

std::optional<SessionState> SessionStore::restore(const std::string& token) const {
    auto at = token.rfind('@');
    if (at == std::string::npos || at == 0) {
        spdlog::warn("Malformed snapshot token '{}'", token);
        return std::nullopt;
    }

    auto doc = read_document(token.substr(0, at));
    if (!doc || !doc->contains("snapshots") || !(*doc)["snapshots"].is_array()) {
        return std::nullopt;
    }

    for (const auto& entry : (*doc)["snapshots"]) {
        if (entry_token(entry) != token) {
            continue;
        }
        Snapshot snap;
        try {
            snap = Snapshot::from_json(entry);
        } catch (const json::exception& e) {
            spdlog::error("PersistenceError: malformed snapshot {}: {}", token, e.what());
            return std::nullopt;
        }

        SessionState state;
        state.session_id = snap.session_id;
        for (const auto& name : snap.active_agents) {
            state.agents[name] = AgentMark{true, snap.created_ms, 0};
        }
        state.recent_decisions = snap.recent_decisions;
        state.last_updated_ms = snap.created_ms;
        return state;
    }

    return std::nullopt;
}

std::optional<std::string> SessionStore::latest_snapshot(const std::string& session_id) const {
    auto doc = read_document(session_id);
    if (!doc || !doc->contains("snapshots") || !(*doc)["snapshots"].is_array()) {
        return std::nullopt;
    }
    const auto& snapshots = (*doc)["snapshots"];
    for (auto it = snapshots.rbegin(); it != snapshots.rend(); ++it) {
        auto token = entry_token(*it);
        if (!token.empty()) {
            return token;
        }
        spdlog::warn("Skipping malformed snapshot entry for session {}", session_id);
    }
    return std::nullopt;
}

} // namespace hookstack::state
