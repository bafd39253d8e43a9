#include <gtest/gtest.h>
#include "core/paths.hpp"
#include "state/session_store.hpp"
#include "test_support.hpp"

using namespace hookstack;

namespace {

state::SessionDelta make_delta(uint64_t seq, int64_t ms,
                               std::vector<std::string> added,
                               std::vector<std::string> removed = {}) {
    state::SessionDelta delta;
    delta.sequence = seq;
    delta.timestamp_ms = ms;
    delta.agents_added = std::move(added);
    delta.agents_removed = std::move(removed);

    state::DecisionRecord record;
    record.sequence = seq;
    record.timestamp_ms = ms;
    record.event = "UserPromptSubmit";
    record.summary = "decision " + std::to_string(seq);
    delta.decisions.push_back(record);
    return delta;
}

} // namespace

TEST(SessionStateTest, ReapplyingDeltaIsNoOp) {
    state::RetentionPolicy policy;
    state::SessionState s;
    auto delta = make_delta(10, 1000, {"backend"});

    EXPECT_TRUE(state::apply_delta(s, delta, policy));
    auto before = s.to_json();
    EXPECT_FALSE(state::apply_delta(s, delta, policy));
    EXPECT_EQ(s.to_json(), before);
}

TEST(SessionStateTest, MergeIsCommutative) {
    state::RetentionPolicy policy;
    auto a = make_delta(10, 1000, {"backend", "frontend"});
    auto b = make_delta(20, 2000, {"database"}, {"frontend"});
    b.attributes["last_plan"] = "plan-b";
    a.attributes["last_plan"] = "plan-a";

    state::SessionState ab;
    state::apply_delta(ab, a, policy);
    state::apply_delta(ab, b, policy);

    state::SessionState ba;
    state::apply_delta(ba, b, policy);
    state::apply_delta(ba, a, policy);

    EXPECT_EQ(ab.to_json(), ba.to_json());
    EXPECT_EQ(ab.active_agents(), (std::set<std::string>{"backend", "database"}));
    EXPECT_EQ(ab.attributes["last_plan"].value, "plan-b");
}

TEST(SessionStateTest, RemovalInSameDeltaWins) {
    state::RetentionPolicy policy;
    state::SessionState s;
    state::apply_delta(s, make_delta(1, 100, {"testing"}, {"testing"}), policy);
    EXPECT_TRUE(s.active_agents().empty());
}

TEST(SessionStateTest, DecisionsAreOrderedAndBounded) {
    state::RetentionPolicy policy;
    policy.decision_retention = 3;
    state::SessionState s;
    for (uint64_t seq : {5, 1, 4, 2, 3}) {
        state::apply_delta(s, make_delta(seq, static_cast<int64_t>(seq) * 10, {}), policy);
    }
    ASSERT_EQ(s.recent_decisions.size(), 3u);
    EXPECT_EQ(s.recent_decisions[0].sequence, 3u);
    EXPECT_EQ(s.recent_decisions[2].sequence, 5u);
}

class SessionStoreTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    state::SessionStore store{dir.path() / "sessions", state::RetentionPolicy{}};
};

TEST_F(SessionStoreTest, MissingSessionIsNotFound) {
    EXPECT_FALSE(store.load("abc").has_value());
}

TEST_F(SessionStoreTest, EnsureCreatesOnce) {
    EXPECT_TRUE(store.ensure("abc", 1000));
    EXPECT_FALSE(store.ensure("abc", 2000));
    auto s = store.load("abc");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->session_id, "abc");
}

TEST_F(SessionStoreTest, MergePersistsAndDeduplicates) {
    auto delta = make_delta(42, 5000, {"backend"});
    auto first = store.merge("abc", delta);
    EXPECT_TRUE(first.applied);

    auto second = store.merge("abc", delta);
    EXPECT_FALSE(second.applied);

    auto s = store.load("abc");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->recent_decisions.size(), 1u);
    EXPECT_EQ(s->active_agents(), (std::set<std::string>{"backend"}));
}

TEST_F(SessionStoreTest, SnapshotRestoreRoundTrip) {
    store.merge("abc", make_delta(1, 1000, {"backend", "frontend"}));
    store.merge("abc", make_delta(2, 2000, {"database"}));

    auto token = store.snapshot("abc", 10, 3000);
    EXPECT_EQ(store.latest_snapshot("abc").value_or(""), token);

    auto restored = store.restore(token);
    ASSERT_TRUE(restored.has_value());
    auto original = store.load("abc");
    ASSERT_TRUE(original.has_value());

    EXPECT_EQ(restored->active_agents(), original->active_agents());
    ASSERT_EQ(restored->recent_decisions.size(), original->recent_decisions.size());
    for (size_t i = 0; i < restored->recent_decisions.size(); ++i) {
        EXPECT_EQ(restored->recent_decisions[i].to_json(), original->recent_decisions[i].to_json());
    }
}

TEST_F(SessionStoreTest, SnapshotTailLimitsDecisions) {
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        store.merge("abc", make_delta(seq, static_cast<int64_t>(seq) * 100, {}));
    }
    auto restored = store.restore(store.snapshot("abc", 2, 1000));
    ASSERT_TRUE(restored.has_value());
    ASSERT_EQ(restored->recent_decisions.size(), 2u);
    EXPECT_EQ(restored->recent_decisions.back().sequence, 5u);
}

TEST_F(SessionStoreTest, SnapshotsAreBounded) {
    store.ensure("abc", 0);
    std::string first = store.snapshot("abc", 10, 1);
    for (int64_t i = 2; i <= 6; ++i) {
        store.snapshot("abc", 10, i);
    }
    EXPECT_FALSE(store.restore(first).has_value());
    EXPECT_TRUE(store.latest_snapshot("abc").has_value());
}

TEST_F(SessionStoreTest, MalformedTokenIsNotFound) {
    EXPECT_FALSE(store.restore("no-at-sign").has_value());
    EXPECT_FALSE(store.restore("abc@123-1").has_value());
}

TEST_F(SessionStoreTest, CorruptFileRecoversToFreshState) {
    test_support::write_file(store.state_file("abc"), "{ this is not json");

    EXPECT_FALSE(store.load("abc").has_value());
    EXPECT_TRUE(store.ensure("abc", 1000));

    auto s = store.load("abc");
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->agents.empty());
}

TEST_F(SessionStoreTest, CorruptFileIsReplacedOnMerge) {
    test_support::write_file(store.state_file("abc"), "garbage");
    auto result = store.merge("abc", make_delta(7, 700, {"security"}));
    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.recovered);
    EXPECT_EQ(store.load("abc")->active_agents(), (std::set<std::string>{"security"}));
}

TEST_F(SessionStoreTest, MalformedSnapshotEntriesAreSkipped) {
    test_support::write_file(store.state_file("s1"), R"({
        "snapshot_counter": "x",
        "snapshots": [42, {"token": "s1@5-1", "session_id": "s1", "active_agents": [7]}, "junk"]
    })");

    EXPECT_EQ(store.latest_snapshot("s1").value_or(""), "s1@5-1");
    EXPECT_FALSE(store.restore("s1@5-1").has_value());

    auto token = store.snapshot("s1", 10, 9000);
    EXPECT_EQ(token, "s1@9000-1");
    EXPECT_EQ(store.latest_snapshot("s1").value_or(""), token);
    EXPECT_TRUE(store.restore(token).has_value());
}

TEST_F(SessionStoreTest, OnlyMalformedSnapshotsIsNotFound) {
    test_support::write_file(store.state_file("s1"), R"({"snapshots": [42]})");
    EXPECT_FALSE(store.latest_snapshot("s1").has_value());
}

TEST_F(SessionStoreTest, SessionIdsAreSanitized) {
    store.ensure("../../etc", 1);
    auto file = store.state_file("../../etc");
    EXPECT_EQ(file.parent_path().parent_path(), dir.path() / "sessions");
    EXPECT_TRUE(std::filesystem::exists(file));
}
