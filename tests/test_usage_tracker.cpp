#include <gtest/gtest.h>
#include "usage/usage_tracker.hpp"
#include "test_support.hpp"

using namespace hookstack;
using json = nlohmann::json;

namespace {

const core::TimePoint kDay1 = core::from_epoch_ms(1700000000000);   // 2023-11-14
const core::TimePoint kDay2 = kDay1 + std::chrono::hours(24);

} // namespace

class UsageTrackerTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    std::filesystem::path file() const { return dir.path() / usage::UsageTracker::kFileName; }
};

TEST_F(UsageTrackerTest, RowsPerDateAndTier) {
    usage::UsageTracker tracker(usage::UsageConfig{}, file());
    tracker.record(core::ModelTier::DEFAULT, kDay1);
    auto report = tracker.record(core::ModelTier::DEFAULT, kDay1);
    EXPECT_EQ(report.date, "2023-11-14");
    EXPECT_EQ(report.row_calls, 2u);
    EXPECT_DOUBLE_EQ(report.row_cost, 0.24);

    auto next = tracker.record(core::ModelTier::DEFAULT, kDay2);
    EXPECT_EQ(next.date, "2023-11-15");
    EXPECT_EQ(next.row_calls, 1u);
    EXPECT_EQ(next.totals.total_calls, 3u);
}

TEST_F(UsageTrackerTest, SavingsAgainstPowerfulTier) {
    usage::UsageTracker tracker(usage::UsageConfig{}, file());
    tracker.record(core::ModelTier::FAST, kDay1);
    tracker.record(core::ModelTier::POWERFUL, kDay1);

    auto s = tracker.summary();
    EXPECT_EQ(s.total_calls, 2u);
    EXPECT_NEAR(s.actual_cost, 0.62, 1e-9);
    EXPECT_NEAR(s.powerful_cost, 1.20, 1e-9);
    EXPECT_NEAR(s.savings, 0.58, 1e-9);
    EXPECT_EQ(s.calls_by_tier["fast"], 1u);
}

TEST_F(UsageTrackerTest, ReportOncePerThresholdCrossing) {
    usage::UsageConfig config;
    config.report_threshold = 1.00;
    usage::UsageTracker tracker(config, file());

    // Each fast call saves 0.58.
    EXPECT_FALSE(tracker.record(core::ModelTier::FAST, kDay1).report_due);
    auto second = tracker.record(core::ModelTier::FAST, kDay1);
    EXPECT_TRUE(second.report_due);
    EXPECT_NEAR(second.totals.baseline, 1.16, 1e-9);
    EXPECT_FALSE(second.message().empty());

    EXPECT_FALSE(tracker.record(core::ModelTier::FAST, kDay1).report_due);
    EXPECT_TRUE(tracker.record(core::ModelTier::FAST, kDay1).report_due);

    auto s = tracker.summary();
    EXPECT_EQ(s.reports_emitted, 2u);
    EXPECT_NEAR(s.savings, 2.32, 1e-9);
}

TEST_F(UsageTrackerTest, PowerfulCallsNeverReport) {
    usage::UsageTracker tracker(usage::UsageConfig{}, file());
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(tracker.record(core::ModelTier::POWERFUL, kDay1).report_due);
    }
    EXPECT_NEAR(tracker.summary().savings, 0.0, 1e-9);
}

TEST_F(UsageTrackerTest, SummaryOfMissingFileIsEmpty) {
    usage::UsageTracker tracker(usage::UsageConfig{}, file());
    auto s = tracker.summary();
    EXPECT_EQ(s.total_calls, 0u);
    EXPECT_FALSE(std::filesystem::exists(file()));
}

TEST_F(UsageTrackerTest, MalformedRowsAreReinitialized) {
    test_support::write_file(file(), R"({"rows": {"2023-11-14": 5}, "baseline_savings": "lots"})");
    usage::UsageTracker tracker(usage::UsageConfig{}, file());

    EXPECT_EQ(tracker.summary().total_calls, 0u);
    auto report = tracker.record(core::ModelTier::FAST, kDay1);
    EXPECT_EQ(report.row_calls, 1u);
    EXPECT_EQ(tracker.summary().total_calls, 1u);
}

TEST(UsageConfigTest, FromJson) {
    json j = {{"usage", {{"report_threshold", 5.0}, {"unit_costs", {{"haiku", 0.01}, {"bogus", 1}}}}}};
    auto config = usage::UsageConfig::from_json(j);
    EXPECT_DOUBLE_EQ(config.report_threshold, 5.0);
    EXPECT_DOUBLE_EQ(config.unit_cost(core::ModelTier::FAST), 0.01);
    EXPECT_DOUBLE_EQ(config.unit_cost(core::ModelTier::POWERFUL), 0.60);
}
