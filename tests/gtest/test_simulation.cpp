// =============================================================================
// Seeded Simulation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "threnody/simulation.hpp"
#include <cmath>

using namespace threnody;

class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.engine.working_set_size = 400;
        options_.engine.cluster_size = 20;
        options_.engine.priority_queue_max_size = 200;
        options_.messages = 1000;
        options_.cycles = 50;
        options_.seed = 42;
        options_.submit_every = 5;
    }

    static std::string describe(const SimulationReport& report) {
        std::string out;
        for (const auto& v : report.violations) out += v + "\n";
        return out;
    }

    SimulationOptions options_;
};

TEST_F(SimulationTest, ThousandRowsFiftyCyclesHoldInvariants) {
    SimulationReport report = run_simulation(options_);

    EXPECT_TRUE(report.ok()) << describe(report);
    EXPECT_EQ(report.cycles_run, 50u);
    EXPECT_EQ(report.clusters_emitted, 51u);
    EXPECT_LE(report.max_working_set, 400u);
    EXPECT_GE(report.min_working_set, 360u);
    ASSERT_EQ(report.submissions.size(), 10u);

    for (const auto& trace : report.submissions) {
        EXPECT_TRUE(trace.entered_working_set) << "submission " << trace.id;
        EXPECT_TRUE(trace.reported_priority) << "submission " << trace.id;
    }
}

TEST_F(SimulationTest, SubmissionsFeaturedWithinBound) {
    SimulationReport report = run_simulation(options_);
    int64_t bound = static_cast<int64_t>(
        std::ceil(static_cast<double>(options_.engine.working_set_size) / options_.engine.cluster_size));

    for (const auto& trace : report.submissions) {
        // The last submission may not have had time to surface
        if (trace.submitted_at_cycle + bound > options_.cycles) continue;
        ASSERT_GE(trace.featured_at_cycle, 0) << "submission " << trace.id << " never featured";
        EXPECT_LE(trace.featured_at_cycle - static_cast<int64_t>(trace.submitted_at_cycle), bound)
            << "submission " << trace.id;
    }
}

TEST_F(SimulationTest, BurstRespectsQueueBound) {
    options_.submit_every = 0;
    options_.burst_at_cycle = 10;
    options_.burst_size = 300;

    SimulationReport report = run_simulation(options_);

    EXPECT_TRUE(report.ok()) << describe(report);
    EXPECT_LE(report.max_queue_depth, 200u);
    EXPECT_EQ(report.dropped_total, 100u);

    // The 200 highest ids survived the overflow and all reached the set
    ASSERT_EQ(report.submissions.size(), 300u);
    for (size_t i = 100; i < report.submissions.size(); ++i) {
        const auto& trace = report.submissions[i];
        EXPECT_TRUE(trace.entered_working_set) << "queued submission " << trace.id;
        EXPECT_TRUE(trace.reported_priority) << "queued submission " << trace.id;
    }
}

TEST_F(SimulationTest, RecyclingKeepsWorkingSetFull) {
    options_.messages = 450;
    options_.cycles = 60;
    options_.submit_every = 0;

    SimulationReport report = run_simulation(options_);

    EXPECT_TRUE(report.ok()) << describe(report);
    EXPECT_EQ(report.max_working_set, 400u);
}

TEST_F(SimulationTest, EmptyStoreEmitsPlaceholders) {
    options_.messages = 0;
    options_.cycles = 5;
    options_.submit_every = 0;

    SimulationReport report = run_simulation(options_);

    EXPECT_TRUE(report.ok()) << describe(report);
    EXPECT_EQ(report.clusters_emitted, 6u);
    EXPECT_EQ(report.max_working_set, 0u);
}

TEST_F(SimulationTest, DeterministicForSeed) {
    options_.cycles = 10;
    SimulationReport a = run_simulation(options_);
    SimulationReport b = run_simulation(options_);

    EXPECT_EQ(a.clusters_emitted, b.clusters_emitted);
    EXPECT_EQ(a.min_working_set, b.min_working_set);
    ASSERT_EQ(a.submissions.size(), b.submissions.size());
    for (size_t i = 0; i < a.submissions.size(); ++i) {
        EXPECT_EQ(a.submissions[i].id, b.submissions[i].id);
    }
}
