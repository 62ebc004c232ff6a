// =============================================================================
// Metrics Tests
// =============================================================================

#include <gtest/gtest.h>
#include "threnody/metrics.hpp"

using namespace threnody;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override { Metrics::getInstance().reset(); }
    void TearDown() override { Metrics::getInstance().reset(); }
};

TEST_F(MetricsTest, CountersAccumulate) {
    auto& metrics = Metrics::getInstance();
    metrics.increment_counter("clusters_emitted");
    metrics.increment_counter("clusters_emitted", 4);

    EXPECT_EQ(metrics.counter("clusters_emitted"), 5);
    EXPECT_EQ(metrics.counter("never_touched"), 0);
}

TEST_F(MetricsTest, GaugesOverwrite) {
    auto& metrics = Metrics::getInstance();
    metrics.set_gauge("working_set_size", 380);
    metrics.set_gauge("working_set_size", 400);

    EXPECT_DOUBLE_EQ(metrics.gauge("working_set_size"), 400.0);
}

TEST_F(MetricsTest, TimerRecordsOnce) {
    {
        Metrics::Timer timer("cycle_duration_us");
        timer.stop();
    }
    std::string text = Metrics::getInstance().export_prometheus();
    EXPECT_NE(text.find("threnody_cycle_duration_us_count 1"), std::string::npos);
}

TEST_F(MetricsTest, PrometheusExport) {
    auto& metrics = Metrics::getInstance();
    metrics.increment_counter("queue_dropped", 2);
    metrics.set_gauge("queue_depth", 7);

    std::string text = metrics.export_prometheus();
    EXPECT_NE(text.find("# TYPE threnody_queue_dropped counter"), std::string::npos);
    EXPECT_NE(text.find("threnody_queue_dropped 2"), std::string::npos);
    EXPECT_NE(text.find("# TYPE threnody_queue_depth gauge"), std::string::npos);
}
