#include "rkv/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace rkv::util;

TEST(MetricsTest, CountersAccumulate) {
    MetricRegistry reg;
    reg.increment("hits");
    reg.increment("hits", 2.0);
    EXPECT_DOUBLE_EQ(reg.counter("hits"), 3.0);
    EXPECT_DOUBLE_EQ(reg.counter("missing"), 0.0);
}

TEST(MetricsTest, GaugesOverwrite) {
    MetricRegistry reg;
    reg.setGauge("buckets", 3);
    reg.setGauge("buckets", 1);
    EXPECT_DOUBLE_EQ(reg.gauge("buckets"), 1.0);
    EXPECT_EQ(reg.snapshotGauges().size(), 1u);
}

TEST(MetricsTest, ResetClearsEverything) {
    MetricRegistry reg;
    reg.increment("a");
    reg.setGauge("b", 1);
    reg.reset();
    EXPECT_TRUE(reg.snapshotCounters().empty());
    EXPECT_TRUE(reg.snapshotGauges().empty());
}

TEST(MetricsTest, ConcurrentIncrements) {
    MetricRegistry reg;
    std::vector<std::thread> ths;
    for (int t = 0; t < 4; ++t) {
        ths.emplace_back([&reg]() {
            for (int i = 0; i < 1000; ++i) reg.increment("n");
        });
    }
    for (auto& t : ths) t.join();
    EXPECT_DOUBLE_EQ(reg.counter("n"), 4000.0);
}

TEST(MetricsTest, ReporterStartsAndStopsPromptly) {
    MetricRegistry reg;
    reg.increment("x");
    reg.startReporter(60);
    // stop must not wait out the interval
    auto t0 = std::chrono::steady_clock::now();
    reg.stopReporter();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
    reg.stopReporter();
}
