#include "rkv/rt/ShutdownCoordinator.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using rkv::rt::ShutdownCoordinator;

TEST(ShutdownCoordinatorTest, RunsStepsInAscendingOrder) {
    ShutdownCoordinator sc;
    std::vector<std::string> ran;
    sc.registerStep("late", 90, [&]{ ran.push_back("late"); });
    sc.registerStep("early", 10, [&]{ ran.push_back("early"); });
    sc.registerStep("mid", 50, [&]{ ran.push_back("mid"); });
    sc.stop();
    EXPECT_EQ(ran, (std::vector<std::string>{"early", "mid", "late"}));
}

TEST(ShutdownCoordinatorTest, EqualOrderKeepsRegistrationOrder) {
    ShutdownCoordinator sc;
    std::vector<int> ran;
    for (int i = 0; i < 5; ++i) sc.registerStep("s", 1, [&ran, i]{ ran.push_back(i); });
    sc.stop();
    EXPECT_EQ(ran, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ShutdownCoordinatorTest, StopIsIdempotent) {
    ShutdownCoordinator sc;
    int calls = 0;
    sc.registerStep("once", 1, [&]{ ++calls; });
    EXPECT_FALSE(sc.stopping());
    sc.stop();
    sc.stop();
    EXPECT_TRUE(sc.stopping());
    EXPECT_EQ(calls, 1);
}

TEST(ShutdownCoordinatorTest, FailingStepDoesNotBlockLaterSteps) {
    ShutdownCoordinator sc;
    bool laterRan = false;
    sc.registerStep("boom", 1, []{ throw std::runtime_error("boom"); });
    sc.registerStep("after", 2, [&]{ laterRan = true; });
    EXPECT_NO_THROW(sc.stop());
    EXPECT_TRUE(laterRan);
}
