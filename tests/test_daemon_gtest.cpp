// ==============================================================================
// test_daemon_gtest.cpp - Тесты опроса готовности демона (GoogleTest)
// ==============================================================================

#include "fulcrum/daemon.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <vector>

namespace fulcrum::daemon::test {

using namespace std::chrono_literals;

class ReadinessPollerTest : public ::testing::Test {
protected:
    std::vector<std::chrono::milliseconds> sleeps_;
    int launches_ = 0;

    ReadinessPoller make_poller() {
        return ReadinessPoller([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    Launcher launcher() {
        return [this]() { ++launches_; };
    }
};

TEST_F(ReadinessPollerTest, NeverReady_ExactlyMaxChecks) {
    auto poller = make_poller();
    int probes = 0;

    auto readiness = poller.ensure_ready([&]() { ++probes; return false; }, 3, 500ms, launcher());

    EXPECT_EQ(readiness, Readiness::DaemonUnavailable);
    EXPECT_EQ(probes, 3);
    EXPECT_EQ(poller.last_attempts(), 3);
    EXPECT_EQ(launches_, 1);
    // Паузы только между попытками
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], 500ms);
    EXPECT_FALSE(poller.is_ready());
}

TEST_F(ReadinessPollerTest, ReadyOnSecondProbe) {
    auto poller = make_poller();
    int probes = 0;

    auto readiness =
        poller.ensure_ready([&]() { return ++probes == 2; }, 5, 100ms, launcher());

    EXPECT_EQ(readiness, Readiness::Ready);
    EXPECT_EQ(probes, 2);
    EXPECT_EQ(sleeps_.size(), 1u);
    EXPECT_TRUE(poller.is_ready());
}

TEST_F(ReadinessPollerTest, ReadinessIsCached) {
    auto poller = make_poller();
    int probes = 0;
    Probe probe = [&]() { ++probes; return true; };

    ASSERT_EQ(poller.ensure_ready(probe, 5, 100ms, launcher()), Readiness::Ready);
    ASSERT_EQ(poller.ensure_ready(probe, 5, 100ms, launcher()), Readiness::Ready);

    EXPECT_EQ(probes, 1);
    EXPECT_EQ(launches_, 1);
}

TEST_F(ReadinessPollerTest, UnavailableIsNotCached) {
    auto poller = make_poller();
    bool up = false;
    Probe probe = [&]() { return up; };

    EXPECT_EQ(poller.ensure_ready(probe, 2, 10ms, launcher()), Readiness::DaemonUnavailable);
    up = true;
    EXPECT_EQ(poller.ensure_ready(probe, 2, 10ms, launcher()), Readiness::Ready);
    EXPECT_EQ(launches_, 2);
}

TEST_F(ReadinessPollerTest, NoLauncher_StillPolls) {
    auto poller = make_poller();
    int probes = 0;
    EXPECT_EQ(poller.ensure_ready([&]() { ++probes; return false; }, 4, 1ms, Launcher{}),
              Readiness::DaemonUnavailable);
    EXPECT_EQ(probes, 4);
}

}  // namespace fulcrum::daemon::test
