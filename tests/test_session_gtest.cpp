// ==============================================================================
// test_session_gtest.cpp - Тесты шлюза сессии (GoogleTest)
// ==============================================================================

#include "fulcrum/session.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace fulcrum::session::test {

using namespace std::chrono_literals;

namespace {

Timestamp at(std::chrono::seconds s) {
    return Timestamp{} + s;
}

}  // namespace

// ==============================================================================
// try_admit
// ==============================================================================

TEST(SessionTest, TryAdmit_FreshSession_Admitted) {
    Session session;
    EXPECT_EQ(try_admit(session, at(7200s), 7200s), Admission::Admitted);
}

TEST(SessionTest, TryAdmit_ExactThreshold_Admitted) {
    Session session{true, at(1000s)};
    EXPECT_EQ(try_admit(session, at(1000s + 7200s), 7200s), Admission::Admitted);
}

TEST(SessionTest, TryAdmit_JustBeforeThreshold_Busy) {
    Session session{true, at(1000s)};
    EXPECT_EQ(try_admit(session, at(1000s + 7199s), 7200s), Admission::Busy);
}

// ==============================================================================
// SessionGate
// ==============================================================================

TEST(SessionTest, Gate_AdmitCommitsStart) {
    SessionGate gate(60s);
    auto result = gate.try_admit_and_commit(at(100s));
    ASSERT_TRUE(result.admitted());
    EXPECT_TRUE(result.session.active);
    EXPECT_EQ(result.session.start, at(100s));

    auto snap = gate.snapshot();
    EXPECT_TRUE(snap.active);
    EXPECT_EQ(snap.start, at(100s));
}

TEST(SessionTest, Gate_BusyLeavesSessionUnchanged) {
    SessionGate gate(60s);
    ASSERT_TRUE(gate.try_admit_and_commit(at(100s)).admitted());

    auto busy = gate.try_admit_and_commit(at(130s));
    EXPECT_FALSE(busy.admitted());
    EXPECT_EQ(busy.session.start, at(100s));
    EXPECT_EQ(gate.snapshot().start, at(100s));

    EXPECT_TRUE(gate.try_admit_and_commit(at(160s)).admitted());
    EXPECT_EQ(gate.snapshot().start, at(160s));
}

TEST(SessionTest, Gate_ConcurrentCalls_SingleAdmission) {
    SessionGate gate(7200s);
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            if (gate.try_admit_and_commit(at(10000s)).admitted()) {
                ++admitted;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 1);
}

// ==============================================================================
// Форматирование
// ==============================================================================

TEST(SessionTest, FormatCooldown) {
    EXPECT_EQ(format_cooldown(7200s), "02h:00m:00s");
    EXPECT_EQ(format_cooldown(3725s), "01h:02m:05s");
    EXPECT_EQ(format_cooldown(0s), "00h:00m:00s");
}

TEST(SessionTest, FormatTimestamp_Shape) {
    std::string s = format_timestamp(Clock::now());
    ASSERT_EQ(s.size(), 19u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[13], ':');
}

}  // namespace fulcrum::session::test
