// ==============================================================================
// test_console_gtest.cpp - Тесты консольного фронтенда (GoogleTest)
// ==============================================================================

#include "fulcrum/console.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <string>

namespace fulcrum::console::test {

using namespace std::chrono_literals;

// ==============================================================================
// parse_request
// ==============================================================================

TEST(ConsoleTest, ParseRequest_Full) {
    auto request = parse_request("  alice start --fresh -memory 4 ");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->requester, "alice");
    EXPECT_EQ(request->command, "start");
    ASSERT_EQ(request->args.size(), 3u);
    EXPECT_EQ(request->args[2], "4");
}

TEST(ConsoleTest, ParseRequest_RequesterOnly) {
    auto request = parse_request("bob");
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->command.empty());
    EXPECT_TRUE(request->args.empty());
}

TEST(ConsoleTest, ParseRequest_BlankAndComment_Skipped) {
    EXPECT_FALSE(parse_request("").has_value());
    EXPECT_FALSE(parse_request("   \t").has_value());
    EXPECT_FALSE(parse_request("# alice start").has_value());
}

// ==============================================================================
// RequestThrottle
// ==============================================================================

TEST(ConsoleTest, Throttle_PerUserWindow) {
    RequestThrottle throttle(10s);
    auto t0 = session::Timestamp{} + 1000s;

    EXPECT_FALSE(throttle.check("alice", t0).has_value());
    EXPECT_FALSE(throttle.check("bob", t0).has_value());

    auto retry = throttle.check("alice", t0 + 3s);
    ASSERT_TRUE(retry.has_value());
    EXPECT_EQ(*retry, 7s);

    EXPECT_FALSE(throttle.check("alice", t0 + 10s).has_value());
}

TEST(ConsoleTest, Throttle_RoundsUp) {
    RequestThrottle throttle(10s);
    auto t0 = session::Timestamp{} + 1000s;
    ASSERT_FALSE(throttle.check("alice", t0).has_value());

    auto retry = throttle.check("alice", t0 + 2500ms);
    ASSERT_TRUE(retry.has_value());
    EXPECT_EQ(*retry, 8s);
}

TEST(ConsoleTest, Throttle_RejectedCallsDoNotExtendWindow) {
    RequestThrottle throttle(10s);
    auto t0 = session::Timestamp{} + 1000s;
    ASSERT_FALSE(throttle.check("alice", t0).has_value());
    ASSERT_TRUE(throttle.check("alice", t0 + 9s).has_value());
    EXPECT_FALSE(throttle.check("alice", t0 + 10s).has_value());
}

TEST(ConsoleTest, Throttle_ZeroWindow_NeverLimits) {
    RequestThrottle throttle(0s);
    auto t0 = session::Timestamp{} + 1000s;
    EXPECT_FALSE(throttle.check("alice", t0).has_value());
    EXPECT_FALSE(throttle.check("alice", t0).has_value());
}

// ==============================================================================
// Frontend
// ==============================================================================

namespace {

class NullRuntime : public runtime::ContainerRuntime {
public:
    int starts = 0;

    runtime::ListResult list(const std::string&) override {
        return runtime::ListResult{true, "1193-mc-1\n", {}};
    }
    runtime::LaunchResult start_existing(const std::string& name) override {
        ++starts;
        return runtime::LaunchResult{true, name, {}, {}};
    }
    runtime::LaunchResult run_fresh(const std::string& name, const volume::VolumeSlot&,
                                    const runtime::LaunchOptions&) override {
        return runtime::LaunchResult{false, name, {}, "not in this test"};
    }
    bool probe_daemon() override { return true; }
    void launch_daemon() override {}
};

}  // namespace

class FrontendTest : public ::testing::Test {
protected:
    NullRuntime runtime_;
    std::unique_ptr<output::Writer> writer_;
    std::unique_ptr<engine::Engine> engine_;

    void SetUp() override {
        output::OutputConfig cfg;
        cfg.quiet = true;
        writer_ = std::make_unique<output::Writer>(cfg);

        engine::EngineConfig engine_cfg;
        engine_cfg.target_tag = "1193";
        engine_cfg.ensure_daemon = false;
        engine_ = std::make_unique<engine::Engine>(engine_cfg, schema::default_start_schema(),
                                                   runtime_, *writer_);
    }

    static Request request(const std::string& line) { return *parse_request(line); }
};

TEST_F(FrontendTest, Start_ReachesEngine) {
    Frontend frontend(*engine_, 10s);
    auto reply = frontend.dispatch(request("alice start"), session::Timestamp{} + 100000s);
    EXPECT_EQ(reply.kind, engine::ReplyKind::Started);
    EXPECT_EQ(runtime_.starts, 1);
}

TEST_F(FrontendTest, RepeatedStart_RateLimited) {
    Frontend frontend(*engine_, 10s);
    auto t0 = session::Timestamp{} + 100000s;

    ASSERT_EQ(frontend.dispatch(request("alice start"), t0).kind, engine::ReplyKind::Started);
    auto limited = frontend.dispatch(request("alice start"), t0 + 1s);
    EXPECT_EQ(limited.kind, engine::ReplyKind::RateLimited);
    EXPECT_NE(limited.text.find("9s"), std::string::npos);

    // Другой пользователь не ограничен окном alice; его отвечает шлюз сессии
    EXPECT_EQ(frontend.dispatch(request("bob start"), t0 + 1s).kind, engine::ReplyKind::Busy);
    EXPECT_EQ(runtime_.starts, 1);
}

TEST_F(FrontendTest, Help_NotThrottled) {
    Frontend frontend(*engine_, 10s);
    auto t0 = session::Timestamp{} + 100000s;

    auto help = frontend.dispatch(request("alice help"), t0);
    EXPECT_EQ(help.kind, engine::ReplyKind::Help);
    EXPECT_NE(help.text.find("start"), std::string::npos);
    EXPECT_EQ(frontend.dispatch(request("alice start"), t0).kind, engine::ReplyKind::Started);
}

TEST_F(FrontendTest, UnknownCommand_Help) {
    Frontend frontend(*engine_, 10s);
    auto reply = frontend.dispatch(request("alice stop"), session::Timestamp{} + 100000s);
    EXPECT_EQ(reply.kind, engine::ReplyKind::Help);
    EXPECT_NE(reply.text.find("Unknown command 'stop'"), std::string::npos);
}

// ==============================================================================
// WorkerSet
// ==============================================================================

TEST(WorkerSetTest, Reap_CollectsFinishedWorkers) {
    WorkerSet workers(8);
    std::atomic<int> ran{0};
    for (int i = 0; i < 5; ++i) {
        workers.spawn([&ran] { ++ran; });
    }

    std::size_t reaped = 0;
    for (int i = 0; i < 200 && workers.size() > 0; ++i) {
        reaped += workers.reap();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(workers.size(), 0u);
    EXPECT_EQ(reaped, 5u);
    EXPECT_EQ(ran.load(), 5);
}

TEST(WorkerSetTest, Reap_KeepsRunningWorkers) {
    WorkerSet workers(8);
    std::atomic<bool> release{false};
    workers.spawn([&release] {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    EXPECT_EQ(workers.reap(), 0u);
    EXPECT_EQ(workers.size(), 1u);

    release = true;
    workers.join_all();
    EXPECT_EQ(workers.size(), 0u);
}

TEST(WorkerSetTest, Spawn_BoundedByLimit) {
    WorkerSet workers(2);
    std::atomic<int> ran{0};
    for (int i = 0; i < 50; ++i) {
        workers.spawn([&ran] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
        });
        EXPECT_LE(workers.size(), 2u);
    }
    workers.join_all();
    EXPECT_EQ(ran.load(), 50);
}

}  // namespace fulcrum::console::test
