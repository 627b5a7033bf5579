// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "fulcrum/platform.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>

#include <unistd.h>

namespace fulcrum::platform::test {

// ==============================================================================
// Идентификация платформы и пути
// ==============================================================================

TEST(PlatformTest, OsName_ReturnsNonEmpty) {
    std::string name = os_name();
    EXPECT_FALSE(name.empty());
    EXPECT_EQ(name, os_name());
}

TEST(PlatformTest, PathUtf8_RoundTrip) {
    std::filesystem::path p = path_from_utf8("volumes/tmp-mc-1");
    EXPECT_EQ(path_to_utf8(p), "volumes/tmp-mc-1");
}

TEST(PlatformTest, DescribeCommand_JoinsWithSpaces) {
    EXPECT_EQ(describe_command({"docker", "start", "1193-mc-2"}), "docker start 1193-mc-2");
    EXPECT_EQ(describe_command({}), "");
}

// ==============================================================================
// run_process
// ==============================================================================

TEST(PlatformTest, RunProcess_CapturesStdout) {
    auto result = run_process({"echo", "1193-mc-1"});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "1193-mc-1\n");
}

TEST(PlatformTest, RunProcess_NonZeroExit) {
    auto result = run_process({"false"});
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.exit_code, 0);
}

TEST(PlatformTest, RunProcess_DropsStderr) {
    auto result = run_process({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "out\n");
}

TEST(PlatformTest, RunProcess_MissingProgram_ExecFailed) {
    auto result = run_process({"/nonexistent/fulcrum/program"});
    EXPECT_EQ(result.exit_code, EXIT_EXEC_FAILED);
}

TEST(PlatformTest, RunProcess_EmptyArgv_Throws) {
    EXPECT_THROW(run_process({}), std::invalid_argument);
}

// ==============================================================================
// spawn_detached
// ==============================================================================

TEST(PlatformTest, SpawnDetached_RunsInBackground) {
    auto marker = std::filesystem::temp_directory_path() /
                  ("fulcrum_spawn_" + std::to_string(getpid()));
    std::error_code ec;
    std::filesystem::remove(marker, ec);

    spawn_detached({"touch", path_to_utf8(marker)});

    bool seen = false;
    for (int i = 0; i < 100 && !seen; ++i) {
        seen = std::filesystem::exists(marker);
        if (!seen) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    EXPECT_TRUE(seen);
    std::filesystem::remove(marker, ec);
}

TEST(PlatformTest, RunProcess_ConcurrentDetachedSpawns_DoNotDelayEof) {
    // Долгоживущие процессы из соседнего потока не должны держать
    // пишущий конец pipe, иначе run_process ждёт их завершения
    std::atomic<bool> stop{false};
    std::thread spawner([&stop] {
        while (!stop.load()) {
            spawn_detached({"sleep", "3"});
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    std::chrono::steady_clock::duration worst{};
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (std::chrono::steady_clock::now() < deadline) {
        auto begin = std::chrono::steady_clock::now();
        auto result = run_process({"true"});
        worst = std::max(worst, std::chrono::steady_clock::now() - begin);
        EXPECT_TRUE(result.ok());
    }
    stop = true;
    spawner.join();

    EXPECT_LT(worst, std::chrono::seconds(1));
}

TEST(PlatformTest, SpawnDetached_EmptyArgv_Throws) {
    EXPECT_THROW(spawn_detached({}), std::invalid_argument);
}

}  // namespace fulcrum::platform::test
