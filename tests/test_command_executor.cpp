// =============================================================================
// Unit tests for CommandRunner / MockCommandExecutor (src/command_executor.hpp)
// Real-runner tests only use /bin/sh, /bin/echo, /bin/cat and /bin/false.
// =============================================================================
#include <gtest/gtest.h>
#include <signal.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>
#include "command_executor.hpp"
#include "mock_command_executor.hpp"

using namespace emu;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
TEST(CommandHelpersTest, FormatCommandLine) {
    EXPECT_EQ(formatCommandLine("adb", {"-s", "emulator-5554", "emu", "kill"}),
              "adb -s emulator-5554 emu kill");
}

TEST(CommandHelpersTest, ProgramBaseName) {
    EXPECT_EQ(programBaseName("/sdk/platform-tools/adb"), "adb");
    EXPECT_EQ(programBaseName("xcrun"), "xcrun");
}

TEST(CommandHelpersTest, MatchesIgnorePattern) {
    const std::vector<std::string> patterns = {"current state: Booted"};
    EXPECT_TRUE(matchesIgnorePattern(
        "Unable to boot device in current state: Booted", patterns));
    EXPECT_FALSE(matchesIgnorePattern("No device matching 'x'", patterns));
    EXPECT_FALSE(matchesIgnorePattern("anything", {""}));
}

// ---------------------------------------------------------------------------
// CommandRunner (real processes)
// ---------------------------------------------------------------------------
TEST(CommandRunnerTest, RunCapturesStdout) {
    CommandRunner runner;
    auto r = runner.run("/bin/echo", {"hello", "world"});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value(), "hello world\n");
}

TEST(CommandRunnerTest, NonZeroExitIsCommandFailed) {
    CommandRunner runner;
    auto r = runner.run("/bin/sh", {"-c", "echo oops >&2; exit 3"});
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorCode::CommandFailed));
    EXPECT_NE(r.error().message.find("exit code 3"), std::string::npos);
    EXPECT_NE(r.error().message.find("oops"), std::string::npos);
}

TEST(CommandRunnerTest, MissingProgramIsSpawnFailed) {
    CommandRunner runner;
    auto r = runner.run("/nonexistent/emu-tool", {});
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorCode::SpawnFailed));
}

TEST(CommandRunnerTest, TimeoutKillsChild) {
    CommandRunner runner(std::chrono::milliseconds(200));
    auto r = runner.run("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorCode::Timeout));
}

TEST(CommandRunnerTest, RunWithInputFeedsStdin) {
    CommandRunner runner;
    auto r = runner.runWithInput("/bin/cat", {}, "no\n");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value(), "no\n");
}

TEST(CommandRunnerTest, RunIgnoringErrorsMatchesStderr) {
    CommandRunner runner;
    auto r = runner.runIgnoringErrors(
        "/bin/sh", {"-c", "echo 'Unable to boot device in current state: Booted' >&2; exit 149"},
        {"current state: Booted"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "");
}

TEST(CommandRunnerTest, SpawnReturnsPid) {
    CommandRunner runner;
    auto r = runner.spawn("/bin/sh", {"-c", "exit 0"});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_GT(r.value(), 0);
}

TEST(CommandRunnerTest, SpawnMissingProgramFails) {
    CommandRunner runner;
    auto r = runner.spawn("/nonexistent/emulator", {"-avd", "x"});
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorCode::SpawnFailed));
}

TEST(CommandRunnerTest, StreamLinesSplitsOutput) {
    CommandRunner runner;
    std::atomic<bool> stop{false};
    std::vector<std::string> lines;
    auto r = runner.streamLines("/bin/sh", {"-c", "printf 'one\\ntwo\\r\\nthree'"},
                                [&](const std::string& line) { lines.push_back(line); }, stop);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(CommandRunnerTest, StreamLinesStopsLongRunningProcess) {
    CommandRunner runner;
    std::atomic<bool> stop{false};
    std::vector<std::string> lines;
    const auto started = std::chrono::steady_clock::now();
    auto r = runner.streamLines("/bin/sh", {"-c", "echo first; sleep 30; echo never"},
                                [&](const std::string& line) {
                                    lines.push_back(line);
                                    stop = true;
                                }, stop);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(lines, std::vector<std::string>{"first"});
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(CommandRunnerTest, StreamLinesReportsFailures) {
    CommandRunner runner;
    std::atomic<bool> stop{false};
    auto missing = runner.streamLines("/nonexistent/adb", {"logcat"}, [](const std::string&) {}, stop);
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.error().is(ErrorCode::SpawnFailed));

    auto failed = runner.streamLines("/bin/sh", {"-c", "echo x; exit 1"}, [](const std::string&) {}, stop);
    ASSERT_TRUE(failed.is_err());
    EXPECT_TRUE(failed.error().is(ErrorCode::CommandFailed));
}

TEST(CommandRunnerTest, SpawnFailureReportsExecErrno) {
    CommandRunner runner;
    const std::string expected = std::strerror(ENOENT);
    // pid and errno travel on separate pipes; the reason must never be a pid
    for (int i = 0; i < 20; ++i) {
        auto r = runner.spawn("/nonexistent/emulator", {"-avd", "x"});
        ASSERT_TRUE(r.is_err());
        EXPECT_EQ(r.error().message, "Failed to spawn command: /nonexistent/emulator: " + expected)
            << "attempt " << i;
    }
}

TEST(CommandRunnerTest, RunLeavesSigpipeDispositionAlone) {
    struct sigaction before {};
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ASSERT_EQ(::sigaction(SIGPIPE, &dfl, &before), 0);

    CommandRunner runner;
    auto r = runner.runWithInput("/bin/cat", {}, "yes\n");
    ASSERT_TRUE(r.is_ok()) << r.error().message;

    struct sigaction now {};
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &now), 0);
    EXPECT_EQ(now.sa_handler, SIG_DFL);
    ::sigaction(SIGPIPE, &before, nullptr);
}

TEST(CommandRunnerTest, InputToExitedChildIsCommandFailed) {
    struct sigaction ign {};
    struct sigaction before {};
    ign.sa_handler = SIG_IGN;
    ASSERT_EQ(::sigaction(SIGPIPE, &ign, &before), 0);   // as main() does at startup

    CommandRunner runner;
    auto r = runner.runWithInput("/bin/sh", {"-c", "exit 3"}, std::string(1 << 20, 'y'));
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorCode::CommandFailed));
    ::sigaction(SIGPIPE, &before, nullptr);
}

// ---------------------------------------------------------------------------
// MockCommandExecutor
// ---------------------------------------------------------------------------
TEST(MockCommandExecutorTest, ExactMatchThenBaseName) {
    MockCommandExecutor mock;
    mock.withSuccess("adb", {"devices"}, "base\n")
        .withSuccess("/opt/sdk/platform-tools/adb", {"devices"}, "exact\n");

    EXPECT_EQ(mock.run("/opt/sdk/platform-tools/adb", {"devices"}).value(), "exact\n");
    EXPECT_EQ(mock.run("/other/sdk/platform-tools/adb", {"devices"}).value(), "base\n");
}

TEST(MockCommandExecutorTest, UnmatchedCallFails) {
    MockCommandExecutor mock;
    auto r = mock.run("avdmanager", {"list", "avd"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "No mock response for: avdmanager list avd");
}

TEST(MockCommandExecutorTest, RegisteredErrorIsCommandError) {
    MockCommandExecutor mock;
    mock.withError("xcrun", {"simctl", "boot", "U1"}, "No device matching 'U1'");
    auto r = mock.run("xcrun", {"simctl", "boot", "U1"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "No device matching 'U1'");
    EXPECT_TRUE(r.error().is(ErrorCode::CommandFailed));
}

TEST(MockCommandExecutorTest, RecordsHistory) {
    MockCommandExecutor mock;
    mock.withSuccess("adb", {"devices"}, "");
    (void)mock.run("/sdk/platform-tools/adb", {"devices"});
    (void)mock.runWithInput("avdmanager", {"create"}, "no\n");

    auto history = mock.callHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].program, "/sdk/platform-tools/adb");
    EXPECT_EQ(history[1].input, "no\n");
    EXPECT_TRUE(mock.wasCalled("adb", {"devices"}));
    EXPECT_EQ(mock.callCount("avdmanager", {"create"}), 1u);

    mock.clearHistory();
    EXPECT_TRUE(mock.callHistory().empty());
}

TEST(MockCommandExecutorTest, RetryStopsAtFirstSuccess) {
    MockCommandExecutor mock;
    mock.withSuccess("avdmanager", {"list", "avd"}, "ok");
    auto r = mock.runWithRetry("avdmanager", {"list", "avd"}, 2);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(mock.callCount("avdmanager", {"list", "avd"}), 1u);
}

TEST(MockCommandExecutorTest, RetryMakesNPlusOneAttempts) {
    MockCommandExecutor mock;
    mock.withError("avdmanager", {"list", "avd"}, "still starting");
    auto r = mock.runWithRetry("avdmanager", {"list", "avd"}, 2);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "still starting");
    EXPECT_EQ(mock.callCount("avdmanager", {"list", "avd"}), 3u);
}

TEST(MockCommandExecutorTest, BootedIsIgnoredButNoDeviceMatchingFails) {
    MockCommandExecutor mock;
    mock.withError("xcrun", {"simctl", "boot", "U1"},
                   "An error was encountered processing the command: Unable to boot device in current state: Booted")
        .withError("xcrun", {"simctl", "boot", "x"}, "Invalid device: No device matching 'x'");

    const std::vector<std::string> ignore = {"current state: Booted"};
    auto booted = mock.runIgnoringErrors("xcrun", {"simctl", "boot", "U1"}, ignore);
    EXPECT_TRUE(booted.is_ok());

    auto missing = mock.runIgnoringErrors("xcrun", {"simctl", "boot", "x"}, ignore);
    ASSERT_TRUE(missing.is_err());
    EXPECT_NE(missing.error().message.find("No device matching 'x'"), std::string::npos);
}

TEST(MockCommandExecutorTest, SpawnResponses) {
    MockCommandExecutor mock;
    mock.withSpawn("emulator", {"-avd", "Pixel_7"}, 4242);
    auto r = mock.spawn("/sdk/emulator/emulator", {"-avd", "Pixel_7"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 4242);

    auto missing = mock.spawn("emulator", {"-avd", "Other"});
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.error().is(ErrorCode::SpawnFailed));
}

TEST(MockCommandExecutorTest, StreamResponses) {
    MockCommandExecutor mock;
    mock.withStream("adb", {"logcat"}, "a\nb\n");
    std::atomic<bool> stop{false};
    std::vector<std::string> lines;
    auto r = mock.streamLines("/sdk/platform-tools/adb", {"logcat"},
                              [&](const std::string& line) { lines.push_back(line); }, stop);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(mock.wasCalled("adb", {"logcat"}));

    auto missing = mock.streamLines("adb", {"logcat", "-c"}, [](const std::string&) {}, stop);
    EXPECT_TRUE(missing.is_err());
}
