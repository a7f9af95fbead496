#pragma once
// =============================================================================
// emu - Command Execution Layer
// =============================================================================
// Every external tool (avdmanager, adb, sdkmanager, emulator, xcrun) is run
// through CommandExecutor so managers can be driven by MockCommandExecutor in
// tests. Calls block the calling thread; the controller runs them on
// background tasks.
// =============================================================================
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "result.hpp"

namespace emu {

using CommandArgs = std::vector<std::string>;

// One stdout line of a streaming command, without the line terminator
using LineSink = std::function<void(const std::string& line)>;

// "program arg1 arg2" (used for logging and as the mock lookup key)
std::string formatCommandLine(const std::string& program, const CommandArgs& args);

// Last path component of an executable path ("/sdk/platform-tools/adb" -> "adb")
std::string programBaseName(const std::string& program);

// True when error text contains any of the patterns
bool matchesIgnorePattern(const std::string& error_text,
                          const std::vector<std::string>& ignore_patterns);

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Spawn, wait, return stdout. Non-zero exit or spawn failure -> error
    virtual Result<std::string> run(const std::string& program, const CommandArgs& args) = 0;

    // Fire-and-forget launch of a long-running process. Returns its pid
    virtual Result<int> spawn(const std::string& program, const CommandArgs& args) = 0;

    // Feeds each stdout line to sink until the process exits or stop is set,
    // in which case the process is killed and the call returns Ok. No timeout
    virtual Result<void> streamLines(const std::string& program, const CommandArgs& args,
                                     const LineSink& sink, const std::atomic<bool>& stop) = 0;

    // Like run() with `input` written to the child's stdin
    virtual Result<std::string> runWithInput(const std::string& program, const CommandArgs& args,
                                             const std::string& input);

    // Up to retries + 1 attempts, immediate retry; the last error is returned
    virtual Result<std::string> runWithRetry(const std::string& program, const CommandArgs& args,
                                             int retries);

    // A failure whose text contains one of ignore_patterns becomes Ok("")
    virtual Result<std::string> runIgnoringErrors(const std::string& program, const CommandArgs& args,
                                                  const std::vector<std::string>& ignore_patterns);
};

/**
 * Real process runner (POSIX fork/exec, no shell).
 * stdout and stderr are captured separately; a child that outlives the
 * timeout is killed and reported as ErrorCode::Timeout.
 */
class CommandRunner : public CommandExecutor {
public:
    explicit CommandRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    Result<std::string> run(const std::string& program, const CommandArgs& args) override;
    Result<int> spawn(const std::string& program, const CommandArgs& args) override;
    Result<std::string> runWithInput(const std::string& program, const CommandArgs& args,
                                     const std::string& input) override;
    Result<void> streamLines(const std::string& program, const CommandArgs& args,
                             const LineSink& sink, const std::atomic<bool>& stop) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    Result<std::string> execute(const std::string& program, const CommandArgs& args,
                                const std::string* input);

    std::chrono::milliseconds timeout_;
};

} // namespace emu
