#pragma once
// =============================================================================
// emu - Deterministic CommandExecutor for tests
// =============================================================================
// Responses are keyed by "program args..."; lookup tries the exact program
// string first, then the program's base name, so tests can register "adb"
// without knowing the SDK path. Every invocation is recorded.
//
//   auto mock = std::make_shared<MockCommandExecutor>();
//   mock->withSuccess("adb", {"devices"}, "List of devices attached\n");
//   mock->withStream("adb", {"-s", "emulator-5554", "logcat", "-v", "time"}, lines, true);
// =============================================================================
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "command_executor.hpp"

namespace emu {

class MockCommandExecutor : public CommandExecutor {
public:
    struct Call {
        std::string program;
        CommandArgs args;
        std::string input;
    };

    MockCommandExecutor& withSuccess(const std::string& program, const CommandArgs& args,
                                     const std::string& output);
    MockCommandExecutor& withError(const std::string& program, const CommandArgs& args,
                                   const std::string& error);
    MockCommandExecutor& withSpawn(const std::string& program, const CommandArgs& args, int pid);
    // streamLines() emits output line by line; keep_open then blocks until
    // stop is set, like a live logcat
    MockCommandExecutor& withStream(const std::string& program, const CommandArgs& args,
                                    const std::string& output, bool keep_open = false);

    Result<std::string> run(const std::string& program, const CommandArgs& args) override;
    Result<int> spawn(const std::string& program, const CommandArgs& args) override;
    Result<void> streamLines(const std::string& program, const CommandArgs& args,
                             const LineSink& sink, const std::atomic<bool>& stop) override;
    Result<std::string> runWithInput(const std::string& program, const CommandArgs& args,
                                     const std::string& input) override;

    std::vector<Call> callHistory() const;
    void clearHistory();

    // Number of recorded calls whose base program name and args match
    size_t callCount(const std::string& program, const CommandArgs& args) const;
    bool wasCalled(const std::string& program, const CommandArgs& args) const {
        return callCount(program, args) > 0;
    }

private:
    using Response = std::pair<bool, std::string>;  // ok?, output or error text

    void record(const std::string& program, const CommandArgs& args, const std::string& input);
    const Response* lookup(const std::string& program, const CommandArgs& args) const;

    mutable std::mutex mutex_;
    std::map<std::string, Response> responses_;
    std::map<std::string, int> spawn_responses_;
    std::map<std::string, std::pair<std::string, bool>> stream_responses_;
    std::vector<Call> history_;
};

} // namespace emu
