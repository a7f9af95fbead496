#include "mock_command_executor.hpp"

#include <sstream>
#include <thread>

namespace emu {

MockCommandExecutor& MockCommandExecutor::withSuccess(const std::string& program,
                                                      const CommandArgs& args,
                                                      const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[formatCommandLine(program, args)] = {true, output};
    return *this;
}

MockCommandExecutor& MockCommandExecutor::withError(const std::string& program,
                                                    const CommandArgs& args,
                                                    const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[formatCommandLine(program, args)] = {false, error};
    return *this;
}

MockCommandExecutor& MockCommandExecutor::withSpawn(const std::string& program,
                                                    const CommandArgs& args, int pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    spawn_responses_[formatCommandLine(program, args)] = pid;
    return *this;
}

MockCommandExecutor& MockCommandExecutor::withStream(const std::string& program,
                                                     const CommandArgs& args,
                                                     const std::string& output, bool keep_open) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_responses_[formatCommandLine(program, args)] = {output, keep_open};
    return *this;
}

void MockCommandExecutor::record(const std::string& program, const CommandArgs& args,
                                 const std::string& input) {
    history_.push_back({program, args, input});
}

// Caller holds mutex_
const MockCommandExecutor::Response* MockCommandExecutor::lookup(const std::string& program,
                                                                 const CommandArgs& args) const {
    auto it = responses_.find(formatCommandLine(program, args));
    if (it != responses_.end()) return &it->second;
    it = responses_.find(formatCommandLine(programBaseName(program), args));
    if (it != responses_.end()) return &it->second;
    return nullptr;
}

Result<std::string> MockCommandExecutor::run(const std::string& program, const CommandArgs& args) {
    return runWithInput(program, args, std::string());
}

Result<std::string> MockCommandExecutor::runWithInput(const std::string& program,
                                                      const CommandArgs& args,
                                                      const std::string& input) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(program, args, input);

    const Response* response = lookup(program, args);
    if (!response) {
        return CommandError("No mock response for: " + formatCommandLine(program, args), -1);
    }
    if (!response->first) {
        return CommandError(response->second, 1);
    }
    return Ok(response->second);
}

Result<int> MockCommandExecutor::spawn(const std::string& program, const CommandArgs& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(program, args, std::string());

    auto it = spawn_responses_.find(formatCommandLine(program, args));
    if (it == spawn_responses_.end()) {
        it = spawn_responses_.find(formatCommandLine(programBaseName(program), args));
    }
    if (it == spawn_responses_.end()) {
        return CommandError("No mock spawn response for: " + formatCommandLine(program, args),
                            -1, ErrorCode::SpawnFailed);
    }
    return Ok(it->second);
}

Result<void> MockCommandExecutor::streamLines(const std::string& program, const CommandArgs& args,
                                              const LineSink& sink, const std::atomic<bool>& stop) {
    std::pair<std::string, bool> response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record(program, args, std::string());
        auto it = stream_responses_.find(formatCommandLine(program, args));
        if (it == stream_responses_.end()) {
            it = stream_responses_.find(formatCommandLine(programBaseName(program), args));
        }
        if (it == stream_responses_.end()) {
            return CommandError("No mock stream response for: " + formatCommandLine(program, args),
                                -1, ErrorCode::SpawnFailed);
        }
        response = it->second;
    }

    // The sink runs without mutex_ held
    std::istringstream iss(response.first);
    std::string line;
    while (!stop.load() && std::getline(iss, line)) {
        sink(line);
    }
    while (response.second && !stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return Ok();
}

std::vector<MockCommandExecutor::Call> MockCommandExecutor::callHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void MockCommandExecutor::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

size_t MockCommandExecutor::callCount(const std::string& program, const CommandArgs& args) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& call : history_) {
        if (programBaseName(call.program) == programBaseName(program) && call.args == args) ++n;
    }
    return n;
}

} // namespace emu
