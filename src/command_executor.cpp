#include "command_executor.hpp"
#include "emu_constants.hpp"
#include "emu_log.hpp"

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <memory>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace emu {

namespace {

// RAII wrapper for a pipe end / file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) { reset(); fd_ = o.fd_; o.fd_ = -1; }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

bool makePipe(Pipe& p, int flags = O_CLOEXEC) {
    int fds[2];
    if (::pipe2(fds, flags) != 0) return false;
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
    return true;
}

// argv must be built before fork(): only async-signal-safe calls in the child
std::vector<char*> buildArgv(const std::string& program, const CommandArgs& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

void writeAll(int fd, const void* data, size_t len) {
    auto p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
}

// Reads until len bytes arrived or every writer closed; returns bytes read
size_t readFull(int fd, void* data, size_t len) {
    auto p = static_cast<char*>(data);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::read(fd, p + got, len - got);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        got += static_cast<size_t>(n);
    }
    return got;
}

std::string trimCopy(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

std::string formatCommandLine(const std::string& program, const CommandArgs& args) {
    std::string line = program + " ";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) line += ' ';
        line += args[i];
    }
    return line;
}

std::string programBaseName(const std::string& program) {
    auto pos = program.find_last_of('/');
    return pos == std::string::npos ? program : program.substr(pos + 1);
}

bool matchesIgnorePattern(const std::string& error_text,
                          const std::vector<std::string>& ignore_patterns) {
    for (const auto& pattern : ignore_patterns) {
        if (!pattern.empty() && error_text.find(pattern) != std::string::npos) return true;
    }
    return false;
}

// =============================================================================
// CommandExecutor policy (shared by real and mock executors)
// =============================================================================

Result<std::string> CommandExecutor::runWithInput(const std::string& program,
                                                  const CommandArgs& args,
                                                  const std::string& /*input*/) {
    return run(program, args);
}

Result<std::string> CommandExecutor::runWithRetry(const std::string& program,
                                                  const CommandArgs& args, int retries) {
    if (retries < 0) retries = 0;
    Result<std::string> last = run(program, args);
    for (int attempt = 1; attempt <= retries && last.is_err(); ++attempt) {
        ELOG_DEBUG("cmd", "retry %d/%d: %s", attempt, retries,
                   formatCommandLine(program, args).c_str());
        last = run(program, args);
    }
    return last;
}

Result<std::string> CommandExecutor::runIgnoringErrors(const std::string& program,
                                                       const CommandArgs& args,
                                                       const std::vector<std::string>& ignore_patterns) {
    auto result = run(program, args);
    if (result.is_err() && matchesIgnorePattern(result.error().message, ignore_patterns)) {
        ELOG_DEBUG("cmd", "ignored expected error from %s: %s",
                   programBaseName(program).c_str(), result.error().message.c_str());
        return Ok(std::string());
    }
    return result;
}

// =============================================================================
// CommandRunner
// =============================================================================

CommandRunner::CommandRunner(std::chrono::milliseconds timeout) : timeout_(timeout) {}

Result<std::string> CommandRunner::run(const std::string& program, const CommandArgs& args) {
    return execute(program, args, nullptr);
}

Result<std::string> CommandRunner::runWithInput(const std::string& program, const CommandArgs& args,
                                                const std::string& input) {
    return execute(program, args, &input);
}

Result<std::string> CommandRunner::execute(const std::string& program, const CommandArgs& args,
                                           const std::string* input) {
    const std::string cmdline = formatCommandLine(program, args);
    ELOG_DEBUG("cmd", "exec: %s", cmdline.c_str());

    Pipe out, err, in, exec_status;
    if (!makePipe(out) || !makePipe(err) || !makePipe(in) || !makePipe(exec_status)) {
        return CommandError("Failed to create pipes for " + programBaseName(program) +
                            ": " + std::strerror(errno), -1, ErrorCode::SpawnFailed);
    }

    auto argv = buildArgv(program, args);
    pid_t pid = ::fork();
    if (pid < 0) {
        return CommandError("Failed to execute command: " + std::string(std::strerror(errno)),
                            -1, ErrorCode::SpawnFailed);
    }

    if (pid == 0) {
        ::dup2(in.read_end.get(), STDIN_FILENO);
        ::dup2(out.write_end.get(), STDOUT_FILENO);
        ::dup2(err.write_end.get(), STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int e = errno;
        writeAll(exec_status.write_end.get(), &e, sizeof(e));
        ::_exit(127);
    }

    out.write_end.reset();
    err.write_end.reset();
    in.read_end.reset();
    exec_status.write_end.reset();

    if (input && !input->empty()) {
        // SIGPIPE is ignored process-wide at startup; a dead child gives EPIPE
        writeAll(in.write_end.get(), input->data(), input->size());
    }
    in.write_end.reset();

    std::string stdout_text, stderr_text;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool timed_out = false;

    pollfd fds[2] = {{out.read_end.get(), POLLIN, 0}, {err.read_end.get(), POLLIN, 0}};
    int open_streams = 2;
    char buffer[4096];
    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        int rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                auto& sink = (i == 0) ? stdout_text : stderr_text;
                if (sink.size() < constants::MAX_COMMAND_OUTPUT) sink.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    int exec_errno = 0;
    if (::read(exec_status.read_end.get(), &exec_errno, sizeof(exec_errno)) ==
        static_cast<ssize_t>(sizeof(exec_errno))) {
        ELOG_DEBUG("cmd", "spawn failed: %s (%s)", cmdline.c_str(), std::strerror(exec_errno));
        return CommandError("Failed to execute command: " + program + ": " + std::strerror(exec_errno),
                            -1, ErrorCode::SpawnFailed);
    }

    if (timed_out) {
        ELOG_WARN("cmd", "timeout after %lldms: %s",
                  static_cast<long long>(timeout_.count()), cmdline.c_str());
        return CommandError("Command timed out after " + std::to_string(timeout_.count()) +
                            "ms: " + cmdline, -1, ErrorCode::Timeout);
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    ELOG_DEBUG("cmd", "exit=%d stdout=%zuB stderr=%zuB", exit_code,
               stdout_text.size(), stderr_text.size());

    if (exit_code != 0) {
        return CommandError("Command failed with exit code " + std::to_string(exit_code) +
                            ": stderr: " + trimCopy(stderr_text) +
                            " stdout: " + trimCopy(stdout_text), exit_code);
    }
    return Ok(std::move(stdout_text));
}

Result<void> CommandRunner::streamLines(const std::string& program, const CommandArgs& args,
                                        const LineSink& sink, const std::atomic<bool>& stop) {
    const std::string cmdline = formatCommandLine(program, args);
    ELOG_DEBUG("cmd", "stream: %s", cmdline.c_str());

    Pipe out, exec_status;
    if (!makePipe(out) || !makePipe(exec_status)) {
        return CommandError("Failed to create pipes for " + programBaseName(program) +
                            ": " + std::strerror(errno), -1, ErrorCode::SpawnFailed);
    }

    auto argv = buildArgv(program, args);
    pid_t pid = ::fork();
    if (pid < 0) {
        return CommandError("Failed to execute command: " + std::string(std::strerror(errno)),
                            -1, ErrorCode::SpawnFailed);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::dup2(out.write_end.get(), STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        int e = errno;
        writeAll(exec_status.write_end.get(), &e, sizeof(e));
        ::_exit(127);
    }

    out.write_end.reset();
    exec_status.write_end.reset();

    int exec_errno = 0;
    if (readFull(exec_status.read_end.get(), &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno)) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return CommandError("Failed to execute command: " + program + ": " + std::strerror(exec_errno),
                            -1, ErrorCode::SpawnFailed);
    }

    // Wake up regularly so a quiet stream still notices stop
    constexpr int kStopPollMs = 100;
    pollfd fd = {out.read_end.get(), POLLIN, 0};
    std::string pending;
    char buffer[4096];
    bool stopped = false;
    for (;;) {
        if (stop.load()) {
            stopped = true;
            break;
        }
        int rc = ::poll(&fd, 1, kStopPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fd.fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        pending.append(buffer, static_cast<size_t>(n));
        size_t start = 0;
        for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
            std::string line = pending.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            start = nl + 1;
            if (stop.load()) break;
            sink(line);
        }
        pending.erase(0, start);
        if (pending.size() > constants::MAX_COMMAND_OUTPUT) pending.clear();
    }
    if (!stopped && !pending.empty() && !stop.load()) sink(pending);

    if (stopped) ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (stopped || stop.load()) {
        ELOG_DEBUG("cmd", "stream stopped: %s", cmdline.c_str());
        return Ok();
    }
    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    ELOG_DEBUG("cmd", "stream ended exit=%d: %s", exit_code, cmdline.c_str());
    if (exit_code != 0) {
        return CommandError("Command failed with exit code " + std::to_string(exit_code) + ": " + cmdline,
                            exit_code);
    }
    return Ok();
}

Result<int> CommandRunner::spawn(const std::string& program, const CommandArgs& args) {
    const std::string cmdline = formatCommandLine(program, args);
    ELOG_DEBUG("cmd", "spawn: %s", cmdline.c_str());

    // Double fork: the launched process is re-parented to init and never
    // becomes a zombie of the dashboard. The intermediate child reports the
    // grandchild pid on pid_pipe; the grandchild reports exec failure on
    // exec_pipe, which CLOEXEC closes empty on success.
    Pipe pid_pipe;
    Pipe exec_pipe;
    if (!makePipe(pid_pipe) || !makePipe(exec_pipe)) {
        return CommandError("Failed to create pipe: " + std::string(std::strerror(errno)),
                            -1, ErrorCode::SpawnFailed);
    }

    auto argv = buildArgv(program, args);
    pid_t mid = ::fork();
    if (mid < 0) {
        return CommandError("Failed to spawn command: " + std::string(std::strerror(errno)),
                            -1, ErrorCode::SpawnFailed);
    }

    if (mid == 0) {
        ::setsid();
        pid_t child = ::fork();
        if (child < 0) ::_exit(1);
        if (child == 0) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
            ::execvp(argv[0], argv.data());
            int32_t e = errno;
            writeAll(exec_pipe.write_end.get(), &e, sizeof(e));
            ::_exit(127);
        }
        exec_pipe.write_end.reset();
        int32_t pid32 = static_cast<int32_t>(child);
        writeAll(pid_pipe.write_end.get(), &pid32, sizeof(pid32));
        ::_exit(0);
    }

    pid_pipe.write_end.reset();
    exec_pipe.write_end.reset();
    int status = 0;
    while (::waitpid(mid, &status, 0) < 0 && errno == EINTR) {}

    int32_t child_pid = 0;
    if (readFull(pid_pipe.read_end.get(), &child_pid, sizeof(child_pid)) != sizeof(child_pid)) {
        return CommandError("Failed to spawn command: " + cmdline, -1, ErrorCode::SpawnFailed);
    }

    // Blocks until the grandchild exec'd (EOF) or reported why it could not
    int32_t exec_errno = 0;
    if (readFull(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno)) {
        return CommandError("Failed to spawn command: " + program + ": " + std::strerror(exec_errno),
                            -1, ErrorCode::SpawnFailed);
    }

    ELOG_INFO("cmd", "spawned pid %d: %s", child_pid, programBaseName(program).c_str());
    return Ok(static_cast<int>(child_pid));
}

} // namespace emu
