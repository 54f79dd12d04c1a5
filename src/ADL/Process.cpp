#include "ADL/Process.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <sstream>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ADL {

namespace {

constexpr int kExecFailedStatus = 127;          // Same status a shell uses for "command not found"
constexpr std::size_t kReadChunkSize = 4096;
constexpr const char* kDefaultPath = "/usr/bin:/bin";

std::error_code lastError() {
    return std::error_code(errno, std::system_category());
}

// RAII owner of one file descriptor
class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.release()) {}
    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FdGuard readEnd;
    FdGuard writeEnd;
};

std::expected<Pipe, std::error_code> makePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(lastError());
    }
    return Pipe{FdGuard(fds[0]), FdGuard(fds[1])};
}

// Kills and reaps the child unless release() was called after a successful waitpid
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ <= 0) {
            return;
        }
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void release() { pid_ = -1; }

private:
    pid_t pid_;
};

// Read both pipes until EOF on each, without letting either one fill up and stall the child.
std::error_code drainPipes(int stdoutFd, int stderrFd, Output& output) {
    pollfd fds[2] = {
        {stdoutFd, POLLIN, 0},
        {stderrFd, POLLIN, 0},
    };
    std::vector<uint8_t>* sinks[2] = {&output.stdoutBytes, &output.stderrBytes};
    int open = 2;
    uint8_t buffer[kReadChunkSize];

    while (open > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return lastError();
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->insert(sinks[i]->end(), buffer, buffer + n);
            } else if (n == 0) {
                fds[i].fd = -1; // poll() skips negative descriptors
                --open;
            } else if (errno != EINTR && errno != EAGAIN) {
                return lastError();
            }
        }
    }
    return {};
}

std::string trimTrailingWhitespace(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

} // anonymous namespace

// --- Command ---

Command::Command(std::string program)
    : program_(std::move(program))
{
}

Command Command::pureParse(std::string_view commandLine) {
    std::vector<std::string> words;
    std::istringstream iss{std::string(commandLine)};
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    if (words.empty()) {
        return Command(std::string());
    }
    Command command(words.front());
    words.erase(words.begin());
    command.withArgs(words);
    return command;
}

Command& Command::withArg(std::string arg) {
    args_.push_back(std::move(arg));
    return *this;
}

Command& Command::withArgs(const std::vector<std::string>& args) {
    args_.insert(args_.end(), args.begin(), args.end());
    return *this;
}

Command& Command::withEnvVar(std::string name, std::string value) {
    envVars_[std::move(name)] = std::move(value);
    return *this;
}

Command& Command::withEnvVars(const std::map<std::string, std::string>& vars) {
    for (const auto& [name, value] : vars) {
        envVars_[name] = value;
    }
    return *this;
}

std::string Command::display() const {
    std::string line = program_;
    for (const auto& arg : args_) {
        line += ' ';
        line += arg;
    }
    return line;
}

// --- ProcessError ---

ProcessError::ProcessError(Kind kind, std::string command, std::optional<Output> output, std::error_code systemError)
    : kind_(kind)
    , command_(std::move(command))
    , output_(std::move(output))
    , systemError_(systemError)
{
}

std::string processErrorKindToString(ProcessError::Kind kind) {
    switch (kind) {
        case ProcessError::Kind::SpawnFailed: return "SpawnFailed";
        case ProcessError::Kind::WaitFailed:  return "WaitFailed";
        case ProcessError::Kind::NonZeroExit: return "NonZeroExit";
        case ProcessError::Kind::Signaled:    return "Signaled";
        default:                              return "Unknown";
    }
}

std::string ProcessError::message() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::SpawnFailed:
            oss << "`" << command_ << "` could not be spawned: " << systemError_.message();
            break;
        case Kind::WaitFailed:
            oss << "failed while waiting for `" << command_ << "`: " << systemError_.message();
            break;
        case Kind::NonZeroExit:
            oss << "`" << command_ << "` exited with status "
                << (output_ && output_->exitCode ? *output_->exitCode : -1);
            break;
        case Kind::Signaled:
            oss << "`" << command_ << "` was killed by signal "
                << (output_ && output_->termSignal ? *output_->termSignal : -1);
            break;
    }
    if (output_ && !output_->stderrBytes.empty()) {
        std::string stderrText(output_->stderrBytes.begin(), output_->stderrBytes.end());
        oss << "\nstderr: " << trimTrailingWhitespace(std::move(stderrText));
    }
    return oss.str();
}

// --- SubprocessRunner ---

std::vector<std::string> resolveProgramCandidates(const std::string& program, const std::string& pathValue) {
    if (program.find('/') != std::string::npos) {
        return {program};
    }
    std::vector<std::string> candidates;
    std::size_t start = 0;
    while (true) {
        std::size_t end = pathValue.find(':', start);
        std::string dir = pathValue.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty()) {
            dir = ".";
        }
        candidates.push_back(dir + "/" + program);
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return candidates;
}

std::expected<Output, ProcessError> SubprocessRunner::runAndWaitForOutput(const Command& command) {
    const std::string display = command.display();
    spdlog::debug("SubprocessRunner: running `{}` with {} explicit env var(s)", display, command.envVars().size());

    if (command.program().empty()) {
        return std::unexpected(ProcessError(ProcessError::Kind::SpawnFailed, display, std::nullopt,
                                            std::make_error_code(std::errc::invalid_argument)));
    }

    // Everything the child touches is prepared before fork(); the child only calls
    // dup2, execve, write and _exit.
    auto pathIt = command.envVars().find("PATH");
    const std::vector<std::string> candidates = resolveProgramCandidates(
        command.program(), pathIt != command.envVars().end() ? pathIt->second : std::string(kDefaultPath));

    std::vector<std::string> argStorage;
    argStorage.reserve(command.args().size() + 1);
    argStorage.push_back(command.program());
    argStorage.insert(argStorage.end(), command.args().begin(), command.args().end());
    std::vector<char*> argv;
    for (auto& arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage;
    for (const auto& [name, value] : command.envVars()) {
        envStorage.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string notFoundMessage = command.program() + ": command not found\n";
    const std::string execFailedMessage = command.program() + ": could not be executed\n";

    auto stdoutPipe = makePipe();
    if (!stdoutPipe) {
        spdlog::error("SubprocessRunner: pipe() failed: {}", stdoutPipe.error().message());
        return std::unexpected(ProcessError(ProcessError::Kind::SpawnFailed, display, std::nullopt, stdoutPipe.error()));
    }
    auto stderrPipe = makePipe();
    if (!stderrPipe) {
        spdlog::error("SubprocessRunner: pipe() failed: {}", stderrPipe.error().message());
        return std::unexpected(ProcessError(ProcessError::Kind::SpawnFailed, display, std::nullopt, stderrPipe.error()));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto ec = lastError();
        spdlog::error("SubprocessRunner: fork() failed: {}", ec.message());
        return std::unexpected(ProcessError(ProcessError::Kind::SpawnFailed, display, std::nullopt, ec));
    }

    if (pid == 0) {
        // -- Child process --
        if (::dup2(stdoutPipe->writeEnd.get(), STDOUT_FILENO) < 0 ||
            ::dup2(stderrPipe->writeEnd.get(), STDERR_FILENO) < 0) {
            ::_exit(kExecFailedStatus);
        }
        bool onlyNotFound = true;
        for (const auto& candidate : candidates) {
            ::execve(candidate.c_str(), argv.data(), envp.data());
            if (errno != ENOENT && errno != ENOTDIR) {
                onlyNotFound = false;
            }
        }
        const std::string& message = onlyNotFound ? notFoundMessage : execFailedMessage;
        if (::write(STDERR_FILENO, message.data(), message.size()) < 0) {
            ::_exit(kExecFailedStatus);
        }
        ::_exit(kExecFailedStatus);
    }

    // -- Parent process --
    ChildGuard child(pid);
    stdoutPipe->writeEnd.reset();
    stderrPipe->writeEnd.reset();

    Output output;
    if (auto ec = drainPipes(stdoutPipe->readEnd.get(), stderrPipe->readEnd.get(), output)) {
        spdlog::error("SubprocessRunner: reading output of `{}` failed: {}", display, ec.message());
        return std::unexpected(ProcessError(ProcessError::Kind::WaitFailed, display, std::nullopt, ec));
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        auto ec = lastError();
        child.release();
        spdlog::error("SubprocessRunner: waitpid() for `{}` failed: {}", display, ec.message());
        return std::unexpected(ProcessError(ProcessError::Kind::WaitFailed, display, std::nullopt, ec));
    }
    child.release();

    if (WIFEXITED(status)) {
        output.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.termSignal = WTERMSIG(status);
    }

    spdlog::debug("SubprocessRunner: `{}` finished (exit={}, signal={}, stdout={} bytes, stderr={} bytes)",
                  display,
                  output.exitCode ? *output.exitCode : -1,
                  output.termSignal ? *output.termSignal : 0,
                  output.stdoutBytes.size(),
                  output.stderrBytes.size());

    if (output.success()) {
        return output;
    }
    const auto kind = output.termSignal ? ProcessError::Kind::Signaled : ProcessError::Kind::NonZeroExit;
    return std::unexpected(ProcessError(kind, display, std::move(output)));
}

} // namespace ADL
