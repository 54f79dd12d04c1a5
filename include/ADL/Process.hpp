// include/ADL/Process.hpp
#pragma once

#include "ADL/Utf8.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ADL {

/**
 * @brief A program invocation: program name, arguments and the exact child environment.
 *
 * No shell is involved. The program is looked up in the PATH entry of envVars(),
 * not in the caller's PATH.
 */
class Command {
public:
    explicit Command(std::string program);

    /**
     * @brief Split a command line on whitespace. Quotes and escapes are not interpreted.
     */
    static Command pureParse(std::string_view commandLine);

    Command& withArg(std::string arg);
    Command& withArgs(const std::vector<std::string>& args);
    Command& withEnvVar(std::string name, std::string value);
    Command& withEnvVars(const std::map<std::string, std::string>& vars);

    const std::string& program() const { return program_; }
    const std::vector<std::string>& args() const { return args_; }
    const std::map<std::string, std::string>& envVars() const { return envVars_; }

    /**
     * @brief Space-joined command line, for logs and error messages.
     */
    std::string display() const;

private:
    std::string program_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> envVars_;
};

/**
 * @brief Everything captured from a finished child.
 */
struct Output {
    std::vector<uint8_t> stdoutBytes;
    std::vector<uint8_t> stderrBytes;
    std::optional<int> exitCode;     ///< Set when the child exited normally
    std::optional<int> termSignal;   ///< Set when the child was killed by a signal

    bool success() const { return exitCode && *exitCode == 0; }

    std::expected<std::string_view, Utf8Error> stdoutStr() const { return decodeUtf8(stdoutBytes); }
    std::expected<std::string_view, Utf8Error> stderrStr() const { return decodeUtf8(stderrBytes); }
};

/**
 * @brief Failure to run a command to a successful exit.
 *
 * output() is present for NonZeroExit and Signaled. SpawnFailed and
 * WaitFailed carry no output: nothing reliable was captured.
 */
class ProcessError {
public:
    enum class Kind {
        SpawnFailed,   ///< pipe(2) or fork(2) failed, nothing ran
        WaitFailed,    ///< Reading the child's pipes or reaping it failed
        NonZeroExit,   ///< Child exited with a non-zero status
        Signaled       ///< Child was terminated by a signal
    };

    ProcessError(Kind kind, std::string command, std::optional<Output> output, std::error_code systemError = {});

    Kind kind() const { return kind_; }
    const std::string& command() const { return command_; }
    const std::optional<Output>& output() const { return output_; }
    std::error_code systemError() const { return systemError_; }

    /**
     * @brief Human-readable description, including captured stderr when there is any.
     */
    std::string message() const;

private:
    Kind kind_;
    std::string command_;
    std::optional<Output> output_;
    std::error_code systemError_;
};

std::string processErrorKindToString(ProcessError::Kind kind);

/**
 * @brief Runs a command to completion and captures its output streams.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Spawn @p command, wait for it to exit and collect stdout/stderr separately.
     * @return Output on a zero exit status, ProcessError otherwise
     */
    virtual std::expected<Output, ProcessError> runAndWaitForOutput(const Command& command) = 0;
};

/**
 * @brief POSIX fork/execve implementation of ICommandRunner.
 *
 * The calling thread blocks until the child exits. If the program cannot be
 * executed the child writes a diagnostic to its stderr and exits with 127, so
 * the failure is reported as a NonZeroExit with captured output.
 */
class SubprocessRunner : public ICommandRunner {
public:
    SubprocessRunner() = default;
    ~SubprocessRunner() override = default;

    std::expected<Output, ProcessError> runAndWaitForOutput(const Command& command) override;

    SubprocessRunner(const SubprocessRunner&) = delete;
    SubprocessRunner& operator=(const SubprocessRunner&) = delete;
};

/**
 * @brief Candidate executable paths for @p program given a PATH value.
 *
 * A program containing '/' is returned unchanged. Empty PATH entries mean the
 * current directory.
 */
std::vector<std::string> resolveProgramCandidates(const std::string& program, const std::string& pathValue);

} // namespace ADL
