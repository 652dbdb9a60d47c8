#pragma once

#include "./os_pipe.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <sys/types.h>

namespace pipekit {

/**
 * @brief Thrown for a child process that did not exit successfully.
 *
 * A pipeline reports it as a process_exit failure, with exit status 128 plus the signal number
 * for a process killed by a signal.
 */
class subprocess_failure : public std::runtime_error {
    int _exit_code;
    int _signal_number;

public:
    /// Exactly one of `exit_code` and `signal_number` is non-zero
    explicit subprocess_failure(int exit_code, int signal_number) noexcept;

    /// The exit code of the child, or zero if it was killed by a signal
    int exit_code() const noexcept { return _exit_code; }
    /// The signal that killed the child, or zero if it exited
    int signal_number() const noexcept { return _signal_number; }
};

/// How a joined child process ended
struct subprocess_exit {
    int exit_code     = 0;
    int signal_number = 0;

    bool successful() const noexcept { return exit_code == 0 and signal_number == 0; }

    /// Throw subprocess_failure unless successful()
    void throw_if_error() const {
        if (!successful()) {
            throw subprocess_failure(exit_code, signal_number);
        }
    }
};

/// Where a standard stream of a child process is connected
enum class stdio_mode {
    /// Share the stream of the parent process
    inherit,
    /// Connect a pipe that the parent reads or writes
    pipe,
    /// Connect /dev/null
    null,
    /// Only for stderr: write into whatever stdout is connected to
    merge_into_stdout,
};

/// A stdio_mode, or a file to read stdin from or to write an output stream into
using stdio_target = std::variant<stdio_mode, std::filesystem::path>;

struct subprocess_spawn_options {
    /// The program followed by its arguments
    std::vector<std::string> command;

    stdio_target stdin_  = stdio_mode::null;
    stdio_target stdout_ = stdio_mode::inherit;
    stdio_target stderr_ = stdio_mode::inherit;

    /// The child's working directory. The parent's if not set.
    std::optional<std::filesystem::path> working_directory{};

    /// Look the program up on PATH unless it contains a slash
    bool search_path = true;
};

/// Output accumulated by subprocess::read_output_into()
struct subprocess_output {
    std::string stdout_;
    std::string stderr_;
};

/**
 * @brief A child process created by fork() and exec().
 *
 * A subprocess must be joined before it is destroyed. Destroying an unjoined subprocess
 * terminates the program, since it would leave a zombie behind.
 */
class subprocess {
    ::pid_t                        _pid = -1;
    pipe_writer                    _stdin;
    pipe_reader                    _stdout;
    pipe_reader                    _stderr;
    std::optional<subprocess_exit> _exit_result;

    explicit subprocess(::pid_t pid) noexcept
        : _pid(pid) {}

    void _check_joined() const noexcept;

public:
    subprocess(subprocess&& other) noexcept;
    subprocess& operator=(subprocess&& other) noexcept;
    ~subprocess() { _check_joined(); }

    /**
     * @brief Start a child process.
     *
     * @throws std::system_error if the child cannot be started. An executable that does not exist
     * is reported as std::errc::no_such_file_or_directory. The failed child is already reaped.
     * @throws std::invalid_argument if `opts` is malformed
     */
    [[nodiscard]] static subprocess spawn(const subprocess_spawn_options& opts);

    /// Start the given command with default options
    [[nodiscard]] static subprocess spawn(std::initializer_list<std::string_view> command);

    /**
     * @brief Wait for output on the stdout and stderr pipes and append what arrives to `out`.
     *
     * A pipe that reaches end-of-stream is closed. Returns immediately if neither pipe is open.
     *
     * @param timeout How long to wait for output. Negative waits forever.
     */
    void read_output_into(subprocess_output&        out,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{-1});

    /// Read stdout and stderr until the child closes both
    [[nodiscard]] subprocess_output read_output();

    pipe_writer& stdin_pipe() noexcept { return _stdin; }
    pipe_reader& stdout_pipe() noexcept { return _stdout; }
    pipe_reader& stderr_pipe() noexcept { return _stderr; }

    /// Close the stdin pipe, so the child reads end-of-stream
    void close_stdin() noexcept { _stdin.close(); }

    [[nodiscard]] bool has_stdin() const noexcept { return _stdin.is_open(); }
    [[nodiscard]] bool has_stdout() const noexcept { return _stdout.is_open(); }
    [[nodiscard]] bool has_stderr() const noexcept { return _stderr.is_open(); }

    [[nodiscard]] ::pid_t pid() const noexcept { return _pid; }

    /**
     * @brief Wait for the child to end and record how it ended. Must be called exactly once.
     *
     * @throws std::system_error if the child cannot be waited for, e.g. because it was already
     * reaped elsewhere. The handle then lets go of the child, and pid() becomes -1.
     */
    const subprocess_exit& join();
    [[nodiscard]] bool     is_joined() const noexcept { return _exit_result.has_value(); }

    /// Set once the child has been joined
    const std::optional<subprocess_exit>& exit_result() const noexcept { return _exit_result; }

    /// Send a signal to the child. It must not have been joined.
    void send_signal(int signum);
};

}  // namespace pipekit
