#pragma once

#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace pipekit {

/**
 * @brief Exception thrown by a stage to fail with an explicit process-style exit code
 */
class exit_error : public std::runtime_error {
    int _exit_code;

public:
    /**
     * @brief Construct a new exit error
     *
     * @param exit_code The exit code to report
     * @param message The error message. If empty, "exit status <code>" is used.
     */
    explicit exit_error(int exit_code, const std::string& message = {});

    /// The exit code carried by this error
    [[nodiscard]] int exit_code() const noexcept { return _exit_code; }
};

/**
 * @brief Exception describing pipeline output that cannot be converted to the requested type
 */
struct conversion_error : std::runtime_error {
    using runtime_error::runtime_error;
};

/// A failure that carries an exit code chosen by the stage itself
struct explicit_exit {
    int code = 0;
};

/// A failure of an external process
struct process_exit {
    /// The exit code of the process, or zero if it was killed by a signal
    int exit_code = 0;
    /// The signal that terminated the process, or zero
    int signal_number = 0;
};

/// Any other failure
struct other_failure {};

/**
 * @brief The closed set of error kinds a pipeline distinguishes when deriving an exit status
 */
using error_kind = std::variant<explicit_exit, process_exit, other_failure>;

/**
 * @brief A failure captured from a pipeline stage or terminal operation.
 *
 * The kind is decided once, when the error is captured.
 */
class pipeline_error {
    error_kind         _kind;
    std::string        _message;
    std::exception_ptr _exception;

public:
    pipeline_error(error_kind kind, std::string message, std::exception_ptr exc = nullptr)
        : _kind(kind)
        , _message(std::move(message))
        , _exception(std::move(exc)) {}

    /**
     * @brief Classify an in-flight exception.
     *
     * exit_error becomes explicit_exit, subprocess_failure becomes process_exit, and everything
     * else becomes other_failure.
     */
    [[nodiscard]] static pipeline_error from_exception(std::exception_ptr exc);

    /// Classify the exception currently being handled. Only valid inside a catch block.
    [[nodiscard]] static pipeline_error from_current_exception() {
        return from_exception(std::current_exception());
    }

    [[nodiscard]] const error_kind&  kind() const noexcept { return _kind; }
    [[nodiscard]] const std::string& message() const noexcept { return _message; }

    /// The original exception, if the error was built from one
    [[nodiscard]] const std::exception_ptr& exception() const noexcept { return _exception; }

    /**
     * @brief The process-style exit status for this error.
     *
     * - explicit_exit: the carried code
     * - process_exit: the process exit code. A child killed by a signal gives 128 plus the
     *   signal number, the way a shell reports it, and never -1.
     * - other_failure: the digits of a trailing "exit status <digits>" in the message, else zero
     */
    [[nodiscard]] int exit_status() const noexcept;

    /// Rethrow the original exception, or a std::runtime_error with the message if there is none
    [[noreturn]] void rethrow() const;
};

/**
 * @brief Derive an exit status from an optional error. Zero if there is no error.
 */
[[nodiscard]] int exit_status(const std::optional<pipeline_error>& err) noexcept;

/**
 * @brief Parse a trailing "exit status <digits>" from an error message.
 *
 * @return The parsed number, or zero if the message does not end with that pattern.
 */
[[nodiscard]] int parse_exit_status_suffix(std::string_view message) noexcept;

/**
 * @brief A mutex-guarded slot holding at most one error.
 *
 * Concurrently running stages capture() into the slot; the first capture wins. Which stage
 * that is depends on scheduling and is not deterministic. A caller may replace or clear the
 * contents with set().
 */
class error_slot {
    mutable std::mutex            _mutex;
    std::optional<pipeline_error> _error;

public:
    /**
     * @brief Store the error if the slot is empty
     *
     * @return true if the error was stored
     */
    bool capture(pipeline_error err);

    /// Unconditionally replace the slot's contents
    void set(std::optional<pipeline_error> err);

    /// Obtain a copy of the current contents
    [[nodiscard]] std::optional<pipeline_error> get() const;

    /// Whether an error is present
    [[nodiscard]] bool has_error() const;
};

}  // namespace pipekit
