#pragma once

#include <string_view>

namespace pipekit {

/**
 * @brief Throw a std::system_error in the system category for the given errno value.
 *
 * `what` names the call that failed and what it was doing.
 */
[[noreturn]] void throw_os_error(int errno_value, std::string_view what);

/// Throw throw_os_error() for the calling thread's current errno
[[noreturn]] void throw_errno(std::string_view what);

}  // namespace pipekit
