#pragma once

#include <csignal>

#include <signal.h>

namespace pipekit {

/**
 * @brief A scoped, thread-local signal block.
 *
 * When constructed, the given signal is added to the calling thread's blocked signal mask. Upon
 * destruction, the prior mask is restored.
 *
 * Blocking SIGPIPE this way turns a write into a closed OS pipe into an EPIPE error on the
 * blocking thread instead of terminating the process.
 */
class signal_blocking_scope {
    int        _signum;
    ::sigset_t _prev_mask;

public:
    /// Block @param signum on the calling thread
    [[nodiscard]] explicit signal_blocking_scope(int signum);

    /// Discard any instance of the signal raised while blocked, then restore the prior signal mask
    ~signal_blocking_scope();

    // This type is immobile
    signal_blocking_scope(signal_blocking_scope&&) = delete;
    signal_blocking_scope& operator=(signal_blocking_scope&&) = delete;
};

}  // namespace pipekit
