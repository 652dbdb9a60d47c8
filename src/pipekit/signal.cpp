#include "./signal.hpp"

#include "./os_error.hpp"

#include <pthread.h>
#include <time.h>

using namespace pipekit;

signal_blocking_scope::signal_blocking_scope(int signum)
    : _signum(signum) {
    ::sigset_t block;
    ::sigemptyset(&block);
    ::sigaddset(&block, signum);
    int rc = ::pthread_sigmask(SIG_BLOCK, &block, &_prev_mask);
    if (rc != 0) {
        throw_os_error(rc, "::pthread_sigmask() failed to block a signal");
    }
}

signal_blocking_scope::~signal_blocking_scope() {
    ::sigset_t pending;
    ::sigpending(&pending);
    if (::sigismember(&pending, _signum) == 1) {
        // Unblocking a pending signal would deliver it right here
        ::sigset_t only;
        ::timespec no_wait = {};
        ::sigemptyset(&only);
        ::sigaddset(&only, _signum);
        ::sigtimedwait(&only, nullptr, &no_wait);
    }
    ::pthread_sigmask(SIG_SETMASK, &_prev_mask, nullptr);
}
