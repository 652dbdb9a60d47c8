#include "./os_pipe.hpp"

#include "./os_error.hpp"

#include <fcntl.h>
#include <unistd.h>

pipekit::os_pipe_pair pipekit::create_os_pipe() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw_errno("::pipe2() failed to create an OS pipe");
    }
    return os_pipe_pair{pipe_reader{fds[0]}, pipe_writer{fds[1]}};
}
