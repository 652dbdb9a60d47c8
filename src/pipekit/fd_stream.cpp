#include "./fd_stream.hpp"

#include "./os_error.hpp"

#include <neo/assert.hpp>

#include <cerrno>

#include <unistd.h>

using namespace pipekit;

namespace {

std::size_t read_fd(int fd, mutable_buffer buf) {
    while (true) {
        auto nread = ::read(fd, buf.data(), buf.size());
        if (nread >= 0) {
            return static_cast<std::size_t>(nread);
        }
        if (errno != EINTR) {
            throw_errno("::read() from a file descriptor failed");
        }
    }
}

std::size_t write_fd(int fd, const_buffer buf) {
    // Short writes are normal for pipes. Keep going until everything is written.
    std::size_t total = 0;
    while (total < buf.size()) {
        auto nwritten = ::write(fd, buf.data() + total, buf.size() - total);
        if (nwritten < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("::write() into a file descriptor failed");
        }
        total += static_cast<std::size_t>(nwritten);
    }
    return total;
}

/// One of the process's standard streams. The descriptor is borrowed.
class standard_stream : public byte_io_stream {
    int _fd;

    std::size_t do_read_into(mutable_buffer buf) override { return read_fd(_fd, buf); }
    std::size_t do_write(const_buffer buf) override { return write_fd(_fd, buf); }

public:
    explicit standard_stream(int fd) noexcept
        : _fd(fd) {}
};

}  // namespace

void fd_stream::close() noexcept {
    if (is_open()) {
        ::close(_fd);
    }
    _fd = -1;
}

std::size_t fd_stream::do_read_into(mutable_buffer buf) {
    if (!is_open()) {
        return 0;
    }
    auto nread = read_fd(_fd, buf);
    if (nread == 0 and buf.size() != 0) {
        close();
    }
    return nread;
}

std::size_t fd_stream::do_write(const_buffer buf) {
    neo_assert(expects, is_open(), "Attempted to write into a closed file descriptor", buf.size());
    return write_fd(_fd, buf);
}

byte_io_stream& pipekit::standard_output() noexcept {
    static standard_stream instance{STDOUT_FILENO};
    return instance;
}

byte_io_stream& pipekit::standard_input() noexcept {
    static standard_stream instance{STDIN_FILENO};
    return instance;
}
