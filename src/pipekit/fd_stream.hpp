#pragma once

#include "./io.hpp"

#include <utility>

namespace pipekit {

/**
 * @brief A byte stream that owns a POSIX file descriptor, and closes it on destruction.
 *
 * Reading zero bytes into a non-empty buffer closes the descriptor, after which every read returns
 * zero. Writing into a closed stream is a precondition violation.
 */
class fd_stream : public byte_io_stream {
    int _fd = -1;

    std::size_t do_read_into(mutable_buffer buf) override;
    std::size_t do_write(const_buffer buf) override;

public:
    fd_stream() = default;
    explicit fd_stream(int fd) noexcept
        : _fd(fd) {}

    fd_stream(fd_stream&& other) noexcept
        : _fd(other.release()) {}
    fd_stream& operator=(fd_stream&& other) noexcept {
        if (&other != this) {
            reset(other.release());
        }
        return *this;
    }

    ~fd_stream() { close(); }

    /// The descriptor, or -1 if the stream is closed
    [[nodiscard]] int fd() const noexcept { return _fd; }

    [[nodiscard]] bool is_open() const noexcept { return _fd >= 0; }

    /// Close the descriptor. Closing a closed stream does nothing.
    void close() noexcept;

    /// Close the current descriptor and take ownership of `fd`
    void reset(int fd) noexcept {
        close();
        _fd = fd;
    }

    /// Give up ownership of the descriptor without closing it
    [[nodiscard]] int release() noexcept { return std::exchange(_fd, -1); }
};

/// The standard output of the current process. Never closed.
byte_io_stream& standard_output() noexcept;
/// The standard input of the current process. Never closed.
byte_io_stream& standard_input() noexcept;

}  // namespace pipekit
