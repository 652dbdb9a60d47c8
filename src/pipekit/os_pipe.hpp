#pragma once

#include "./fd_stream.hpp"

namespace pipekit {

/// The read end of an OS pipe. Writing into it does not compile.
struct pipe_reader : fd_stream {
    using fd_stream::fd_stream;

private:
    using byte_io_stream::write;
    using byte_io_stream::write_bytes;
};

/// The write end of an OS pipe. Reading from it does not compile.
struct pipe_writer : fd_stream {
    using fd_stream::fd_stream;

private:
    using byte_io_stream::read;
    using byte_io_stream::read_bytes;
    using byte_io_stream::read_into;
};

/// Both ends of a new OS pipe
struct os_pipe_pair {
    pipe_reader reader;
    pipe_writer writer;
};

/**
 * @brief Create an anonymous OS pipe with both ends marked close-on-exec.
 *
 * These connect a pipeline to child processes. Stages inside the process talk through
 * create_stream_pair() instead.
 */
os_pipe_pair create_os_pipe();

}  // namespace pipekit
