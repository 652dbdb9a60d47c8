#pragma once

#include "./io.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace pipekit {

/**
 * @brief Exception thrown when writing into a stream pair whose read end has been closed.
 *
 * This is the in-process counterpart of EPIPE.
 */
struct broken_pipe_error : std::runtime_error {
    using runtime_error::runtime_error;
};

/**
 * @brief Exception thrown when writing into a stream whose write end has already been closed
 */
struct closed_stream_error : std::runtime_error {
    using runtime_error::runtime_error;
};

/**
 * @brief A stream type that has a close() member
 */
template <typename S>
concept closeable_stream = std::derived_from<S, byte_io_stream> and requires(S& s) {
    s.close();
};

namespace detail {

class conduit;

}  // namespace detail

struct stream_pair;

/**
 * @brief Create a new in-process, unbuffered, synchronous stream pair
 */
[[nodiscard]] stream_pair create_stream_pair();

/**
 * @brief The read end of a stream pair.
 *
 * Either shares a conduit with a stream_writer, or (for a read-only pair) owns an existing
 * source directly. Reading after close() always yields end-of-stream.
 */
class stream_reader : public byte_reader {
    std::shared_ptr<detail::conduit> _conduit;
    std::unique_ptr<byte_io_stream>  _source;
    std::function<void()>            _close_source;
    bool                             _closed = false;

    std::size_t do_read_into(mutable_buffer buf) override;

    friend stream_pair create_stream_pair();

public:
    stream_reader() = default;
    // A moved-from reader is closed, so destroying it leaves the source alone
    stream_reader(stream_reader&& o) noexcept
        : _conduit(std::move(o._conduit))
        , _source(std::move(o._source))
        , _close_source(std::exchange(o._close_source, nullptr))
        , _closed(std::exchange(o._closed, true)) {}
    stream_reader& operator=(stream_reader&& o) noexcept {
        close();
        _conduit      = std::move(o._conduit);
        _source       = std::move(o._source);
        _close_source = std::exchange(o._close_source, nullptr);
        _closed       = std::exchange(o._closed, true);
        return *this;
    }

    /// Closes the read end
    ~stream_reader() { close(); }

    /**
     * @brief Create a read-only stream over an existing source.
     *
     * close() will call the source's own close() if it has one.
     */
    template <std::derived_from<byte_io_stream> Source>
    [[nodiscard]] static stream_reader over(std::unique_ptr<Source> source) {
        stream_reader ret;
        if constexpr (closeable_stream<Source>) {
            ret._close_source = [src = source.get()] { src->close(); };
        }
        ret._source = std::move(source);
        return ret;
    }

    /**
     * @brief Close the read end. Any blocked or future write on the paired writer fails with
     * broken_pipe_error. Closing more than once does nothing.
     */
    void close() noexcept;

    /// Whether close() has been called
    [[nodiscard]] bool is_closed() const noexcept { return _closed; }
};

/**
 * @brief The write end of a stream pair.
 *
 * A write blocks until every byte has been consumed by the reader, or until the reader closes.
 */
class stream_writer : public byte_writer {
    std::shared_ptr<detail::conduit> _conduit;

    std::size_t do_write(const_buffer buf) override;

    friend stream_pair create_stream_pair();

public:
    stream_writer() = default;
    stream_writer(stream_writer&&) noexcept = default;
    stream_writer& operator=(stream_writer&& o) noexcept {
        close();
        _conduit = std::move(o._conduit);
        return *this;
    }

    /// Closes the write end
    ~stream_writer() { close(); }

    /**
     * @brief Close the write end. The reader will observe end-of-stream once it has consumed any
     * data already handed over. Closing more than once does nothing.
     */
    void close() noexcept;

    /// Whether the write end has been closed (or was never opened)
    [[nodiscard]] bool is_closed() const noexcept;
};

/**
 * @brief An aggregate of the read and write ends of a new stream pair
 */
struct stream_pair {
    /// The read-end of the conduit
    stream_reader reader;
    /// The write-end of the conduit
    stream_writer writer;
};

}  // namespace pipekit
