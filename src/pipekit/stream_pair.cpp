#include "./stream_pair.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>

using namespace pipekit;

/**
 * @brief The synchronous rendezvous shared by the two ends of a stream pair.
 *
 * A writer publishes its buffer and sleeps until the reader has drained all of it. Nothing is
 * buffered beyond the writer's own memory.
 */
class detail::conduit {
    /// Serializes writers, so that only one buffer is published at a time
    std::mutex _write_mutex;

    std::mutex              _mutex;
    std::condition_variable _cv;

    const std::byte* _pending   = nullptr;
    std::size_t      _remaining = 0;

    bool _writer_closed = false;
    bool _reader_closed = false;

public:
    std::size_t write(const_buffer buf) {
        std::unique_lock write_lock{_write_mutex};
        std::unique_lock lk{_mutex};
        if (_writer_closed) {
            throw closed_stream_error("Write into a stream pair whose write end is closed");
        }
        if (_reader_closed) {
            throw broken_pipe_error("Write into a stream pair whose read end is closed");
        }
        if (buf.size() == 0) {
            // A zero-length hand-off would look like end-of-stream to the reader
            return 0;
        }
        _pending   = buf.data();
        _remaining = buf.size();
        _cv.notify_all();
        _cv.wait(lk, [&] { return _remaining == 0 or _reader_closed or _writer_closed; });
        const auto written = buf.size() - _remaining;
        _pending           = nullptr;
        _remaining         = 0;
        if (written < buf.size()) {
            if (_reader_closed) {
                throw broken_pipe_error("The read end of a stream pair was closed during a write");
            }
            throw closed_stream_error("The write end of a stream pair was closed during a write");
        }
        return written;
    }

    std::size_t read(mutable_buffer buf) {
        if (buf.size() == 0) {
            return 0;
        }
        std::unique_lock lk{_mutex};
        _cv.wait(lk, [&] { return _remaining != 0 or _writer_closed or _reader_closed; });
        if (_reader_closed or _remaining == 0) {
            return 0;
        }
        const auto n = std::min(buf.size(), _remaining);
        std::memcpy(buf.data(), _pending, n);
        _pending += n;
        _remaining -= n;
        if (_remaining == 0) {
            _cv.notify_all();
        }
        return n;
    }

    void close_read() noexcept {
        std::unique_lock lk{_mutex};
        _reader_closed = true;
        _cv.notify_all();
    }

    void close_write() noexcept {
        std::unique_lock lk{_mutex};
        _writer_closed = true;
        _cv.notify_all();
    }

    bool write_closed() noexcept {
        std::unique_lock lk{_mutex};
        return _writer_closed;
    }
};

std::size_t stream_reader::do_read_into(mutable_buffer buf) {
    if (_closed) {
        return 0;
    }
    if (_conduit) {
        return _conduit->read(buf);
    }
    if (_source) {
        return _source->read_bytes(buf);
    }
    return 0;
}

void stream_reader::close() noexcept {
    if (_closed) {
        return;
    }
    _closed = true;
    if (_conduit) {
        _conduit->close_read();
    } else if (_close_source) {
        _close_source();
    }
}

std::size_t stream_writer::do_write(const_buffer buf) {
    if (!_conduit) {
        throw closed_stream_error("Write into a stream pair whose write end is closed");
    }
    return _conduit->write(buf);
}

void stream_writer::close() noexcept {
    if (_conduit) {
        _conduit->close_write();
    }
}

bool stream_writer::is_closed() const noexcept { return !_conduit or _conduit->write_closed(); }

stream_pair pipekit::create_stream_pair() {
    auto        shared = std::make_shared<detail::conduit>();
    stream_pair ret;
    ret.reader._conduit = shared;
    ret.writer._conduit = shared;
    return ret;
}
