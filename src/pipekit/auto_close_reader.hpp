#pragma once

#include "./io.hpp"
#include "./stream_pair.hpp"

#include <functional>
#include <memory>

namespace pipekit {

/**
 * @brief A reader that closes its source the first time it observes end-of-stream.
 *
 * The source is closed exactly once, however the reads that reach the end are sized. Sources
 * without a close() member are given a no-op close. Once closed, every read yields
 * end-of-stream without touching the source again.
 */
class auto_close_reader : public byte_reader {
    std::unique_ptr<byte_io_stream> _source;
    std::function<void()>           _close_source;
    bool                            _closed = false;

    std::size_t do_read_into(mutable_buffer buf) override;

public:
    /// An empty reader that is immediately at end-of-stream
    auto_close_reader() = default;

    /// Wrap an owned source
    template <std::derived_from<byte_io_stream> Source>
    explicit auto_close_reader(std::unique_ptr<Source> source) {
        if constexpr (closeable_stream<Source>) {
            _close_source = [src = source.get()] { src->close(); };
        } else {
            _close_source = [] {};
        }
        _source = std::move(source);
    }

    auto_close_reader(auto_close_reader&&) = delete;
    auto_close_reader& operator=(auto_close_reader&&) = delete;

    /// Close the underlying source, if it is not closed already
    void close() noexcept;

    /// Whether the underlying source has been closed
    [[nodiscard]] bool is_closed() const noexcept { return _closed; }
};

}  // namespace pipekit
