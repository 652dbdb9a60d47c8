#pragma once

#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/trivial_range.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pipekit {

using neo::const_buffer;
using neo::mutable_buffer;
using neo::mutable_trivial_range;
using neo::trivial_range;
using neo::trivial_type;

/// The bytes of `buf` as characters
inline std::string_view as_string_view(const_buffer buf) noexcept {
    return std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size());
}

/// The characters of `str` as bytes
inline const_buffer as_bytes(std::string_view str) noexcept {
    return const_buffer(reinterpret_cast<const std::byte*>(str.data()), str.size());
}

/**
 * @brief Exception thrown when a stream is asked for an operation it does not support, such as
 * writing into a read-only stream.
 */
struct unsupported_stream_operation : std::logic_error {
    using logic_error::logic_error;
};

/**
 * @brief The interface of every byte source and sink in pipekit.
 *
 * A read may return fewer bytes than requested at any time. Only a read of zero bytes into a
 * non-empty buffer means end-of-stream, and every later read must return zero as well. A write
 * either consumes the whole buffer or throws.
 */
class byte_io_stream {
public:
    virtual ~byte_io_stream() = default;

private:
    virtual std::size_t do_read_into(mutable_buffer buf) = 0;
    virtual std::size_t do_write(const_buffer buf)       = 0;

public:
    /// Read up to `count` objects of type T into `out`. Returns the number of whole objects read.
    template <trivial_type T>
    std::size_t read_into(T* out, std::size_t count) {
        auto nbytes = do_read_into(neo::mutable_buffer(neo::byte_pointer(out), count * sizeof(T)));
        return nbytes / sizeof(T);
    }

    /// Read into a contiguous range of trivial objects. Returns the number of objects read.
    std::size_t read_into(mutable_trivial_range auto&& range) {
        return do_read_into(mutable_buffer(range)) / neo::data_type_size_v<decltype(range)>;
    }

    /// Read up to `buf.size()` bytes. Zero means end-of-stream.
    std::size_t read_bytes(mutable_buffer buf) { return do_read_into(buf); }

    /// Read until end-of-stream
    std::string read();

    /// A single read of at most `count` bytes. The result may be shorter even before the end.
    std::string read(std::size_t count);

    /// Write all of `data`. Returns the number of objects written.
    std::size_t write(trivial_range auto&& data) {
        auto nbytes = do_write(const_buffer(data));
        return nbytes / neo::data_type_size_v<decltype(data)>;
    }

    /// Write all of the bytes in `buf`
    std::size_t write_bytes(const_buffer buf) { return do_write(buf); }
};

/**
 * @brief Base class for streams that can only be read.
 *
 * Writing into one throws unsupported_stream_operation.
 */
class byte_reader : public byte_io_stream {
    std::size_t do_write(const_buffer) final;

    using byte_io_stream::write;
    using byte_io_stream::write_bytes;
};

/**
 * @brief Base class for streams that can only be written.
 *
 * Reading from one throws unsupported_stream_operation.
 */
class byte_writer : public byte_io_stream {
    std::size_t do_read_into(mutable_buffer) final;

    using byte_io_stream::read;
    using byte_io_stream::read_bytes;
    using byte_io_stream::read_into;
};

/**
 * @brief A writer that forwards into another stream, one whole write at a time.
 *
 * Writes from concurrent threads are serialized so that their bytes do not interleave.
 */
class synchronized_writer : public byte_writer {
    std::mutex      _mutex;
    byte_io_stream& _target;

    std::size_t do_write(const_buffer buf) override;

public:
    explicit synchronized_writer(byte_io_stream& target) noexcept
        : _target(target) {}

    /// The stream that receives the writes
    [[nodiscard]] byte_io_stream& target() const noexcept { return _target; }
};

/**
 * @brief Copy everything from `source` into `sink` until `source` reaches end-of-stream
 *
 * @return std::uint64_t The number of bytes that were copied
 */
std::uint64_t copy(byte_io_stream& source, byte_io_stream& sink);

/**
 * @brief A process-wide sink that accepts and discards everything written to it. Reading from it
 * yields end-of-stream.
 */
byte_io_stream& discard_stream() noexcept;

}  // namespace pipekit
