#include "./io.hpp"

#include <array>

using namespace pipekit;

std::string byte_io_stream::read() {
    std::string ret;
    std::size_t filled = 0;
    // Short reads say nothing about the end of a stream. Only a zero-length read does.
    for (std::size_t want = 4096;; want = ret.size()) {
        ret.resize(filled + want);
        auto nread = read_into(ret.data() + filled, want);
        filled += nread;
        if (nread == 0) {
            break;
        }
    }
    ret.resize(filled);
    return ret;
}

std::string byte_io_stream::read(std::size_t count) {
    std::string ret(count, '\0');
    ret.resize(read_into(ret));
    return ret;
}

std::size_t byte_reader::do_write(const_buffer) {
    throw unsupported_stream_operation("Attempted to write into a read-only stream");
}

std::size_t byte_writer::do_read_into(mutable_buffer) {
    throw unsupported_stream_operation("Attempted to read from a write-only stream");
}

std::size_t synchronized_writer::do_write(const_buffer buf) {
    std::unique_lock lk{_mutex};
    return _target.write_bytes(buf);
}

std::uint64_t pipekit::copy(byte_io_stream& source, byte_io_stream& sink) {
    std::array<std::byte, 1024 * 32> chunk;
    std::uint64_t                     total = 0;
    while (true) {
        auto nread = source.read_bytes(mutable_buffer(chunk.data(), chunk.size()));
        if (nread == 0) {
            return total;
        }
        sink.write_bytes(const_buffer(chunk.data(), nread));
        total += nread;
    }
}

namespace {

class discarding_stream : public byte_io_stream {
    std::size_t do_read_into(mutable_buffer) override { return 0; }
    std::size_t do_write(const_buffer buf) override { return buf.size(); }
};

}  // namespace

byte_io_stream& pipekit::discard_stream() noexcept {
    static discarding_stream instance;
    return instance;
}
