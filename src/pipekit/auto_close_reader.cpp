#include "./auto_close_reader.hpp"

using namespace pipekit;

std::size_t auto_close_reader::do_read_into(mutable_buffer buf) {
    if (_closed or !_source) {
        return 0;
    }
    auto n = _source->read_bytes(buf);
    if (n == 0 and buf.size() != 0) {
        close();
    }
    return n;
}

void auto_close_reader::close() noexcept {
    if (_closed) {
        return;
    }
    _closed = true;
    if (_close_source) {
        _close_source();
    }
}
