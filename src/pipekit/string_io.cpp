#include "./string_io.hpp"

#include <algorithm>
#include <cstring>

using namespace pipekit;

std::size_t string_reader::do_read_into(mutable_buffer buf) {
    const auto n = std::min(buf.size(), remaining());
    std::memcpy(buf.data(), _content.data() + _offset, n);
    _offset += n;
    return n;
}

std::size_t string_writer::do_write(const_buffer buf) {
    _content.append(as_string_view(buf));
    return buf.size();
}
