#include "./line_scanner.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>
#include <cstring>

using namespace pipekit;

line_too_long_error::line_too_long_error(std::size_t max_size)
    : runtime_error(neo::ufmt("Line exceeds the maximum scan buffer size of {} bytes", max_size))
    , _max_size(max_size) {}

void line_scanner::_fill() {
    if (_begin != 0) {
        // Shift the unconsumed tail to the front
        std::memmove(_buffer.data(), _buffer.data() + _begin, _end - _begin);
        _end -= _begin;
        _begin = 0;
    }
    if (_end == _buffer.size()) {
        if (_buffer.size() >= _max_size) {
            throw line_too_long_error(_max_size);
        }
        auto new_size = _buffer.empty() ? initial_buffer_size : _buffer.size() * 2;
        _buffer.resize(std::min(new_size, _max_size));
    }
    auto nread = _source.read_into(_buffer.data() + _end, _buffer.size() - _end);
    if (nread == 0) {
        _eof = true;
    }
    _end += nread;
}

std::optional<std::string_view> line_scanner::next() {
    while (true) {
        std::string_view pending{_buffer.data() + _begin, _end - _begin};
        auto             nl = pending.find('\n');
        if (nl != pending.npos) {
            _begin += nl + 1;
            auto line = pending.substr(0, nl);
            if (line.ends_with('\r')) {
                line.remove_suffix(1);
            }
            return line;
        }
        if (_eof) {
            if (pending.empty()) {
                return std::nullopt;
            }
            // Final line with no terminator
            _begin = _end;
            if (pending.ends_with('\r')) {
                pending.remove_suffix(1);
            }
            return pending;
        }
        _fill();
    }
}
