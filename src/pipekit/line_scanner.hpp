#pragma once

#include "./io.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pipekit {

/**
 * @brief Exception thrown by line_scanner when a single line does not fit in the largest buffer it
 * is allowed to grow to.
 */
class line_too_long_error : public std::runtime_error {
    std::size_t _max_size;

public:
    explicit line_too_long_error(std::size_t max_size);

    /// The buffer ceiling that was exceeded
    [[nodiscard]] std::size_t max_size() const noexcept { return _max_size; }
};

/**
 * @brief Splits a byte stream into lines.
 *
 * Lines are terminated by '\n'. The terminator, and a '\r' immediately before it, are not part
 * of the returned line. A final line without a terminator is still returned.
 *
 * The buffer starts small and doubles as needed, up to `max_line_size`.
 */
class line_scanner {
public:
    static constexpr std::size_t initial_buffer_size = 4096;
    static constexpr std::size_t default_max_line_size
        = static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());

private:
    byte_io_stream& _source;
    std::size_t     _max_size;

    std::string _buffer;
    /// Offset of the first unconsumed byte in _buffer
    std::size_t _begin = 0;
    /// Offset past the last valid byte in _buffer
    std::size_t _end = 0;
    bool        _eof = false;

    /// Read more data from the source, growing or compacting the buffer as needed
    void _fill();

public:
    explicit line_scanner(byte_io_stream& source,
                          std::size_t     max_line_size = default_max_line_size) noexcept
        : _source(source)
        , _max_size(max_line_size) {}

    /**
     * @brief Obtain the next line, or nullopt at end-of-stream.
     *
     * The returned view is valid until the next call to next().
     *
     * @throws line_too_long_error if a line would exceed the maximum line size
     * @throws Whatever the source throws when read
     */
    [[nodiscard]] std::optional<std::string_view> next();
};

}  // namespace pipekit
