#pragma once

#include "./io.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace pipekit {

/**
 * @brief A read-only stream over an owned string
 */
class string_reader : public byte_reader {
    std::string _content;
    std::size_t _offset = 0;

    std::size_t do_read_into(mutable_buffer buf) override;

public:
    explicit string_reader(std::string content) noexcept
        : _content(std::move(content)) {}

    /// The number of bytes that have not yet been read
    [[nodiscard]] std::size_t remaining() const noexcept { return _content.size() - _offset; }
};

/**
 * @brief A write-only stream that accumulates everything written into a string
 */
class string_writer : public byte_writer {
    std::string _content;

    std::size_t do_write(const_buffer buf) override;

public:
    string_writer() = default;

    /// The data written so far
    [[nodiscard]] const std::string& str() const noexcept { return _content; }

    /// Take the accumulated data, leaving the writer empty
    [[nodiscard]] std::string take() noexcept { return std::exchange(_content, std::string()); }
};

}  // namespace pipekit
