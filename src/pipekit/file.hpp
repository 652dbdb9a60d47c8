#pragma once

#include "./fd_stream.hpp"
#include "./io.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace pipekit {

/// Failure to open a file. A std::system_error carrying the errno of ::open().
struct file_error : std::system_error {
    using system_error::system_error;
};

/// A file_error for a path that does not exist
struct file_not_found_error : file_error {
    using file_error::file_error;
};

/// How file::open() opens a path
enum class open_mode {
    /// Read from the start of an existing file
    read,
    /// Create the file, or replace the contents of an existing one
    write,
    /// Create the file, or write at the end of an existing one
    append,
};

/**
 * @brief A file opened with ::open(). The descriptor is close-on-exec, so child processes spawned
 * by concurrent stages never inherit it.
 */
class file : public fd_stream {
    explicit file(int fd) noexcept
        : fd_stream(fd) {}

public:
    using byte_io_stream::read;
    using byte_io_stream::write;

    /**
     * @brief Open `path` in the given mode
     *
     * @throws file_not_found_error if the path, or a directory leading to it, does not exist
     * @throws file_error for any other reason the file cannot be opened
     */
    [[nodiscard]] static file open(const std::filesystem::path& path,
                                   open_mode                    mode = open_mode::read);

    /// The whole content of the file at `path`
    [[nodiscard]] static std::string read(const std::filesystem::path& path);

    /// Replace the content of the file at `path`
    static void write(const std::filesystem::path& path, trivial_range auto&& content) {
        open(path, open_mode::write).write(content);
    }

    /// Add `content` to the end of the file at `path`, creating the file if needed
    static void append(const std::filesystem::path& path, trivial_range auto&& content) {
        open(path, open_mode::append).write(content);
    }
};

}  // namespace pipekit
