#include "./file.hpp"

#include <neo/ufmt.hpp>

#include <cerrno>

#include <fcntl.h>

using namespace pipekit;

namespace {

int open_flags(open_mode mode) noexcept {
    switch (mode) {
    case open_mode::read:
        return O_RDONLY;
    case open_mode::write:
        return O_WRONLY | O_CREAT | O_TRUNC;
    case open_mode::append:
        return O_WRONLY | O_CREAT | O_APPEND;
    }
    return O_RDONLY;
}

const char* mode_name(open_mode mode) noexcept {
    switch (mode) {
    case open_mode::read:
        return "reading";
    case open_mode::write:
        return "writing";
    case open_mode::append:
        return "appending";
    }
    return "?";
}

}  // namespace

file file::open(const std::filesystem::path& path, open_mode mode) {
    int fd = ::open(path.c_str(), open_flags(mode) | O_CLOEXEC, 0666);
    if (fd >= 0) {
        return file(fd);
    }
    auto ec = std::error_code(errno, std::system_category());
    if (ec == std::errc::no_such_file_or_directory) {
        throw file_not_found_error(ec,
                                   neo::ufmt("No such file [{}] to open for {}",
                                             path.string(),
                                             mode_name(mode)));
    }
    throw file_error(ec, neo::ufmt("Cannot open [{}] for {}", path.string(), mode_name(mode)));
}

std::string file::read(const std::filesystem::path& path) { return open(path).read(); }
