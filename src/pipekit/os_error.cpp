#include "./os_error.hpp"

#include <cerrno>
#include <string>
#include <system_error>

void pipekit::throw_os_error(int errno_value, std::string_view what) {
    throw std::system_error(errno_value, std::system_category(), std::string(what));
}

void pipekit::throw_errno(std::string_view what) { throw_os_error(errno, what); }
