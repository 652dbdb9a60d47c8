#include "./fd_stream.hpp"

#include "./os_pipe.hpp"

#include <catch2/catch.hpp>

#include <string_view>

TEST_CASE("Release and adopt a descriptor") {
    auto p  = pipekit::create_os_pipe();
    int  fd = p.writer.release();
    CHECK_FALSE(p.writer.is_open());
    CHECK(p.writer.fd() == -1);

    pipekit::fd_stream adopted{fd};
    adopted.write(std::string_view("adopted"));
    adopted.reset(-1);
    CHECK_FALSE(adopted.is_open());
    CHECK(p.reader.read() == "adopted");
}

TEST_CASE("A closed descriptor stream reads end-of-stream") {
    pipekit::fd_stream closed;
    CHECK_FALSE(closed.is_open());
    CHECK(closed.read() == "");
    closed.close();
}

TEST_CASE("Move-assigning a descriptor stream closes the old descriptor") {
    auto first  = pipekit::create_os_pipe();
    auto second = pipekit::create_os_pipe();
    first.writer.write(std::string_view("x"));
    first.reader = std::move(second.reader);
    second.writer.close();
    CHECK(first.reader.read() == "");
    CHECK_FALSE(first.reader.is_open());
}
