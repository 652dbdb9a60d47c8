#include "./file.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace {

/// A fresh path in the temp directory, removed when the test ends
struct scratch_path {
    fs::path path;

    explicit scratch_path(std::string_view name)
        : path(fs::temp_directory_path() / name) {
        fs::remove(path);
    }
    ~scratch_path() { fs::remove(path); }
};

}  // namespace

TEST_CASE("Read this source file") {
    auto content = pipekit::file::read(__FILE__);
    CHECK(content.find("Find this marker") != content.npos);
}

TEST_CASE("Missing files throw file_not_found_error") {
    auto here = fs::path(__FILE__).parent_path();
    CHECK_THROWS_AS(pipekit::file::open(here / "no-such-dir/file.txt"),
                    pipekit::file_not_found_error);
    CHECK_THROWS_AS(pipekit::file::open(here / "no-such-file.txt"), pipekit::file_not_found_error);
    CHECK_THROWS_AS(pipekit::file::read(here / "no-such-file.txt"), pipekit::file_error);
}

TEST_CASE("Write, append, and replace a file") {
    scratch_path tmp{"pipekit-file-test.txt"};
    pipekit::file::write(tmp.path, std::string_view("first\n"));
    CHECK(pipekit::file::read(tmp.path) == "first\n");

    pipekit::file::append(tmp.path, std::string_view("second\n"));
    CHECK(pipekit::file::read(tmp.path) == "first\nsecond\n");

    pipekit::file::write(tmp.path, std::string_view("third"));
    CHECK(pipekit::file::read(tmp.path) == "third");
}

TEST_CASE("Append creates a missing file") {
    scratch_path tmp{"pipekit-file-append-test.txt"};
    pipekit::file::append(tmp.path, std::string_view("created"));
    CHECK(pipekit::file::read(tmp.path) == "created");
}

TEST_CASE("Reading a directory fails") {
    auto dir = pipekit::file::open(fs::temp_directory_path());
    CHECK_THROWS_AS(dir.read(), std::system_error);
}

TEST_CASE("A file closes at end of stream and reads empty afterwards") {
    auto f = pipekit::file::open(__FILE__);
    CHECK_FALSE(f.read(4).empty());
    CHECK_FALSE(f.read().empty());
    CHECK_FALSE(f.is_open());
    CHECK(f.read() == "");
    f.close();
}

TEST_CASE("Moving a file transfers the descriptor") {
    auto f  = pipekit::file::open(__FILE__);
    auto fd = f.fd();
    auto g  = std::move(f);
    CHECK_FALSE(f.is_open());
    CHECK(g.fd() == fd);
    CHECK(g.read() == pipekit::file::read(__FILE__));
}
