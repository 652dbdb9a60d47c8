#include "./stream_pair.hpp"

#include "./string_io.hpp"

#include <catch2/catch.hpp>

#include <exception>
#include <string_view>
#include <thread>

TEST_CASE("Transfer data through a stream pair") {
    auto        pair = pipekit::create_stream_pair();
    std::thread producer{[&] {
        pair.writer.write(std::string_view("I am a string"));
        pair.writer.write(std::string_view(", and so am I"));
        pair.writer.close();
    }};
    auto content = pair.reader.read();
    producer.join();
    CHECK(content == "I am a string, and so am I");
}

TEST_CASE("Small reads consume a write piece by piece") {
    auto        pair = pipekit::create_stream_pair();
    std::thread producer{[&] {
        pair.writer.write(std::string_view("foobar"));
        pair.writer.close();
    }};
    CHECK(pair.reader.read(3) == "foo");
    CHECK(pair.reader.read(3) == "bar");
    CHECK(pair.reader.read(3) == "");
    producer.join();
}

TEST_CASE("Closing the read end breaks a blocked writer") {
    auto               pair = pipekit::create_stream_pair();
    std::exception_ptr error;
    std::thread        producer{[&] {
        try {
            pair.writer.write(std::string_view("Nobody will read this"));
        } catch (...) {
            error = std::current_exception();
        }
    }};
    pair.reader.close();
    producer.join();
    REQUIRE(error);
    CHECK_THROWS_AS(std::rethrow_exception(error), pipekit::broken_pipe_error);
}

TEST_CASE("Writing after closing the write end fails") {
    auto pair = pipekit::create_stream_pair();
    pair.writer.close();
    CHECK(pair.writer.is_closed());
    CHECK_THROWS_AS(pair.writer.write(std::string_view("late")), pipekit::closed_stream_error);
    // The reader sees a clean end-of-stream
    CHECK(pair.reader.read() == "");
}

TEST_CASE("Closing is idempotent and reads after close report end-of-stream") {
    auto pair = pipekit::create_stream_pair();
    pair.reader.close();
    pair.reader.close();
    CHECK(pair.reader.is_closed());
    CHECK(pair.reader.read() == "");
    CHECK(pair.reader.read(10) == "");

    pair.writer.close();
    pair.writer.close();
    CHECK(pair.writer.is_closed());
}

TEST_CASE("An empty write does not end the stream") {
    auto pair = pipekit::create_stream_pair();
    CHECK(pair.writer.write(std::string_view()) == 0);
    std::thread producer{[&] {
        pair.writer.write(std::string_view("still here"));
        pair.writer.close();
    }};
    CHECK(pair.reader.read() == "still here");
    producer.join();
}

namespace {

struct closeable_source : pipekit::byte_reader {
    pipekit::string_reader inner;
    int*                   close_count;

    closeable_source(std::string content, int* count)
        : inner(std::move(content))
        , close_count(count) {}

    std::size_t do_read_into(pipekit::mutable_buffer buf) override { return inner.read_bytes(buf); }

    void close() { ++*close_count; }
};

}  // namespace

TEST_CASE("A read-only stream pair over an existing source") {
    int  closes = 0;
    auto reader
        = pipekit::stream_reader::over(std::make_unique<closeable_source>("hello", &closes));
    CHECK(reader.read() == "hello");
    CHECK(closes == 0);
    reader.close();
    reader.close();
    CHECK(closes == 1);
    CHECK(reader.read() == "");

    // A source without a close() is fine too
    auto plain = pipekit::stream_reader::over(std::make_unique<pipekit::string_reader>("plain"));
    CHECK(plain.read() == "plain");
    plain.close();
}

TEST_CASE("Moving a reader hands over the duty to close the source") {
    int  closes = 0;
    auto reader
        = pipekit::stream_reader::over(std::make_unique<closeable_source>("moved", &closes));
    {
        auto moved = std::move(reader);
        CHECK(reader.is_closed());
        CHECK_FALSE(moved.is_closed());
        reader = pipekit::stream_reader{};
        reader.close();
        CHECK(closes == 0);
        CHECK(moved.read() == "moved");
    }
    CHECK(closes == 1);
}
