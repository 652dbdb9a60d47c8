#include "./pipeline.hpp"

#include "./line_scanner.hpp"
#include "./log.hpp"
#include "./fd_stream.hpp"
#include "./stages.hpp"
#include "./string_io.hpp"

#include <neo/scope.hpp>
#include <neo/ufmt.hpp>

#include <charconv>
#include <exception>
#include <future>
#include <utility>

using namespace pipekit;

pipeline::pipeline()
    : _tail(std::make_shared<auto_close_reader>())
    , _stdout(&standard_output())
    , _diagnostics(std::make_shared<synchronized_writer>(discard_stream()))
    , _errors(std::make_shared<error_slot>()) {}

pipeline& pipeline::operator=(pipeline&& other) noexcept {
    if (&other != this) {
        _finish();
        _tail          = std::move(other._tail);
        _stdout        = other._stdout;
        _diagnostics   = std::move(other._diagnostics);
        _errors        = std::move(other._errors);
        _exit_on_error = other._exit_on_error;
        _tasks         = std::move(other._tasks);
    }
    return *this;
}

pipeline pipeline::echo(std::string text) {
    pipeline ret;
    ret.with_reader(std::make_unique<string_reader>(std::move(text)));
    return ret;
}

pipeline pipeline::from_args(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return from_lines(args);
}

pipeline pipeline::from_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (auto& line : lines) {
        text.append(line);
        text.push_back('\n');
    }
    return echo(std::move(text));
}

pipeline pipeline::from_file(std::filesystem::path path) {
    pipeline ret;
    ret.filter(stages::cat_file(std::move(path)));
    return ret;
}

pipeline pipeline::exec(std::string_view command) {
    pipeline ret;
    ret.pipe(stages::exec(command));
    return ret;
}

pipeline pipeline::if_exists(std::filesystem::path path) {
    pipeline ret;
    ret.exit_on_error();
    ret.filter(stages::if_exists(std::move(path)));
    ret.wait();
    return ret;
}

pipeline& pipeline::pipe(diagnostic_stage s) {
    if (_exit_on_error and _errors->has_error()) {
        PIPEKIT_LOG_DEBUG("Not launching stage {}: the pipeline has already failed", _tasks.size());
        return *this;
    }

    auto               pair  = create_stream_pair();
    auto               index = _tasks.size();
    std::promise<void> started;
    auto               started_future = started.get_future();

    _tasks.emplace_back([s       = std::move(s),
                         input   = _tail,
                         output  = std::move(pair.writer),
                         diag    = _diagnostics,
                         errors  = _errors,
                         started = std::move(started),
                         index]() mutable {
        neo_defer {
            output.close();
            // Release an upstream producer that this stage did not read to the end
            input->close();
        };
        started.set_value();
        PIPEKIT_LOG_DEBUG("Stage {} started", index);
        try {
            s(*input, output, *diag);
            PIPEKIT_LOG_DEBUG("Stage {} finished", index);
        } catch (const broken_pipe_error& e) {
            PIPEKIT_LOG_DEBUG("Stage {} stopped because its output was closed: {}",
                              index,
                              e.what());
        } catch (...) {
            auto err = pipeline_error::from_current_exception();
            PIPEKIT_LOG_DEBUG("Stage {} failed: {}", index, err.message());
            if (!errors->capture(std::move(err))) {
                PIPEKIT_LOG_TRACE("Stage {} failure dropped: an earlier error was captured",
                                  index);
            }
        }
    });

    _tail = std::make_shared<auto_close_reader>(
        std::make_unique<stream_reader>(std::move(pair.reader)));
    started_future.wait();
    return *this;
}

std::size_t pipeline::do_read_into(mutable_buffer buf) {
    if (!_tail) {
        return 0;
    }
    return _tail->read_bytes(buf);
}

void pipeline::_finish() noexcept {
    if (_tail) {
        _tail->close();
    }
    for (auto& task : _tasks) {
        if (task.joinable()) {
            task.join();
        }
    }
    _tasks.clear();
}

pipeline_result<std::uint64_t> pipeline::run() {
    std::uint64_t nbytes = 0;
    try {
        nbytes = copy(*this, *_stdout);
    } catch (...) {
        _errors->capture(pipeline_error::from_current_exception());
    }
    _finish();
    return {nbytes, error()};
}

pipeline& pipeline::wait() {
    try {
        copy(*this, discard_stream());
    } catch (...) {
        _errors->capture(pipeline_error::from_current_exception());
    }
    _finish();
    return *this;
}

std::string pipeline::_drain_bytes() {
    std::string data;
    try {
        data = read();
    } catch (...) {
        _errors->capture(pipeline_error::from_current_exception());
    }
    _finish();
    return data;
}

pipeline_result<std::vector<std::byte>> pipeline::bytes() {
    auto data = _drain_bytes();
    auto ptr  = reinterpret_cast<const std::byte*>(data.data());
    return {std::vector<std::byte>(ptr, ptr + data.size()), error()};
}

pipeline_result<std::string> pipeline::string() {
    auto data = _drain_bytes();
    return {std::move(data), error()};
}

namespace {

bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v';
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() and is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() and is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

pipeline_error conversion_failure(std::string message) {
    auto exc = std::make_exception_ptr(conversion_error(message));
    return pipeline_error(other_failure{}, std::move(message), std::move(exc));
}

}  // namespace

pipeline_result<std::int64_t> pipeline::to_int() {
    auto data = _drain_bytes();
    auto text = trim(data);

    // from_chars accepts a leading '-' but not a '+'
    auto digits = text;
    if (digits.size() > 1 and digits.front() == '+' and digits[1] != '-') {
        digits.remove_prefix(1);
    }

    std::int64_t value = 0;
    auto [ptr, ec]     = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() or ec != std::errc{} or ptr != digits.data() + digits.size()) {
        auto what = ec == std::errc::result_out_of_range ? "is out of range for" : "is not";
        return {0, conversion_failure(neo::ufmt("Pipeline output \"{}\" {} a base-10 integer",
                                                text,
                                                what))};
    }
    return {value, error()};
}

pipeline_result<std::vector<std::string>> pipeline::lines() {
    string_reader            data{_drain_bytes()};
    std::vector<std::string> ret;
    try {
        line_scanner scanner{data};
        while (auto line = scanner.next()) {
            ret.emplace_back(*line);
        }
    } catch (const std::exception& e) {
        return {{}, conversion_failure(e.what())};
    }
    return {std::move(ret), error()};
}

pipeline& pipeline::with_stderr(byte_io_stream& sink) {
    _diagnostics = std::make_shared<synchronized_writer>(sink);
    return *this;
}

pipeline& pipeline::set_error(std::optional<pipeline_error> err) {
    if (err) {
        PIPEKIT_LOG_TRACE("Pipeline error overridden: {}", err->message());
    } else {
        PIPEKIT_LOG_TRACE("Pipeline error cleared");
    }
    _errors->set(std::move(err));
    return *this;
}

int pipeline::exit_status() const { return pipekit::exit_status(error()); }

void pipeline::close() noexcept {
    if (_tail) {
        _tail->close();
    }
}
