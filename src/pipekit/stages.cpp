#include "./stages.hpp"

#include "./error.hpp"
#include "./fd_stream.hpp"
#include "./file.hpp"
#include "./line_scanner.hpp"
#include "./log.hpp"
#include "./signal.hpp"
#include "./string_io.hpp"
#include "./subprocess.hpp"

#include <neo/scope.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <array>
#include <deque>
#include <exception>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <glob.h>

using namespace pipekit;

namespace {

bool is_blank(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v';
}

/// Split a line on runs of whitespace
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> ret;
    while (true) {
        auto begin = std::find_if_not(line.begin(), line.end(), is_blank);
        if (begin == line.end()) {
            return ret;
        }
        auto end = std::find_if(begin, line.end(), is_blank);
        ret.emplace_back(&*begin, static_cast<std::size_t>(end - begin));
        line.remove_prefix(static_cast<std::size_t>(end - line.begin()));
    }
}

std::string replace_all(std::string_view line, std::string_view search, std::string_view repl) {
    std::string ret;
    if (search.empty()) {
        // An empty search string matches before and after every character
        ret.append(repl);
        for (char c : line) {
            ret.push_back(c);
            ret.append(repl);
        }
        return ret;
    }
    std::size_t pos = 0;
    while (true) {
        auto found = line.find(search, pos);
        ret.append(line.substr(pos, found - pos));
        if (found == line.npos) {
            return ret;
        }
        ret.append(repl);
        pos = found + search.size();
    }
}

/// Write the input into the file opened with `mode`, then produce the byte count
stage copy_into_file(std::filesystem::path path, open_mode mode) {
    return [path = std::move(path), mode](byte_io_stream& in, byte_io_stream& out) {
        auto f       = file::open(path, mode);
        auto written = copy(in, f);
        f.close();
        out.write_bytes(as_bytes(std::to_string(written)));
    };
}

}  // namespace

stage stages::echo(std::string text) {
    return [text = std::move(text)](byte_io_stream&, byte_io_stream& out) {
        out.write_bytes(as_bytes(text));
    };
}

stage stages::from_lines(std::vector<std::string> lines) {
    return [lines = std::move(lines)](byte_io_stream&, byte_io_stream& out) {
        for (auto& line : lines) {
            write_line(out, line);
        }
    };
}

stage stages::cat_file(std::filesystem::path path) {
    return [path = std::move(path)](byte_io_stream&, byte_io_stream& out) {
        auto f = file::open(path);
        copy(f, out);
    };
}

stage stages::stdin_source() {
    return [](byte_io_stream&, byte_io_stream& out) { copy(standard_input(), out); };
}

stage stages::match(std::string text) {
    return scan_lines([text = std::move(text)](std::string_view line, byte_io_stream& out) {
        if (line.find(text) != line.npos) {
            write_line(out, line);
        }
    });
}

stage stages::reject(std::string text) {
    return scan_lines([text = std::move(text)](std::string_view line, byte_io_stream& out) {
        if (line.find(text) == line.npos) {
            write_line(out, line);
        }
    });
}

stage stages::replace(std::string search, std::string replacement) {
    return scan_lines([search = std::move(search), replacement = std::move(replacement)](
                          std::string_view line, byte_io_stream& out) {
        write_line(out, replace_all(line, search, replacement));
    });
}

stage stages::match_regex(std::regex re) {
    return scan_lines([re = std::move(re)](std::string_view line, byte_io_stream& out) {
        if (std::regex_search(line.begin(), line.end(), re)) {
            write_line(out, line);
        }
    });
}

stage stages::reject_regex(std::regex re) {
    return scan_lines([re = std::move(re)](std::string_view line, byte_io_stream& out) {
        if (!std::regex_search(line.begin(), line.end(), re)) {
            write_line(out, line);
        }
    });
}

stage stages::replace_regex(std::regex re, std::string replacement) {
    return scan_lines([re = std::move(re), replacement = std::move(replacement)](
                          std::string_view line, byte_io_stream& out) {
        std::string replaced;
        std::regex_replace(std::back_inserter(replaced), line.begin(), line.end(), re, replacement);
        write_line(out, replaced);
    });
}

stage stages::first(std::int64_t n) {
    return [n](byte_io_stream& in, byte_io_stream& out) {
        line_scanner scanner{in};
        for (std::int64_t i = 0; i < n; ++i) {
            auto line = scanner.next();
            if (!line) {
                break;
            }
            write_line(out, *line);
        }
    };
}

stage stages::last(std::int64_t n) {
    return [n](byte_io_stream& in, byte_io_stream& out) {
        if (n <= 0) {
            return;
        }
        std::deque<std::string> window;
        line_scanner            scanner{in};
        while (auto line = scanner.next()) {
            if (static_cast<std::int64_t>(window.size()) == n) {
                window.pop_front();
            }
            window.emplace_back(*line);
        }
        for (auto& line : window) {
            write_line(out, line);
        }
    };
}

stage stages::freq() {
    return [](byte_io_stream& in, byte_io_stream& out) {
        std::map<std::string, std::int64_t, std::less<>> counts;
        line_scanner                                     scanner{in};
        while (auto line = scanner.next()) {
            auto it = counts.find(*line);
            if (it == counts.end()) {
                counts.emplace(std::string(*line), 1);
            } else {
                ++it->second;
            }
        }

        std::vector<std::pair<std::string, std::int64_t>> sorted(counts.begin(), counts.end());
        // The map is already ordered by line, so a stable sort keeps ties in order
        std::stable_sort(sorted.begin(), sorted.end(), [](auto& lhs, auto& rhs) {
            return lhs.second > rhs.second;
        });

        auto width = sorted.empty() ? 0 : std::to_string(sorted.front().second).size();
        for (auto& [line, count] : sorted) {
            auto count_str = std::to_string(count);
            std::string entry(width - count_str.size(), ' ');
            entry.append(count_str);
            entry.push_back(' ');
            entry.append(line);
            write_line(out, entry);
        }
    };
}

stage stages::count_lines() {
    return [](byte_io_stream& in, byte_io_stream& out) {
        std::int64_t n = 0;
        line_scanner scanner{in};
        while (scanner.next()) {
            ++n;
        }
        write_line(out, std::to_string(n));
    };
}

stage stages::column(int col) {
    return scan_lines([col](std::string_view line, byte_io_stream& out) {
        auto fields = split_fields(line);
        if (col > 0 and static_cast<std::size_t>(col) <= fields.size()) {
            write_line(out, fields[static_cast<std::size_t>(col - 1)]);
        }
    });
}

stage stages::join() {
    return [](byte_io_stream& in, byte_io_stream& out) {
        std::string  joined;
        line_scanner scanner{in};
        bool         first = true;
        while (auto line = scanner.next()) {
            if (!first) {
                joined.push_back(' ');
            }
            joined.append(*line);
            first = false;
        }
        write_line(out, joined);
    };
}

stage stages::basename() {
    return scan_lines([](std::string_view line, byte_io_stream& out) {
        if (line.empty()) {
            write_line(out, ".");
            return;
        }
        while (line.size() > 0 and line.back() == '/') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            write_line(out, "/");
            return;
        }
        auto slash = line.rfind('/');
        write_line(out, slash == line.npos ? line : line.substr(slash + 1));
    });
}

stage stages::dirname() {
    return scan_lines([](std::string_view line, byte_io_stream& out) {
        auto path = line;
        if (path.size() > 1 and path.back() == '/') {
            path.remove_suffix(1);
        }
        auto slash   = path.rfind('/');
        auto dirname
            = clean_path(slash == path.npos ? std::string_view() : path.substr(0, slash + 1));
        if (path.starts_with("./") and dirname != ".") {
            dirname.insert(0, "./");
        }
        write_line(out, dirname);
    });
}

stage stages::concat() {
    return scan_lines([](std::string_view line, byte_io_stream& out) {
        try {
            auto f = file::open(std::filesystem::path(line));
            copy(f, out);
        } catch (const std::system_error& e) {
            // Missing files and directories alike
            PIPEKIT_LOG_DEBUG("concat: skipping [{}]: {}", line, e.what());
        }
    });
}

stage stages::tee(std::vector<std::reference_wrapper<byte_io_stream>> sinks) {
    return [sinks = std::move(sinks)](byte_io_stream& in, byte_io_stream& out) {
        std::array<std::byte, 1024 * 32> chunk;
        while (true) {
            auto nread = in.read_bytes(mutable_buffer(chunk.data(), chunk.size()));
            if (nread == 0) {
                return;
            }
            const_buffer data(chunk.data(), nread);
            for (byte_io_stream& sink : sinks) {
                sink.write_bytes(data);
            }
            out.write_bytes(data);
        }
    };
}

stage stages::transform_lines(std::function<std::string(std::string_view)> fn) {
    return scan_lines([fn = std::move(fn)](std::string_view line, byte_io_stream& out) {
        write_line(out, fn(line));
    });
}

stage stages::each_line(std::function<void(std::string_view, std::string&)> fn) {
    return [fn = std::move(fn)](byte_io_stream& in, byte_io_stream& out) {
        std::string  acc;
        line_scanner scanner{in};
        while (auto line = scanner.next()) {
            fn(*line, acc);
        }
        out.write_bytes(as_bytes(acc));
    };
}

namespace {

bool has_glob_chars(std::string_view path) noexcept {
    return path.find_first_of("[]^*?\\{}!") != path.npos;
}

void write_glob_matches(const std::string& pattern, byte_io_stream& out) {
    ::glob_t matches = {};
    neo_defer { ::globfree(&matches); };
    auto rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == GLOB_NOMATCH) {
        return;
    }
    if (rc != 0) {
        throw std::runtime_error(neo::ufmt("Failed to expand glob pattern [{}]", pattern));
    }
    for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
        write_line(out, matches.gl_pathv[i]);
    }
}

/// The names in `dir`, sorted
std::vector<std::string> sorted_entries(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (auto& entry : std::filesystem::directory_iterator{dir}) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void walk_files(const std::string& path, byte_io_stream& out) {
    auto st = std::filesystem::symlink_status(path);
    if (!std::filesystem::exists(st)) {
        throw std::filesystem::filesystem_error(
            "Cannot walk a missing path",
            path,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (!std::filesystem::is_directory(st)) {
        write_line(out, path);
        return;
    }
    for (auto& name : sorted_entries(path)) {
        walk_files(stages::clean_path(path + "/" + name), out);
    }
}

}  // namespace

stage stages::list_files(std::string path) {
    return [path = std::move(path)](byte_io_stream&, byte_io_stream& out) {
        if (has_glob_chars(path)) {
            write_glob_matches(path, out);
            return;
        }
        auto st = std::filesystem::status(path);
        if (std::filesystem::is_directory(st)) {
            for (auto& name : sorted_entries(path)) {
                write_line(out, clean_path(path + "/" + name));
            }
        } else if (std::filesystem::exists(st)) {
            write_line(out, path);
        } else {
            throw std::filesystem::filesystem_error(
                "Cannot list a missing path",
                path,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }
    };
}

stage stages::find_files(std::string dir) {
    return [dir = std::move(dir)](byte_io_stream&, byte_io_stream& out) { walk_files(dir, out); };
}

stage stages::write_file(std::filesystem::path path) {
    return copy_into_file(std::move(path), open_mode::write);
}

stage stages::append_file(std::filesystem::path path) {
    return copy_into_file(std::move(path), open_mode::append);
}

stage stages::if_exists(std::filesystem::path path) {
    return [path = std::move(path)](byte_io_stream&, byte_io_stream&) {
        std::error_code ec;
        auto            st = std::filesystem::status(path, ec);
        if (!std::filesystem::exists(st)) {
            if (!ec) {
                ec = std::make_error_code(std::errc::no_such_file_or_directory);
            }
            throw std::filesystem::filesystem_error("Path does not exist", path, ec);
        }
    };
}

stage stages::exit_with(int code, std::string message) {
    return [code, message = std::move(message)](byte_io_stream&, byte_io_stream&) {
        throw exit_error(code, message);
    };
}

namespace {

/// Report a program that could not be started, and fail the way a shell does
[[noreturn]] void fail_to_start(byte_io_stream& diag, const std::string& message) {
    write_line(diag, message);
    throw exit_error(1, message);
}

void run_process(const std::vector<std::string>& argv,
                 byte_io_stream&                 in,
                 byte_io_stream&                 out,
                 byte_io_stream&                 diag) {
    if (argv.empty()) {
        fail_to_start(diag, "Cannot execute an empty command");
    }

    subprocess_spawn_options opts;
    opts.command = argv;
    opts.stdin_  = stdio_mode::pipe;
    opts.stdout_ = stdio_mode::pipe;
    opts.stderr_ = stdio_mode::pipe;

    auto proc = [&] {
        try {
            return subprocess::spawn(opts);
        } catch (const std::system_error& e) {
            fail_to_start(diag, neo::ufmt("Failed to start [{}]: {}", argv.front(), e.what()));
        }
    }();
    PIPEKIT_LOG_DEBUG("Started subprocess [{}]", argv.front());

    std::exception_ptr feed_error;
    std::thread        feeder;
    neo_defer {
        // Reap the child and stop the feeder on every way out of this stage
        if (!feeder.joinable()) {
            proc.close_stdin();
        }
        // The program sees a broken pipe if it writes any more
        proc.stdout_pipe().close();
        proc.stderr_pipe().close();
        if (proc.pid() != -1 and !proc.is_joined()) {
            try {
                proc.join();
            } catch (const std::system_error& e) {
                PIPEKIT_LOG_WARN("Lost track of subprocess [{}]: {}", argv.front(), e.what());
            }
        }
        if (feeder.joinable()) {
            feeder.join();
        }
    };

    // Feed the stage input to the program on a separate thread, so that a program which fills
    // its stdout before reading all of its stdin cannot deadlock against us.
    feeder = std::thread{[&] {
        signal_blocking_scope block_sigpipe{SIGPIPE};
        try {
            copy(in, proc.stdin_pipe());
        } catch (const std::system_error& e) {
            if (e.code() != std::errc::broken_pipe) {
                feed_error = std::current_exception();
            }
            // Otherwise the program exited without reading all of its input, which is fine
        } catch (...) {
            feed_error = std::current_exception();
        }
        proc.close_stdin();
    }};

    subprocess_output chunk;
    while (proc.has_stdout() or proc.has_stderr()) {
        proc.read_output_into(chunk);
        if (!chunk.stdout_.empty()) {
            out.write_bytes(as_bytes(chunk.stdout_));
            chunk.stdout_.clear();
        }
        if (!chunk.stderr_.empty()) {
            diag.write_bytes(as_bytes(chunk.stderr_));
            chunk.stderr_.clear();
        }
    }

    const auto& result = proc.join();
    feeder.join();
    PIPEKIT_LOG_DEBUG("Subprocess [{}] exited with code {}, signal {}",
                      argv.front(),
                      result.exit_code,
                      result.signal_number);
    if (feed_error) {
        std::rethrow_exception(feed_error);
    }
    result.throw_if_error();
}

}  // namespace

diagnostic_stage stages::exec(std::vector<std::string> argv) {
    return [argv = std::move(argv)](byte_io_stream& in, byte_io_stream& out, byte_io_stream& diag) {
        run_process(argv, in, out, diag);
    };
}

diagnostic_stage stages::exec(std::string_view command_line) {
    return [command_line = std::string(command_line)](byte_io_stream& in,
                                                      byte_io_stream& out,
                                                      byte_io_stream& diag) {
        std::vector<std::string> argv;
        try {
            argv = split_command_line(command_line);
        } catch (const std::invalid_argument& e) {
            fail_to_start(diag, e.what());
        }
        run_process(argv, in, out, diag);
    };
}

namespace {

/// A command template, split around its `{{.}}` actions
struct command_template {
    std::vector<std::string> literals;

    static command_template parse(const std::string_view whole) {
        command_template ret;
        auto             text = whole;
        while (true) {
            auto open = text.find("{{");
            ret.literals.emplace_back(text.substr(0, open));
            if (open == text.npos) {
                return ret;
            }
            auto close = text.find("}}", open + 2);
            if (close == text.npos) {
                throw std::invalid_argument(
                    neo::ufmt("Unterminated action in command template [{}]", whole));
            }
            auto action = text.substr(open + 2, close - open - 2);
            while (!action.empty() and is_blank(action.front())) {
                action.remove_prefix(1);
            }
            while (!action.empty() and is_blank(action.back())) {
                action.remove_suffix(1);
            }
            if (action != ".") {
                throw std::invalid_argument(
                    neo::ufmt("Unsupported action [{}] in command template [{}]", action, whole));
            }
            text.remove_prefix(close + 2);
        }
    }

    std::string render(std::string_view line) const {
        std::string ret = literals.front();
        for (auto it = std::next(literals.begin()); it != literals.end(); ++it) {
            ret.append(line);
            ret.append(*it);
        }
        return ret;
    }
};

}  // namespace

diagnostic_stage stages::exec_for_each(std::string_view command_template_text) {
    std::optional<command_template> tmpl;
    std::string                     parse_error;
    try {
        tmpl = command_template::parse(command_template_text);
    } catch (const std::invalid_argument& e) {
        parse_error = e.what();
    }
    return [tmpl = std::move(tmpl), parse_error = std::move(parse_error)](
               byte_io_stream& in, byte_io_stream& out, byte_io_stream& diag) {
        if (!tmpl) {
            throw std::invalid_argument(parse_error);
        }
        line_scanner scanner{in};
        while (auto line = scanner.next()) {
            auto argv = split_command_line(tmpl->render(*line));
            if (argv.empty()) {
                throw std::invalid_argument(
                    neo::ufmt("Command template rendered an empty command for [{}]", *line));
            }
            string_reader no_input{std::string()};
            try {
                run_process(argv, no_input, out, diag);
            } catch (const exit_error&) {
                // Already reported to the diagnostics
            } catch (const subprocess_failure& e) {
                write_line(diag, e.what());
            }
        }
    };
}

std::vector<std::string> stages::split_command_line(std::string_view command_line) {
    std::vector<std::string> ret;
    std::string              current;
    bool                     in_word = false;

    const auto n = command_line.size();
    for (std::size_t i = 0; i < n; ++i) {
        char c = command_line[i];
        if (c == ' ' or c == '\t' or c == '\n') {
            if (in_word) {
                ret.push_back(std::exchange(current, std::string()));
                in_word = false;
            }
            continue;
        }
        if (c == '\\') {
            if (++i == n) {
                throw std::invalid_argument("Command line ends with an unescaped backslash");
            }
            // A backslash-newline is a line continuation
            if (command_line[i] != '\n') {
                current.push_back(command_line[i]);
                in_word = true;
            }
            continue;
        }
        in_word = true;
        if (c == '\'') {
            auto close = command_line.find('\'', i + 1);
            if (close == command_line.npos) {
                throw std::invalid_argument(
                    neo::ufmt("Unterminated single quote in command line [{}]", command_line));
            }
            current.append(command_line.substr(i + 1, close - i - 1));
            i = close;
            continue;
        }
        if (c == '"') {
            ++i;
            while (true) {
                if (i == n) {
                    throw std::invalid_argument(
                        neo::ufmt("Unterminated double quote in command line [{}]", command_line));
                }
                char d = command_line[i];
                if (d == '"') {
                    break;
                }
                if (d == '\\' and i + 1 < n
                    and std::string_view("$`\"\\\n").find(command_line[i + 1])
                        != std::string_view::npos) {
                    ++i;
                    if (command_line[i] != '\n') {
                        current.push_back(command_line[i]);
                    }
                } else {
                    current.push_back(d);
                }
                ++i;
            }
            continue;
        }
        current.push_back(c);
    }
    if (in_word) {
        ret.push_back(std::move(current));
    }
    return ret;
}

std::string stages::clean_path(std::string_view path) {
    const bool                    rooted = path.starts_with('/');
    std::vector<std::string_view> parts;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto part  = path.substr(0, slash);
        path.remove_prefix(slash == path.npos ? path.size() : slash + 1);
        if (part.empty() or part == ".") {
            continue;
        }
        if (part == "..") {
            if (!parts.empty() and parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(part);
            }
            continue;
        }
        parts.push_back(part);
    }

    std::string ret = rooted ? "/" : "";
    for (auto& part : parts) {
        if (ret.size() > 1 or (!ret.empty() and !rooted)) {
            ret.push_back('/');
        }
        ret.append(part);
    }
    return ret.empty() ? "." : ret;
}
