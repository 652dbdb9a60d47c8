#include "./subprocess.hpp"

#include "./os_error.hpp"

#include <neo/assert.hpp>
#include <neo/overload.hpp>
#include <neo/ufmt.hpp>

#include <array>
#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace pipekit;

namespace {

bool is_mode(const stdio_target& target, stdio_mode mode) noexcept {
    auto m = std::get_if<stdio_mode>(&target);
    return m and *m == mode;
}

int open_for_child(const std::filesystem::path& path, int flags, std::string_view stream) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw_errno(
            neo::ufmt("Cannot open [{}] as the {} of a child process", path.string(), stream));
    }
    return fd;
}

/// The child's end of its stdin. For a pipe, the parent's end is stored in `parent_end`.
pipe_reader child_input(const stdio_target& target, pipe_writer& parent_end) {
    return std::visit(  //
        neo::overload{
            [&](stdio_mode mode) -> pipe_reader {
                switch (mode) {
                case stdio_mode::inherit:
                    return pipe_reader{};
                case stdio_mode::pipe: {
                    auto p     = create_os_pipe();
                    parent_end = std::move(p.writer);
                    return std::move(p.reader);
                }
                case stdio_mode::null:
                    return pipe_reader{open_for_child("/dev/null", O_RDONLY, "stdin")};
                case stdio_mode::merge_into_stdout:
                    break;
                }
                throw std::invalid_argument("The stdin of a child process cannot be merged");
            },
            [&](const std::filesystem::path& path) -> pipe_reader {
                return pipe_reader{open_for_child(path, O_RDONLY, "stdin")};
            },
        },
        target);
}

/// The child's end of an output stream. For a pipe, the parent's end is stored in `parent_end`.
pipe_writer child_output(const stdio_target& target, pipe_reader& parent_end, const char* stream) {
    return std::visit(  //
        neo::overload{
            [&](stdio_mode mode) -> pipe_writer {
                switch (mode) {
                case stdio_mode::inherit:
                case stdio_mode::merge_into_stdout:
                    return pipe_writer{};
                case stdio_mode::pipe: {
                    auto p     = create_os_pipe();
                    parent_end = std::move(p.reader);
                    return std::move(p.writer);
                }
                case stdio_mode::null:
                    return pipe_writer{open_for_child("/dev/null", O_WRONLY, stream)};
                }
                return pipe_writer{};
            },
            [&](const std::filesystem::path& path) -> pipe_writer {
                return pipe_writer{open_for_child(path, O_WRONLY | O_CREAT | O_TRUNC, stream)};
            },
        },
        target);
}

}  // namespace

subprocess_failure::subprocess_failure(int exit_code, int signal_number) noexcept
    : runtime_error(signal_number
                        ? neo::ufmt("Child process was killed by signal {}", signal_number)
                        : neo::ufmt("Child process failed with exit status {}", exit_code))
    , _exit_code(exit_code)
    , _signal_number(signal_number) {}

subprocess::subprocess(subprocess&& other) noexcept
    : _pid(std::exchange(other._pid, -1))
    , _stdin(std::move(other._stdin))
    , _stdout(std::move(other._stdout))
    , _stderr(std::move(other._stderr))
    , _exit_result(std::exchange(other._exit_result, std::nullopt)) {}

subprocess& subprocess::operator=(subprocess&& other) noexcept {
    if (&other != this) {
        _check_joined();
        _pid         = std::exchange(other._pid, -1);
        _stdin       = std::move(other._stdin);
        _stdout      = std::move(other._stdout);
        _stderr      = std::move(other._stderr);
        _exit_result = std::exchange(other._exit_result, std::nullopt);
    }
    return *this;
}

void subprocess::_check_joined() const noexcept {
    neo_assert_always(expects,
                      _pid == -1 or is_joined(),
                      "A pipekit::subprocess was dropped without being joined",
                      _pid);
}

subprocess subprocess::spawn(std::initializer_list<std::string_view> command) {
    subprocess_spawn_options opts;
    for (auto arg : command) {
        opts.command.emplace_back(arg);
    }
    return spawn(opts);
}

subprocess subprocess::spawn(const subprocess_spawn_options& opts) {
    if (opts.command.empty()) {
        throw std::invalid_argument("Cannot spawn a child process without a command");
    }
    if (is_mode(opts.stdout_, stdio_mode::merge_into_stdout)) {
        throw std::invalid_argument("The stdout of a child process cannot be merged into itself");
    }

    pipe_writer parent_stdin;
    pipe_reader parent_stdout;
    pipe_reader parent_stderr;
    auto        stdin_end  = child_input(opts.stdin_, parent_stdin);
    auto        stdout_end = child_output(opts.stdout_, parent_stdout, "stdout");
    auto        stderr_end = child_output(opts.stderr_, parent_stderr, "stderr");
    const bool  merge      = is_mode(opts.stderr_, stdio_mode::merge_into_stdout);

    // Everything the child needs is prepared up front: it may not allocate after fork()
    std::vector<char*> argv;
    for (auto& arg : opts.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::string workdir;
    if (opts.working_directory) {
        workdir = opts.working_directory->string();
    }
    const auto chdir_failed = neo::ufmt("Cannot change into directory [{}]", workdir);
    const auto exec_failed  = neo::ufmt("Cannot execute [{}]", opts.command.front());

    // The child writes its errno here if it fails before exec(). A successful exec() closes the
    // write end, so the parent reads end-of-stream.
    auto report = create_os_pipe();

    auto pid = ::fork();
    if (pid < 0) {
        throw_errno("::fork() failed to create a child process");
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on. Another thread may hold the malloc lock.
        auto fail = [&](std::string_view what) {
            int err = errno;
            (void)!::write(report.writer.fd(), &err, sizeof err);
            (void)!::write(report.writer.fd(), what.data(), what.size());
            ::_exit(127);
        };
        auto redirect = [&](const fd_stream& from, int to, std::string_view what) {
            if (from.is_open() and ::dup2(from.fd(), to) < 0) {
                fail(what);
            }
        };

        // The spawning thread may have blocked or ignored signals that the program expects
        ::sigset_t none;
        ::sigemptyset(&none);
        ::pthread_sigmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        redirect(stdin_end, STDIN_FILENO, "dup2() failed for stdin");
        redirect(stdout_end, STDOUT_FILENO, "dup2() failed for stdout");
        redirect(stderr_end, STDERR_FILENO, "dup2() failed for stderr");
        if (merge and ::dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
            fail("dup2() failed to merge stderr into stdout");
        }
        if (!workdir.empty() and ::chdir(workdir.c_str()) < 0) {
            fail(chdir_failed);
        }
        if (opts.search_path) {
            ::execvp(argv[0], argv.data());
        } else {
            ::execv(argv[0], argv.data());
        }
        fail(exec_failed);
    }

    subprocess ret{pid};
    ret._stdin  = std::move(parent_stdin);
    ret._stdout = std::move(parent_stdout);
    ret._stderr = std::move(parent_stderr);

    // Drop our copies of the child's ends, or the parent would never see end-of-stream
    stdin_end.close();
    stdout_end.close();
    stderr_end.close();
    report.writer.close();

    int child_errno = 0;
    if (report.reader.read_into(&child_errno, 1) != 0) {
        auto what = report.reader.read();
        ret.join();
        throw_os_error(child_errno, what);
    }
    return ret;
}

const subprocess_exit& subprocess::join() {
    neo_assert(expects, _pid != -1, "join() called on a moved-from pipekit::subprocess");
    neo_assert(expects, !is_joined(), "join() called twice on a pipekit::subprocess", _pid);

    ::siginfo_t info{};
    while (::waitid(P_PID, _pid, &info, WEXITED) != 0) {
        if (errno != EINTR) {
            // The child cannot be waited for any more. Drop it so the handle may be destroyed.
            auto pid = std::exchange(_pid, -1);
            throw_errno(neo::ufmt("::waitid() failed for child process {}", pid));
        }
    }

    if (info.si_code == CLD_EXITED) {
        _exit_result = subprocess_exit{.exit_code = info.si_status};
    } else {
        // CLD_KILLED or CLD_DUMPED. WEXITED reports nothing else.
        _exit_result = subprocess_exit{.signal_number = info.si_status};
    }
    return *_exit_result;
}

void subprocess::send_signal(int signum) {
    neo_assert(expects, !is_joined(), "Cannot signal a child process after joining it", signum);
    if (::kill(_pid, signum) != 0) {
        throw_errno(
            neo::ufmt("::kill() failed to send signal {} to child process {}", signum, _pid));
    }
}

void subprocess::read_output_into(subprocess_output& out, std::chrono::milliseconds timeout) {
    struct watched {
        pipe_reader* pipe;
        std::string* sink;
    };
    std::array<::pollfd, 2> fds{};
    std::array<watched, 2>  which{};
    ::nfds_t                count = 0;
    for (auto w : {watched{&_stdout, &out.stdout_}, watched{&_stderr, &out.stderr_}}) {
        if (w.pipe->is_open()) {
            fds[count]   = ::pollfd{w.pipe->fd(), POLLIN, 0};
            which[count] = w;
            ++count;
        }
    }
    if (count == 0) {
        return;
    }

    int rc = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return;
        }
        throw_errno("::poll() failed on the output pipes of a child process");
    }

    for (::nfds_t i = 0; i < count; ++i) {
        auto [pipe, sink] = which[i];
        if (fds[i].revents == 0) {
            continue;
        }
        if (!(fds[i].revents & POLLIN)) {
            // Hung up with nothing left to read
            pipe->close();
            continue;
        }
        auto prev_size = sink->size();
        sink->resize(prev_size + 4096);
        // A zero-length read closes the pipe
        auto nread = pipe->read_into(sink->data() + prev_size, 4096);
        sink->resize(prev_size + nread);
    }
}

subprocess_output subprocess::read_output() {
    subprocess_output ret;
    while (has_stdout() or has_stderr()) {
        read_output_into(ret);
    }
    return ret;
}
