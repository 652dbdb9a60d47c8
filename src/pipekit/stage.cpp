#include "./stage.hpp"

#include "./line_scanner.hpp"
#include "./stream_pair.hpp"

#include <exception>
#include <string>
#include <utility>

using namespace pipekit;

diagnostic_stage pipekit::with_diagnostics(stage s) {
    return [s = std::move(s)](byte_io_stream& in, byte_io_stream& out, byte_io_stream& diag) {
        try {
            s(in, out);
        } catch (const broken_pipe_error&) {
            // The consumer went away. Like SIGPIPE, that is not worth a message.
            throw;
        } catch (const std::exception& e) {
            write_line(diag, e.what());
            throw;
        }
    };
}

stage pipekit::scan_lines(line_callback fn) {
    return [fn = std::move(fn)](byte_io_stream& in, byte_io_stream& out) {
        line_scanner scanner{in};
        while (auto line = scanner.next()) {
            fn(*line, out);
        }
    };
}

void pipekit::write_line(byte_io_stream& out, std::string_view line) {
    std::string buf;
    buf.reserve(line.size() + 1);
    buf.append(line);
    buf.push_back('\n');
    out.write_bytes(as_bytes(buf));
}
