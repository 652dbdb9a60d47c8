#pragma once

#include "./io.hpp"

#include <functional>
#include <string_view>

namespace pipekit {

/**
 * @brief A plain pipeline stage: reads its input and writes its output.
 *
 * A stage reports failure by throwing. Stages may keep private state, but must not depend on the
 * pipeline that runs them.
 */
using stage = std::function<void(byte_io_stream& input, byte_io_stream& output)>;

/**
 * @brief A diagnostic-capable pipeline stage, which may also write messages into a diagnostic
 * stream.
 */
using diagnostic_stage
    = std::function<void(byte_io_stream& input, byte_io_stream& output, byte_io_stream& diag)>;

/**
 * @brief A callback invoked once per line by scan_lines()
 */
using line_callback = std::function<void(std::string_view line, byte_io_stream& output)>;

/**
 * @brief Lift a plain stage into a diagnostic stage.
 *
 * If the stage throws, the exception's message and a newline are written to the diagnostic
 * stream, then the exception propagates unchanged.
 */
[[nodiscard]] diagnostic_stage with_diagnostics(stage s);

/**
 * @brief Build a stage that calls `fn` for each line of its input.
 *
 * Lines are passed without their terminator. Scan failures (a line too long for the scan buffer,
 * or an error reading the input) propagate out of the stage.
 */
[[nodiscard]] stage scan_lines(line_callback fn);

/**
 * @brief Write a line of text followed by a newline into `out`
 */
void write_line(byte_io_stream& out, std::string_view line);

}  // namespace pipekit
