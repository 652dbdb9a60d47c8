#pragma once

#include "./auto_close_reader.hpp"
#include "./error.hpp"
#include "./io.hpp"
#include "./stage.hpp"
#include "./stream_pair.hpp"

#include <neo/fwd.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pipekit {

/**
 * @brief The value produced by a pipeline terminal operation, along with the pipeline's error
 * (if any).
 */
template <typename T>
struct pipeline_result {
    /// The materialized value. Holds a default value if the conversion failed.
    T value{};
    /// The captured pipeline error, or the conversion error
    std::optional<pipeline_error> error{};

    /// Whether there is no error
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    /// The process-style exit status of the error, or zero
    [[nodiscard]] int exit_status() const noexcept { return pipekit::exit_status(error); }

    /// If there is an error, rethrow it as an exception
    void throw_if_error() const {
        if (error) {
            error->rethrow();
        }
    }
};

/**
 * @brief A chain of concurrently running stages connected by stream pairs.
 *
 * Each call to pipe() launches a stage on its own thread, reading the previous tail and writing a
 * new stream pair that becomes the tail. A terminal operation (run(), wait(), string(), ...) reads
 * the tail to its end and then joins every stage thread, so the error it reports is final.
 *
 * The first failure among concurrently running stages is captured. Which stage that is depends on
 * scheduling.
 *
 * The pipeline itself is a readable stream over its tail. Destroying a pipeline closes the tail
 * and joins every stage.
 */
class pipeline : public byte_reader {
    std::shared_ptr<auto_close_reader>   _tail;
    byte_io_stream*                      _stdout;
    std::shared_ptr<synchronized_writer> _diagnostics;
    std::shared_ptr<error_slot>          _errors;
    bool                                 _exit_on_error = false;
    std::vector<std::thread>             _tasks;

    std::size_t do_read_into(mutable_buffer buf) override;

    /// Read the tail to its end, capturing any error, then join the stages
    std::string _drain_bytes();

    /// Close the tail and join every stage thread
    void _finish() noexcept;

public:
    /// Create an empty pipeline. Its tail is at end-of-stream.
    pipeline();

    pipeline(pipeline&&) noexcept = default;
    pipeline& operator=(pipeline&& other) noexcept;

    ~pipeline() { _finish(); }

    /**
     * @brief Create a pipeline whose tail reads the given text
     */
    [[nodiscard]] static pipeline echo(std::string text);

    /**
     * @brief Create a pipeline whose tail reads the given lines, each followed by a newline
     */
    [[nodiscard]] static pipeline from_lines(const std::vector<std::string>& lines);

    /**
     * @brief Create a pipeline whose tail reads the program arguments after argv[0], one per line
     */
    [[nodiscard]] static pipeline from_args(int argc, const char* const* argv);

    /**
     * @brief Create a pipeline that reads the named file. A missing file is a pipeline error.
     */
    [[nodiscard]] static pipeline from_file(std::filesystem::path path);

    /**
     * @brief Create a pipeline that runs the given command line and reads its output
     */
    [[nodiscard]] static pipeline exec(std::string_view command);

    /**
     * @brief Create a pipeline that fails unless the given path exists.
     *
     * Exit-on-error is enabled so that nothing piped afterwards runs if the path is missing.
     */
    [[nodiscard]] static pipeline if_exists(std::filesystem::path path);

    /**
     * @brief Launch a diagnostic stage reading the current tail, and make its output the new tail.
     *
     * If exit-on-error is set and an error has already been captured, the stage is not launched.
     * Returns once the stage thread has started.
     */
    pipeline& pipe(diagnostic_stage s);

    /// Launch a plain stage, reporting its failure message to the diagnostic destination
    pipeline& filter(stage s) { return pipe(with_diagnostics(std::move(s))); }

    /// Launch a stage that calls `fn` for each line of the tail
    pipeline& filter_lines(line_callback fn) { return filter(scan_lines(std::move(fn))); }

    /**
     * @brief Launch the given diagnostic stages, then copy the tail into the configured output.
     *
     * @return The number of bytes copied, and the pipeline's error
     */
    template <typename Stage, typename... Stages>
    pipeline_result<std::uint64_t> run(Stage&& first, Stages&&... rest) {
        pipe(diagnostic_stage(NEO_FWD(first)));
        (pipe(diagnostic_stage(NEO_FWD(rest))), ...);
        return run();
    }

    /// Copy the tail into the configured output and join the stages
    pipeline_result<std::uint64_t> run();

    /// Read and discard the tail, then join the stages
    pipeline& wait();

    /// Read the tail into a byte vector
    [[nodiscard]] pipeline_result<std::vector<std::byte>> bytes();

    /// Read the tail into a string
    [[nodiscard]] pipeline_result<std::string> string();

    /**
     * @brief Read the tail and parse it as a base-10 integer.
     *
     * Surrounding whitespace is ignored. Output that is not an integer yields a conversion_error
     * and the value zero. That error is not captured by the pipeline.
     */
    [[nodiscard]] pipeline_result<std::int64_t> to_int();

    /// Read the tail and split it into lines
    [[nodiscard]] pipeline_result<std::vector<std::string>> lines();

    /**
     * @brief Replace the tail with the given source.
     *
     * The previous tail is dropped without being drained.
     */
    template <std::derived_from<byte_io_stream> Source>
    pipeline& with_reader(std::unique_ptr<Source> source) {
        auto reader = std::make_unique<stream_reader>(stream_reader::over(std::move(source)));
        _tail       = std::make_shared<auto_close_reader>(std::move(reader));
        return *this;
    }

    /**
     * @brief Set the destination of run(). Defaults to the process's standard output.
     *
     * The sink must outlive the pipeline's use of it.
     */
    pipeline& with_stdout(byte_io_stream& sink) noexcept {
        _stdout = &sink;
        return *this;
    }

    /**
     * @brief Set the diagnostic destination for stages launched after this call. Defaults to a
     * sink that discards everything.
     *
     * The sink must outlive the stages that write into it.
     */
    pipeline& with_stderr(byte_io_stream& sink);

    /// Enable or disable skipping stages once an error has been captured
    pipeline& exit_on_error(bool enable = true) noexcept {
        _exit_on_error = enable;
        return *this;
    }

    /// The captured error
    [[nodiscard]] std::optional<pipeline_error> error() const { return _errors->get(); }

    /// Replace or clear the captured error
    pipeline& set_error(std::optional<pipeline_error> err);

    /// Replace the captured error with one classified from the given exception
    pipeline& set_error(std::exception_ptr exc) {
        return set_error(pipeline_error::from_exception(std::move(exc)));
    }

    /// The process-style exit status derived from the captured error
    [[nodiscard]] int exit_status() const;

    /// Close the tail. Stages still writing into it stop with a broken pipe.
    void close() noexcept;
};

}  // namespace pipekit
