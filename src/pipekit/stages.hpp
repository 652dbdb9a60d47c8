#pragma once

#include "./io.hpp"
#include "./stage.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief A standard library of pipeline stages, modelled on the Unix tools of the same names.
 *
 * Line-oriented stages split their input with a line_scanner and terminate each output line with
 * '\n'.
 */
namespace pipekit::stages {

/// Produce the given text, ignoring the input
[[nodiscard]] stage echo(std::string text);

/// Produce each of the given lines followed by a newline, ignoring the input
[[nodiscard]] stage from_lines(std::vector<std::string> lines);

/**
 * @brief Produce the contents of the file at `path`, ignoring the input.
 *
 * @throws file_not_found_error if the file does not exist
 */
[[nodiscard]] stage cat_file(std::filesystem::path path);

/// Produce the standard input of the process, ignoring the stage input
[[nodiscard]] stage stdin_source();

/// Produce only the lines that contain `text`
[[nodiscard]] stage match(std::string text);

/// Produce only the lines that do not contain `text`
[[nodiscard]] stage reject(std::string text);

/// Replace every occurrence of `search` in each line with `replacement`
[[nodiscard]] stage replace(std::string search, std::string replacement);

/// Produce only the lines in which `re` matches somewhere
[[nodiscard]] stage match_regex(std::regex re);

/// Produce only the lines in which `re` matches nowhere
[[nodiscard]] stage reject_regex(std::regex re);

/**
 * @brief Replace every match of `re` in each line with `replacement`.
 *
 * The replacement uses ECMAScript format: `$&` is the whole match, and `$1`..`$99` are the
 * capture groups.
 */
[[nodiscard]] stage replace_regex(std::regex re, std::string replacement);

/// Produce the first `n` lines. Nothing if `n` is not positive.
[[nodiscard]] stage first(std::int64_t n);

/// Produce the last `n` lines. Nothing if `n` is not positive.
[[nodiscard]] stage last(std::int64_t n);

/**
 * @brief Produce each distinct line once, prefixed by the number of times it occurred.
 *
 * The most frequent lines come first, and lines with the same count are sorted. Counts are
 * right-aligned to the width of the largest count, like `sort | uniq -c | sort -rn`.
 */
[[nodiscard]] stage freq();

/// Produce the number of input lines, followed by a newline
[[nodiscard]] stage count_lines();

/**
 * @brief Produce column `col` (starting from 1) of each line. Columns are separated by
 * whitespace. Lines with fewer columns are skipped.
 */
[[nodiscard]] stage column(int col);

/// Join all lines into a single space-separated line
[[nodiscard]] stage join();

/**
 * @brief Reduce each line (a path) to its final component.
 *
 * Trailing slashes are ignored. An empty line becomes ".", and a line of only slashes becomes "/".
 */
[[nodiscard]] stage basename();

/**
 * @brief Reduce each line (a path) to its parent directory.
 *
 * The result is lexically normalized. A path without a directory part becomes ".". A leading
 * "./" is kept unless the result is "." itself, so "./foo" becomes "." and never "./.".
 */
[[nodiscard]] stage dirname();

/**
 * @brief Treat each line as a file path, and produce the contents of each file in turn.
 *
 * Files that cannot be read are skipped, like cat(1) carrying on after an error.
 */
[[nodiscard]] stage concat();

/**
 * @brief Copy the input into each of `sinks` as well as into the output.
 *
 * The sinks must outlive the stage.
 */
[[nodiscard]] stage tee(std::vector<std::reference_wrapper<byte_io_stream>> sinks);

/// Replace each line with the result of `fn`
[[nodiscard]] stage transform_lines(std::function<std::string(std::string_view)> fn);

/**
 * @brief Call `fn` with each line and a buffer to append to. The buffer is written out once the
 * input is exhausted.
 */
[[nodiscard]] stage each_line(std::function<void(std::string_view, std::string&)> fn);

/**
 * @brief List the files named by `path`, one per line, ignoring the input.
 *
 * If `path` contains a glob(7) metacharacter it is expanded as a pattern, and a pattern that
 * matches nothing produces nothing. Otherwise a directory produces each of its entries in sorted
 * order, and anything else produces `path` itself.
 *
 * @throws std::filesystem::filesystem_error if `path` does not exist
 */
[[nodiscard]] stage list_files(std::string path);

/**
 * @brief Produce the path of every file below `dir`, recursively, ignoring the input.
 *
 * Directories are walked in sorted order but are not listed themselves. Symbolic links are not
 * followed.
 *
 * @throws std::filesystem::filesystem_error if `dir` cannot be read
 */
[[nodiscard]] stage find_files(std::string dir);

/**
 * @brief Write the input into the file at `path`, replacing its contents. Produces the number of
 * bytes written.
 */
[[nodiscard]] stage write_file(std::filesystem::path path);

/**
 * @brief Append the input to the file at `path`, creating it if needed. Produces the number of
 * bytes written.
 */
[[nodiscard]] stage append_file(std::filesystem::path path);

/**
 * @brief Fail unless `path` exists. Produces nothing.
 *
 * @throws std::filesystem::filesystem_error if the path does not exist
 */
[[nodiscard]] stage if_exists(std::filesystem::path path);

/// Fail with exit_error carrying the given code and message
[[nodiscard]] stage exit_with(int code, std::string message = {});

/**
 * @brief Run an external program as a filter.
 *
 * The stage input is written to the program's stdin, its stdout becomes the stage output, and its
 * stderr is written into the diagnostic stream. If the program cannot be started, the reason is
 * written to the diagnostics and the stage fails with exit_error code 1. If the program exits
 * unsuccessfully, the stage fails with subprocess_failure.
 *
 * @param argv The program followed by its arguments. The program is looked up on PATH.
 */
[[nodiscard]] diagnostic_stage exec(std::vector<std::string> argv);

/**
 * @brief Run a command line as a filter. The command line is split with split_command_line().
 */
[[nodiscard]] diagnostic_stage exec(std::string_view command_line);

/**
 * @brief Run one command per input line.
 *
 * Each `{{.}}` in `command_template` is replaced by the line, and the result is split with
 * split_command_line() and run with an empty stdin. The command's stdout becomes the stage output
 * and its stderr goes to the diagnostics. A command that cannot be started or that fails is
 * reported to the diagnostics and the remaining lines still run.
 *
 * The stage fails with std::invalid_argument if the template has an action other than `{{.}}`
 * or an unterminated `{{`, or if a rendered line cannot be split.
 */
[[nodiscard]] diagnostic_stage exec_for_each(std::string_view command_template);

/**
 * @brief Split a command line into arguments the way a POSIX shell splits words.
 *
 * Whitespace separates arguments. Single quotes preserve everything up to the closing quote.
 * Double quotes preserve everything but a backslash before one of `$`, `` ` ``, `"`, `\` or a
 * newline. Outside of quotes a backslash preserves the next character. No expansions are
 * performed.
 *
 * @throws std::invalid_argument for an unterminated quote or a trailing backslash
 */
[[nodiscard]] std::vector<std::string> split_command_line(std::string_view command_line);

/**
 * @brief Lexically normalize a slash-separated path.
 *
 * Repeated slashes and "." components are removed, and ".." components remove the component
 * before them where there is one. An empty result becomes ".".
 */
[[nodiscard]] std::string clean_path(std::string_view path);

}  // namespace pipekit::stages
