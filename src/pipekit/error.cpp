#include "./error.hpp"

#include "./subprocess.hpp"

#include <neo/overload.hpp>
#include <neo/ufmt.hpp>

#include <charconv>
#include <string_view>

using namespace pipekit;

exit_error::exit_error(int exit_code, const std::string& message)
    : runtime_error(message.empty() ? neo::ufmt("exit status {}", exit_code) : message)
    , _exit_code(exit_code) {}

pipeline_error pipeline_error::from_exception(std::exception_ptr exc) {
    try {
        std::rethrow_exception(exc);
    } catch (const exit_error& e) {
        return pipeline_error(explicit_exit{e.exit_code()}, e.what(), exc);
    } catch (const subprocess_failure& e) {
        return pipeline_error(process_exit{e.exit_code(), e.signal_number()}, e.what(), exc);
    } catch (const std::exception& e) {
        return pipeline_error(other_failure{}, e.what(), exc);
    } catch (...) {
        return pipeline_error(other_failure{}, "Unknown exception escaped a pipeline stage", exc);
    }
}

int pipeline_error::exit_status() const noexcept {
    return std::visit(neo::overload{
                          [](const explicit_exit& e) { return e.code; },
                          [](const process_exit& p) {
                              return p.signal_number ? 128 + p.signal_number : p.exit_code;
                          },
                          [&](const other_failure&) { return parse_exit_status_suffix(_message); },
                      },
                      _kind);
}

void pipeline_error::rethrow() const {
    if (_exception) {
        std::rethrow_exception(_exception);
    }
    throw std::runtime_error(_message);
}

int pipekit::exit_status(const std::optional<pipeline_error>& err) noexcept {
    return err ? err->exit_status() : 0;
}

int pipekit::parse_exit_status_suffix(std::string_view message) noexcept {
    constexpr std::string_view prefix = "exit status ";
    auto                       pos    = message.rfind(prefix);
    if (pos == message.npos) {
        return 0;
    }
    auto digits = message.substr(pos + prefix.size());
    if (digits.empty() or digits.front() < '0' or digits.front() > '9') {
        return 0;
    }
    int  status = 0;
    auto res    = std::from_chars(digits.data(), digits.data() + digits.size(), status);
    if (res.ec != std::errc{} or res.ptr != digits.data() + digits.size()) {
        // Not a number, trailing garbage, or out of range
        return 0;
    }
    return status;
}

bool error_slot::capture(pipeline_error err) {
    std::unique_lock lk{_mutex};
    if (_error) {
        return false;
    }
    _error.emplace(std::move(err));
    return true;
}

void error_slot::set(std::optional<pipeline_error> err) {
    std::unique_lock lk{_mutex};
    _error = std::move(err);
}

std::optional<pipeline_error> error_slot::get() const {
    std::unique_lock lk{_mutex};
    return _error;
}

bool error_slot::has_error() const {
    std::unique_lock lk{_mutex};
    return _error.has_value();
}
