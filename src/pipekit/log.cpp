#include "./log.hpp"

#include <spdlog/cfg/helpers.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

using namespace pipekit;

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get("pipekit")) {
        return existing;
    }
    auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pipekit", std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
    logger->set_level(spdlog::level::warn);
    spdlog::register_logger(logger);
    // Applies to registered loggers only, so this must come after registration
    if (auto levels = std::getenv("PIPEKIT_LOG_LEVEL"); levels and *levels) {
        spdlog::cfg::helpers::load_levels(levels);
    }
    return logger;
}

}  // namespace

const std::shared_ptr<spdlog::logger>& pipekit::logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}
