#include "cpull/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cpull {

void init_logging(Verbosity verbosity) {
    auto logger = spdlog::get("cpull");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cpull");
    }
    logger->set_pattern("[%^%l%$] %v");

    switch (verbosity) {
        case Verbosity::Quiet:
            logger->set_level(spdlog::level::warn);
            break;
        case Verbosity::Normal:
            logger->set_level(spdlog::level::info);
            break;
        case Verbosity::Verbose:
            logger->set_level(spdlog::level::debug);
            break;
    }

    spdlog::set_default_logger(logger);
}

void report_error(ErrorKind kind, const std::string& message) {
    spdlog::error("{}: {}", error_kind_to_string(kind), message);
}

} // namespace cpull
