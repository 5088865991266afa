/**
 * cpull CLI - Common utilities and types
 */

#pragma once

#include <cpull/log.hpp>
#include <cpull/types.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace cpull::cli {

/**
 * Global options available to every action.
 */
struct GlobalOptions {
    std::string action;            // positional, required
    std::string manifest;          // -m, --manifest
    std::string home;              // --home
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline Verbosity verbosity_from(const GlobalOptions& opts) {
    if (opts.verbose) return Verbosity::Verbose;
    if (opts.quiet) return Verbosity::Quiet;
    return Verbosity::Normal;
}

/**
 * Report a fatal error. No stack or trace is shown to the user.
 * With the CLI logger pattern this prints "[error] <kind>: <message>".
 */
inline void print_error(ErrorKind kind, const std::string& msg) {
    report_error(kind, msg);
}

} // namespace cpull::cli
