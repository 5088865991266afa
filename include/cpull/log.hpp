#pragma once

#include "cpull/types.hpp"

#include <string>

namespace cpull {

enum class Verbosity {
    Quiet,    // warnings and errors
    Normal,   // progress
    Verbose,  // commands and walk bookkeeping
};

// Install the colored stderr logger named "cpull" as the spdlog default
void init_logging(Verbosity verbosity);

// Log a fatal error once, as "<kind>: <message>" at error level
void report_error(ErrorKind kind, const std::string& message);

} // namespace cpull
