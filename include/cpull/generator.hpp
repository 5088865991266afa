#pragma once

#include "cpull/types.hpp"

#include <string>
#include <vector>

namespace cpull {

// ============================================================================
// Generated Build Include File
// ============================================================================

constexpr const char* INCLUDE_FILE_NAME = "CMakeLists.txt";
constexpr const char* GENERATED_HEADER =
    "# This file is generated by cpull. Do not edit; changes will be overwritten.";

// Header line followed by one add_subdirectory() per library, newline-terminated
std::string render_include_file(const std::vector<ResolvedLibrary>& libraries);

struct GenerateResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;  // IncludeFileWriteFailed on failure
    std::string error;
    std::string path;
};

// Atomically (re)write <destination>/CMakeLists.txt
GenerateResult write_include_file(const std::string& destination,
                                  const std::vector<ResolvedLibrary>& libraries);

} // namespace cpull
