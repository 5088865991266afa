#pragma once

#include "cpull/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace cpull {

// ============================================================================
// Project Descriptor Loading (project.json)
// ============================================================================

struct ManifestLoadResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;  // ManifestNotFound or ManifestMalformed on failure
    std::string error;
    ProjectDescriptor descriptor;
};

// Resolve the manifest location.
//   - nullopt or empty: <cwd>/project.json
//   - an existing directory: <dir>/project.json
//   - anything else: the path itself
std::string resolve_manifest_path(const std::optional<std::string>& path_or_dir);

// Parse a descriptor. Relative paths are anchored at the manifest's directory.
ManifestLoadResult parse_project_descriptor(const std::string& json_str,
                                            const std::string& manifest_path);

// The destination is recreated on every install, so it must not be the project
// directory or one of its ancestors. Returns the error message when it is.
std::optional<std::string> check_libraries_destination(const ProjectDescriptor& descriptor);

// Read and parse a descriptor, then run its preconditions when requested
ManifestLoadResult load_manifest(const std::string& manifest_path,
                                 bool execute_preconditions = true);

// Run precondition steps in declared order from the project directory.
// Failures are logged and counted; they never stop the remaining steps.
std::size_t run_preconditions(const ProjectDescriptor& descriptor);

} // namespace cpull
