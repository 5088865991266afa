#pragma once

#include "cpull/fetcher.hpp"
#include "cpull/settings.hpp"
#include "cpull/types.hpp"

#include <string>
#include <vector>

namespace cpull {

// ============================================================================
// Install: load -> walk -> generate
// ============================================================================

struct InstallOptions {
    std::string manifest_path;   // Already resolved, see resolve_manifest_path()
    bool run_preconditions = true;
};

struct InstallResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string failed_library;
    std::string project_name;
    std::string destination;
    std::string include_file;    // Empty when nothing was generated
    std::vector<ResolvedLibrary> libraries;
};

/**
 * Materialize every library the project at `options.manifest_path` needs.
 *
 * A project without libraries leaves its destination untouched and generates
 * nothing. The include file is written only after a complete walk.
 */
InstallResult install_project(const InstallOptions& options, const Settings& settings,
                              SourceFetcher& fetcher);

} // namespace cpull
