#pragma once

#include "cpull/fetcher.hpp"
#include "cpull/settings.hpp"
#include "cpull/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cpull {

// ============================================================================
// Registry Index (index.json in the registry mirror)
// ============================================================================

struct RegistryIndex {
    std::unordered_map<std::string, std::string> libraries;  // bare name -> location
};

struct RegistryIndexParseResult {
    bool ok = false;
    std::string error;
    RegistryIndex index;
    std::vector<std::string> warnings;  // Skipped entries
};

// Parse {"libraries": {"name": "location", ...}}
RegistryIndexParseResult parse_registry_index(const std::string& json_str);

// Conventional location for a repository on the configured hosting service
std::string hosted_location(const Settings& settings, const std::string& owner,
                            const std::string& repo);

// ============================================================================
// Remote Index
// ============================================================================

struct RegistryRefreshResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    bool stale = false;   // Update of an existing mirror failed; old copy in use
    bool cloned = false;  // Mirror was fetched for the first time
};

struct RegistryLookupResult {
    std::string source_location;
    bool guessed = false;  // Name absent from the index, default location used
};

/**
 * Local mirror of the central name -> location registry.
 *
 * ensure_up_to_date() fetches or updates the mirror at most once per instance.
 * lookup() reads the mirrored index file on first use and never touches the
 * network; callers refresh before looking names up.
 */
class RemoteIndex {
public:
    RemoteIndex(const Settings& settings, SourceFetcher& fetcher);

    RegistryRefreshResult ensure_up_to_date();

    RegistryLookupResult lookup(const std::string& name);

    bool refreshed() const { return refreshed_; }

private:
    void load_index();

    const Settings& settings_;
    SourceFetcher& fetcher_;
    bool refreshed_ = false;
    RegistryRefreshResult last_refresh_;
    bool loaded_ = false;
    RegistryIndex index_;
    std::unordered_set<std::string> guessed_names_;  // misses already warned about
};

} // namespace cpull
