#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cpull {

// ============================================================================
// Settings
// ============================================================================

constexpr const char* DEFAULT_REGISTRY_URL = "https://github.com/cpull-registry/registry.git";
constexpr const char* DEFAULT_OWNER = "cpull-registry";
constexpr const char* DEFAULT_HOST_URL = "https://github.com/";
constexpr const char* REGISTRY_INDEX_FILE = "index.json";
constexpr const char* CONFIG_FILE = "config.json";

struct Settings {
    std::string home;           // Local configuration store
    std::string registry_url;   // Canonical registry location
    std::string registry_dir;   // Local mirror, <home>/registry
    std::string index_file = REGISTRY_INDEX_FILE;
    std::string default_owner;  // Owner for bare names missing from the index
    std::string host_url;       // Prefix for owner/repo locations, ends with '/'
    bool quiet_vcs = true;      // Pass --quiet to git

    std::string index_path() const;
};

/**
 * Resolve the configuration store directory.
 * Priority: explicit override > CPULL_HOME env > ~/.cpull
 */
std::string resolve_home(const std::optional<std::string>& override_home);

struct SettingsLoadResult {
    Settings settings;
    std::vector<std::string> warnings;
};

/**
 * Build settings for a run.
 *
 * Built-in defaults are overridden by <home>/config.json, which is overridden by
 * CPULL_REGISTRY_URL, CPULL_DEFAULT_OWNER and CPULL_HOST_URL.
 * A malformed config file is reported in `warnings` and otherwise ignored.
 */
SettingsLoadResult load_settings(const std::optional<std::string>& override_home);

// Apply a config.json document on top of `settings`. Returns an error message
// when the document is not a JSON object.
std::optional<std::string> apply_config_json(Settings& settings, const std::string& json_str);

} // namespace cpull
