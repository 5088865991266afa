#include "cpull/registry.hpp"
#include "cpull/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cpull {

RegistryIndexParseResult parse_registry_index(const std::string& json_str) {
    RegistryIndexParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("invalid JSON: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    if (!j.contains("libraries") || !j["libraries"].is_object()) {
        result.error = "\"libraries\" must be an object";
        return result;
    }

    for (auto& [name, location] : j["libraries"].items()) {
        if (!location.is_string() || location.get<std::string>().empty()) {
            result.warnings.push_back("registry entry \"" + name + "\" has no location");
            continue;
        }
        result.index.libraries[name] = location.get<std::string>();
    }

    result.ok = true;
    return result;
}

std::string hosted_location(const Settings& settings, const std::string& owner,
                            const std::string& repo) {
    return settings.host_url + owner + "/" + repo + ".git";
}

RemoteIndex::RemoteIndex(const Settings& settings, SourceFetcher& fetcher)
    : settings_(settings), fetcher_(fetcher) {}

RegistryRefreshResult RemoteIndex::ensure_up_to_date() {
    if (refreshed_) {
        return last_refresh_;
    }

    RegistryRefreshResult result;
    const std::string& mirror = settings_.registry_dir;

    if (!is_directory(mirror)) {
        if (!create_directories(get_parent_directory(mirror))) {
            result.kind = ErrorKind::RegistryUnavailable;
            result.error = "cannot create configuration directory " + get_parent_directory(mirror);
            return result;
        }

        spdlog::info("Fetching library registry from {}", settings_.registry_url);
        auto fetched = fetcher_.clone(settings_.registry_url, mirror);
        if (!fetched.ok) {
            // Never leave a half-cloned mirror behind; the next run starts fresh
            if (!remove_directory(mirror)) {
                spdlog::debug("Could not remove partial registry mirror {}", mirror);
            }
            result.kind = ErrorKind::RegistryUnavailable;
            result.error = "failed to fetch registry " + settings_.registry_url + ": " + fetched.error;
            return result;
        }
        result.cloned = true;
    } else {
        spdlog::debug("Updating library registry in {}", mirror);
        auto pulled = fetcher_.pull(mirror);
        if (!pulled.ok) {
            spdlog::warn("Could not update library registry ({}); using the existing copy",
                         pulled.error);
            result.stale = true;
        }
    }

    result.ok = true;
    refreshed_ = true;
    loaded_ = false;
    last_refresh_ = result;
    return result;
}

void RemoteIndex::load_index() {
    loaded_ = true;
    index_ = RegistryIndex{};

    std::string path = settings_.index_path();
    auto content = read_file(path);
    if (!content) {
        spdlog::warn("Registry index {} not found", path);
        return;
    }

    auto parsed = parse_registry_index(*content);
    if (!parsed.ok) {
        spdlog::warn("Registry index {} is malformed: {}", path, parsed.error);
        return;
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}", w);
    }
    index_ = std::move(parsed.index);
}

RegistryLookupResult RemoteIndex::lookup(const std::string& name) {
    if (!loaded_) {
        load_index();
    }

    RegistryLookupResult result;
    auto it = index_.libraries.find(name);
    if (it != index_.libraries.end()) {
        result.source_location = it->second;
        return result;
    }

    result.source_location = hosted_location(settings_, settings_.default_owner, name);
    result.guessed = true;
    if (guessed_names_.insert(name).second) {
        spdlog::warn("Library \"{}\" is not in the registry; guessing {}", name,
                     result.source_location);
    }
    return result;
}

} // namespace cpull
