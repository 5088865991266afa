#include "cpull/walker.hpp"
#include "cpull/manifest.hpp"
#include "cpull/platform.hpp"

#include <spdlog/spdlog.h>

namespace cpull {

FetchResult recreate_directory(const std::string& path) {
    FetchResult result;

    if (!remove_directory(path)) {
        result.error = "cannot remove " + path;
        return result;
    }
    if (!create_directories(path)) {
        result.error = "cannot create " + path;
        return result;
    }

    result.ok = true;
    return result;
}

WalkResult DependencyGraphWalker::walk(const ProjectDescriptor& root) {
    WalkResult result;
    state_ = WalkState{};
    destination_ = root.libraries_destination;

    if (root.dependency_tokens.empty()) {
        spdlog::info("{} declares no libraries", root.display_name);
        result.ok = true;
        result.skipped = true;
        return result;
    }

    // Nested manifests may name any destination; only the root's is recreated
    if (auto unsafe = check_libraries_destination(root)) {
        result.kind = ErrorKind::ManifestMalformed;
        result.error = *unsafe;
        return result;
    }

    // The registry must be usable before anything on disk is touched
    auto refresh = index_.ensure_up_to_date();
    if (!refresh.ok) {
        result.kind = refresh.kind;
        result.error = refresh.error;
        return result;
    }

    auto cleared = recreate_directory(destination_);
    if (!cleared.ok) {
        result.kind = ErrorKind::DestinationUnavailable;
        result.error = cleared.error;
        return result;
    }
    spdlog::debug("Recreated {}", destination_);

    for (const auto& token : root.dependency_tokens) {
        if (!admit(token, root.display_name, result)) {
            return result;
        }
    }

    while (!state_.frontier.empty()) {
        std::string name = state_.frontier.front();
        state_.frontier.pop_front();

        if (!expand(name, result)) {
            return result;
        }
        state_.processed.insert(name);
    }

    for (const auto& name : state_.discovery_order) {
        if (state_.processed.count(name)) {
            result.libraries.push_back(state_.resolved_by_name.at(name));
        }
    }

    result.ok = true;
    return result;
}

bool DependencyGraphWalker::admit(const std::string& token, const std::string& declared_by,
                                  WalkResult& result) {
    auto resolution = resolver_.resolve(token, destination_);
    if (!resolution.ok) {
        result.kind = resolution.kind;
        result.error = declared_by + ": " + resolution.error;
        return false;
    }

    const ResolvedLibrary& lib = resolution.library;
    if (state_.resolved_by_name.count(lib.canonical_name)) {
        const auto& known = state_.resolved_by_name.at(lib.canonical_name);
        spdlog::debug("{} already resolved (requested as \"{}\" by {})", lib.canonical_name,
                      token, declared_by);
        if (known.source_location != lib.source_location) {
            spdlog::debug("keeping {} from {}, ignoring {}", lib.canonical_name,
                          known.source_location, lib.source_location);
        }
        return true;
    }

    spdlog::info("Fetching {} from {}", lib.canonical_name, lib.source_location);

    auto parent = get_parent_directory(lib.local_path);
    if (parent != destination_ && !create_directories(parent)) {
        result.kind = ErrorKind::DestinationUnavailable;
        result.error = "cannot create " + parent;
        return false;
    }

    auto fetched = fetcher_.clone(lib.source_location, lib.local_path);
    if (!fetched.ok) {
        result.kind = ErrorKind::LibraryFetchFailed;
        result.failed_library = lib.canonical_name;
        result.error = "failed to fetch " + lib.canonical_name + " from " +
                       lib.source_location + ": " + fetched.error;
        return false;
    }

    state_.resolved_by_name.emplace(lib.canonical_name, lib);
    state_.discovery_order.push_back(lib.canonical_name);
    state_.fetched.insert(lib.canonical_name);
    state_.frontier.push_back(lib.canonical_name);
    return true;
}

bool DependencyGraphWalker::expand(const std::string& name, WalkResult& result) {
    const std::string local_path = state_.resolved_by_name.at(name).local_path;
    auto manifest_path = join_path(local_path, DEFAULT_MANIFEST_NAME);

    auto loaded = load_manifest(manifest_path, options_.run_nested_preconditions);
    if (!loaded.ok) {
        if (loaded.kind == ErrorKind::ManifestNotFound) {
            spdlog::debug("{} has no {}; treating it as a leaf", name, DEFAULT_MANIFEST_NAME);
        } else {
            spdlog::warn("Ignoring dependencies of {}: {}", name, loaded.error);
        }
        return true;
    }

    for (const auto& token : loaded.descriptor.dependency_tokens) {
        if (!admit(token, name, result)) {
            return false;
        }
    }
    return true;
}

} // namespace cpull
