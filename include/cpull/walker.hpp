#pragma once

#include "cpull/fetcher.hpp"
#include "cpull/registry.hpp"
#include "cpull/resolver.hpp"
#include "cpull/types.hpp"

#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cpull {

// ============================================================================
// Walk State
// ============================================================================
//
// Invariants:
//   processed is a subset of fetched
//   frontier holds exactly fetched \ processed, in discovery order
//   resolved_by_name only grows

struct WalkState {
    std::unordered_map<std::string, ResolvedLibrary> resolved_by_name;
    std::vector<std::string> discovery_order;
    std::unordered_set<std::string> fetched;
    std::unordered_set<std::string> processed;
    std::deque<std::string> frontier;
};

struct WalkOptions {
    bool run_nested_preconditions = true;
};

struct WalkResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string failed_library;   // Canonical name for LibraryFetchFailed
    bool skipped = false;         // Root declared no dependencies; nothing touched
    std::vector<ResolvedLibrary> libraries;  // Processed libraries in discovery order
};

/**
 * Breadth-first materialization of a project's transitive libraries.
 *
 * Every library lands directly below the root project's destination directory,
 * which is wiped and recreated at the start of each non-empty walk. Each
 * canonical name is cloned at most once and its own project.json is read at most
 * once, so dependency cycles terminate.
 *
 * Any clone failure aborts the walk; the destination may then be incomplete.
 */
class DependencyGraphWalker {
public:
    DependencyGraphWalker(SourceFetcher& fetcher, RemoteIndex& index,
                          LibraryNameResolver& resolver, WalkOptions options = {})
        : fetcher_(fetcher), index_(index), resolver_(resolver), options_(options) {}

    WalkResult walk(const ProjectDescriptor& root);

    const WalkState& state() const { return state_; }

private:
    // Resolve one token and clone it if its canonical name is new.
    // Returns false after recording a fatal error in `result`.
    bool admit(const std::string& token, const std::string& declared_by, WalkResult& result);

    // Read one fetched library's project.json and admit its dependencies
    bool expand(const std::string& name, WalkResult& result);

    SourceFetcher& fetcher_;
    RemoteIndex& index_;
    LibraryNameResolver& resolver_;
    WalkOptions options_;
    WalkState state_;
    std::string destination_;
};

// Remove `path` with everything below it and create it again, empty
FetchResult recreate_directory(const std::string& path);

} // namespace cpull
