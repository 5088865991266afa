#pragma once

#include "cpull/registry.hpp"
#include "cpull/settings.hpp"
#include "cpull/types.hpp"

#include <string>

namespace cpull {

// ============================================================================
// Dependency Token Classification
// ============================================================================

// True for tokens naming a remote explicitly: "<scheme>://...", "git@host:...",
// or any scp-style "user@host:path"
bool has_remote_marker(const std::string& token);

// Classification in priority order: remote marker, then a single '/', then bare name
TokenForm classify_token(const std::string& token);

// Last path segment of a location with one trailing extension removed
// ("https://host/acme/foo.git" -> "foo", "git@host:foo.git" -> "foo")
std::string canonical_name_from_location(const std::string& location);

// A canonical name must be usable as a directory below the destination
bool is_valid_canonical_name(const std::string& name);

// ============================================================================
// Library Name Resolver
// ============================================================================

struct TokenResolution {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;  // InvalidDependency on failure
    std::string error;
    ResolvedLibrary library;
};

class LibraryNameResolver {
public:
    LibraryNameResolver(const Settings& settings, RemoteIndex& index)
        : settings_(settings), index_(index) {}

    // Resolve one token; `destination` is the directory libraries land in.
    // Only bare names consult the registry index.
    TokenResolution resolve(const std::string& token, const std::string& destination);

private:
    const Settings& settings_;
    RemoteIndex& index_;
};

} // namespace cpull
