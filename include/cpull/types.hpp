#pragma once

#include <string>
#include <vector>

namespace cpull {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    None,
    RegistryUnavailable,     // Initial registry mirror fetch failed
    ManifestNotFound,
    ManifestMalformed,
    InvalidDependency,       // Token cannot name a library directory
    LibraryFetchFailed,
    DestinationUnavailable,  // Destination directory could not be recreated
    IncludeFileWriteFailed,
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::RegistryUnavailable: return "registry_unavailable";
        case ErrorKind::ManifestNotFound: return "manifest_not_found";
        case ErrorKind::ManifestMalformed: return "manifest_malformed";
        case ErrorKind::InvalidDependency: return "invalid_dependency";
        case ErrorKind::LibraryFetchFailed: return "library_fetch_failed";
        case ErrorKind::DestinationUnavailable: return "destination_unavailable";
        case ErrorKind::IncludeFileWriteFailed: return "include_file_write_failed";
    }
    return "unknown";
}

// ============================================================================
// Project Descriptor (project.json)
// ============================================================================

constexpr const char* DEFAULT_MANIFEST_NAME = "project.json";
constexpr const char* DEFAULT_LIBRARIES_DESTINATION = "lib";

struct ProjectDescriptor {
    std::string display_name;                 // "name", defaults to the directory name
    std::string project_dir;                  // Absolute directory holding the manifest
    std::string manifest_path;
    std::string libraries_destination;        // Absolute, "lib" under project_dir by default
    std::vector<std::string> dependency_tokens;
    std::vector<std::string> precondition_steps;
};

// ============================================================================
// Resolved Library
// ============================================================================

// How a dependency token was interpreted
enum class TokenForm {
    RemoteUrl,   // git@host:owner/repo.git, https://host/owner/repo.git, ...
    OwnerRepo,   // owner/repo
    BareName,    // looked up in the registry index
};

inline const char* token_form_to_string(TokenForm form) {
    switch (form) {
        case TokenForm::RemoteUrl: return "remote_url";
        case TokenForm::OwnerRepo: return "owner_repo";
        case TokenForm::BareName: return "bare_name";
    }
    return "unknown";
}

struct ResolvedLibrary {
    std::string canonical_name;   // Dedup key and directory name
    std::string source_location;  // Fetchable URL
    std::string local_path;       // destination / canonical_name
    std::string token;            // Token as written in the declaring manifest
    TokenForm form = TokenForm::BareName;
    bool guessed_location = false;  // Bare name missing from the registry index
};

} // namespace cpull
