#pragma once

#include <optional>
#include <string>

namespace cpull {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Replace `path` with `content` via a sibling temp file that is synced and
// renamed into place. On failure the previous file, if any, is unchanged.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities (POSIX separators)
// ============================================================================

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized, without a trailing separator
std::string absolute_path(const std::string& path);

bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Whole file contents; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

bool create_directories(const std::string& path);

// Remove a tree; a missing path counts as removed
bool remove_directory(const std::string& path);

// Environment variable; nullopt if unset or empty
std::optional<std::string> get_env(const std::string& name);

} // namespace cpull
