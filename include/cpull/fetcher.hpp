#pragma once

#include <string>
#include <utility>

namespace cpull {

// ============================================================================
// Source Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
};

// Materializes remote sources on disk. The walker and the registry mirror only
// talk to this interface; tests substitute local fakes.
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;

    // Fresh shallow copy of `source` at `destination` (which must not exist)
    virtual FetchResult clone(const std::string& source, const std::string& destination) = 0;

    // Update an existing checkout in place
    virtual FetchResult pull(const std::string& path) = 0;
};

// SourceFetcher backed by the `git` executable on PATH
class GitFetcher : public SourceFetcher {
public:
    explicit GitFetcher(bool quiet = true, std::string git_executable = "git")
        : quiet_(quiet), git_(std::move(git_executable)) {}

    FetchResult clone(const std::string& source, const std::string& destination) override;
    FetchResult pull(const std::string& path) override;

private:
    bool quiet_;
    std::string git_;
};

} // namespace cpull
