#include "cpull/resolver.hpp"
#include "cpull/generator.hpp"
#include "cpull/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace cpull {

bool has_remote_marker(const std::string& token) {
    if (token.find("://") != std::string::npos) {
        return true;
    }

    // scp-like syntax: user@host:path, with no '/' ahead of the '@'
    auto at_pos = token.find('@');
    if (at_pos == std::string::npos || at_pos == 0) {
        return false;
    }
    auto slash_pos = token.find('/');
    if (slash_pos != std::string::npos && slash_pos < at_pos) {
        return false;
    }
    auto colon_pos = token.find(':', at_pos);
    return colon_pos != std::string::npos && colon_pos > at_pos + 1;
}

TokenForm classify_token(const std::string& token) {
    if (has_remote_marker(token)) {
        return TokenForm::RemoteUrl;
    }
    if (std::count(token.begin(), token.end(), '/') == 1) {
        return TokenForm::OwnerRepo;
    }
    return TokenForm::BareName;
}

std::string canonical_name_from_location(const std::string& location) {
    std::string trimmed = location;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }

    auto sep = trimmed.find_last_of("/:");
    std::string segment = sep == std::string::npos ? trimmed : trimmed.substr(sep + 1);

    auto dot = segment.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        segment.erase(dot);
    }
    return segment;
}

bool is_valid_canonical_name(const std::string& name) {
    if (name.empty() || name.find('\0') != std::string::npos ||
        name.find('\\') != std::string::npos || name.front() == '/') {
        return false;
    }

    // The generated include file owns this name inside the destination
    auto first = name.substr(0, name.find('/'));
    if (first == INCLUDE_FILE_NAME) {
        return false;
    }

    // Every segment must be a plain directory name
    size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find('/', start);
        if (end == std::string::npos) end = name.size();
        std::string segment = name.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

TokenResolution LibraryNameResolver::resolve(const std::string& token,
                                             const std::string& destination) {
    TokenResolution result;
    ResolvedLibrary& lib = result.library;
    lib.token = token;
    lib.form = classify_token(token);

    switch (lib.form) {
        case TokenForm::RemoteUrl:
            lib.source_location = token;
            lib.canonical_name = canonical_name_from_location(token);
            break;

        case TokenForm::OwnerRepo: {
            auto slash = token.find('/');
            std::string owner = token.substr(0, slash);
            std::string repo = token.substr(slash + 1);
            if (owner.empty() || repo.empty()) {
                result.kind = ErrorKind::InvalidDependency;
                result.error = "\"" + token + "\" is not of the form owner/repo";
                return result;
            }
            lib.source_location = hosted_location(settings_, owner, repo);
            lib.canonical_name = repo;
            break;
        }

        case TokenForm::BareName: {
            if (!is_valid_canonical_name(token)) {
                break;
            }
            auto found = index_.lookup(token);
            lib.source_location = found.source_location;
            lib.guessed_location = found.guessed;
            lib.canonical_name = token;
            break;
        }
    }

    if (!is_valid_canonical_name(lib.canonical_name)) {
        result.kind = ErrorKind::InvalidDependency;
        result.error = "dependency \"" + token + "\" does not name a library";
        return result;
    }

    lib.local_path = join_path(destination, lib.canonical_name);
    spdlog::debug("resolved \"{}\" ({}) -> {} from {}", token, token_form_to_string(lib.form),
                  lib.canonical_name, lib.source_location);

    result.ok = true;
    return result;
}

} // namespace cpull
