#include "cpull/manifest.hpp"
#include "cpull/platform.hpp"
#include "cpull/process.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cpull {

namespace {

ManifestLoadResult malformed(ManifestLoadResult result, const std::string& message) {
    result.ok = false;
    result.kind = ErrorKind::ManifestMalformed;
    result.error = result.descriptor.manifest_path + ": " + message;
    return result;
}

// Strict string-array field: absent -> empty, wrong type -> error message
std::optional<std::string> read_string_array(const nlohmann::json& j, const std::string& key,
                                             std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_array()) {
        return "\"" + key + "\" must be an array of strings";
    }
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            return "\"" + key + "\" must contain only strings";
        }
        out.push_back(elem.get<std::string>());
    }
    return std::nullopt;
}

} // namespace

std::string resolve_manifest_path(const std::optional<std::string>& path_or_dir) {
    if (!path_or_dir || path_or_dir->empty()) {
        return absolute_path(join_path(std::filesystem::current_path().string(),
                                       DEFAULT_MANIFEST_NAME));
    }
    if (is_directory(*path_or_dir)) {
        return absolute_path(join_path(*path_or_dir, DEFAULT_MANIFEST_NAME));
    }
    return absolute_path(*path_or_dir);
}

ManifestLoadResult parse_project_descriptor(const std::string& json_str,
                                            const std::string& manifest_path) {
    ManifestLoadResult result;
    ProjectDescriptor& d = result.descriptor;
    d.manifest_path = absolute_path(manifest_path);
    d.project_dir = get_parent_directory(d.manifest_path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return malformed(std::move(result), std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return malformed(std::move(result), "JSON must be an object");
    }

    // name (optional)
    if (j.contains("name") && !j["name"].is_null()) {
        if (!j["name"].is_string()) {
            return malformed(std::move(result), "\"name\" must be a string");
        }
        d.display_name = j["name"].get<std::string>();
    }
    if (d.display_name.empty()) {
        d.display_name = get_filename(d.project_dir);
    }

    // libraries_destination (optional)
    std::string destination = DEFAULT_LIBRARIES_DESTINATION;
    if (j.contains("libraries_destination") && !j["libraries_destination"].is_null()) {
        if (!j["libraries_destination"].is_string()) {
            return malformed(std::move(result), "\"libraries_destination\" must be a string");
        }
        auto value = j["libraries_destination"].get<std::string>();
        if (!value.empty()) {
            destination = value;
        }
    }
    d.libraries_destination = absolute_path(join_path(d.project_dir, destination));

    if (auto err = read_string_array(j, "libraries", d.dependency_tokens)) {
        return malformed(std::move(result), *err);
    }
    if (auto err = read_string_array(j, "preconditions", d.precondition_steps)) {
        return malformed(std::move(result), *err);
    }

    result.ok = true;
    return result;
}

std::optional<std::string> check_libraries_destination(const ProjectDescriptor& descriptor) {
    const std::string& dest = descriptor.libraries_destination;
    if (dest == "/" || dest == descriptor.project_dir ||
        descriptor.project_dir.rfind(dest + "/", 0) == 0) {
        return descriptor.manifest_path +
               ": \"libraries_destination\" must not contain the project directory";
    }
    return std::nullopt;
}

ManifestLoadResult load_manifest(const std::string& manifest_path, bool execute_preconditions) {
    if (!is_regular_file(manifest_path)) {
        ManifestLoadResult result;
        result.kind = ErrorKind::ManifestNotFound;
        result.error = "no project descriptor at " + manifest_path;
        return result;
    }

    auto content = read_file(manifest_path);
    if (!content) {
        ManifestLoadResult result;
        result.kind = ErrorKind::ManifestNotFound;
        result.error = "cannot read " + manifest_path;
        return result;
    }

    auto result = parse_project_descriptor(*content, manifest_path);
    if (!result.ok) {
        return result;
    }

    spdlog::debug("Loaded {} ({} libraries, {} preconditions)", result.descriptor.manifest_path,
                  result.descriptor.dependency_tokens.size(),
                  result.descriptor.precondition_steps.size());

    if (execute_preconditions) {
        auto failed = run_preconditions(result.descriptor);
        if (failed > 0) {
            spdlog::debug("[{}] {} of {} preconditions failed", result.descriptor.display_name,
                          failed, result.descriptor.precondition_steps.size());
        }
    }
    return result;
}

std::size_t run_preconditions(const ProjectDescriptor& descriptor) {
    std::size_t failures = 0;

    for (const auto& step : descriptor.precondition_steps) {
        spdlog::debug("[{}] precondition: {}", descriptor.display_name, step);
        auto proc = run_shell(step, descriptor.project_dir);

        if (!proc.ok) {
            spdlog::warn("[{}] precondition \"{}\" could not be started: {}",
                         descriptor.display_name, step, proc.error);
            ++failures;
        } else if (proc.exit_code != 0) {
            spdlog::warn("[{}] precondition \"{}\" exited with status {}",
                         descriptor.display_name, step, proc.exit_code);
            ++failures;
        }
    }

    return failures;
}

} // namespace cpull
