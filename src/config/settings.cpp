#include "cpull/settings.hpp"
#include "cpull/platform.hpp"

#include <nlohmann/json.hpp>

namespace cpull {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string with_trailing_slash(std::string url) {
    if (!url.empty() && url.back() != '/') {
        url.push_back('/');
    }
    return url;
}

} // namespace

std::string Settings::index_path() const {
    return join_path(registry_dir, index_file);
}

std::string resolve_home(const std::optional<std::string>& override_home) {
    if (override_home && !override_home->empty()) {
        return *override_home;
    }

    if (auto env_home = get_env("CPULL_HOME")) {
        return *env_home;
    }

    if (auto home = get_env("HOME")) {
        return *home + "/.cpull";
    }

    if (auto userprofile = get_env("USERPROFILE")) {
        return *userprofile + "/.cpull";
    }

    return ".cpull";
}

std::optional<std::string> apply_config_json(Settings& settings, const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return std::string("invalid JSON: ") + e.what();
    }

    if (!j.is_object()) {
        return std::string("JSON must be an object");
    }

    if (auto url = get_string(j, "registry_url")) {
        settings.registry_url = *url;
    }
    if (auto owner = get_string(j, "default_owner")) {
        settings.default_owner = *owner;
    }
    if (auto host = get_string(j, "host_url")) {
        settings.host_url = with_trailing_slash(*host);
    }

    return std::nullopt;
}

SettingsLoadResult load_settings(const std::optional<std::string>& override_home) {
    SettingsLoadResult result;
    Settings& s = result.settings;

    s.home = absolute_path(resolve_home(override_home));
    s.registry_dir = join_path(s.home, "registry");
    s.registry_url = DEFAULT_REGISTRY_URL;
    s.default_owner = DEFAULT_OWNER;
    s.host_url = DEFAULT_HOST_URL;

    std::string config_path = join_path(s.home, CONFIG_FILE);
    if (auto content = read_file(config_path)) {
        if (auto err = apply_config_json(s, *content)) {
            result.warnings.push_back("ignoring " + config_path + ": " + *err);
        }
    }

    if (auto url = get_env("CPULL_REGISTRY_URL")) {
        s.registry_url = *url;
    }
    if (auto owner = get_env("CPULL_DEFAULT_OWNER")) {
        s.default_owner = *owner;
    }
    if (auto host = get_env("CPULL_HOST_URL")) {
        s.host_url = with_trailing_slash(*host);
    }

    return result;
}

} // namespace cpull
