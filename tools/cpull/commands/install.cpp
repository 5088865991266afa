/**
 * cpull CLI - install action
 *
 * Fetch every library the project needs and generate the include file.
 */

#include "../common.hpp"

#include <cpull/fetcher.hpp>
#include <cpull/install.hpp>
#include <cpull/manifest.hpp>
#include <cpull/settings.hpp>

#include <optional>

namespace cpull::cli::commands {

int cmd_install(const GlobalOptions& opts) {
    std::optional<std::string> home;
    if (!opts.home.empty()) home = opts.home;

    auto loaded = load_settings(home);
    for (const auto& w : loaded.warnings) {
        spdlog::warn("{}", w);
    }
    loaded.settings.quiet_vcs = !opts.verbose;

    std::optional<std::string> manifest;
    if (!opts.manifest.empty()) manifest = opts.manifest;

    InstallOptions install_opts;
    install_opts.manifest_path = resolve_manifest_path(manifest);

    GitFetcher fetcher(loaded.settings.quiet_vcs);
    auto result = install_project(install_opts, loaded.settings, fetcher);

    if (!result.ok) {
        print_error(result.kind, result.error);
        return 1;
    }

    if (result.include_file.empty()) {
        spdlog::info("Nothing to install for {}", result.project_name);
    } else {
        spdlog::info("Installed {} {} for {} into {}", result.libraries.size(),
                     result.libraries.size() == 1 ? "library" : "libraries",
                     result.project_name, result.destination);
    }
    return 0;
}

} // namespace cpull::cli::commands
