#include "cpull/install.hpp"
#include "cpull/generator.hpp"
#include "cpull/manifest.hpp"
#include "cpull/registry.hpp"
#include "cpull/resolver.hpp"
#include "cpull/walker.hpp"

#include <spdlog/spdlog.h>

namespace cpull {

InstallResult install_project(const InstallOptions& options, const Settings& settings,
                              SourceFetcher& fetcher) {
    InstallResult result;

    auto loaded = load_manifest(options.manifest_path, options.run_preconditions);
    if (!loaded.ok) {
        result.kind = loaded.kind;
        result.error = loaded.error;
        return result;
    }

    const ProjectDescriptor& root = loaded.descriptor;
    result.project_name = root.display_name;
    result.destination = root.libraries_destination;

    RemoteIndex index(settings, fetcher);
    LibraryNameResolver resolver(settings, index);
    WalkOptions walk_options;
    walk_options.run_nested_preconditions = options.run_preconditions;
    DependencyGraphWalker walker(fetcher, index, resolver, walk_options);

    auto walked = walker.walk(root);
    if (!walked.ok) {
        result.kind = walked.kind;
        result.error = walked.error;
        result.failed_library = walked.failed_library;
        return result;
    }

    result.libraries = walked.libraries;
    if (walked.skipped) {
        result.ok = true;
        return result;
    }

    auto generated = write_include_file(root.libraries_destination, walked.libraries);
    if (!generated.ok) {
        result.kind = generated.kind;
        result.error = generated.error;
        return result;
    }
    result.include_file = generated.path;

    spdlog::debug("{}: {} libraries in {}", root.display_name, result.libraries.size(),
                  root.libraries_destination);
    result.ok = true;
    return result;
}

} // namespace cpull
