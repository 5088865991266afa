/**
 * cpull CLI - Entry Point
 *
 * Fetches a project's libraries and everything they depend on.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <functional>
#include <map>

namespace cpull::cli::commands {
    int cmd_install(const GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cpull::cli;

    const std::map<std::string, std::function<int(const GlobalOptions&)>> actions = {
        {"install", commands::cmd_install},
    };

    CLI::App app{"cpull - fetch a project's libraries and their dependencies"};
    app.set_version_flag("-V,--version", CPULL_VERSION);

    GlobalOptions opts;

    app.add_option("action", opts.action, "Action to perform (install)")
        ->required()
        ->check(CLI::IsMember({"install"}));
    app.add_option("-m,--manifest", opts.manifest,
                   "project.json, or the directory holding it (default: current)");
    app.add_option("--home", opts.home, "Configuration directory (default: ~/.cpull)");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");

    CLI11_PARSE(app, argc, argv);

    cpull::init_logging(verbosity_from(opts));

    return actions.at(opts.action)(opts);
}
