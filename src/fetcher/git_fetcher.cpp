#include "cpull/fetcher.hpp"
#include "cpull/process.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace cpull {

namespace {

FetchResult run_git(const std::vector<std::string>& argv) {
    FetchResult result;

    spdlog::debug("running: {}", format_command_line(argv));
    auto proc = run_process(argv);

    if (!proc.ok) {
        result.error = proc.error;
        return result;
    }
    if (proc.exit_code != 0) {
        result.error = argv[0] + " exited with status " + std::to_string(proc.exit_code);
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace

FetchResult GitFetcher::clone(const std::string& source, const std::string& destination) {
    std::vector<std::string> argv = {git_, "clone", "--depth", "1"};
    if (quiet_) {
        argv.push_back("--quiet");
    }
    argv.push_back(source);
    argv.push_back(destination);
    return run_git(argv);
}

FetchResult GitFetcher::pull(const std::string& path) {
    std::vector<std::string> argv = {git_, "-C", path, "pull"};
    if (quiet_) {
        argv.push_back("--quiet");
    }
    return run_git(argv);
}

} // namespace cpull
