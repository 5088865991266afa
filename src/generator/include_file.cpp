#include "cpull/generator.hpp"
#include "cpull/platform.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace cpull {

std::string render_include_file(const std::vector<ResolvedLibrary>& libraries) {
    std::ostringstream out;
    out << GENERATED_HEADER << "\n";
    for (const auto& lib : libraries) {
        out << "add_subdirectory(" << lib.canonical_name << ")\n";
    }
    return out.str();
}

GenerateResult write_include_file(const std::string& destination,
                                  const std::vector<ResolvedLibrary>& libraries) {
    GenerateResult result;
    result.path = join_path(destination, INCLUDE_FILE_NAME);

    auto written = atomic_write_file(result.path, render_include_file(libraries));
    if (!written.ok) {
        result.kind = ErrorKind::IncludeFileWriteFailed;
        result.error = "cannot write " + result.path + ": " + written.error;
        return result;
    }

    spdlog::debug("Wrote {} ({} libraries)", result.path, libraries.size());
    result.ok = true;
    return result;
}

} // namespace cpull
