#include "cpull/process.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <sys/wait.h>

namespace cpull {

ProcessResult run_process(const std::vector<std::string>& argv_strings, const std::string& cwd) {
    ProcessResult result;

    if (argv_strings.empty()) {
        result.error = "empty command";
        return result;
    }

    // Build C-style array before fork; the child must not allocate
    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty()) {
            if (chdir(cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

ProcessResult run_shell(const std::string& command, const std::string& cwd) {
    return run_process({"/bin/sh", "-c", command}, cwd);
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (i > 0) line += ' ';

        if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`") == std::string::npos) {
            line += arg;
            continue;
        }

        line += '\'';
        for (char c : arg) {
            if (c == '\'') {
                line += "'\\''";
            } else {
                line += c;
            }
        }
        line += '\'';
    }
    return line;
}

} // namespace cpull
