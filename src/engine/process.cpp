#include "covmap/engine/process.hpp"
#include "covmap/core/utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <sys/wait.h>

namespace covmap::engine {

std::string ProcessResult::tail_text() const {
    return core::join(std::vector<std::string>(output_tail.begin(), output_tail.end()), "\n");
}

ProcessResult run_process(const fs::path& program, const std::vector<std::string>& args,
                          const fs::path& working_dir, const LineSink& on_line,
                          std::size_t tail_lines) {
    std::string cmd;
    if (!working_dir.empty()) {
        cmd = "cd " + core::shell_quote(working_dir.string()) + " && ";
    }
    cmd += core::shell_quote(program.string());
    for (const auto& a : args) {
        cmd += " " + core::shell_quote(a);
    }
    cmd += " 2>&1";

    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("cannot start " + program.string() + ": " +
                                 std::strerror(errno));
    }

    ProcessResult result;
    std::string line;
    char buffer[4096];
    auto flush_line = [&]() {
        if (on_line) on_line(line);
        result.output_tail.push_back(line);
        if (result.output_tail.size() > tail_lines) {
            result.output_tail.pop_front();
        }
        line.clear();
    };

    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        line += buffer;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            flush_line();
        }
    }
    if (!line.empty()) {
        flush_line();
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("cannot collect exit status of " + program.string() +
                                 ": " + std::strerror(errno));
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        // The shell reports a child killed by signal N as exit status 128+N.
        if (result.exit_code > 128 && result.exit_code < 128 + NSIG) {
            result.signaled = true;
        }
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace covmap::engine
