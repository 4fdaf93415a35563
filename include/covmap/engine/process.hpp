#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace covmap::engine {

namespace fs = std::filesystem;

using LineSink = std::function<void(const std::string&)>;

struct ProcessResult {
    int exit_code = -1;
    bool signaled = false;  // exit_code is then 128 + signal number
    std::deque<std::string> output_tail;  // last lines of combined stdout/stderr

    bool ok() const { return !signaled && exit_code == 0; }
    std::string tail_text() const;
};

/**
 * Run `program args...` in `working_dir` and block until it exits.
 * stdout and stderr are merged; each line is handed to `on_line` as it arrives.
 * Throws std::runtime_error if the process cannot be started.
 */
ProcessResult run_process(const fs::path& program, const std::vector<std::string>& args,
                          const fs::path& working_dir, const LineSink& on_line,
                          std::size_t tail_lines = 20);

} // namespace covmap::engine
