#pragma once

#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = 0;      // negative signal number if the child was killed
    std::string stdout_data;
    std::string stderr_data;
};

// Runs argv[0] with the given argument vector and environment ("KEY=value"
// entries) without a shell, capturing both output streams. Blocks until the
// child exits.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const std::vector<std::string>& env);

// `dir:existing`, or just `dir` when there is nothing to keep.
std::string prepend_search_path(const std::string& dir, const std::string& existing);

// Copy of the current environment with `library_dir` prepended to LD_LIBRARY_PATH.
std::vector<std::string> build_environment(const std::string& library_dir);
