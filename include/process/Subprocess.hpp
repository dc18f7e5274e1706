#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bc::process {

struct ExecRequest {
    std::vector<std::string> argv;                            // argv[0] resolved through PATH
    std::vector<std::pair<std::string, std::string>> env;     // overrides on top of the parent environment
    std::filesystem::path cwd;                                // empty = inherit
};

struct ExecResult {
    int exit_code = -1;          // valid when !signaled
    bool signaled = false;
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool success() const { return !signaled && exit_code == 0; }
    [[nodiscard]] std::string describeStatus() const;
};

// Blocks until the child exits and both output streams reach EOF.
// Throws std::runtime_error if the child cannot be started at all.
ExecResult run(const ExecRequest& req);

// One entry per line, '\n' (and a trailing '\r') stripped, no trailing empty entry.
std::vector<std::string> splitLines(std::string_view text);

} // namespace bc::process
