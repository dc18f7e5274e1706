#pragma once

#include "git/Repository.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace bc::blame {

struct Completed {
    std::vector<std::string> lines;
};

struct Failed {
    int exit_code = -1;         // -1 when the process never ran or was signaled
    int signal = 0;
    std::string stderr_snippet;

    [[nodiscard]] std::string describe() const;
};

using InvocationResult = std::variant<Completed, Failed>;

class BlameInvoker {
public:
    BlameInvoker(std::filesystem::path executable,
                 git::Repository repo,
                 std::vector<std::string> extraArgs = {},
                 size_t stderrSnippetBytes = 512);

    // `<executable> blame [extra...] <abs path>` with GIT_DIR/GIT_WORK_TREE set.
    // Never throws; launch errors come back as Failed.
    [[nodiscard]] InvocationResult invoke(const std::filesystem::path& relPath) const;

    [[nodiscard]] const std::filesystem::path& executable() const { return executable_; }

private:
    std::filesystem::path executable_;
    git::Repository repo_;
    std::vector<std::string> extraArgs_;
    size_t stderrSnippetBytes_;
};

} // namespace bc::blame
