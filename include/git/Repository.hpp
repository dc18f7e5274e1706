#pragma once

#include <filesystem>

namespace bc::git {

// work_tree is made absolute against the current directory on construction, so every
// path handed to a child process is absolute.
struct Repository {
    std::filesystem::path work_tree;

    Repository() = default;
    explicit Repository(const std::filesystem::path& workTree)
        : work_tree(std::filesystem::absolute(workTree)) {}

    [[nodiscard]] std::filesystem::path gitDir() const { return work_tree / ".git"; }
    [[nodiscard]] std::filesystem::path absolute(const std::filesystem::path& rel) const { return work_tree / rel; }
};

} // namespace bc::git
