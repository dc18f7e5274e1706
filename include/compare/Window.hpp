#pragma once

#include "git/FileEnumerator.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bc::compare {

struct WindowedFile {
    size_t index = 0;           // position before windowing, progress output only
    git::FileCandidate file;
};

// Skip `offset`, then take at most `limit`. Negative values throw std::invalid_argument.
std::vector<WindowedFile> window(const std::vector<git::FileCandidate>& files, int64_t offset, int64_t limit);

} // namespace bc::compare
