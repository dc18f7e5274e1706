#include "compare/Window.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>

namespace bc::compare {

std::vector<WindowedFile> window(const std::vector<git::FileCandidate>& files, const int64_t offset, const int64_t limit) {
    if (offset < 0) throw std::invalid_argument(fmt::format("window: negative offset {}", offset));
    if (limit < 0) throw std::invalid_argument(fmt::format("window: negative limit {}", limit));

    std::vector<WindowedFile> out;
    const auto start = static_cast<size_t>(offset);
    if (start >= files.size()) return out;

    const auto end = start + std::min(static_cast<size_t>(limit), files.size() - start);
    out.reserve(end - start);
    for (size_t i = start; i < end; ++i) out.push_back({i, files[i]});
    return out;
}

} // namespace bc::compare
