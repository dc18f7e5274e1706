#pragma once

#include "blame/BlameInvoker.hpp"
#include "compare/Outcome.hpp"
#include "compare/Window.hpp"

#include <cstddef>
#include <map>
#include <optional>

namespace bc::runtime {

struct FileReport {
    compare::WindowedFile entry;
    compare::Outcome outcome = compare::Outcome::BlamesMatch;
    std::optional<compare::Side> failed_side;   // set with FailedToRunExecutable
    std::optional<blame::Failed> failure;
    compare::FileComparisonResult comparison;
};

struct RunSummary {
    size_t tracked = 0;
    size_t comparable = 0;
    size_t compared = 0;
    std::map<compare::Outcome, size_t> outcomes;

    void add(const FileReport& r) { ++compared; ++outcomes[r.outcome]; }

    [[nodiscard]] size_t count(const compare::Outcome o) const {
        const auto it = outcomes.find(o);
        return it == outcomes.end() ? 0 : it->second;
    }

    [[nodiscard]] size_t matches() const { return count(compare::Outcome::BlamesMatch); }
    [[nodiscard]] size_t nonMatches() const { return compared - matches(); }
};

} // namespace bc::runtime
