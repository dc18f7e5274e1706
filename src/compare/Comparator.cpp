#include "compare/Comparator.hpp"
#include "log/Registry.hpp"

#include <utility>

namespace bc::compare {

bool Comparator::hashesAgree(const std::string_view baseline, const std::string_view candidate,
                             const config::HashMatch mode) {
    if (mode == config::HashMatch::Exact) return baseline == candidate;
    // Abbreviated ids: either side may be a prefix of the other
    return baseline.starts_with(candidate) || candidate.starts_with(baseline);
}

FileComparisonResult Comparator::compare(const std::vector<std::string>& baselineLines,
                                         const std::vector<std::string>& candidateLines) const {
    FileComparisonResult result;
    result.baseline_line_count = baselineLines.size();
    result.candidate_line_count = candidateLines.size();

    if (baselineLines.size() != candidateLines.size()) {
        result.length_mismatch = true;
        return result;
    }

    const auto logger = log::Registry::compare();

    for (size_t i = 0; i < baselineLines.size(); ++i) {
        const auto baseline = blame::parse(baselineLines[i], opts_.baseline_format);
        const auto candidate = blame::parse(candidateLines[i], opts_.candidate_format);

        const auto* b = std::get_if<blame::BlameRecord>(&baseline);
        const auto* c = std::get_if<blame::BlameRecord>(&candidate);

        if (!b) {
            logger->debug("[Comparator] baseline line {} is malformed: `{}`", i, baselineLines[i]);
            result.parse_failures.push_back({i, Side::Baseline, baselineLines[i]});
            continue;
        }
        if (!c) {
            logger->debug("[Comparator] candidate line {} is malformed: `{}`", i, candidateLines[i]);
            result.parse_failures.push_back({i, Side::Candidate, candidateLines[i]});
            continue;
        }

        if (!hashesAgree(b->commit_hash, c->commit_hash, opts_.hash_match))
            result.mismatches.push_back({i, b->commit_hash, c->commit_hash, c->content});
    }

    return result;
}

std::string to_string(const Side side) {
    return side == Side::Baseline ? "baseline" : "candidate";
}

} // namespace bc::compare
