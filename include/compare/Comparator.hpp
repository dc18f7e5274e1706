#pragma once

#include "blame/BlameLine.hpp"
#include "config/Config.hpp"
#include "git/FileEnumerator.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bc::compare {

enum class Side { Baseline, Candidate };

struct LineMismatch {
    size_t line_index;
    std::string baseline_hash;
    std::string candidate_hash;
    std::string content;        // as reported by the candidate

    bool operator==(const LineMismatch&) const = default;
};

struct ParseFailure {
    size_t line_index;
    Side side;
    std::string raw_line;
};

struct FileComparisonResult {
    git::FileCandidate file;
    bool length_mismatch = false;
    size_t baseline_line_count = 0;
    size_t candidate_line_count = 0;
    std::vector<LineMismatch> mismatches;      // always empty when length_mismatch
    std::vector<ParseFailure> parse_failures;  // lines excluded from comparison

    [[nodiscard]] bool matches() const { return !length_mismatch && mismatches.empty() && parse_failures.empty(); }
};

struct ComparatorOptions {
    config::HashMatch hash_match = config::HashMatch::Exact;
    blame::LineFormat baseline_format = blame::LineFormat::Gix;
    blame::LineFormat candidate_format = blame::LineFormat::Gix;
};

class Comparator {
public:
    Comparator() = default;
    explicit Comparator(ComparatorOptions opts) : opts_(opts) {}

    // Index-aligned attribution check. Only commit hashes are compared.
    [[nodiscard]] FileComparisonResult compare(const std::vector<std::string>& baselineLines,
                                               const std::vector<std::string>& candidateLines) const;

    [[nodiscard]] static bool hashesAgree(std::string_view baseline, std::string_view candidate, config::HashMatch mode);

private:
    ComparatorOptions opts_;
};

std::string to_string(Side side);

} // namespace bc::compare
