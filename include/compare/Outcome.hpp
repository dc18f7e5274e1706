#pragma once

#include "compare/Comparator.hpp"

#include <string>

namespace bc::compare {

enum class Outcome {
    BlamesMatch,
    DifferingLineNumbers,
    LineDidNotMatchPattern,
    HashesDidNotMatch,
    FailedToRunExecutable
};

// Hash mismatches outrank parse failures.
inline Outcome classify(const FileComparisonResult& r) {
    if (r.length_mismatch) return Outcome::DifferingLineNumbers;
    if (!r.mismatches.empty()) return Outcome::HashesDidNotMatch;
    if (!r.parse_failures.empty()) return Outcome::LineDidNotMatchPattern;
    return Outcome::BlamesMatch;
}

inline std::string to_string(const Outcome o) {
    switch (o) {
    case Outcome::BlamesMatch: return "blames match";
    case Outcome::DifferingLineNumbers: return "differing number of lines";
    case Outcome::LineDidNotMatchPattern: return "unparseable lines";
    case Outcome::HashesDidNotMatch: return "hashes did not match";
    case Outcome::FailedToRunExecutable: return "failed to run executable";
    }
    return "unknown";
}

} // namespace bc::compare
