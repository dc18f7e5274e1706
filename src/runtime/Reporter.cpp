#include "runtime/Reporter.hpp"
#include "log/Registry.hpp"

#include <cstdio>
#include <fmt/core.h>

namespace bc::runtime {

void Reporter::endDotRow() {
    if (!dotRowOpen_) return;
    fmt::print("\n");
    std::fflush(stdout);
    dotRowOpen_ = false;
}

void Reporter::line(const std::string& text) {
    endDotRow();
    log::Registry::report()->info("{}", text);
}

void Reporter::enumerated(const size_t tracked, const size_t comparable, const int64_t limit, const int64_t offset) const {
    const auto out = log::Registry::report();
    out->info("{} files to run blame for, filtering out non-text files", tracked);
    out->info("{} files to run blame for, limit {}, offset {}", comparable, limit, offset);
    out->info("comparing blames");
}

void Reporter::progress(const compare::WindowedFile& entry) const {
    if (style_ == config::ProgressStyle::Lines)
        log::Registry::report()->info("{} {}", entry.index, entry.file.path);
}

void Reporter::file(const FileReport& report) {
    const auto& cmp = report.comparison;

    if (report.outcome == compare::Outcome::FailedToRunExecutable) {
        line(fmt::format("{} executable failed for {}: {}",
                         report.failed_side ? compare::to_string(*report.failed_side) : "blame",
                         report.entry.file.path,
                         report.failure ? report.failure->describe() : "unknown error"));
    } else if (cmp.length_mismatch) {
        line(fmt::format("blames have different number of lines (baseline {}, candidate {})",
                         cmp.baseline_line_count, cmp.candidate_line_count));
    } else {
        for (const auto& f : cmp.parse_failures)
            line(fmt::format("{} line {}: `{}` does not look like a blame line",
                             compare::to_string(f.side), f.line_index, f.raw_line));

        for (const auto& m : cmp.mismatches) {
            line(fmt::format("hashes don't match for line {}: {}", m.line_index, m.content));
            line(fmt::format("baseline blamed {} while comparison blamed {}", m.baseline_hash, m.candidate_hash));
            line("");
        }
    }

    if (style_ == config::ProgressStyle::Dots) {
        fmt::print("{}", report.outcome == compare::Outcome::BlamesMatch ? '.' : 'x');
        std::fflush(stdout);
        dotRowOpen_ = true;
    }
}

void Reporter::summary(const RunSummary& summary) {
    endDotRow();

    const auto out = log::Registry::report();
    if (summary.nonMatches() == 0) {
        out->info("done, all blames matched");
        return;
    }

    out->info("done, number of matches: {}, number of non-matches: {}", summary.matches(), summary.nonMatches());
    for (const auto& [outcome, n] : summary.outcomes)
        if (outcome != compare::Outcome::BlamesMatch) out->info("  {}: {}", compare::to_string(outcome), n);
}

} // namespace bc::runtime
