#include "runtime/Driver.hpp"
#include "cli/Args.hpp"
#include "git/FileEnumerator.hpp"
#include "log/Registry.hpp"

#include <exception>
#include <future>
#include <optional>
#include <utility>
#include <variant>

namespace bc::runtime {

namespace {

compare::ComparatorOptions comparatorOptions(const DriverOptions& opts, const config::Config& cfg) {
    return {
        cfg.comparison.hash_match,
        blame::resolveFormat(cfg.comparison.baseline_format, opts.baseline_executable),
        blame::resolveFormat(cfg.comparison.candidate_format, opts.candidate_executable)
    };
}

} // namespace

Driver::Driver(DriverOptions opts, config::Config cfg)
    : opts_(std::move(opts)),
      cfg_(std::move(cfg)),
      baseline_(opts_.baseline_executable, opts_.repo, cli::splitArgs(cfg_.comparison.extra_args),
                cfg_.invocation.stderr_snippet_bytes),
      candidate_(opts_.candidate_executable, opts_.repo, cli::splitArgs(cfg_.comparison.extra_args),
                 cfg_.invocation.stderr_snippet_bytes),
      comparator_(comparatorOptions(opts_, cfg_)),
      reporter_(cfg_.report.progress) {}

RunSummary Driver::run() {
    const git::FileEnumerator enumerator(opts_.repo, cfg_.repository.git_executable);
    const auto tracked = enumerator.listTracked();
    const auto comparable = git::filterComparable(tracked);

    reporter_.enumerated(tracked.size(), comparable.size(), opts_.limit, opts_.offset);

    auto summary = runFiles(compare::window(comparable, opts_.offset, opts_.limit));
    summary.tracked = tracked.size();
    summary.comparable = comparable.size();
    return summary;
}

RunSummary Driver::runFiles(const std::vector<compare::WindowedFile>& files) {
    RunSummary summary;
    for (const auto& entry : files) {
        reporter_.progress(entry);
        const auto report = compareFile(entry);
        reporter_.file(report);
        summary.add(report);
    }
    reporter_.summary(summary);
    return summary;
}

std::pair<blame::InvocationResult, blame::InvocationResult> Driver::invokeBoth(const std::string& path) const {
    if (!cfg_.comparison.parallel_invocations)
        return {baseline_.invoke(path), candidate_.invoke(path)};

    // Both outputs are fully buffered before comparison starts
    auto baselineFuture = std::async(std::launch::async, [this, &path] { return baseline_.invoke(path); });
    auto candidateResult = candidate_.invoke(path);
    return {baselineFuture.get(), std::move(candidateResult)};
}

FileReport Driver::compareFile(const compare::WindowedFile& entry) const {
    FileReport report;
    report.entry = entry;
    report.comparison.file = entry.file;

    const auto fail = [&report](const std::optional<compare::Side> side, blame::Failed f) {
        report.outcome = compare::Outcome::FailedToRunExecutable;
        report.failed_side = side;
        report.failure = std::move(f);
    };

    try {
        auto [baseline, candidate] = invokeBoth(entry.file.path);

        if (const auto* f = std::get_if<blame::Failed>(&baseline)) {
            fail(compare::Side::Baseline, *f);
            return report;
        }
        if (const auto* f = std::get_if<blame::Failed>(&candidate)) {
            fail(compare::Side::Candidate, *f);
            return report;
        }

        report.comparison = comparator_.compare(std::get<blame::Completed>(baseline).lines,
                                                std::get<blame::Completed>(candidate).lines);
        report.comparison.file = entry.file;
        report.outcome = compare::classify(report.comparison);
    } catch (const std::exception& e) {
        log::Registry::blamecheck()->error("[Driver] {}: {}", entry.file.path, e.what());
        fail(std::nullopt, blame::Failed{-1, 0, e.what()});
    }

    return report;
}

} // namespace bc::runtime
