#pragma once

#include "blame/BlameInvoker.hpp"
#include "compare/Comparator.hpp"
#include "compare/Window.hpp"
#include "config/Config.hpp"
#include "git/Repository.hpp"
#include "runtime/Report.hpp"
#include "runtime/Reporter.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bc::runtime {

struct DriverOptions {
    git::Repository repo;
    std::filesystem::path baseline_executable;
    std::filesystem::path candidate_executable;
    int64_t limit = 0;
    int64_t offset = 0;
};

// enumerate -> window -> per file: invoke both, compare, report. Strictly one file at a time.
class Driver {
public:
    Driver(DriverOptions opts, config::Config cfg);

    // Throws if the tracked file query fails; per-file problems never escape.
    RunSummary run();

    RunSummary runFiles(const std::vector<compare::WindowedFile>& files);

    // Never throws
    [[nodiscard]] FileReport compareFile(const compare::WindowedFile& entry) const;

private:
    [[nodiscard]] std::pair<blame::InvocationResult, blame::InvocationResult> invokeBoth(const std::string& path) const;

    DriverOptions opts_;
    config::Config cfg_;
    blame::BlameInvoker baseline_;
    blame::BlameInvoker candidate_;
    compare::Comparator comparator_;
    Reporter reporter_;
};

} // namespace bc::runtime
