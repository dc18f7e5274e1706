#pragma once

#include "config/Config.hpp"
#include "runtime/Report.hpp"

#include <cstdint>
#include <string>

namespace bc::runtime {

// Console output of a comparison run. In dots mode, per-file detail starts on a
// fresh line below the dots printed so far.
class Reporter {
public:
    explicit Reporter(config::ProgressStyle style = config::ProgressStyle::Lines) : style_(style) {}

    void enumerated(size_t tracked, size_t comparable, int64_t limit, int64_t offset) const;
    void progress(const compare::WindowedFile& entry) const;
    void file(const FileReport& report);
    void summary(const RunSummary& summary);

private:
    void line(const std::string& text);
    void endDotRow();

    config::ProgressStyle style_;
    bool dotRowOpen_ = false;
};

} // namespace bc::runtime
