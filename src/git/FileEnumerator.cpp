#include "git/FileEnumerator.hpp"
#include "process/Subprocess.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include <fmt/core.h>
#include <stdexcept>
#include <string_view>

namespace bc::git {

static constexpr const auto* LS_FILES_FORMAT = "%(path) %(eolinfo:index)";

TextAttribute classify(const std::string_view attr) {
    if (attr.empty()) return TextAttribute::Unspecified;
    if (attr.find("-text") != std::string_view::npos) return TextAttribute::Binary;
    return TextAttribute::Text;
}

FileCandidate parseLsFilesLine(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.remove_suffix(1);

    // eolinfo never contains a space, the path may
    const auto sp = line.rfind(' ');
    if (sp == std::string_view::npos) return {std::string(line), TextAttribute::Unspecified};
    return {std::string(line.substr(0, sp)), classify(line.substr(sp + 1))};
}

std::vector<FileCandidate> filterComparable(const std::vector<FileCandidate>& files) {
    std::vector<FileCandidate> out;
    out.reserve(files.size());
    std::ranges::copy_if(files, std::back_inserter(out), isComparable);
    return out;
}

FileEnumerator::FileEnumerator(Repository repo, std::string gitExecutable)
    : repo_(std::move(repo)), gitExecutable_(std::move(gitExecutable)) {}

std::vector<FileCandidate> FileEnumerator::listTracked() const {
    process::ExecRequest req;
    // -z keeps paths unquoted, so non-ASCII names come back verbatim
    req.argv = {gitExecutable_, "ls-files", "-z", "--format", LS_FILES_FORMAT};
    req.env = {{"GIT_DIR", repo_.gitDir().string()}};
    req.cwd = repo_.work_tree;

    log::Registry::git()->debug("[FileEnumerator] Running {} ls-files in {}", gitExecutable_, repo_.work_tree.string());

    const auto res = process::run(req);
    if (!res.success())
        throw std::runtime_error(fmt::format("git ls-files failed ({}): {}", res.describeStatus(), res.stderr_text));

    std::vector<FileCandidate> files;
    std::string_view rest = res.stdout_text;
    while (!rest.empty()) {
        const auto end = rest.find('\0');
        const auto record = rest.substr(0, end);
        if (!record.empty()) files.push_back(parseLsFilesLine(record));
        if (end == std::string_view::npos) break;
        rest.remove_prefix(end + 1);
    }

    log::Registry::git()->debug("[FileEnumerator] {} tracked files", files.size());
    return files;
}

std::string to_string(const TextAttribute a) {
    switch (a) {
    case TextAttribute::Text: return "text";
    case TextAttribute::Binary: return "binary";
    default: return "unspecified";
    }
}

} // namespace bc::git
