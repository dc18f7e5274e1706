#include "blame/BlameInvoker.hpp"
#include "process/Subprocess.hpp"
#include "log/Registry.hpp"

#include <cstring>
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace bc::blame {

static std::string snippet(std::string s, const size_t max) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    if (s.size() <= max) return s;
    return s.substr(0, max) + "...";
}

std::string Failed::describe() const {
    std::string status = signal ? fmt::format("killed by signal {} ({})", signal, ::strsignal(signal))
                                : fmt::format("exit code {}", exit_code);
    if (stderr_snippet.empty()) return status;
    return fmt::format("{}: {}", status, stderr_snippet);
}

BlameInvoker::BlameInvoker(std::filesystem::path executable,
                           git::Repository repo,
                           std::vector<std::string> extraArgs,
                           const size_t stderrSnippetBytes)
    : executable_(std::move(executable)),
      repo_(std::move(repo)),
      extraArgs_(std::move(extraArgs)),
      stderrSnippetBytes_(stderrSnippetBytes) {}

InvocationResult BlameInvoker::invoke(const std::filesystem::path& relPath) const {
    process::ExecRequest req;
    req.argv.reserve(3 + extraArgs_.size());
    req.argv.push_back(executable_.string());
    req.argv.emplace_back("blame");
    req.argv.insert(req.argv.end(), extraArgs_.begin(), extraArgs_.end());
    req.argv.push_back(repo_.absolute(relPath).string());
    req.env = {
        {"GIT_DIR", repo_.gitDir().string()},
        {"GIT_WORK_TREE", repo_.work_tree.string()}
    };

    process::ExecResult res;
    try {
        res = process::run(req);
    } catch (const std::runtime_error& e) {
        log::Registry::invoke()->error("[BlameInvoker] Could not launch {}: {}", executable_.string(), e.what());
        return Failed{-1, 0, e.what()};
    }

    if (!res.success()) {
        log::Registry::invoke()->warn("[BlameInvoker] {} blame {} -> {}",
                                      executable_.string(), relPath.string(), res.describeStatus());
        return Failed{res.signaled ? -1 : res.exit_code, res.signaled ? res.signal : 0,
                      snippet(res.stderr_text, stderrSnippetBytes_)};
    }

    auto lines = process::splitLines(res.stdout_text);
    log::Registry::invoke()->debug("[BlameInvoker] {} blame {} -> {} lines",
                                   executable_.string(), relPath.string(), lines.size());
    return Completed{std::move(lines)};
}

} // namespace bc::blame
