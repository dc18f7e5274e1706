#include "process/Subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bc::process {

namespace {

std::runtime_error sysError(const char* what) {
    return std::runtime_error(fmt::format("{} failed: {}", what, std::strerror(errno)));
}

void closeQuietly(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const auto eq = entry.find('=');
        const auto key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [k, v] : overrides) if (k == key) { overridden = true; break; }
        if (!overridden) out.emplace_back(entry);
    }
    for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> toCArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void drain(int& outFd, int& errFd, std::string& out, std::string& err) {
    char buf[8192];
    while (outFd >= 0 || errFd >= 0) {
        pollfd fds[2];
        nfds_t n = 0;
        if (outFd >= 0) fds[n++] = {outFd, POLLIN, 0};
        if (errFd >= 0) fds[n++] = {errFd, POLLIN, 0};

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            throw sysError("poll");
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const bool isOut = fds[i].fd == outFd;
            const ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) {
                closeQuietly(isOut ? outFd : errFd);
                continue;
            }
            (isOut ? out : err).append(buf, static_cast<size_t>(r));
        }
    }
}

} // namespace

std::string ExecResult::describeStatus() const {
    if (signaled) return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
    return fmt::format("exit code {}", exit_code);
}

ExecResult run(const ExecRequest& req) {
    if (req.argv.empty()) throw std::invalid_argument("process::run: empty argv");

    // Everything the child touches is prepared before fork()
    auto argvStrings = req.argv;
    auto envStrings = buildEnvironment(req.env);
    auto argvC = toCArray(argvStrings);
    auto envC = toCArray(envStrings);
    const std::string cwd = req.cwd.string();
    const std::string execFailMsg = fmt::format("failed to execute '{}'\n", req.argv.front());

    int outPipe[2], errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) != 0) throw sysError("pipe2");
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        throw sysError("pipe2");
    }

    const pid_t pid = fork();
    if (pid < 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        throw sysError("fork");
    }

    if (pid == 0) {
        // Child: stdin from /dev/null, stdout/stderr to pipes
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (dup2(outPipe[1], STDOUT_FILENO) == -1) _exit(127);
        if (dup2(errPipe[1], STDERR_FILENO) == -1) _exit(127);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(127);

        execvpe(argvC[0], argvC.data(), envC.data());
        (void)!::write(STDERR_FILENO, execFailMsg.data(), execFailMsg.size());
        _exit(127); // exec failed
    }

    // Parent
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    ExecResult result;
    int outFd = outPipe[0], errFd = errPipe[0];
    try {
        drain(outFd, errFd, result.stdout_text, result.stderr_text);
    } catch (...) {
        closeQuietly(outFd);
        closeQuietly(errFd);
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        throw;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw sysError("waitpid");
    }

    if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    return result;
}

std::vector<std::string> splitLines(const std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

} // namespace bc::process
