#include "shell/Process.hpp"
#include "fs/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ds::shell {

namespace {

void splitLines(std::string& pending, std::vector<std::string>& out, const bool flush) {
    std::size_t start = 0;
    for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
        auto line = pending.substr(start, nl - start);
        while (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        start = nl + 1;
    }
    pending.erase(0, start);

    if (flush && !pending.empty()) {
        while (!pending.empty() && pending.back() == '\r') pending.pop_back();
        if (!pending.empty()) out.push_back(std::move(pending));
        pending.clear();
    }
}

}

Result run(const std::vector<std::string>& argv) {
    if (argv.empty()) throw fs::OperationFailed("Cannot run an empty command");

    log::Registry::shell()->debug("[shell] {}", join(argv));

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1)
        throw fs::OperationFailed(std::string("Failed to create pipe: ") + std::strerror(errno));

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw fs::OperationFailed(std::string("Failed to fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout and stderr both feed the pipe
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    Result result;
    std::string pending;
    char buf[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) {
            pending.append(buf, static_cast<std::size_t>(n));
            splitLines(pending, result.lines, false);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(pipefd[0]);
    splitLines(pending, result.lines, true);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw fs::OperationFailed(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    if (result.exit_code == 127 && result.lines.empty())
        throw fs::OperationFailed("Failed to execute '" + argv.front() + "'");

    log::Registry::shell()->trace("[shell] exit {} ({} lines)", result.exit_code, result.lines.size());
    return result;
}

std::string quote(const std::string& arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (const char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string join(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

}
