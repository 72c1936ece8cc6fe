#include "sandbox/process.h"
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <sys/stat.h>

namespace testbox {
namespace sandbox {

namespace {

constexpr auto kDrainGrace = std::chrono::seconds(2);

struct Pipe {
    int fds[2] = {-1, -1};

    // Close-on-exec so a child forked concurrently for another run never
    // inherits these ends.
    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void closeRead() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
    ~Pipe() { closeRead(); closeWrite(); }
};

// dup2 clears close-on-exec on the target; an fd already in place keeps it.
void redirectFd(int fd, int target) {
    if (fd == target) fcntl(fd, F_SETFD, 0);
    else dup2(fd, target);
}

// Drops whatever the parent had open without close-on-exec (log files,
// descriptors from other libraries) so it never reaches sandboxed code.
void closeInheritedFds() {
    long maxFd = sysconf(_SC_OPEN_MAX);
    if (maxFd < 256) maxFd = 256;
    if (maxFd > 65536) maxFd = 65536;
    for (int fd = STDERR_FILENO + 1; fd < static_cast<int>(maxFd); ++fd) close(fd);
}

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

}

std::optional<std::string> findExecutable(const std::string& name, const std::string& pathValue,
                                          const std::string& cwd) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        std::filesystem::path p(name);
        if (p.is_relative() && !cwd.empty()) p = std::filesystem::path(cwd) / p;
        if (isExecutableFile(p.string())) return p.string();
        return std::nullopt;
    }

    std::istringstream iss(pathValue);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) continue;
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (candidate.is_relative() && !cwd.empty()) {
            candidate = std::filesystem::path(cwd) / candidate;
        }
        if (isExecutableFile(candidate.string())) return candidate.string();
    }
    return std::nullopt;
}

EnvList hostToolEnv() {
    EnvList env;
    const char* path = std::getenv("PATH");
    env.emplace_back("PATH", path && *path ? path : "/usr/local/bin:/usr/bin:/bin");
    const char* home = std::getenv("HOME");
    if (home && *home) env.emplace_back("HOME", home);
    env.emplace_back("LC_ALL", "C");
    return env;
}

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string tail(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    return text.substr(text.size() - maxBytes);
}

ProcessResult runProcess(const ProcessOptions& options) {
    ProcessResult result;

    Pipe out, err;
    if (!out.open() || !err.open()) {
        result.error = std::string("failed to create pipes: ") + std::strerror(errno);
        return result;
    }

    std::vector<std::string> envStrings;
    envStrings.reserve(options.env.size());
    for (const auto& [k, v] : options.env) {
        envStrings.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    for (auto& s : envStrings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::string shell = "/bin/sh";
    std::string dashC = "-c";
    std::string command = options.command;
    char* argv[] = {const_cast<char*>(shell.c_str()), const_cast<char*>(dashC.c_str()),
                    const_cast<char*>(command.c_str()), nullptr};

    PreparedRestrictions restrictions(options.restrictions);
    int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    auto startTime = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("failed to fork process: ") + std::strerror(errno);
        if (devNull >= 0) close(devNull);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        if (devNull >= 0) redirectFd(devNull, STDIN_FILENO);
        redirectFd(out.fds[1], STDOUT_FILENO);
        redirectFd(err.fds[1], STDERR_FILENO);
        closeInheritedFds();

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            const char msg[] = "testbox: cannot enter working directory\n";
            ssize_t n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)n;
            _exit(126);
        }

        restrictions.applyInChild();

        execve(shell.c_str(), argv, envp.data());
        _exit(127);
    }

    setpgid(pid, pid);
    if (devNull >= 0) close(devNull);
    out.closeWrite();
    err.closeWrite();
    result.started = true;

    fcntl(out.fds[0], F_SETFL, O_NONBLOCK);
    fcntl(err.fds[0], F_SETFL, O_NONBLOCK);

    auto deadline = startTime + std::chrono::milliseconds(options.timeoutMs);
    std::chrono::steady_clock::time_point drainDeadline;
    bool exited = false;
    bool draining = false;
    int status = 0;
    size_t captured = 0;
    char buffer[8192];

    auto readFrom = [&](Pipe& p, std::string& sink) {
        while (true) {
            ssize_t n = read(p.fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = captured < options.maxOutputBytes ? options.maxOutputBytes - captured : 0;
                size_t keep = std::min(room, static_cast<size_t>(n));
                sink.append(buffer, keep);
                captured += keep;
                if (keep < static_cast<size_t>(n)) result.outputLimitExceeded = true;
                continue;
            }
            if (n == 0) {
                p.closeRead();
            } else if (errno == EINTR) {
                continue;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                p.closeRead();
            }
            break;
        }
    };

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (options.timeoutMs > 0 && now >= deadline) {
            killpg(pid, SIGKILL);
            result.timedOut = true;
            break;
        }

        bool outOpen = out.fds[0] >= 0;
        bool errOpen = err.fds[0] >= 0;
        if (exited && !outOpen && !errOpen) break;

        if (outOpen || errOpen) {
            struct pollfd pfds[2];
            nfds_t n = 0;
            if (outOpen) pfds[n++] = {out.fds[0], POLLIN, 0};
            if (errOpen) pfds[n++] = {err.fds[0], POLLIN, 0};
            int rc = poll(pfds, n, 50);
            if (rc > 0) {
                if (outOpen) readFrom(out, result.stdoutText);
                if (errOpen) readFrom(err, result.stderrText);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid || (w < 0 && errno == ECHILD)) {
                exited = true;
            }
        } else if (out.fds[0] >= 0 || err.fds[0] >= 0) {
            // Leftover background processes still hold the pipes open.
            if (!draining) {
                draining = true;
                drainDeadline = std::chrono::steady_clock::now() + kDrainGrace;
            } else if (std::chrono::steady_clock::now() >= drainDeadline) {
                killpg(pid, SIGKILL);
                out.closeRead();
                err.closeRead();
            }
        }
    }

    if (!exited) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    if (result.timedOut) {
        if (out.fds[0] >= 0) readFrom(out, result.stdoutText);
        if (err.fds[0] >= 0) readFrom(err, result.stderrText);
    }

    auto endTime = std::chrono::steady_clock::now();
    result.durationMs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
        result.exitCode = 128 + result.termSignal;
    }
    return result;
}

}
}
