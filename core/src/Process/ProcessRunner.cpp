// ProcessRunner.cpp — fork/execvp с перехватом stdout/stderr и timeout

#include "adbee/Process/ProcessRunner.h"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Adbee {

using Clock = std::chrono::steady_clock;

namespace {

constexpr int POLL_SLICE_MS = 50;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void closePipe(int fds[2]) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

/// Прочитать всё доступное из fd. @return false если EOF или ошибка
bool drainFd(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buffer)) return true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) result += ' ';
        result += arg;
    }
    return result;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// PosixProcessRunner::run
// ═══════════════════════════════════════════════════════════

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty() || argv[0].empty()) {
        result.error = "Empty command";
        return result;
    }

    // argv готовим до fork: после fork в дочернем процессе нельзя аллоцировать
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};   // Дочерний пишет errno, если exec не удался

    if (pipe2(outPipe, O_CLOEXEC) < 0 || pipe2(errPipe, O_CLOEXEC) < 0 ||
        pipe2(execPipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        spdlog::error("Process: {}", result.error);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(execPipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        spdlog::error("Process: {}", result.error);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(execPipe);
        return result;
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // EOF = exec прошёл (O_CLOEXEC), иначе читаем errno
    int childErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        result.error = "exec '" + argv[0] + "' failed: " + std::strerror(childErrno);
        spdlog::warn("Process: {}", result.error);
        return result;
    }

    result.started = true;
    spdlog::debug("Process: Started pid {} ({})", pid, argv[0]);

    fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    std::array<pollfd, 2> fds{};
    fds[0] = {outPipe[0], POLLIN, 0};
    fds[1] = {errPipe[0], POLLIN, 0};
    std::array<std::string*, 2> sinks = {&result.stdoutData, &result.stderrData};

    const auto deadline = Clock::now() + timeout;
    int status = 0;
    bool exited = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            result.timedOut = true;
            break;
        }

        bool anyOpen = fds[0].fd >= 0 || fds[1].fd >= 0;
        if (anyOpen) {
            int sliceMs = static_cast<int>(std::min<int64_t>(remaining, POLL_SLICE_MS));
            int rc = poll(fds.data(), fds.size(), sliceMs);
            if (rc < 0 && errno != EINTR) {
                spdlog::error("Process: poll failed: {}", std::strerror(errno));
                break;
            }
            if (rc > 0) {
                for (size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0) continue;
                    if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                        if (!drainFd(fds[i].fd, *sinks[i])) {
                            close(fds[i].fd);
                            fds[i].fd = -1;
                        }
                    }
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(
                std::min<int64_t>(remaining, 10)));
        }

        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            spdlog::error("Process: waitpid failed: {}", std::strerror(errno));
            break;
        }
    }

    if (exited) {
        // Дочитываем остаток; внуки (adb server) могут держать pipe открытым
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd >= 0) {
                drainFd(fds[i].fd, *sinks[i]);
            }
        }
    } else {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        if (result.timedOut) {
            spdlog::warn("Process: '{}' killed after {} ms timeout", joinArgs(argv), timeout.count());
        }
    }

    closeFd(fds[0].fd);
    closeFd(fds[1].fd);

    if (exited) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.error = "terminated by signal " + std::to_string(WTERMSIG(status));
        }
    }

    return result;
}

std::optional<std::string> PosixProcessRunner::findExecutable(const std::string& name) const {
    return which(name);
}

// ═══════════════════════════════════════════════════════════
// Поиск в PATH
// ═══════════════════════════════════════════════════════════

std::optional<std::string> PosixProcessRunner::which(const std::string& name) {
    if (name.empty()) return std::nullopt;

    auto isExecutable = [](const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (isExecutable(name)) return name;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        if (isExecutable(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

} // namespace Adbee
