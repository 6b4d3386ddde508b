/**
 * @file subprocess.cpp
 * @brief fork/exec based child-process helpers.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/utils/subprocess.hpp"
#include "camfleet/utils/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace camfleet {
namespace utils {

namespace {

std::vector<char*> toCArgv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) {
        cargv.push_back(const_cast<char*>(s.c_str()));
    }
    cargv.push_back(nullptr);
    return cargv;
}

void drain(int fd, std::string& into, size_t limit) {
    char tmp[4096];
    for (;;) {
        ssize_t n = ::read(fd, tmp, sizeof(tmp));
        if (n <= 0) {
            return;
        }
        size_t room = into.size() < limit ? limit - into.size() : 0;
        into.append(tmp, std::min(room, static_cast<size_t>(n)));
    }
}

}  // namespace

ProcessResult runWithTimeout(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t maxOutputBytes) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int outfd[2];
    int errfd[2];
    if (::pipe(outfd) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe(errfd) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outfd[0]);
        ::close(outfd[1]);
        return result;
    }

    auto cargv = toCArgv(argv);
    pid_t pid = ::fork();
    if (pid == -1) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        ::close(outfd[0]); ::close(outfd[1]);
        ::close(errfd[0]); ::close(errfd[1]);
        return result;
    }
    if (pid == 0) {
        // Child: own process group so the deadline kill reaches grandchildren
        ::setpgid(0, 0);
        ::dup2(outfd[1], STDOUT_FILENO);
        ::dup2(errfd[1], STDERR_FILENO);
        ::close(outfd[0]); ::close(outfd[1]);
        ::close(errfd[0]); ::close(errfd[1]);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    result.started = true;
    ::close(outfd[1]);
    ::close(errfd[1]);
    ::fcntl(outfd[0], F_SETFL, ::fcntl(outfd[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errfd[0], F_SETFL, ::fcntl(errfd[0], F_GETFL) | O_NONBLOCK);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        drain(outfd[0], result.stdout_text, maxOutputBytes);
        drain(errfd[0], result.stderr_text, maxOutputBytes);

        int status = 0;
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
            break;
        }
        if (w == -1 && errno == ECHILD) {
            // Reaped elsewhere; exit status is lost
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            result.exit_code = 128 + SIGKILL;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    drain(outfd[0], result.stdout_text, maxOutputBytes);
    drain(errfd[0], result.stderr_text, maxOutputBytes);
    ::close(outfd[0]);
    ::close(errfd[0]);

    if (result.exit_code == 127 && !result.timed_out) {
        result.error = "command not found: " + argv[0];
    }
    return result;
}

pid_t spawnDetached(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }
    auto cargv = toCArgv(argv);
    pid_t pid = ::fork();
    if (pid == -1) {
        LOG_ERROR("Subprocess", "fork failed: {}", std::strerror(errno));
        return -1;
    }
    if (pid == 0) {
        ::setsid();
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }
    LOG_DEBUG("Subprocess", "Spawned {} as pid {}", argv[0], pid);
    return pid;
}

std::vector<pid_t> findProcesses(const std::string& pattern) {
    std::vector<pid_t> pids;
    if (pattern.empty()) {
        return pids;
    }

    DIR* proc = ::opendir("/proc");
    if (proc == nullptr) {
        return pids;
    }

    const pid_t self = ::getpid();
    while (struct dirent* entry = ::readdir(proc)) {
        const char* name = entry->d_name;
        if (name[0] < '0' || name[0] > '9') {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::strtol(name, nullptr, 10));
        if (pid == self) {
            continue;
        }

        std::ifstream in(std::string("/proc/") + name + "/cmdline", std::ios::binary);
        if (!in) {
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        std::string cmdline = buffer.str();
        // Arguments are NUL separated
        for (auto& c : cmdline) {
            if (c == '\0') c = ' ';
        }
        if (cmdline.find(pattern) != std::string::npos) {
            pids.push_back(pid);
        }
    }
    ::closedir(proc);
    return pids;
}

int terminateMatching(const std::string& pattern) {
    int count = 0;
    for (pid_t pid : findProcesses(pattern)) {
        if (::kill(pid, SIGTERM) == 0) {
            ++count;
        } else {
            LOG_WARN("Subprocess", "Failed to signal pid {}: {}", pid, std::strerror(errno));
        }
    }
    return count;
}

int reapZombies() {
    int count = 0;
    int status = 0;
    while (::waitpid(-1, &status, WNOHANG) > 0) {
        ++count;
    }
    return count;
}

}  // namespace utils
}  // namespace camfleet
