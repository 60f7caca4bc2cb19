// src/common/process_runner.cpp
#include "common/process_runner.h"
#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace photobooth::common {

namespace {

constexpr size_t kMaxCapturedOutput = 4096;
constexpr std::chrono::milliseconds kTerminateGrace{500};

std::vector<char*> buildArgv(const std::vector<std::string>& argv) {
    std::vector<char*> result;
    result.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        result.push_back(const_cast<char*>(arg.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

// Returns -1 if the child could not be reaped, otherwise the wait status.
int terminateAndReap(pid_t pid) {
    int status = 0;
    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return status;
        }
        if (r < 0 && errno != EINTR) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

int descriptorLimit() {
    long limit = ::sysconf(_SC_OPEN_MAX);
    return limit > 0 && limit < 65536 ? static_cast<int>(limit) : 65536;
}

// Child side, before exec: only stdio and keepFd stay open
void closeInheritedDescriptors(int limit, int keepFd) {
    for (int fd = STDERR_FILENO + 1; fd < limit; ++fd) {
        if (fd != keepFd) {
            ::close(fd);
        }
    }
}

// Drops a UTF-8 sequence left incomplete at the end of text
void trimToCharacterBoundary(std::string& text) {
    size_t end = text.size();
    size_t continuation = 0;
    while (end > 0 && continuation < 3 && (static_cast<unsigned char>(text[end - 1]) & 0xC0) == 0x80) {
        --end;
        ++continuation;
    }
    if (end == 0) {
        return;
    }
    unsigned char lead = static_cast<unsigned char>(text[end - 1]);
    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0) length = 4;
    if (length > 1 && continuation + 1 < length) {
        text.resize(end - 1);
    }
}

// Reads what is available; once kMaxCapturedOutput is reached the rest is discarded
void drain(int fd, std::string& output, bool& full) {
    char buf[512];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (!full) {
                output.append(buf, static_cast<size_t>(n));
                if (output.size() >= kMaxCapturedOutput) {
                    output.resize(kMaxCapturedOutput);
                    trimToCharacterBoundary(output);
                    full = true;
                }
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
}

} // namespace

std::string ProcessRunner::describe(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) text += ' ';
        text += arg;
    }
    return text;
}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool>* cancelFlag) {
    ProcessResult result;
    if (argv.empty()) {
        result.output = "empty command";
        return result;
    }

    int outPipe[2];
    int execPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return result;
    }

    std::vector<char*> cargv = buildArgv(argv);
    const int fdLimit = descriptorLimit();
    pid_t pid = ::fork();
    if (pid < 0) {
        result.output = std::string("fork failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(execPipe[0]);
        ::close(execPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        closeInheritedDescriptors(fdLimit, execPipe[1]);
        ::execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(outPipe[1]);
    ::close(execPipe[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(outPipe[0]);
        result.output = "cannot execute " + argv[0] + ": " + std::strerror(execErr);
        return result;
    }
    result.started = true;

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool outputFull = false;

    while (true) {
        struct pollfd pfd { outPipe[0], POLLIN, 0 };
        int pr = ::poll(&pfd, 1, 10);
        if (pr > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            drain(outPipe[0], result.output, outputFull);
        }

        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            break;
        }
        if (r < 0 && errno != EINTR) {
            result.output += std::string("waitpid failed: ") + std::strerror(errno);
            status = -1;
            break;
        }
        if (cancelFlag && cancelFlag->load()) {
            result.cancelled = true;
            status = terminateAndReap(pid);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            status = terminateAndReap(pid);
            break;
        }
    }

    drain(outPipe[0], result.output, outputFull);
    ::close(outPipe[0]);

    if (status >= 0 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (status >= 0 && WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

BackgroundProcess::~BackgroundProcess() {
    stop();
}

bool BackgroundProcess::start(const std::vector<std::string>& argv) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 || argv.empty()) {
        return pid_ > 0;
    }

    std::vector<char*> cargv = buildArgv(argv);
    const int fdLimit = descriptorLimit();
    pid_t pid = ::fork();
    if (pid < 0) {
        logging::Logger::getInstance().error(std::string("fork failed: ") + std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        closeInheritedDescriptors(fdLimit, -1);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }
    pid_ = pid;
    logging::Logger::getInstance().debug("Started background process " + std::to_string(pid_) + ": " +
                                         ProcessRunner::describe(argv));
    return true;
}

void BackgroundProcess::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return;
    }
    int status = 0;
    if (::waitpid(pid_, &status, WNOHANG) != pid_) {
        terminateAndReap(pid_);
    }
    logging::Logger::getInstance().debug("Stopped background process " + std::to_string(pid_));
    pid_ = -1;
}

bool BackgroundProcess::isRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        pid_ = -1;
        return false;
    }
    return true;
}

} // namespace photobooth::common
