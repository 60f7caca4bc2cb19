// include/common/process_runner.h
#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace photobooth::common {

struct ProcessResult {
    bool started = false;      // false: fork/exec failed, see output
    bool timedOut = false;
    bool cancelled = false;
    int exitCode = -1;         // valid when started and neither timedOut nor cancelled
    std::string output;        // merged stdout/stderr, truncated

    bool succeeded() const { return started && !timedOut && !cancelled && exitCode == 0; }
};

// Runs external utilities (camera still capture, print spooler client) without a shell.
class ProcessRunner {
public:
    // Blocks until the child exits, the timeout elapses or *cancelFlag becomes true.
    // The child is terminated in the latter two cases.
    static ProcessResult run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             const std::atomic<bool>* cancelFlag = nullptr);

    static std::string describe(const std::vector<std::string>& argv);
};

// Long-lived child process (e.g. a preview window) owned by the caller.
class BackgroundProcess {
public:
    BackgroundProcess() = default;
    ~BackgroundProcess();
    BackgroundProcess(const BackgroundProcess&) = delete;
    BackgroundProcess& operator=(const BackgroundProcess&) = delete;

    bool start(const std::vector<std::string>& argv);
    void stop();
    bool isRunning();

private:
    std::mutex mutex_;
    pid_t pid_{-1};
};

} // namespace photobooth::common
