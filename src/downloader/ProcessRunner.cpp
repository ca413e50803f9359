#include "ProcessRunner.h"
#include "../../include/Logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace media_grab::downloader {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);
constexpr auto TERMINATE_GRACE = std::chrono::seconds(2);

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class LineSplitter {
public:
    explicit LineSplitter(const ProcessOptions& options) : options_(options) {}

    void feed(const char* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            char c = data[i];
            // Tools redraw progress with '\r'; treat it as a line break
            if (c == '\n' || c == '\r') {
                flush();
            } else {
                partial_.push_back(c);
            }
        }
    }

    void flush() {
        if (partial_.empty()) {
            return;
        }
        if (options_.onLine) {
            options_.onLine(partial_);
        }
        tail_.push_back(partial_);
        while (tail_.size() > options_.tailLines) {
            tail_.pop_front();
        }
        partial_.clear();
    }

    std::string tail() const {
        std::string joined;
        for (const auto& line : tail_) {
            joined += line;
            joined += '\n';
        }
        return joined;
    }

private:
    const ProcessOptions& options_;
    std::string partial_;
    std::deque<std::string> tail_;
};

} // namespace

std::optional<std::string> ProcessRunner::findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }

    std::string paths(pathEnv);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos) {
            end = paths.size();
        }
        std::string dir = paths.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

void ProcessRunner::terminate(pid_t pid) {
    ::kill(-pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    while (std::chrono::steady_clock::now() < deadline) {
        int status;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid || (done < 0 && errno == ECHILD)) {
            // Leader is gone; make sure no helper survives it
            ::kill(-pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(-pid, SIGKILL);
}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;
    const auto start = std::chrono::steady_clock::now();

    if (argv.empty()) {
        result.execFailed = true;
        result.execError = "empty command line";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.execFailed = true;
        result.execError = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    LOG_DEBUG("Running: " + argv.front() + " (" + std::to_string(argv.size() - 1) + " args)");

    pid_t pid = ::fork();
    if (pid < 0) {
        result.execFailed = true;
        result.execError = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    // The error pipe closes on successful exec and carries errno otherwise
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status;
        ::waitpid(pid, &status, 0);
        closeFd(outPipe[0]);
        result.execFailed = true;
        result.execError = "cannot execute " + argv.front() + ": " + std::strerror(execErrno);
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        LOG_WARNING(result.execError);
        return result;
    }

    LineSplitter splitter(options);
    const auto deadline = start + options.timeout;
    bool killed = false;
    char buffer[4096];

    while (outPipe[0] >= 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARNING("Process " + argv.front() + " exceeded " +
                        std::to_string(options.timeout.count() / 1000) + "s, terminating");
            result.timedOut = true;
            terminate(pid);
            killed = true;
            break;
        }
        if (options.shouldAbort && options.shouldAbort()) {
            LOG_INFO("Terminating " + argv.front() + " on cancellation");
            result.aborted = true;
            terminate(pid);
            killed = true;
            break;
        }

        struct pollfd pfd = {outPipe[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(POLL_INTERVAL.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        n = ::read(outPipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            splitter.feed(buffer, static_cast<size_t>(n));
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            closeFd(outPipe[0]);
        }
    }
    splitter.flush();
    closeFd(outPipe[0]);

    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Already reaped by terminate()
            status = -1;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            terminate(pid);
            killed = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    result.outputTail = splitter.tail();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    LOG_DEBUG(argv.front() + " finished with exit code " + std::to_string(result.exitCode) +
              " in " + std::to_string(result.elapsed.count()) + "ms");
    return result;
}

} // namespace media_grab::downloader
