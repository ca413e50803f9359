#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace media_grab::downloader {

struct ProcessOptions {
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    // Called for every complete output line (stdout and stderr are merged)
    std::function<void(const std::string&)> onLine;
    // Polled while the child runs; returning true terminates it
    std::function<bool()> shouldAbort;
    // Output lines kept for the diagnostic tail
    size_t tailLines = 40;
};

struct ProcessResult {
    int exitCode = -1;
    bool timedOut = false;
    bool aborted = false;
    bool execFailed = false;       // executable could not be started
    std::string execError;
    std::string outputTail;        // last lines of merged output
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return !execFailed && !timedOut && !aborted && exitCode == 0; }
};

/**
 * Runs an external tool with fork/exec, streaming its merged output line by line.
 * The child gets its own process group so helper processes it spawns are
 * terminated along with it on timeout or abort.
 */
class ProcessRunner {
public:
    static ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options);

    /**
     * Resolve an executable: paths containing '/' are checked directly, bare
     * names are searched on PATH.
     */
    static std::optional<std::string> findExecutable(const std::string& name);

private:
    static void terminate(pid_t pid);
};

} // namespace media_grab::downloader
