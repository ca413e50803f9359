#pragma once

#include <map>
#include <string>
#include <vector>

namespace media_grab::downloader {

enum class RunMode {
    SINGLE,  // no persisted side effects
    BULK     // tracking log + per-source history
};

struct FailedUrl {
    std::string url;
    std::string diagnostic;
};

// Per-source counters, folded into the history store once at run end
struct SourceTally {
    int downloaded = 0;
    int failed = 0;
    int skipped = 0;
    std::vector<std::string> downloadedUrls;  // raw inputs, removed from the source list at run end
    std::vector<std::string> skippedUrls;     // tracked by an earlier run
};

// Lives for one run invocation only
struct SessionState {
    RunMode mode = RunMode::SINGLE;
    bool cancelled = false;
    int successCount = 0;
    int skippedCount = 0;
    std::vector<FailedUrl> failedUrls;
    std::map<std::string, SourceTally> sourceTallies;
    int totalRequests = 0;
};

// Final report of a run, emitted through the finished event
struct RunSummary {
    bool success = false;
    std::string message;
    SessionState session;
};

} // namespace media_grab::downloader
