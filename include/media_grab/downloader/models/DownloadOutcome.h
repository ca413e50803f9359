#pragma once

#include <chrono>
#include <string>

namespace media_grab::downloader {

struct DownloadOutcome {
    bool succeeded = false;
    std::string diagnosticText;
    std::chrono::milliseconds elapsed{0};

    // Hints for failure classification, filled in by the backend that produced the outcome
    int exitCode = 0;
    bool timedOut = false;
    bool toolMissing = false;

    static DownloadOutcome success(std::chrono::milliseconds elapsed, const std::string& diagnostic = "") {
        DownloadOutcome outcome;
        outcome.succeeded = true;
        outcome.elapsed = elapsed;
        outcome.diagnosticText = diagnostic;
        return outcome;
    }

    static DownloadOutcome failure(const std::string& diagnostic, std::chrono::milliseconds elapsed = std::chrono::milliseconds(0)) {
        DownloadOutcome outcome;
        outcome.succeeded = false;
        outcome.diagnosticText = diagnostic;
        outcome.elapsed = elapsed;
        return outcome;
    }
};

} // namespace media_grab::downloader
