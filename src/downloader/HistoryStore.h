#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include "../../include/infrastructure.h"

namespace media_grab::downloader {

struct HistoryEntry {
    int totalDownloaded = 0;
    int totalFailed = 0;
    int lastBatchCount = 0;
    std::string lastDownload;        // local time, ISO 8601, empty when never run
    std::string lastStatus = "never"; // success | partial | failed | never
};

/**
 * Per-source download statistics kept in a JSON object keyed by source name.
 * Read once on construction, written atomically by save().
 */
class HistoryStore {
public:
    using Clock = std::chrono::system_clock;

    explicit HistoryStore(std::string path);

    // True if the source finished a download within the last windowHours
    bool shouldSkipSource(const std::string& sourceName, int windowHours, Clock::time_point now = Clock::now()) const;

    void updateSource(const std::string& sourceName, int downloaded, int failed,
                      Clock::time_point now = Clock::now());

    HistoryEntry getEntry(const std::string& sourceName) const;
    const std::map<std::string, HistoryEntry>& entries() const { return entries_; }

    // Write to a temp file beside the target and rename over it
    Result<bool> save() const;

    static std::string formatTimestamp(Clock::time_point time);
    static std::optional<Clock::time_point> parseTimestamp(const std::string& text);

private:
    void load();

    std::string path_;
    std::map<std::string, HistoryEntry> entries_;
};

} // namespace media_grab::downloader
