#pragma once

#include <string>
#include <unordered_set>
#include "../../include/media_grab/downloader/DownloadTracker.h"

namespace media_grab::downloader {

/**
 * Append-only file of dedup keys, one per line. The file is read once on
 * construction; every markDownloaded appends and syncs immediately under an
 * exclusive lock so concurrent processes never interleave lines.
 */
class TrackingLog : public DownloadTracker {
public:
    explicit TrackingLog(std::string path);

    bool isAlreadyDownloaded(const std::string& dedupKey) const override;
    Result<bool> markDownloaded(const std::string& dedupKey) override;

    size_t size() const { return keys_.size(); }
    const std::string& path() const { return path_; }

private:
    void load();

    std::string path_;
    std::unordered_set<std::string> keys_;
};

} // namespace media_grab::downloader
