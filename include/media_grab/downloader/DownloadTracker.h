#pragma once

#include <string>
#include "../../infrastructure.h"

namespace media_grab::downloader {

// Remembers which dedup keys have been downloaded already
class DownloadTracker {
public:
    virtual ~DownloadTracker() = default;

    virtual bool isAlreadyDownloaded(const std::string& dedupKey) const = 0;

    // Record a completed download; the key is durable when this returns success
    virtual Result<bool> markDownloaded(const std::string& dedupKey) = 0;
};

// Single mode: nothing is remembered and nothing touches the disk
class NullDownloadTracker : public DownloadTracker {
public:
    bool isAlreadyDownloaded(const std::string&) const override { return false; }
    Result<bool> markDownloaded(const std::string&) override { return Result<bool>::Success(true); }
};

} // namespace media_grab::downloader
