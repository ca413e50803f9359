#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "models/DownloadOutcome.h"

namespace media_grab::downloader {

// Everything a backend needs for one attempt
struct FetchRequest {
    std::string url;
    std::string outputDir;
    std::string outputTemplate;
    std::vector<std::string> cookieCandidates;  // the first entry is used
    std::optional<std::string> proxy;
    std::string formatPref;
    std::string userAgent;
    std::chrono::seconds timeout{1800};

    // Raw tool output, one line at a time
    std::function<void(const std::string&)> onOutputLine;
    // Byte counters for backends that transfer data themselves; total is 0 when unknown
    std::function<void(uint64_t downloaded, uint64_t total)> onBytes;
    // Polled during the attempt; true stops the backend early
    std::function<bool()> shouldAbort;
};

/**
 * A way of fetching media for a URL. The orchestrator depends only on this
 * contract; concrete backends are picked by name from the strategy table.
 */
class DownloadBackend {
public:
    virtual ~DownloadBackend() = default;

    virtual std::string name() const = 0;

    /**
     * Run one attempt. Never throws for download problems; everything is
     * reported through the outcome.
     */
    virtual DownloadOutcome fetch(const FetchRequest& request) = 0;
};

} // namespace media_grab::downloader
