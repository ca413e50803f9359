#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../../include/media_grab/downloader/DownloadBackend.h"
#include "../../include/media_grab/downloader/models/DownloadConfig.h"
#include "../../include/media_grab/downloader/models/DownloadRequest.h"
#include "../../include/media_grab/downloader/models/FailureType.h"
#include "BackendRegistry.h"
#include "ProxyPool.h"
#include "RateLimiter.h"

namespace media_grab::downloader {

struct BackendRunResult {
    enum class Status {
        SUCCEEDED,
        EXHAUSTED,    // every retry this backend is allowed has failed
        CANCELLED,
        OUT_OF_TIME   // the per-URL time budget ran out
    };

    Status status = Status::EXHAUSTED;
    FailureType lastFailure = FailureType::TRANSIENT;
    std::string diagnostic;
    int attempts = 0;
};

struct UrlRunResult {
    bool succeeded = false;
    bool cancelled = false;
    std::string backend;     // backend that succeeded
    std::string diagnostic;  // one line per failed backend
    int attempts = 0;
};

/**
 * The single retry / fallback routine: walks the backends chosen for a URL and
 * decides after every failed attempt whether to retry, switch cookie file,
 * switch to or rotate the proxy, back off, or give up on the backend.
 */
class RetryController {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using CancelCheck = std::function<bool()>;

    RetryController(const DownloadConfig& config,
                    RateLimiter& rateLimiter,
                    ProxyPool& proxyPool,
                    CancelCheck isCancelled,
                    SleepFunction sleep = {});

    /**
     * Try backends in order until one succeeds.
     * @param request The URL being downloaded
     * @param backendNames Ordered names from the strategy table
     * @param registry Where names are looked up; unknown names are skipped
     * @param fetchTemplate Output location, format and callbacks shared by all attempts
     * @param cookieCandidates Resolved cookie files, most preferred first
     */
    UrlRunResult downloadUrl(const DownloadRequest& request,
                             const std::vector<std::string>& backendNames,
                             const BackendRegistry& registry,
                             const FetchRequest& fetchTemplate,
                             const std::vector<std::string>& cookieCandidates);

    // Retry budget for one backend; exposed for tests
    BackendRunResult runBackend(DownloadBackend& backend,
                                const DownloadRequest& request,
                                const FetchRequest& fetchTemplate,
                                const std::vector<std::string>& cookieCandidates,
                                std::optional<std::chrono::steady_clock::time_point> deadline);

    // Most useful line of a backend's diagnostic output
    static std::string shortDiagnostic(const std::string& text);

private:
    std::function<bool()> makeAbortCheck() const;
    void pause(std::chrono::milliseconds delay);

    const DownloadConfig& config_;
    RateLimiter& rateLimiter_;
    ProxyPool& proxyPool_;
    CancelCheck isCancelled_;
    SleepFunction sleep_;
};

} // namespace media_grab::downloader
