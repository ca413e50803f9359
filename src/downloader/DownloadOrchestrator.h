#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../include/media_grab/downloader/DownloadEvents.h"
#include "../../include/media_grab/downloader/DownloadTracker.h"
#include "../../include/media_grab/downloader/models/DownloadConfig.h"
#include "../../include/media_grab/downloader/models/DownloadRequest.h"
#include "../../include/media_grab/downloader/models/SessionState.h"
#include "BackendRegistry.h"
#include "CookieResolver.h"
#include "HistoryStore.h"
#include "PlatformClassifier.h"
#include "ProxyPool.h"
#include "RateLimiter.h"
#include "RetryController.h"
#include "SourceList.h"

namespace media_grab::downloader {

// A run cannot start: no URLs, or nowhere writable to put the media
class PreconditionError : public std::runtime_error {
public:
    explicit PreconditionError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Runs one download session over a request list. Everything a run touches
 * lives in this object, so two runs in the same process share no state.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(DownloadConfig config,
                         DownloadEvents events,
                         std::shared_ptr<std::atomic<bool>> cancelFlag = std::make_shared<std::atomic<bool>>(false));

    /**
     * Download the URLs found in the inputs into outputDir. Nothing but the
     * media itself is written.
     * @throws PreconditionError when no URL is found or outputDir is not writable
     */
    RunSummary runSingle(const std::vector<std::string>& inputs, const std::string& outputDir);

    /**
     * Download every source folder under root, skipping tracked links and
     * updating history and links files at the end.
     * @throws PreconditionError when no source has links or root is not writable
     */
    RunSummary runBulk(const std::string& root);

    void cancel() { cancelFlag_->store(true); }
    bool isCancelled() const { return cancelFlag_->load(); }

    // Replace collaborators; used by tests and embedders
    void setBackendRegistry(BackendRegistry registry) { registry_ = std::move(registry); }
    void setStrategyTable(StrategyTable table) { strategies_ = std::move(table); }
    void setProxyPool(ProxyPool pool) { proxies_ = std::move(pool); }
    void setSleepFunction(RetryController::SleepFunction sleep) { sleep_ = std::move(sleep); }
    void setRateLimiter(std::unique_ptr<RateLimiter> limiter) { rateLimiter_ = std::move(limiter); }
    void setCookieResolver(std::unique_ptr<CookieResolver> resolver) { cookieResolver_ = std::move(resolver); }

    const DownloadConfig& config() const { return config_; }

    static std::string formatSummary(const SessionState& session);

private:
    RunSummary process(const std::vector<DownloadRequest>& requests,
                       RunMode mode,
                       DownloadTracker& tracker,
                       const std::map<std::string, std::string>& outputFolders);

    void finalizeBulk(const SessionState& session,
                      HistoryStore& history,
                      const std::map<std::string, BulkSource>& sources);

    static void ensureWritable(const std::string& dir);

    DownloadConfig config_;
    DownloadEvents events_;
    std::shared_ptr<std::atomic<bool>> cancelFlag_;

    BackendRegistry registry_;
    StrategyTable strategies_;
    ProxyPool proxies_;
    std::unique_ptr<RateLimiter> rateLimiter_;
    std::unique_ptr<CookieResolver> cookieResolver_;
    RetryController::SleepFunction sleep_;
};

} // namespace media_grab::downloader
