#include "DownloadOrchestrator.h"
#include "ProgressReporter.h"
#include "TrackingLog.h"
#include "UrlNormalizer.h"
#include "../../include/Logger.h"

#include <filesystem>
#include <sstream>
#include <unistd.h>
#include <unordered_set>

namespace fs = std::filesystem;

namespace media_grab::downloader {

DownloadOrchestrator::DownloadOrchestrator(DownloadConfig config,
                                           DownloadEvents events,
                                           std::shared_ptr<std::atomic<bool>> cancelFlag)
    : config_(std::move(config)),
      events_(std::move(events)),
      cancelFlag_(cancelFlag ? std::move(cancelFlag) : std::make_shared<std::atomic<bool>>(false)) {
    config_.validate();
    registry_ = BackendRegistry::withDefaults(config_);
    proxies_ = ProxyPool::fromFile(config_.proxyConfigPath);
    rateLimiter_ = std::make_unique<RateLimiter>(config_);
    cookieResolver_ = std::make_unique<CookieResolver>(config_);
}

void DownloadOrchestrator::ensureWritable(const std::string& dir) {
    if (dir.empty()) {
        throw PreconditionError("No output location given");
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        throw PreconditionError("Output location cannot be created: " + dir);
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        throw PreconditionError("Output location is not writable: " + dir);
    }
}

RunSummary DownloadOrchestrator::runSingle(const std::vector<std::string>& inputs, const std::string& outputDir) {
    std::vector<std::string> urls;
    {
        std::string joined;
        for (const auto& input : inputs) {
            joined += input;
            joined += '\n';
        }
        urls = UrlNormalizer::extract(joined);
    }

    std::vector<DownloadRequest> requests;
    std::unordered_set<std::string> seenKeys;
    UrlNormalizer::appendRequests(urls, "", requests, seenKeys);
    if (requests.empty()) {
        throw PreconditionError("No URLs found in the input");
    }
    ensureWritable(outputDir);

    LOG_INFO("Single download of " + std::to_string(requests.size()) + " URL(s) into " + outputDir);
    NullDownloadTracker tracker;
    return process(requests, RunMode::SINGLE, tracker, {{"", outputDir}});
}

RunSummary DownloadOrchestrator::runBulk(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw PreconditionError("Bulk folder does not exist: " + root);
    }
    ensureWritable(root);

    HistoryStore history((fs::path(root) / "history.json").string());

    std::vector<DownloadRequest> requests;
    std::unordered_set<std::string> seenKeys;
    std::map<std::string, BulkSource> sources;
    std::map<std::string, std::string> folders;

    for (const auto& source : SourceList::scan(root)) {
        if (config_.skipRecentWindow && history.shouldSkipSource(source.name, config_.recentWindowHours)) {
            LOG_INFO("Skipping " + source.name + ": downloaded within the last " +
                     std::to_string(config_.recentWindowHours) + "h");
            events_.emitProgressLine("Skipping " + source.name + " (downloaded recently)");
            continue;
        }
        auto links = SourceList::readLinks(source, config_.maxLinksPerSource);
        if (links.empty()) {
            continue;
        }
        size_t before = requests.size();
        UrlNormalizer::appendRequests(links, source.name, requests, seenKeys);
        LOG_INFO("Source " + source.name + ": " + std::to_string(requests.size() - before) + " link(s)");
        sources[source.name] = source;
        folders[source.name] = source.folder;
    }

    if (requests.empty()) {
        throw PreconditionError("No links found in any source folder under " + root);
    }

    TrackingLog tracker((fs::path(root) / ".downloaded_links.txt").string());
    RunSummary summary = process(requests, RunMode::BULK, tracker, folders);
    finalizeBulk(summary.session, history, sources);
    return summary;
}

RunSummary DownloadOrchestrator::process(const std::vector<DownloadRequest>& requests,
                                         RunMode mode,
                                         DownloadTracker& tracker,
                                         const std::map<std::string, std::string>& outputFolders) {
    SessionState session;
    session.mode = mode;
    session.totalRequests = static_cast<int>(requests.size());

    auto isCancelled = [flag = cancelFlag_]() { return flag->load(); };
    RetryController retry(config_, *rateLimiter_, proxies_, isCancelled, sleep_);
    ProgressReporter reporter(events_, isCancelled);

    FetchRequest fetchTemplate;
    fetchTemplate.outputTemplate = config_.outputTemplate;
    fetchTemplate.formatPref = config_.formatSpec();
    fetchTemplate.userAgent = config_.userAgent;
    fetchTemplate.timeout = config_.backendTimeout;
    fetchTemplate.onOutputLine = [&reporter](const std::string& line) { reporter.onOutputLine(line); };
    fetchTemplate.onBytes = [&reporter](uint64_t downloaded, uint64_t total) { reporter.onBytes(downloaded, total); };

    for (size_t i = 0; i < requests.size(); ++i) {
        const DownloadRequest& request = requests[i];

        if (isCancelled()) {
            LOG_INFO("Cancellation requested, stopping before " + request.rawInput);
            session.cancelled = true;
            break;
        }

        const std::string position = "[" + std::to_string(i + 1) + "/" + std::to_string(requests.size()) + "] ";

        if (tracker.isAlreadyDownloaded(request.dedupKey)) {
            LOG_INFO(position + "Already downloaded, skipping " + request.rawInput);
            session.skippedCount++;
            if (mode == RunMode::BULK) {
                SourceTally& tally = session.sourceTallies[request.sourceName];
                tally.skipped++;
                tally.skippedUrls.push_back(request.rawInput);
            }
            events_.emitUrlComplete(request.rawInput, true, "already downloaded");
            continue;
        }

        auto folderIt = outputFolders.find(request.sourceName);
        const std::string outputDir = folderIt != outputFolders.end() ? folderIt->second : outputFolders.begin()->second;

        std::vector<std::string> backends = strategies_.backendsFor(request.platformTag, config_.forceAllBackends,
                                                                    config_.defaultBackendCount);
        std::vector<std::string> cookies = cookieResolver_->resolve(request.canonicalUrl,
                                                                    mode == RunMode::BULK ? outputDir : "");

        events_.emitProgressLine(position + "Downloading " + request.rawInput);
        LOG_INFO(position + request.platformTag + " " + request.canonicalUrl + " (" +
                 std::to_string(backends.size()) + " backend(s), " + std::to_string(cookies.size()) + " cookie file(s))");

        reporter.reset();
        FetchRequest fetch = fetchTemplate;
        fetch.outputDir = outputDir;

        UrlRunResult result = retry.downloadUrl(request, backends, registry_, fetch, cookies);

        if (result.cancelled) {
            LOG_INFO("Cancelled while downloading " + request.rawInput);
            session.cancelled = true;
            break;
        }

        if (result.succeeded) {
            session.successCount++;
            auto tracked = tracker.markDownloaded(request.dedupKey);
            if (!tracked.success) {
                LOG_WARNING("Downloaded but not tracked: " + tracked.message);
            }
            if (mode == RunMode::BULK) {
                SourceTally& tally = session.sourceTallies[request.sourceName];
                tally.downloaded++;
                tally.downloadedUrls.push_back(request.rawInput);
            }
            events_.emitUrlComplete(request.rawInput, true, "downloaded with " + result.backend);
        } else {
            LOG_ERROR(position + "Failed " + request.rawInput + ": " + result.diagnostic);
            session.failedUrls.push_back({request.rawInput, result.diagnostic});
            if (mode == RunMode::BULK) {
                session.sourceTallies[request.sourceName].failed++;
            }
            events_.emitUrlComplete(request.rawInput, false, result.diagnostic);
        }
    }

    RunSummary summary;
    summary.session = session;
    summary.success = session.successCount + session.skippedCount > 0 || session.failedUrls.empty();
    summary.message = formatSummary(session);

    LOG_INFO(summary.message);
    events_.emitFinished(summary.success, summary.message);
    return summary;
}

void DownloadOrchestrator::finalizeBulk(const SessionState& session,
                                        HistoryStore& history,
                                        const std::map<std::string, BulkSource>& sources) {
    // Links done in this or an earlier run; a link may be listed by several sources
    std::vector<std::string> completed;
    for (const auto& [name, tally] : session.sourceTallies) {
        completed.insert(completed.end(), tally.downloadedUrls.begin(), tally.downloadedUrls.end());
        completed.insert(completed.end(), tally.skippedUrls.begin(), tally.skippedUrls.end());
        if (tally.downloaded + tally.failed > 0) {
            history.updateSource(name, tally.downloaded, tally.failed);
        }
    }

    if (!completed.empty()) {
        for (const auto& entry : sources) {
            auto removed = SourceList::removeDownloaded(entry.second.linksFile, completed);
            if (!removed.success) {
                LOG_WARNING(removed.message);
            }
        }
    }

    auto saved = history.save();
    if (!saved.success) {
        LOG_ERROR("History not saved: " + saved.message);
    }
}

std::string DownloadOrchestrator::formatSummary(const SessionState& session) {
    std::ostringstream oss;
    if (session.cancelled) {
        oss << "Cancelled. ";
    }
    oss << "Downloaded " << session.successCount
        << ", skipped " << session.skippedCount
        << ", failed " << session.failedUrls.size()
        << " of " << session.totalRequests << " URL(s)";
    if (!session.failedUrls.empty()) {
        oss << "\nFailed URLs:";
        for (const auto& failed : session.failedUrls) {
            std::string firstLine = failed.diagnostic.substr(0, failed.diagnostic.find('\n'));
            oss << "\n  " << failed.url << " - " << firstLine;
        }
    }
    return oss.str();
}

} // namespace media_grab::downloader
