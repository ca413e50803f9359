#include "RetryController.h"
#include "FailureClassifier.h"
#include "UrlNormalizer.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <memory>
#include <sstream>
#include <thread>

namespace media_grab::downloader {

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(100);

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

RetryController::RetryController(const DownloadConfig& config,
                                 RateLimiter& rateLimiter,
                                 ProxyPool& proxyPool,
                                 CancelCheck isCancelled,
                                 SleepFunction sleep)
    : config_(config),
      rateLimiter_(rateLimiter),
      proxyPool_(proxyPool),
      isCancelled_(std::move(isCancelled)),
      sleep_(std::move(sleep)) {
}

std::string RetryController::shortDiagnostic(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(common::stripAnsiEscapes(text));
    std::string line;
    while (std::getline(in, line)) {
        if (!isBlank(line)) {
            lines.push_back(line);
        }
    }
    if (lines.empty()) {
        return "no diagnostic output";
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find("ERROR") != std::string::npos || it->find("error") != std::string::npos) {
            return *it;
        }
    }
    return lines.back();
}

void RetryController::pause(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        return;
    }
    if (sleep_) {
        sleep_(delay);
        return;
    }
    // Sleep in slices so a cancellation is noticed before the next attempt
    auto until = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < until) {
        if (isCancelled_ && isCancelled_()) {
            return;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::duration_cast<std::chrono::milliseconds>(SLEEP_SLICE)));
    }
}

std::function<bool()> RetryController::makeAbortCheck() const {
    if (config_.cancelGracePeriod.count() <= 0 || !isCancelled_) {
        // In-flight attempts always run to completion
        return {};
    }
    auto cancelSeenAt = std::make_shared<std::optional<std::chrono::steady_clock::time_point>>();
    auto grace = config_.cancelGracePeriod;
    auto isCancelled = isCancelled_;
    return [cancelSeenAt, grace, isCancelled]() {
        if (!isCancelled()) {
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (!*cancelSeenAt) {
            *cancelSeenAt = now;
        }
        return now - **cancelSeenAt >= grace;
    };
}

BackendRunResult RetryController::runBackend(DownloadBackend& backend,
                                             const DownloadRequest& request,
                                             const FetchRequest& fetchTemplate,
                                             const std::vector<std::string>& cookieCandidates,
                                             std::optional<std::chrono::steady_clock::time_point> deadline) {
    BackendRunResult result;
    const std::string backendName = backend.name();
    const std::string domain = UrlNormalizer::extractDomain(request.canonicalUrl);

    size_t cookieIndex = 0;
    bool useProxy = false;
    int transientRetries = 0;
    int blockedRetries = 0;

    while (true) {
        if (isCancelled_ && isCancelled_()) {
            result.status = BackendRunResult::Status::CANCELLED;
            return result;
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            LOG_WARNING("[" + backendName + "] Time budget for " + request.rawInput + " exhausted");
            result.status = BackendRunResult::Status::OUT_OF_TIME;
            if (result.diagnostic.empty()) {
                result.diagnostic = "per-URL time budget exhausted";
            }
            return result;
        }

        rateLimiter_.blockUntilAllowed(domain);

        FetchRequest fetch = fetchTemplate;
        fetch.url = request.canonicalUrl;
        fetch.cookieCandidates.assign(cookieCandidates.begin() + std::min(cookieIndex, cookieCandidates.size()),
                                      cookieCandidates.end());
        fetch.proxy = useProxy ? proxyPool_.getCurrent() : std::nullopt;
        fetch.shouldAbort = makeAbortCheck();
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(*deadline - std::chrono::steady_clock::now());
            fetch.timeout = std::max(std::chrono::seconds(1), std::min(fetch.timeout, left));
        }

        result.attempts++;
        LOG_DEBUG("[" + backendName + "] Attempt " + std::to_string(result.attempts) + " for " + request.canonicalUrl +
                  (fetch.proxy ? " via proxy" : "") +
                  (fetch.cookieCandidates.empty() ? "" : " with cookies " + fetch.cookieCandidates.front()));

        DownloadOutcome outcome = backend.fetch(fetch);
        if (outcome.succeeded) {
            result.status = BackendRunResult::Status::SUCCEEDED;
            result.diagnostic.clear();
            return result;
        }

        FailureType type = FailureClassifier::classifyOutcome(outcome, config_);
        result.lastFailure = type;
        result.diagnostic = shortDiagnostic(outcome.diagnosticText);

        switch (type) {
            case FailureType::CONFIGURATION:
                LOG_WARNING("[" + backendName + "] Backend unavailable, skipping: " + result.diagnostic);
                result.status = BackendRunResult::Status::EXHAUSTED;
                return result;

            case FailureType::AUTHENTICATION:
                if (cookieIndex + 1 < cookieCandidates.size()) {
                    cookieIndex++;
                    LOG_INFO("[" + backendName + "] Cookies rejected, trying " + cookieCandidates[cookieIndex]);
                    continue;
                }
                LOG_WARNING("[" + backendName + "] Authentication failed with every cookie file");
                result.status = BackendRunResult::Status::EXHAUSTED;
                return result;

            case FailureType::ACCESS_BLOCKED:
                if (!useProxy && !proxyPool_.empty()) {
                    useProxy = true;
                    LOG_INFO("[" + backendName + "] Access blocked, retrying through proxy");
                    continue;
                }
                if (blockedRetries < config_.blockedBackoffRetries) {
                    blockedRetries++;
                    if (useProxy) {
                        proxyPool_.rotate();
                    }
                    auto delay = FailureClassifier::calculateRetryDelay(blockedRetries, config_, type);
                    LOG_INFO("[" + backendName + "] Still blocked, backing off " + std::to_string(delay.count()) + "ms");
                    pause(delay);
                    continue;
                }
                LOG_WARNING("[" + backendName + "] Access blocked, giving up on this backend");
                result.status = BackendRunResult::Status::EXHAUSTED;
                return result;

            case FailureType::PERMANENT:
                LOG_WARNING("[" + backendName + "] Permanent failure: " + result.diagnostic);
                result.status = BackendRunResult::Status::EXHAUSTED;
                return result;

            case FailureType::TRANSIENT:
            case FailureType::TIMEOUT:
            default:
                if (FailureClassifier::shouldRetry(type, transientRetries, config_)) {
                    transientRetries++;
                    auto delay = FailureClassifier::calculateRetryDelay(transientRetries, config_, type);
                    LOG_INFO("[" + backendName + "] " + FailureClassifier::getFailureTypeDescription(type) +
                             " failure, retry " + std::to_string(transientRetries) + " in " +
                             std::to_string(delay.count()) + "ms");
                    pause(delay);
                    continue;
                }
                result.status = BackendRunResult::Status::EXHAUSTED;
                return result;
        }
    }
}

UrlRunResult RetryController::downloadUrl(const DownloadRequest& request,
                                          const std::vector<std::string>& backendNames,
                                          const BackendRegistry& registry,
                                          const FetchRequest& fetchTemplate,
                                          const std::vector<std::string>& cookieCandidates) {
    UrlRunResult result;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (config_.urlTimeBudget.count() > 0) {
        deadline = std::chrono::steady_clock::now() + config_.urlTimeBudget;
    }

    std::vector<std::string> failures;
    for (const auto& name : backendNames) {
        auto backend = registry.find(name);
        if (!backend) {
            LOG_WARNING("Backend '" + name + "' is not registered, skipping");
            continue;
        }

        BackendRunResult run = runBackend(*backend, request, fetchTemplate, cookieCandidates, deadline);
        result.attempts += run.attempts;

        if (run.status == BackendRunResult::Status::SUCCEEDED) {
            result.succeeded = true;
            result.backend = name;
            LOG_INFO("[" + name + "] Downloaded " + request.rawInput);
            return result;
        }
        if (run.status == BackendRunResult::Status::CANCELLED) {
            result.cancelled = true;
            return result;
        }

        failures.push_back(name + ": " + run.diagnostic);
        if (run.status == BackendRunResult::Status::OUT_OF_TIME) {
            break;
        }
        LOG_INFO("[" + name + "] Exhausted for " + request.rawInput + ", moving to next backend");
    }

    if (failures.empty()) {
        result.diagnostic = "no download backend available for platform " + request.platformTag;
    } else {
        for (size_t i = 0; i < failures.size(); ++i) {
            if (i > 0) {
                result.diagnostic += "\n";
            }
            result.diagnostic += failures[i];
        }
    }
    return result;
}

} // namespace media_grab::downloader
