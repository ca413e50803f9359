#pragma once

#include <chrono>
#include <string>
#include "../../include/media_grab/downloader/models/DownloadConfig.h"
#include "../../include/media_grab/downloader/models/DownloadOutcome.h"
#include "../../include/media_grab/downloader/models/FailureType.h"

namespace media_grab::downloader {

// Signature matches found in a backend's diagnostic text
struct FailureSignals {
    bool ipBlocked = false;
    bool authenticationRequired = false;
    bool permanent = false;
};

class FailureClassifier {
public:
    /**
     * Match diagnostic text against the configured signature sets.
     * Color escapes are removed and matching is case-insensitive.
     * @param errorText Raw backend output
     * @param config Signature lists
     */
    static FailureSignals classifyFailure(const std::string& errorText, const DownloadConfig& config);

    /**
     * Map a failed outcome to the failure taxonomy. Tool resolution and timeout
     * hints win over text signatures; block signatures are checked before
     * authentication and permanent ones.
     */
    static FailureType classifyOutcome(const DownloadOutcome& outcome, const DownloadConfig& config);

    /**
     * Check if another attempt on the same backend is allowed
     * @param failureType The type of failure
     * @param retryCount Retries already performed for this failure type
     * @param config Retry budgets
     */
    static bool shouldRetry(FailureType failureType, int retryCount, const DownloadConfig& config);

    /**
     * Calculate the delay before next retry attempt using exponential backoff
     * @param retryCount Current retry attempt number (1-based)
     * @param config Configuration with retry settings
     * @param failureType Blocked failures use the blocked backoff base
     * @return Delay in milliseconds before next retry
     */
    static std::chrono::milliseconds calculateRetryDelay(int retryCount,
                                                         const DownloadConfig& config,
                                                         FailureType failureType);

    static std::string getFailureTypeDescription(FailureType failureType);

    // Lower-cased text with terminal escape sequences removed
    static std::string normalizeDiagnostic(const std::string& text);

private:
    static bool containsAny(const std::string& haystack, const std::vector<std::string>& needles);
};

} // namespace media_grab::downloader
