#include "FailureClassifier.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cmath>

namespace media_grab::downloader {

std::string FailureClassifier::normalizeDiagnostic(const std::string& text) {
    return common::toLowerAscii(common::stripAnsiEscapes(text));
}

bool FailureClassifier::containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

FailureSignals FailureClassifier::classifyFailure(const std::string& errorText, const DownloadConfig& config) {
    const std::string text = normalizeDiagnostic(errorText);

    FailureSignals signals;
    signals.ipBlocked = containsAny(text, config.blockSignatures);
    signals.authenticationRequired = containsAny(text, config.authSignatures);
    signals.permanent = containsAny(text, config.permanentSignatures);
    return signals;
}

FailureType FailureClassifier::classifyOutcome(const DownloadOutcome& outcome, const DownloadConfig& config) {
    if (outcome.toolMissing) {
        LOG_DEBUG("Classified as CONFIGURATION (backend tool unavailable)");
        return FailureType::CONFIGURATION;
    }
    if (outcome.timedOut) {
        LOG_DEBUG("Classified as TIMEOUT");
        return FailureType::TIMEOUT;
    }

    const FailureSignals signals = classifyFailure(outcome.diagnosticText, config);
    if (signals.ipBlocked) {
        LOG_DEBUG("Classified as ACCESS_BLOCKED (block signature)");
        return FailureType::ACCESS_BLOCKED;
    }
    if (signals.authenticationRequired) {
        LOG_DEBUG("Classified as AUTHENTICATION (auth signature)");
        return FailureType::AUTHENTICATION;
    }
    if (signals.permanent) {
        LOG_DEBUG("Classified as PERMANENT (content signature)");
        return FailureType::PERMANENT;
    }

    LOG_DEBUG("Classified as TRANSIENT (exit code " + std::to_string(outcome.exitCode) + ")");
    return FailureType::TRANSIENT;
}

bool FailureClassifier::shouldRetry(FailureType failureType, int retryCount, const DownloadConfig& config) {
    switch (failureType) {
        case FailureType::TRANSIENT:
        case FailureType::TIMEOUT:
            return retryCount < config.maxRetries;
        case FailureType::ACCESS_BLOCKED:
            return retryCount < config.blockedBackoffRetries;
        case FailureType::AUTHENTICATION:
        case FailureType::CONFIGURATION:
        case FailureType::PERMANENT:
        default:
            return false;
    }
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int retryCount,
                                                                 const DownloadConfig& config,
                                                                 FailureType failureType) {
    std::chrono::milliseconds baseDelay = config.baseRetryDelay;
    double multiplier = std::pow(config.backoffMultiplier, retryCount - 1);

    if (failureType == FailureType::ACCESS_BLOCKED) {
        // Blocked backoff always doubles: 2s, 4s, ...
        baseDelay = config.blockedBackoffBase;
        multiplier = std::pow(2.0, retryCount - 1);
    }

    auto calculatedDelay = std::chrono::milliseconds(
        static_cast<long>(baseDelay.count() * multiplier)
    );

    auto finalDelay = std::min(calculatedDelay, config.maxRetryDelay);

    LOG_DEBUG("Calculated retry delay for attempt " + std::to_string(retryCount) +
              ": " + std::to_string(finalDelay.count()) + "ms (type: " +
              getFailureTypeDescription(failureType) + ")");

    return finalDelay;
}

std::string FailureClassifier::getFailureTypeDescription(FailureType failureType) {
    switch (failureType) {
        case FailureType::TRANSIENT:
            return "TRANSIENT";
        case FailureType::TIMEOUT:
            return "TIMEOUT";
        case FailureType::ACCESS_BLOCKED:
            return "ACCESS_BLOCKED";
        case FailureType::AUTHENTICATION:
            return "AUTHENTICATION";
        case FailureType::CONFIGURATION:
            return "CONFIGURATION";
        case FailureType::PERMANENT:
            return "PERMANENT";
        default:
            return "INVALID";
    }
}

} // namespace media_grab::downloader
