#include <catch2/catch_test_macros.hpp>
#include "FailureClassifier.h"

using namespace media_grab::downloader;

namespace {

DownloadOutcome failure(const std::string& text) {
    auto outcome = DownloadOutcome::failure(text);
    outcome.exitCode = 1;
    return outcome;
}

} // namespace

TEST_CASE("FailureClassifier detects block phrases", "[FailureClassifier]") {
    DownloadConfig config;

    SECTION("Matching ignores case and color escapes") {
        auto signals = FailureClassifier::classifyFailure(
            "\x1b[0;31mERROR:\x1b[0m [youtube] abc: Your IP Address Is Blocked from accessing this post", config);
        REQUIRE(signals.ipBlocked);
    }

    SECTION("HTTP 403 and 429 responses count as blocks") {
        REQUIRE(FailureClassifier::classifyFailure("ERROR: HTTP Error 403: Forbidden", config).ipBlocked);
        REQUIRE(FailureClassifier::classifyFailure("ERROR: HTTP Error 429: Too Many Requests", config).ipBlocked);
    }

    SECTION("A copyright takedown is not a block") {
        auto signals = FailureClassifier::classifyFailure(
            "ERROR: Video unavailable. This video is no longer available due to a copyright claim by Foo", config);
        REQUIRE_FALSE(signals.ipBlocked);
        REQUIRE(signals.permanent);
    }

    SECTION("A label owner blocking on copyright grounds is permanent") {
        const std::string text = "ERROR: [youtube] dQw4w9WgXcQ: Video unavailable. This video contains content "
                                 "from UMG, who has blocked it on copyright grounds";
        REQUIRE_FALSE(FailureClassifier::classifyFailure(text, config).ipBlocked);
        REQUIRE(FailureClassifier::classifyOutcome(failure(text), config) == FailureType::PERMANENT);
    }

    SECTION("Non-ASCII diagnostics are matched byte for byte") {
        auto signals = FailureClassifier::classifyFailure(
            "ERROR: [instagram] C0d3: \xE2\x9A\xA0 Vid\xC3\xA9o: Your IP Address Is Blocked", config);
        REQUIRE(signals.ipBlocked);
        REQUIRE(FailureClassifier::normalizeDiagnostic("\xC3\x89RROR") == "\xC3\x89rror");
    }

    SECTION("Unrelated network errors match nothing") {
        auto signals = FailureClassifier::classifyFailure("ERROR: Unable to download webpage: connection reset", config);
        REQUIRE_FALSE(signals.ipBlocked);
        REQUIRE_FALSE(signals.authenticationRequired);
        REQUIRE_FALSE(signals.permanent);
    }

    SECTION("Signatures come from configuration") {
        config.blockSignatures = {"captcha"};
        REQUIRE(FailureClassifier::classifyFailure("Solve the CAPTCHA to continue", config).ipBlocked);
        REQUIRE_FALSE(FailureClassifier::classifyFailure("HTTP Error 403", config).ipBlocked);
    }
}

TEST_CASE("FailureClassifier maps outcomes to failure types", "[FailureClassifier]") {
    DownloadConfig config;

    SECTION("Missing tool is a configuration failure") {
        auto outcome = failure("yt-dlp: not found");
        outcome.toolMissing = true;
        REQUIRE(FailureClassifier::classifyOutcome(outcome, config) == FailureType::CONFIGURATION);
    }

    SECTION("Timeout hint wins over text") {
        auto outcome = failure("HTTP Error 403");
        outcome.timedOut = true;
        REQUIRE(FailureClassifier::classifyOutcome(outcome, config) == FailureType::TIMEOUT);
    }

    SECTION("Geo restrictions are blocks even when the video is reported unavailable") {
        auto outcome = failure("ERROR: Video unavailable. The uploader has not made this video available in your country");
        REQUIRE(FailureClassifier::classifyOutcome(outcome, config) == FailureType::ACCESS_BLOCKED);
    }

    SECTION("Login prompts are authentication failures") {
        auto outcome = failure("ERROR: [instagram] abc: Login required to access this post. Use --cookies");
        REQUIRE(FailureClassifier::classifyOutcome(outcome, config) == FailureType::AUTHENTICATION);
    }

    SECTION("Removed content is permanent") {
        REQUIRE(FailureClassifier::classifyOutcome(failure("ERROR: HTTP Error 404: Not Found"), config) == FailureType::PERMANENT);
    }

    SECTION("Anything else is transient") {
        REQUIRE(FailureClassifier::classifyOutcome(failure("ERROR: giving up after 10 fragment retries"), config) ==
                FailureType::TRANSIENT);
    }
}

TEST_CASE("FailureClassifier retry budget and backoff", "[FailureClassifier]") {
    DownloadConfig config;
    config.maxRetries = 2;
    config.blockedBackoffRetries = 1;
    config.baseRetryDelay = std::chrono::milliseconds(1000);
    config.backoffMultiplier = 2.0f;
    config.blockedBackoffBase = std::chrono::milliseconds(2000);
    config.maxRetryDelay = std::chrono::milliseconds(5000);

    SECTION("Transient and timeout failures retry up to maxRetries") {
        REQUIRE(FailureClassifier::shouldRetry(FailureType::TRANSIENT, 0, config));
        REQUIRE(FailureClassifier::shouldRetry(FailureType::TIMEOUT, 1, config));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::TRANSIENT, 2, config));
    }

    SECTION("Blocked failures use their own budget") {
        REQUIRE(FailureClassifier::shouldRetry(FailureType::ACCESS_BLOCKED, 0, config));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::ACCESS_BLOCKED, 1, config));
    }

    SECTION("Other failures never retry the same backend") {
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::AUTHENTICATION, 0, config));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::CONFIGURATION, 0, config));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::PERMANENT, 0, config));
    }

    SECTION("Delays grow exponentially and are capped") {
        using std::chrono::milliseconds;
        REQUIRE(FailureClassifier::calculateRetryDelay(1, config, FailureType::TRANSIENT) == milliseconds(1000));
        REQUIRE(FailureClassifier::calculateRetryDelay(2, config, FailureType::TRANSIENT) == milliseconds(2000));
        REQUIRE(FailureClassifier::calculateRetryDelay(4, config, FailureType::TRANSIENT) == milliseconds(5000));
        REQUIRE(FailureClassifier::calculateRetryDelay(1, config, FailureType::ACCESS_BLOCKED) == milliseconds(2000));
        REQUIRE(FailureClassifier::calculateRetryDelay(2, config, FailureType::ACCESS_BLOCKED) == milliseconds(4000));
    }
}
