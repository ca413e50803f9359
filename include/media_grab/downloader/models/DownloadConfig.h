#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace media_grab::downloader {

// Thrown for invalid or unknown configuration keys
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

enum class Quality {
    MOBILE,
    LOW,
    MEDIUM,
    HD,
    UHD_4K,
    BEST
};

struct DownloadConfig {
    // === USER OPTIONS ===
    Quality quality = Quality::HD;
    std::optional<int> customBitrate;  // kbps
    int maxRetries = 2;                // same-backend retries after a transient failure
    bool skipRecentWindow = false;     // bulk: skip sources downloaded within recentWindowHours
    bool forceAllBackends = false;     // use the full strategy list instead of the first few
    std::string proxyConfigPath;

    // === BACKENDS ===
    std::string outputTemplate = "%(title).150B-%(id)s.%(ext)s";
    std::chrono::seconds backendTimeout{1800};
    size_t defaultBackendCount = 3;
    std::string userAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
    // Backend tool name -> executable path. Missing entries are looked up on PATH.
    std::map<std::string, std::string> toolPaths;

    // === COOKIES ===
    std::string cookiesDirectory = "cookies";
    std::string convenienceCookieFile;  // empty: ~/Desktop/cookies.txt

    // === RETRY / BACKOFF ===
    std::chrono::milliseconds baseRetryDelay{1000};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{30000};
    std::chrono::milliseconds blockedBackoffBase{2000};
    int blockedBackoffRetries = 2;
    std::chrono::seconds urlTimeBudget{0};       // 0: no per-URL wall-clock bound
    std::chrono::seconds cancelGracePeriod{0};   // 0: never terminate an in-flight backend

    // === RATE LIMITING ===
    std::chrono::milliseconds defaultRateLimit{3000};
    // Domain suffix -> minimum interval between calls
    std::map<std::string, std::chrono::milliseconds> rateLimits = {
        {"youtube.com", std::chrono::milliseconds(3000)},
        {"youtu.be", std::chrono::milliseconds(3000)},
        {"instagram.com", std::chrono::milliseconds(5000)},
        {"tiktok.com", std::chrono::milliseconds(4000)},
        {"facebook.com", std::chrono::milliseconds(6000)},
        {"fb.watch", std::chrono::milliseconds(6000)},
        {"twitter.com", std::chrono::milliseconds(3000)},
        {"x.com", std::chrono::milliseconds(3000)}
    };

    // === FAILURE SIGNATURES (lower-case substrings) ===
    std::vector<std::string> blockSignatures = {
        "ip address is blocked",
        "your ip",
        "not available in your country",
        "not available in your region",
        "not made this video available in your country",
        "geo restricted",
        "geo-restricted",
        "georestricted",
        "http error 403",
        "403 forbidden",
        "forbidden",
        "access denied",
        "too many requests",
        "http error 429",
        "rate-limit reached"
    };
    std::vector<std::string> authSignatures = {
        "login required",
        "log in",
        "sign in to confirm",
        "use --cookies",
        "cookies are no longer valid",
        "http error 401",
        "unauthorized",
        "checkpoint required",
        "session expired"
    };
    std::vector<std::string> permanentSignatures = {
        "video unavailable",
        "has been removed",
        "copyright claim",
        "copyright grounds",
        "this video is private",
        "http error 404",
        "404 not found",
        "unsupported url",
        "no video formats found",
        "does not exist"
    };

    // === BULK MODE ===
    int recentWindowHours = 24;
    size_t maxLinksPerSource = 0;  // 0: all links

    // === LOGGING ===
    std::string logLevel = "INFO";
    std::string logFile;

    // yt-dlp format string for the selected quality, with the bitrate cap if set
    std::string formatSpec() const;

    // Throws ConfigError on unknown keys or ill-typed / out-of-range values
    static DownloadConfig fromJson(const nlohmann::json& json);
    static DownloadConfig fromFile(const std::string& path);

    // Throws ConfigError when a field is out of range
    void validate() const;
};

Quality parseQuality(const std::string& name);
std::string qualityToFormat(Quality quality);

} // namespace media_grab::downloader
