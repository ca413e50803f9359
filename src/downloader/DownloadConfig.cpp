#include "../../include/media_grab/downloader/models/DownloadConfig.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <fstream>
#include <functional>

namespace media_grab::downloader {

namespace {

std::vector<std::string> lowerAll(std::vector<std::string> values) {
    for (auto& v : values) {
        v = common::toLowerAscii(v);
    }
    return values;
}

template <typename T>
T readValue(const nlohmann::json& json, const std::string& key) {
    try {
        return json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

} // namespace

Quality parseQuality(const std::string& name) {
    const std::string lower = common::toLowerAscii(name);

    if (lower == "mobile") return Quality::MOBILE;
    if (lower == "low") return Quality::LOW;
    if (lower == "medium") return Quality::MEDIUM;
    if (lower == "hd") return Quality::HD;
    if (lower == "4k") return Quality::UHD_4K;
    if (lower == "best") return Quality::BEST;
    throw ConfigError("Unknown quality '" + name + "' (expected mobile, low, medium, hd, 4k or best)");
}

std::string qualityToFormat(Quality quality) {
    switch (quality) {
        case Quality::MOBILE:
        case Quality::LOW:
            return "bestvideo[height<=480][ext=mp4]+bestaudio/best[height<=480]";
        case Quality::MEDIUM:
            return "bestvideo[height<=720][ext=mp4]+bestaudio/best[height<=720]";
        case Quality::HD:
            return "bestvideo[height<=1080][ext=mp4]+bestaudio/best[height<=1080]";
        case Quality::UHD_4K:
            return "bestvideo[height<=2160][ext=mp4]+bestaudio/best[height<=2160]";
        case Quality::BEST:
        default:
            return "bestvideo+bestaudio/best";
    }
}

std::string DownloadConfig::formatSpec() const {
    std::string format = qualityToFormat(quality);
    if (customBitrate && *customBitrate > 0) {
        format = "best[tbr<=" + std::to_string(*customBitrate) + "]/" + format;
    }
    return format;
}

void DownloadConfig::validate() const {
    if (maxRetries < 0) {
        throw ConfigError("maxRetries must not be negative");
    }
    if (customBitrate && *customBitrate <= 0) {
        throw ConfigError("customBitrate must be a positive number of kbps");
    }
    if (backendTimeout.count() <= 0) {
        throw ConfigError("backendTimeoutSeconds must be positive");
    }
    if (defaultBackendCount == 0) {
        throw ConfigError("defaultBackendCount must be at least 1");
    }
    if (backoffMultiplier < 1.0f) {
        throw ConfigError("backoffMultiplier must be >= 1");
    }
    if (blockedBackoffRetries < 0) {
        throw ConfigError("blockedBackoffRetries must not be negative");
    }
    if (recentWindowHours <= 0) {
        throw ConfigError("recentWindowHours must be positive");
    }
    if (defaultRateLimit.count() < 0) {
        throw ConfigError("defaultRateLimitMs must not be negative");
    }
    for (const auto& [domain, interval] : rateLimits) {
        if (interval.count() < 0) {
            throw ConfigError("rate limit for '" + domain + "' must not be negative");
        }
    }
}

DownloadConfig DownloadConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    DownloadConfig config;

    using Handler = std::function<void(const nlohmann::json&, const std::string&)>;
    const std::map<std::string, Handler> handlers = {
        {"quality", [&](const nlohmann::json& j, const std::string& k) { config.quality = parseQuality(readValue<std::string>(j, k)); }},
        {"customBitrate", [&](const nlohmann::json& j, const std::string& k) {
            if (j.at(k).is_null()) {
                config.customBitrate.reset();
            } else {
                config.customBitrate = readValue<int>(j, k);
            }
        }},
        {"maxRetries", [&](const nlohmann::json& j, const std::string& k) { config.maxRetries = readValue<int>(j, k); }},
        {"skipRecentWindow", [&](const nlohmann::json& j, const std::string& k) { config.skipRecentWindow = readValue<bool>(j, k); }},
        {"forceAllBackends", [&](const nlohmann::json& j, const std::string& k) { config.forceAllBackends = readValue<bool>(j, k); }},
        {"proxyConfigPath", [&](const nlohmann::json& j, const std::string& k) { config.proxyConfigPath = readValue<std::string>(j, k); }},
        {"outputTemplate", [&](const nlohmann::json& j, const std::string& k) { config.outputTemplate = readValue<std::string>(j, k); }},
        {"backendTimeoutSeconds", [&](const nlohmann::json& j, const std::string& k) { config.backendTimeout = std::chrono::seconds(readValue<long>(j, k)); }},
        {"defaultBackendCount", [&](const nlohmann::json& j, const std::string& k) { config.defaultBackendCount = readValue<size_t>(j, k); }},
        {"userAgent", [&](const nlohmann::json& j, const std::string& k) { config.userAgent = readValue<std::string>(j, k); }},
        {"toolPaths", [&](const nlohmann::json& j, const std::string& k) { config.toolPaths = readValue<std::map<std::string, std::string>>(j, k); }},
        {"cookiesDirectory", [&](const nlohmann::json& j, const std::string& k) { config.cookiesDirectory = readValue<std::string>(j, k); }},
        {"convenienceCookieFile", [&](const nlohmann::json& j, const std::string& k) { config.convenienceCookieFile = readValue<std::string>(j, k); }},
        {"baseRetryDelayMs", [&](const nlohmann::json& j, const std::string& k) { config.baseRetryDelay = std::chrono::milliseconds(readValue<long>(j, k)); }},
        {"backoffMultiplier", [&](const nlohmann::json& j, const std::string& k) { config.backoffMultiplier = readValue<float>(j, k); }},
        {"maxRetryDelayMs", [&](const nlohmann::json& j, const std::string& k) { config.maxRetryDelay = std::chrono::milliseconds(readValue<long>(j, k)); }},
        {"blockedBackoffBaseMs", [&](const nlohmann::json& j, const std::string& k) { config.blockedBackoffBase = std::chrono::milliseconds(readValue<long>(j, k)); }},
        {"blockedBackoffRetries", [&](const nlohmann::json& j, const std::string& k) { config.blockedBackoffRetries = readValue<int>(j, k); }},
        {"urlTimeBudgetSeconds", [&](const nlohmann::json& j, const std::string& k) { config.urlTimeBudget = std::chrono::seconds(readValue<long>(j, k)); }},
        {"cancelGracePeriodSeconds", [&](const nlohmann::json& j, const std::string& k) { config.cancelGracePeriod = std::chrono::seconds(readValue<long>(j, k)); }},
        {"defaultRateLimitMs", [&](const nlohmann::json& j, const std::string& k) { config.defaultRateLimit = std::chrono::milliseconds(readValue<long>(j, k)); }},
        {"rateLimits", [&](const nlohmann::json& j, const std::string& k) {
            config.rateLimits.clear();
            for (const auto& [domain, ms] : readValue<std::map<std::string, long>>(j, k)) {
                config.rateLimits[domain] = std::chrono::milliseconds(ms);
            }
        }},
        {"blockSignatures", [&](const nlohmann::json& j, const std::string& k) { config.blockSignatures = lowerAll(readValue<std::vector<std::string>>(j, k)); }},
        {"authSignatures", [&](const nlohmann::json& j, const std::string& k) { config.authSignatures = lowerAll(readValue<std::vector<std::string>>(j, k)); }},
        {"permanentSignatures", [&](const nlohmann::json& j, const std::string& k) { config.permanentSignatures = lowerAll(readValue<std::vector<std::string>>(j, k)); }},
        {"recentWindowHours", [&](const nlohmann::json& j, const std::string& k) { config.recentWindowHours = readValue<int>(j, k); }},
        {"maxLinksPerSource", [&](const nlohmann::json& j, const std::string& k) { config.maxLinksPerSource = readValue<size_t>(j, k); }},
        {"logLevel", [&](const nlohmann::json& j, const std::string& k) { config.logLevel = readValue<std::string>(j, k); }},
        {"logFile", [&](const nlohmann::json& j, const std::string& k) { config.logFile = readValue<std::string>(j, k); }},
    };

    std::vector<std::string> unknown;
    for (const auto& item : json.items()) {
        auto it = handlers.find(item.key());
        if (it == handlers.end()) {
            unknown.push_back(item.key());
            continue;
        }
        it->second(json, item.key());
    }

    if (!unknown.empty()) {
        std::string joined;
        for (const auto& key : unknown) {
            if (!joined.empty()) joined += ", ";
            joined += key;
        }
        throw ConfigError("Unknown configuration key(s): " + joined);
    }

    config.validate();
    return config;
}

DownloadConfig DownloadConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open configuration file: " + path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path + ": " + e.what());
    }

    LOG_DEBUG("Loaded configuration from " + path);
    return fromJson(json);
}

} // namespace media_grab::downloader
