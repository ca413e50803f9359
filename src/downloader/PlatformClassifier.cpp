#include "PlatformClassifier.h"
#include "UrlNormalizer.h"
#include "../../include/Logger.h"

namespace media_grab::downloader {

namespace {

// host equals domain or is a subdomain of it
bool hostMatches(const std::string& host, const std::string& domain) {
    if (host == domain) {
        return true;
    }
    return host.size() > domain.size() &&
           host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
           host[host.size() - domain.size() - 1] == '.';
}

struct PlatformHosts {
    std::string tag;
    std::vector<std::string> hosts;
};

const std::vector<PlatformHosts>& platformHosts() {
    static const std::vector<PlatformHosts> table = {
        {platform::YOUTUBE, {"youtube.com", "youtu.be", "youtube-nocookie.com"}},
        {platform::INSTAGRAM, {"instagram.com", "instagr.am"}},
        {platform::TIKTOK, {"tiktok.com"}},
        {platform::FACEBOOK, {"facebook.com", "fb.com", "fb.watch"}},
        {platform::TWITTER, {"twitter.com", "x.com"}},
    };
    return table;
}

} // namespace

std::string PlatformClassifier::classify(const std::string& url) {
    // Without a scheme or a dot there is no host to match (e.g. a dedup key)
    if (url.find("://") == std::string::npos && url.find('.') == std::string::npos) {
        return platform::OTHER;
    }

    const std::string host = UrlNormalizer::extractDomain(url);
    for (const auto& entry : platformHosts()) {
        for (const auto& domain : entry.hosts) {
            if (hostMatches(host, domain)) {
                return entry.tag;
            }
        }
    }
    return platform::OTHER;
}

const std::vector<std::string>& PlatformClassifier::knownPlatforms() {
    static const std::vector<std::string> all = {
        platform::YOUTUBE, platform::INSTAGRAM, platform::TIKTOK,
        platform::FACEBOOK, platform::TWITTER, platform::OTHER
    };
    return all;
}

StrategyTable::StrategyTable() : table_(defaultTable()) {
}

StrategyTable::StrategyTable(std::map<std::string, std::vector<std::string>> table) : table_(std::move(table)) {
}

std::map<std::string, std::vector<std::string>> StrategyTable::defaultTable() {
    return {
        {platform::YOUTUBE, {"yt-dlp", "yt-dlp-compat", "ffmpeg-stream", "yt-dlp-generic"}},
        {platform::INSTAGRAM, {"yt-dlp", "instaloader", "gallery-dl", "yt-dlp-compat", "ffmpeg-stream"}},
        {platform::TIKTOK, {"yt-dlp", "yt-dlp-compat", "gallery-dl", "ffmpeg-stream"}},
        {platform::FACEBOOK, {"yt-dlp", "yt-dlp-compat", "ffmpeg-stream", "yt-dlp-generic"}},
        {platform::TWITTER, {"yt-dlp", "gallery-dl", "yt-dlp-compat", "ffmpeg-stream"}},
        {platform::OTHER, {"yt-dlp", "direct-http", "yt-dlp-generic", "ffmpeg-stream"}},
    };
}

std::vector<std::string> StrategyTable::backendsFor(const std::string& platformTag, bool thorough, size_t defaultCount) const {
    auto it = table_.find(platformTag);
    if (it == table_.end()) {
        it = table_.find(platform::OTHER);
        if (it == table_.end()) {
            LOG_WARNING("No strategy configured for platform '" + platformTag + "'");
            return {};
        }
    }

    std::vector<std::string> backends = it->second;
    if (!thorough && backends.size() > defaultCount) {
        backends.resize(defaultCount);
    }
    return backends;
}

void StrategyTable::setBackends(const std::string& platformTag, std::vector<std::string> backends) {
    table_[platformTag] = std::move(backends);
}

} // namespace media_grab::downloader
