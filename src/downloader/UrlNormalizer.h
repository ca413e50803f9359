#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../include/media_grab/downloader/models/DownloadRequest.h"

namespace media_grab::downloader {

// A structured link entry, e.g. one row produced by a link grabber
struct LinkRecord {
    std::string url;
    std::string source;
};

class UrlNormalizer {
public:
    /**
     * Recover URL-like tokens from free text. Tokens are separated by whitespace,
     * commas or semicolons; surrounding punctuation and zero-width characters are
     * ignored and a bare "www." prefix gets an https scheme.
     * @return URLs in first-seen order, one per dedup key
     */
    static std::vector<std::string> extract(const std::string& text);

    // Same as above for structured records; records without a URL are ignored
    static std::vector<std::string> extract(const std::vector<LinkRecord>& records);

    // JSON array of strings or of objects carrying a "url" field
    static std::vector<std::string> extractFromJson(const nlohmann::json& json);

    /**
     * Drop tracking query parameters and the fragment, lower-case scheme and host.
     * Idempotent; non-tracking parameters keep their order.
     */
    static std::string stripTracking(const std::string& url);

    /**
     * Dedup key for a URL: "<platform>_<id>" for recognized platforms, the
     * stripped URL otherwise. canonicalize(canonicalize(x)) == canonicalize(x).
     */
    static std::string canonicalize(const std::string& url);

    // Lower-case host without "www."/"m." prefix, user info or port
    static std::string extractDomain(const std::string& url);

    /**
     * Build requests for the given URLs, skipping any whose dedup key is already
     * in seenKeys (which is updated). Used across bulk sources so a link listed
     * by two sources is only requested once.
     */
    static void appendRequests(const std::vector<std::string>& urls,
                               const std::string& sourceName,
                               std::vector<DownloadRequest>& requests,
                               std::unordered_set<std::string>& seenKeys);

private:
    static bool isTrackingParameter(const std::string& name);
    static std::optional<std::string> recoverUrl(const std::string& token, bool allowBareDomain);
    static std::vector<std::string> dedupe(const std::vector<std::string>& candidates);
};

} // namespace media_grab::downloader
