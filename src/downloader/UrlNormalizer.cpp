#include "UrlNormalizer.h"
#include "PlatformClassifier.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace media_grab::downloader {

namespace {

bool isSeparator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == ',' || c == ';';
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (isSeparator(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

// Position of the first URL marker in a token, npos if none
size_t findUrlStart(const std::string& token) {
    static const std::vector<std::string> markers = {"https://", "http://", "ftps://", "ftp://", "www."};
    const std::string lower = common::toLowerAscii(token);
    size_t best = std::string::npos;
    for (const auto& marker : markers) {
        size_t pos = lower.find(marker);
        if (pos != std::string::npos && pos < best) {
            best = pos;
        }
    }
    return best;
}

std::string firstMatch(const std::string& input, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(input, match, pattern) && match.size() > 1) {
        return match[1].str();
    }
    return "";
}

} // namespace

bool UrlNormalizer::isTrackingParameter(const std::string& name) {
    static const std::unordered_set<std::string> exact = {
        "fbclid", "gclid", "igshid", "igsh", "si", "mibextid", "_r", "_t", "ref_src", "ref_url"
    };
    const std::string lower = common::toLowerAscii(name);
    return lower.rfind("utm_", 0) == 0 || exact.count(lower) > 0;
}

std::string UrlNormalizer::stripTracking(const std::string& url) {
    std::string result = common::sanitizeUrl(url);

    size_t hashPos = result.find('#');
    if (hashPos != std::string::npos) {
        result.erase(hashPos);
    }

    std::string prefix;
    std::string path = result;
    size_t schemeEnd = result.find("://");
    if (schemeEnd != std::string::npos) {
        size_t authorityEnd = result.find_first_of("/?", schemeEnd + 3);
        if (authorityEnd == std::string::npos) {
            authorityEnd = result.size();
        }
        prefix = common::toLowerAscii(result.substr(0, authorityEnd));
        path = result.substr(authorityEnd);
    }

    std::string query;
    size_t queryPos = path.find('?');
    if (queryPos != std::string::npos) {
        query = path.substr(queryPos + 1);
        path.erase(queryPos);
    }

    // Trailing slashes on a path are not significant for media pages
    while (!prefix.empty() && path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    std::string keptQuery;
    std::stringstream params(query);
    std::string param;
    while (std::getline(params, param, '&')) {
        if (param.empty()) {
            continue;
        }
        std::string name = param.substr(0, param.find('='));
        if (isTrackingParameter(name)) {
            continue;
        }
        if (!keptQuery.empty()) {
            keptQuery += '&';
        }
        keptQuery += param;
    }

    std::string stripped = prefix + path;
    if (!keptQuery.empty()) {
        stripped += "?" + keptQuery;
    }

    LOG_TRACE("UrlNormalizer::stripTracking - Original: " + url + " Stripped: " + stripped);
    return stripped;
}

std::string UrlNormalizer::canonicalize(const std::string& url) {
    static const std::regex tiktokVideo(R"(/video/(\d+))");
    static const std::regex youtubeQuery(R"([?&]v=([A-Za-z0-9_-]{11}))");
    static const std::regex youtubePath(R"(/(?:shorts|embed|live|v)/([A-Za-z0-9_-]{11}))");
    static const std::regex youtubeShort(R"(youtu\.be/([A-Za-z0-9_-]{11}))");
    static const std::regex instagramPost(R"(/(?:p|reels?|tv)/([A-Za-z0-9_-]+))");
    static const std::regex twitterStatus(R"(/status(?:es)?/(\d+))");
    static const std::regex facebookVideo(R"(/(?:videos/(?:[^/?]+/)?|reel/|watch/?\?v=)(\d+))");
    static const std::regex facebookQuery(R"([?&]v=(\d+))");

    const std::string stripped = stripTracking(url);
    const std::string tag = PlatformClassifier::classify(stripped);

    std::string id;
    if (tag == platform::TIKTOK) {
        id = firstMatch(stripped, tiktokVideo);
    } else if (tag == platform::YOUTUBE) {
        id = firstMatch(stripped, youtubeShort);
        if (id.empty()) id = firstMatch(stripped, youtubeQuery);
        if (id.empty()) id = firstMatch(stripped, youtubePath);
    } else if (tag == platform::INSTAGRAM) {
        id = firstMatch(stripped, instagramPost);
    } else if (tag == platform::TWITTER) {
        id = firstMatch(stripped, twitterStatus);
    } else if (tag == platform::FACEBOOK) {
        id = firstMatch(stripped, facebookVideo);
        if (id.empty()) id = firstMatch(stripped, facebookQuery);
    }

    if (id.empty()) {
        return stripped;
    }
    return tag + "_" + id;
}

std::string UrlNormalizer::extractDomain(const std::string& url) {
    std::string host = url;
    size_t schemeEnd = host.find("://");
    if (schemeEnd != std::string::npos) {
        host = host.substr(schemeEnd + 3);
    }

    size_t authorityEnd = host.find_first_of("/?#");
    if (authorityEnd != std::string::npos) {
        host.erase(authorityEnd);
    }

    size_t at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }

    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host.erase(colon);
    }

    host = common::toLowerAscii(host);
    if (host.rfind("www.", 0) == 0) {
        host = host.substr(4);
    } else if (host.rfind("m.", 0) == 0) {
        host = host.substr(2);
    }
    return host;
}

std::optional<std::string> UrlNormalizer::recoverUrl(const std::string& token, bool allowBareDomain) {
    static const std::regex bareDomain(R"(^[\w.-]+\.[A-Za-z]{2,}(/[\w./?=&%+#:~@-]*)?$)");

    std::string candidate;
    size_t start = findUrlStart(token);
    if (start != std::string::npos) {
        candidate = token.substr(start);
    } else if (allowBareDomain) {
        candidate = token;
        size_t first = candidate.find_first_not_of("(<[{'\"");
        candidate = first == std::string::npos ? "" : candidate.substr(first);
    }

    size_t cut = candidate.find_first_of("<>\"'");
    if (cut != std::string::npos) {
        candidate.erase(cut);
    }
    while (!candidate.empty() && std::string(".,;:!?)]}>'\"").find(candidate.back()) != std::string::npos) {
        candidate.pop_back();
    }
    if (candidate.empty()) {
        return std::nullopt;
    }

    size_t schemeEnd = candidate.find("://");
    if (schemeEnd == std::string::npos) {
        if (start == std::string::npos && !std::regex_match(candidate, bareDomain)) {
            return std::nullopt;
        }
        candidate = "https://" + candidate;
        schemeEnd = 5;
    }
    candidate = common::toLowerAscii(candidate.substr(0, schemeEnd)) + candidate.substr(schemeEnd);

    if (extractDomain(candidate).empty()) {
        LOG_DEBUG("UrlNormalizer::recoverUrl - Dropping token without host: " + token);
        return std::nullopt;
    }
    return candidate;
}

std::vector<std::string> UrlNormalizer::dedupe(const std::vector<std::string>& candidates) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& url : candidates) {
        if (seen.insert(canonicalize(url)).second) {
            result.push_back(url);
        } else {
            LOG_DEBUG("Duplicate link ignored: " + url);
        }
    }
    return result;
}

std::vector<std::string> UrlNormalizer::extract(const std::string& text) {
    std::string cleaned = common::stripInvisible(text);
    std::replace(cleaned.begin(), cleaned.end(), '\r', '\n');

    const std::vector<std::string> tokens = tokenize(cleaned);
    bool anyExplicit = std::any_of(tokens.begin(), tokens.end(), [](const std::string& token) {
        return findUrlStart(token) != std::string::npos;
    });

    std::vector<std::string> candidates;
    for (const auto& token : tokens) {
        if (auto url = recoverUrl(token, !anyExplicit)) {
            candidates.push_back(*url);
        }
    }

    std::vector<std::string> urls = dedupe(candidates);
    LOG_DEBUG("Extracted " + std::to_string(urls.size()) + " link(s) from " +
              std::to_string(tokens.size()) + " token(s)");
    return urls;
}

std::vector<std::string> UrlNormalizer::extract(const std::vector<LinkRecord>& records) {
    std::vector<std::string> candidates;
    for (const auto& record : records) {
        std::string cleaned = common::sanitizeUrl(record.url);
        if (cleaned.empty()) {
            continue;
        }
        if (auto url = recoverUrl(cleaned, true)) {
            candidates.push_back(*url);
        } else {
            LOG_DEBUG("Record without usable URL ignored: " + record.url);
        }
    }
    return dedupe(candidates);
}

std::vector<std::string> UrlNormalizer::extractFromJson(const nlohmann::json& json) {
    if (!json.is_array()) {
        LOG_WARNING("Link list JSON is not an array, ignoring");
        return {};
    }

    std::vector<LinkRecord> records;
    for (const auto& item : json) {
        if (item.is_string()) {
            records.push_back({item.get<std::string>(), ""});
        } else if (item.is_object() && item.contains("url") && item["url"].is_string()) {
            std::string source = item.contains("source") && item["source"].is_string()
                ? item["source"].get<std::string>() : "";
            records.push_back({item["url"].get<std::string>(), source});
        }
    }
    return extract(records);
}

void UrlNormalizer::appendRequests(const std::vector<std::string>& urls,
                                   const std::string& sourceName,
                                   std::vector<DownloadRequest>& requests,
                                   std::unordered_set<std::string>& seenKeys) {
    for (const auto& url : urls) {
        DownloadRequest request;
        request.rawInput = url;
        request.canonicalUrl = stripTracking(url);
        request.dedupKey = canonicalize(url);
        request.platformTag = PlatformClassifier::classify(request.canonicalUrl);
        request.sourceName = sourceName;

        if (!seenKeys.insert(request.dedupKey).second) {
            LOG_DEBUG("Link already requested by another source: " + url);
            continue;
        }
        requests.push_back(std::move(request));
    }
}

} // namespace media_grab::downloader
