#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../../include/media_grab/downloader/models/DownloadConfig.h"

namespace media_grab::downloader {

/**
 * Locates cookie files for a URL. Candidates are returned most preferred first:
 * shared master file, platform files, other cookie files in the cookies
 * directory, the user's convenience file, then files inside the bulk source folder.
 */
class CookieResolver {
public:
    explicit CookieResolver(const DownloadConfig& config, std::string cacheDirectory = "");

    /**
     * @param url Request URL, used to pick platform-specific files
     * @param sourceFolder Bulk source folder, empty in single mode
     * @return Existing usable files (> 10 bytes), without duplicates
     */
    std::vector<std::string> resolve(const std::string& url, const std::string& sourceFolder = "") const;

    /**
     * Returns path unchanged for a Netscape cookie file, the path of a converted
     * copy for a simple "name=value" file, or nothing when the file is unusable.
     */
    std::optional<std::string> ensureNetscape(const std::string& path, const std::string& platformTag) const;

    // Short names accepted for a platform's cookie file, e.g. "yt" for youtube
    static const std::vector<std::string>& platformAliases(const std::string& platformTag);

private:
    std::vector<std::string> platformFileNames(const std::string& platformTag) const;
    bool belongsToOtherPlatform(const std::string& fileName, const std::string& platformTag) const;
    std::string convenienceFile() const;

    std::string cookiesDirectory_;
    std::string convenienceCookieFile_;
    std::string cacheDirectory_;
};

} // namespace media_grab::downloader
