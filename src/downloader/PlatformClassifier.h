#pragma once

#include <map>
#include <string>
#include <vector>

namespace media_grab::downloader {

namespace platform {
inline const std::string YOUTUBE = "youtube";
inline const std::string INSTAGRAM = "instagram";
inline const std::string TIKTOK = "tiktok";
inline const std::string FACEBOOK = "facebook";
inline const std::string TWITTER = "twitter";
inline const std::string OTHER = "other";
}

class PlatformClassifier {
public:
    // Platform tag for a URL, "other" when the host is not recognized
    static std::string classify(const std::string& url);

    // All tags of the closed enumeration, "other" last
    static const std::vector<std::string>& knownPlatforms();
};

/**
 * Ordered backend names per platform, fastest / most reliable first.
 * Reordering or adding backends is a change to this table only.
 */
class StrategyTable {
public:
    StrategyTable();
    explicit StrategyTable(std::map<std::string, std::vector<std::string>> table);

    /**
     * Backends to try for a platform.
     * @param platformTag Tag from PlatformClassifier::classify
     * @param thorough When true the full list is returned
     * @param defaultCount Number of entries kept when not thorough
     */
    std::vector<std::string> backendsFor(const std::string& platformTag, bool thorough, size_t defaultCount) const;

    void setBackends(const std::string& platformTag, std::vector<std::string> backends);

    static std::map<std::string, std::vector<std::string>> defaultTable();

private:
    std::map<std::string, std::vector<std::string>> table_;
};

} // namespace media_grab::downloader
