#include "CookieResolver.h"
#include "PlatformClassifier.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>

namespace fs = std::filesystem;

namespace media_grab::downloader {

namespace {

// Smaller files are leftovers or placeholders, never a real cookie jar
constexpr uintmax_t MIN_COOKIE_FILE_SIZE = 10;

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string cookieDomain(const std::string& platformTag) {
    if (platformTag == platform::YOUTUBE) return ".youtube.com";
    if (platformTag == platform::INSTAGRAM) return ".instagram.com";
    if (platformTag == platform::TIKTOK) return ".tiktok.com";
    if (platformTag == platform::FACEBOOK) return ".facebook.com";
    if (platformTag == platform::TWITTER) return ".twitter.com";
    return "";
}

bool isUsable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    auto size = fs::file_size(path, ec);
    return !ec && size > MIN_COOKIE_FILE_SIZE;
}

bool isCookieFileName(const std::string& name) {
    const std::string lower = common::toLowerAscii(name);
    return lower.find("cookie") != std::string::npos && fs::path(lower).extension() == ".txt";
}

// Regular *cookie*.txt files of a directory, sorted by name
std::vector<fs::path> cookieFilesIn(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && isCookieFileName(entry.path().filename().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

CookieResolver::CookieResolver(const DownloadConfig& config, std::string cacheDirectory)
    : cookiesDirectory_(config.cookiesDirectory),
      convenienceCookieFile_(config.convenienceCookieFile),
      cacheDirectory_(std::move(cacheDirectory)) {
    if (cacheDirectory_.empty()) {
        std::error_code ec;
        fs::path tmp = fs::temp_directory_path(ec);
        cacheDirectory_ = ((ec ? fs::path("/tmp") : tmp) / "media_grab_cookie_cache").string();
    }
}

const std::vector<std::string>& CookieResolver::platformAliases(const std::string& platformTag) {
    static const std::map<std::string, std::vector<std::string>> aliases = {
        {platform::YOUTUBE, {"youtube", "yt"}},
        {platform::INSTAGRAM, {"instagram", "ig", "insta"}},
        {platform::TIKTOK, {"tiktok", "tt"}},
        {platform::FACEBOOK, {"facebook", "fb"}},
        {platform::TWITTER, {"twitter", "x"}},
    };
    static const std::vector<std::string> none;
    auto it = aliases.find(platformTag);
    return it == aliases.end() ? none : it->second;
}

std::vector<std::string> CookieResolver::platformFileNames(const std::string& platformTag) const {
    std::vector<std::string> names;
    for (const auto& alias : platformAliases(platformTag)) {
        names.push_back(alias + ".txt");
        names.push_back(alias + "_cookies.txt");
    }
    return names;
}

bool CookieResolver::belongsToOtherPlatform(const std::string& fileName, const std::string& platformTag) const {
    const std::string lower = common::toLowerAscii(fileName);
    for (const auto& other : PlatformClassifier::knownPlatforms()) {
        if (other == platformTag) {
            continue;
        }
        for (const auto& alias : platformAliases(other)) {
            if (lower.rfind(alias + "_", 0) == 0 || lower.rfind(alias + "-", 0) == 0 || lower == alias + ".txt") {
                return true;
            }
        }
    }
    return false;
}

std::string CookieResolver::convenienceFile() const {
    if (!convenienceCookieFile_.empty()) {
        return convenienceCookieFile_;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return "";
    }
    return (fs::path(home) / "Desktop" / "cookies.txt").string();
}

std::vector<std::string> CookieResolver::resolve(const std::string& url, const std::string& sourceFolder) const {
    const std::string platformTag = PlatformClassifier::classify(url);
    const fs::path dir(cookiesDirectory_);

    std::vector<fs::path> ordered;
    ordered.push_back(dir / "cookies.txt");
    for (const auto& name : platformFileNames(platformTag)) {
        ordered.push_back(dir / name);
    }
    for (const auto& file : cookieFilesIn(dir)) {
        if (!belongsToOtherPlatform(file.filename().string(), platformTag)) {
            ordered.push_back(file);
        }
    }
    const std::string convenience = convenienceFile();
    if (!convenience.empty()) {
        ordered.push_back(convenience);
    }
    if (!sourceFolder.empty()) {
        ordered.push_back(fs::path(sourceFolder) / "cookies.txt");
        for (const auto& file : cookieFilesIn(sourceFolder)) {
            ordered.push_back(file);
        }
    }

    std::vector<std::string> candidates;
    std::vector<fs::path> seen;
    for (const auto& path : ordered) {
        if (!isUsable(path)) {
            continue;
        }
        std::error_code ec;
        fs::path key = fs::weakly_canonical(path, ec);
        if (ec) {
            key = path.lexically_normal();
        }
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            continue;
        }
        seen.push_back(key);

        if (auto usable = ensureNetscape(path.string(), platformTag)) {
            candidates.push_back(*usable);
        } else {
            LOG_DEBUG("Cookie file not usable for " + platformTag + ": " + path.string());
        }
    }

    LOG_DEBUG("Resolved " + std::to_string(candidates.size()) + " cookie candidate(s) for " + url);
    return candidates;
}

std::optional<std::string> CookieResolver::ensureNetscape(const std::string& path, const std::string& platformTag) const {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    std::string firstData;
    for (const auto& l : lines) {
        std::string stripped = trim(l);
        if (!stripped.empty() && stripped[0] != '#') {
            firstData = stripped;
            break;
        }
    }
    if (lines.empty()) {
        return std::nullopt;
    }
    if (trim(lines.front()).rfind("# Netscape", 0) == 0 ||
        std::count(firstData.begin(), firstData.end(), '\t') >= 6) {
        return path;
    }
    if (firstData.empty()) {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& l : lines) {
        std::string stripped = trim(l);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        if (stripped.find('\t') != std::string::npos) {
            // Partial Netscape layout, not something we can convert safely
            return std::nullopt;
        }
        size_t sep = stripped.find('=');
        if (sep == std::string::npos) {
            sep = stripped.find(' ');
        }
        if (sep == std::string::npos) {
            continue;
        }
        std::string name = trim(stripped.substr(0, sep));
        std::string value = trim(stripped.substr(sep + 1));
        if (!name.empty() && !value.empty()) {
            entries.emplace_back(name, value);
        }
    }

    const std::string domain = cookieDomain(platformTag);
    if (entries.empty() || domain.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::create_directories(cacheDirectory_, ec);
    if (ec) {
        LOG_WARNING("Cannot create cookie cache directory " + cacheDirectory_ + ": " + ec.message());
        return std::nullopt;
    }

    const size_t digest = std::hash<std::string>{}(path + platformTag);
    const fs::path converted = fs::path(cacheDirectory_) / (std::to_string(digest) + ".txt");
    const auto expiry = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() + 365LL * 24 * 60 * 60;

    std::ofstream out(converted, std::ios::trunc);
    if (!out) {
        LOG_WARNING("Cannot write converted cookie file " + converted.string());
        return std::nullopt;
    }
    out << "# Netscape HTTP Cookie File\n";
    out << "# Converted from " << path << "\n\n";
    for (const auto& [name, value] : entries) {
        out << domain << "\tTRUE\t/\tTRUE\t" << expiry << "\t" << name << "\t" << value << "\n";
    }
    out.close();
    if (!out) {
        LOG_WARNING("Failed writing converted cookie file " + converted.string());
        return std::nullopt;
    }

    LOG_DEBUG("Converted simple cookie file " + path + " -> " + converted.string());
    return converted.string();
}

} // namespace media_grab::downloader
