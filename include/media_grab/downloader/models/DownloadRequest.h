#pragma once

#include <string>

namespace media_grab::downloader {

// One distinct input URL, built once at run start and never modified afterwards
struct DownloadRequest {
    std::string rawInput;      // URL as recovered from the user's input
    std::string canonicalUrl;  // tracking parameters stripped, scheme/host lower-cased
    std::string dedupKey;      // e.g. "youtube_dQw4w9WgXcQ", or canonicalUrl for unknown platforms
    std::string platformTag;   // youtube | instagram | tiktok | facebook | twitter | other
    std::string sourceName;    // originating bulk source, empty in single mode
};

} // namespace media_grab::downloader
