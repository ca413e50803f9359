#pragma once

#include <string>
#include <vector>
#include "../../include/infrastructure.h"

namespace media_grab::downloader {

// One sub-folder of a bulk root holding a links file
struct BulkSource {
    std::string name;       // folder name, used as the history key
    std::string folder;     // media is saved here
    std::string linksFile;
};

class SourceList {
public:
    /**
     * Sources under a bulk root, sorted by name. A folder qualifies when it
     * holds a "*links*.txt" file, otherwise its first other visible .txt file
     * that is not a cookie file.
     */
    static std::vector<BulkSource> scan(const std::string& root);

    /**
     * URLs listed in a source's links file, in file order, deduplicated.
     * @param maxLinks 0 for all
     */
    static std::vector<std::string> readLinks(const BulkSource& source, size_t maxLinks = 0);

    /**
     * Rewrite a links file without the lines naming any of the given URLs
     * (compared by dedup key). Other lines, comments included, are kept.
     * @return Number of lines removed
     */
    static Result<int> removeDownloaded(const std::string& linksFile, const std::vector<std::string>& urls);

private:
    static std::string findLinksFile(const std::string& folder);
};

} // namespace media_grab::downloader
