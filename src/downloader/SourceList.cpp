#include "SourceList.h"
#include "UrlNormalizer.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace media_grab::downloader {

std::string SourceList::findLinksFile(const std::string& folder) {
    std::vector<fs::path> textFiles;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || common::toLowerAscii(entry.path().extension().string()) != ".txt") {
            continue;
        }
        textFiles.push_back(entry.path());
    }
    std::sort(textFiles.begin(), textFiles.end());

    for (const auto& file : textFiles) {
        if (common::toLowerAscii(file.filename().string()).find("links") != std::string::npos) {
            return file.string();
        }
    }
    for (const auto& file : textFiles) {
        if (common::toLowerAscii(file.filename().string()).find("cookie") == std::string::npos) {
            return file.string();
        }
    }
    return "";
}

std::vector<BulkSource> SourceList::scan(const std::string& root) {
    std::vector<BulkSource> sources;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_WARNING("Bulk root is not a directory: " + root);
        return sources;
    }

    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        std::string linksFile = findLinksFile(entry.path().string());
        if (linksFile.empty()) {
            LOG_DEBUG("No links file in " + entry.path().string());
            continue;
        }
        sources.push_back({name, entry.path().string(), linksFile});
    }

    std::sort(sources.begin(), sources.end(), [](const BulkSource& a, const BulkSource& b) {
        return a.name < b.name;
    });
    LOG_INFO("Found " + std::to_string(sources.size()) + " source folder(s) in " + root);
    return sources;
}

std::vector<std::string> SourceList::readLinks(const BulkSource& source, size_t maxLinks) {
    std::ifstream in(source.linksFile);
    if (!in) {
        LOG_WARNING("Cannot read links file " + source.linksFile);
        return {};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::vector<std::string> links = UrlNormalizer::extract(buffer.str());
    if (maxLinks > 0 && links.size() > maxLinks) {
        LOG_INFO("Source " + source.name + ": taking " + std::to_string(maxLinks) + " of " +
                 std::to_string(links.size()) + " links");
        links.resize(maxLinks);
    }
    return links;
}

Result<int> SourceList::removeDownloaded(const std::string& linksFile, const std::vector<std::string>& urls) {
    if (urls.empty()) {
        return Result<int>::Success(0);
    }

    std::unordered_set<std::string> keys;
    for (const auto& url : urls) {
        keys.insert(UrlNormalizer::canonicalize(url));
    }

    std::ifstream in(linksFile);
    if (!in) {
        return Result<int>::Failure("Cannot read links file " + linksFile);
    }

    std::vector<std::string> kept;
    int removed = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::vector<std::string> lineUrls = UrlNormalizer::extract(line);
        bool drop = !lineUrls.empty() && std::all_of(lineUrls.begin(), lineUrls.end(), [&keys](const std::string& url) {
            return keys.count(UrlNormalizer::canonicalize(url)) > 0;
        });
        if (drop) {
            removed++;
        } else {
            kept.push_back(line);
        }
    }
    in.close();

    if (removed == 0) {
        return Result<int>::Success(0);
    }

    const std::string tempPath = linksFile + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Result<int>::Failure("Cannot write " + tempPath);
        }
        for (const auto& keptLine : kept) {
            out << keptLine << "\n";
        }
        out.close();
        if (!out) {
            return Result<int>::Failure("Failed writing " + tempPath);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, linksFile, ec);
    if (ec) {
        std::string message = "Cannot replace links file " + linksFile + ": " + ec.message();
        fs::remove(tempPath, ec);
        return Result<int>::Failure(message);
    }

    LOG_INFO("Removed " + std::to_string(removed) + " downloaded link(s) from " + linksFile);
    return Result<int>::Success(removed);
}

} // namespace media_grab::downloader
