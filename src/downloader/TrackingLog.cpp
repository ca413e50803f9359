#include "TrackingLog.h"
#include "UrlNormalizer.h"
#include "../../include/Logger.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace media_grab::downloader {

TrackingLog::TrackingLog(std::string path) : path_(std::move(path)) {
    load();
}

void TrackingLog::load() {
    std::ifstream in(path_);
    if (!in) {
        LOG_DEBUG("No tracking log at " + path_ + ", starting empty");
        return;
    }

    std::string line;
    while (std::getline(in, line)) {
        size_t end = line.find_last_not_of(" \t\r");
        if (end == std::string::npos) {
            continue;
        }
        line.erase(end + 1);
        size_t start = line.find_first_not_of(" \t");
        line = line.substr(start);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        // Older logs may hold full URLs; reduce them to the same key space
        keys_.insert(UrlNormalizer::canonicalize(line));
    }
    LOG_INFO("Loaded " + std::to_string(keys_.size()) + " tracked download(s) from " + path_);
}

bool TrackingLog::isAlreadyDownloaded(const std::string& dedupKey) const {
    return keys_.count(dedupKey) > 0;
}

Result<bool> TrackingLog::markDownloaded(const std::string& dedupKey) {
    keys_.insert(dedupKey);

    int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::string message = "Cannot open tracking log " + path_ + ": " + std::strerror(errno);
        LOG_ERROR(message);
        return Result<bool>::Failure(message);
    }

    if (::flock(fd, LOCK_EX) != 0) {
        std::string message = "Cannot lock tracking log " + path_ + ": " + std::strerror(errno);
        ::close(fd);
        LOG_ERROR(message);
        return Result<bool>::Failure(message);
    }

    const std::string line = dedupKey + "\n";
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string message = "Cannot append to tracking log " + path_ + ": " + std::strerror(errno);
            ::flock(fd, LOCK_UN);
            ::close(fd);
            LOG_ERROR(message);
            return Result<bool>::Failure(message);
        }
        written += static_cast<size_t>(n);
    }

    bool synced = ::fsync(fd) == 0;
    int syncError = errno;
    ::flock(fd, LOCK_UN);
    ::close(fd);

    if (!synced) {
        std::string message = "Cannot sync tracking log " + path_ + ": " + std::strerror(syncError);
        LOG_WARNING(message);
        return Result<bool>::Failure(message);
    }

    LOG_DEBUG("Tracked " + dedupKey);
    return Result<bool>::Success(true);
}

} // namespace media_grab::downloader
