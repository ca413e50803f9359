#include "ProgressReporter.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace media_grab::downloader {

namespace {

// "NA", "None" and empty fields mean unknown
uint64_t parseCount(const std::string& field) {
    if (field.empty() || field == "NA" || field == "None") {
        return 0;
    }
    try {
        double value = std::stod(field);
        return value > 0 ? static_cast<uint64_t>(value) : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

ProgressReporter::ProgressReporter(const DownloadEvents& events, std::function<bool()> isCancelled)
    : events_(events), isCancelled_(std::move(isCancelled)) {
}

bool ProgressReporter::active() const {
    return !(isCancelled_ && isCancelled_());
}

bool ProgressReporter::parseProgressLine(const std::string& line, uint64_t& downloaded, uint64_t& total) {
    static const std::string prefix = "progress:";
    size_t start = line.find(prefix);
    if (start == std::string::npos) {
        return false;
    }

    std::vector<std::string> fields;
    std::string rest = line.substr(start + prefix.size());
    size_t pos = 0;
    while (true) {
        size_t next = rest.find(':', pos);
        fields.push_back(rest.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    if (fields.size() < 2) {
        return false;
    }

    downloaded = parseCount(fields[0]);
    total = parseCount(fields[1]);
    if (total == 0 && fields.size() > 2) {
        total = parseCount(fields[2]);
    }
    return true;
}

void ProgressReporter::onOutputLine(const std::string& line) {
    try {
        if (!active()) {
            return;
        }
        const std::string clean = common::stripAnsiEscapes(line);
        uint64_t downloaded = 0;
        uint64_t total = 0;
        if (parseProgressLine(clean, downloaded, total)) {
            update(downloaded, total, Clock::now());
            return;
        }
        LOG_TRACE("backend: " + clean);
        events_.emitProgressLine(clean);
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Progress reporting failed: ") + e.what());
    }
}

void ProgressReporter::onBytes(uint64_t downloaded, uint64_t total) {
    try {
        update(downloaded, total, Clock::now());
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Progress reporting failed: ") + e.what());
    }
}

void ProgressReporter::update(uint64_t downloaded, uint64_t total, Clock::time_point now) {
    if (!active()) {
        return;
    }

    if (!lastSample_ || downloaded < lastBytes_) {
        lastSample_ = now;
        lastBytes_ = downloaded;
    } else {
        double seconds = std::chrono::duration<double>(now - *lastSample_).count();
        // Samples closer than this give a meaningless rate; keep the older one
        if (seconds >= 0.2) {
            double instant = static_cast<double>(downloaded - lastBytes_) / seconds;
            speed_ = speed_ <= 0.0 ? instant : SPEED_SMOOTHING * instant + (1.0 - SPEED_SMOOTHING) * speed_;
            lastSample_ = now;
            lastBytes_ = downloaded;
        }
    }

    if (total > 0) {
        int percent = static_cast<int>(std::min<uint64_t>(100, downloaded * 100 / total));
        if (!lastPercent_ || *lastPercent_ != percent) {
            lastPercent_ = percent;
            events_.emitPercent(percent);
        }
    }

    if (speed_ > 0.0) {
        events_.emitSpeed(formatSpeed(speed_));
        if (total > downloaded) {
            // A stalled transfer has no meaningful ETA
            if (speed_ < MIN_ETA_SPEED) {
                events_.emitEta("unknown");
            } else {
                double seconds = std::min(std::ceil((total - downloaded) / speed_), MAX_ETA_SECONDS);
                events_.emitEta(formatEta(std::chrono::seconds(static_cast<long>(seconds))));
            }
        }
    }
}

void ProgressReporter::reset() {
    lastSample_.reset();
    lastBytes_ = 0;
    speed_ = 0.0;
    lastPercent_.reset();
}

std::string ProgressReporter::formatSpeed(double bytesPerSecond) {
    static const char* units[] = {"B/s", "KiB/s", "MiB/s", "GiB/s"};
    int unit = 0;
    while (bytesPerSecond >= 1024.0 && unit < 3) {
        bytesPerSecond /= 1024.0;
        unit++;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", bytesPerSecond, units[unit]);
    return buffer;
}

std::string ProgressReporter::formatEta(std::chrono::seconds remaining) {
    long total = remaining.count() < 0 ? 0 : static_cast<long>(remaining.count());
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long seconds = total % 60;
    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld:%02ld", hours, minutes, seconds);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%02ld:%02ld", minutes, seconds);
    }
    return buffer;
}

} // namespace media_grab::downloader
