#include "HistoryStore.h"
#include "../../include/Logger.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace media_grab::downloader {

HistoryStore::HistoryStore(std::string path) : path_(std::move(path)) {
    load();
}

void HistoryStore::load() {
    std::ifstream in(path_);
    if (!in) {
        return;
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARNING("Ignoring unreadable history file " + path_ + ": " + e.what());
        return;
    }
    if (!json.is_object()) {
        LOG_WARNING("Ignoring history file " + path_ + ": not a JSON object");
        return;
    }

    for (const auto& [name, value] : json.items()) {
        if (!value.is_object()) {
            continue;
        }
        HistoryEntry entry;
        try {
            entry.totalDownloaded = value.value("totalDownloaded", 0);
            entry.totalFailed = value.value("totalFailed", 0);
            entry.lastBatchCount = value.value("lastBatchCount", 0);
            if (value.contains("lastDownload") && value["lastDownload"].is_string()) {
                entry.lastDownload = value["lastDownload"].get<std::string>();
            }
            entry.lastStatus = value.value("lastStatus", std::string("never"));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARNING("Ignoring malformed history entry '" + name + "': " + e.what());
            continue;
        }
        entries_[name] = entry;
    }
    LOG_DEBUG("Loaded history for " + std::to_string(entries_.size()) + " source(s) from " + path_);
}

std::string HistoryStore::formatTimestamp(Clock::time_point time) {
    std::time_t t = Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::optional<HistoryStore::Clock::time_point> HistoryStore::parseTimestamp(const std::string& text) {
    std::tm local{};
    std::istringstream iss(text);
    iss >> std::get_time(&local, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    local.tm_isdst = -1;
    std::time_t t = std::mktime(&local);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(t);
}

bool HistoryStore::shouldSkipSource(const std::string& sourceName, int windowHours, Clock::time_point now) const {
    auto it = entries_.find(sourceName);
    if (it == entries_.end() || it->second.lastDownload.empty()) {
        return false;
    }
    auto last = parseTimestamp(it->second.lastDownload);
    if (!last) {
        LOG_WARNING("Unparseable lastDownload for source " + sourceName + ": " + it->second.lastDownload);
        return false;
    }
    return now - *last < std::chrono::hours(windowHours);
}

void HistoryStore::updateSource(const std::string& sourceName, int downloaded, int failed, Clock::time_point now) {
    HistoryEntry& entry = entries_[sourceName];
    entry.totalDownloaded += downloaded;
    entry.totalFailed += failed;
    entry.lastBatchCount = downloaded;
    entry.lastDownload = formatTimestamp(now);
    if (failed == 0) {
        entry.lastStatus = "success";
    } else if (downloaded > 0) {
        entry.lastStatus = "partial";
    } else {
        entry.lastStatus = "failed";
    }
}

HistoryEntry HistoryStore::getEntry(const std::string& sourceName) const {
    auto it = entries_.find(sourceName);
    return it == entries_.end() ? HistoryEntry{} : it->second;
}

Result<bool> HistoryStore::save() const {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [name, entry] : entries_) {
        json[name] = {
            {"totalDownloaded", entry.totalDownloaded},
            {"totalFailed", entry.totalFailed},
            {"lastBatchCount", entry.lastBatchCount},
            {"lastDownload", entry.lastDownload.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.lastDownload)},
            {"lastStatus", entry.lastStatus}
        };
    }

    const std::string tempPath = path_ + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Result<bool>::Failure("Cannot write history file " + tempPath);
        }
        out << json.dump(2) << "\n";
        out.close();
        if (!out) {
            return Result<bool>::Failure("Failed writing history file " + tempPath);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path_, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Result<bool>::Failure("Cannot replace history file " + path_);
    }

    LOG_DEBUG("Saved history for " + std::to_string(entries_.size()) + " source(s)");
    return Result<bool>::Success(true);
}

} // namespace media_grab::downloader
