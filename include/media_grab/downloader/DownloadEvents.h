#pragma once
#include <functional>
#include <string>

namespace media_grab::downloader {

// Notifications emitted to the controlling context during a run.
// Unset callbacks are skipped; all of them are invoked on the worker thread.
struct DownloadEvents {
    using TextFunction = std::function<void(const std::string&)>;
    using PercentFunction = std::function<void(int)>;
    using UrlCompleteFunction = std::function<void(const std::string& url, bool success, const std::string& message)>;
    using FinishedFunction = std::function<void(bool success, const std::string& summary)>;

    TextFunction progressLine;
    PercentFunction percent;
    TextFunction speed;
    TextFunction eta;
    UrlCompleteFunction urlComplete;
    FinishedFunction finished;

    void emitProgressLine(const std::string& line) const { if (progressLine) progressLine(line); }
    void emitPercent(int value) const { if (percent) percent(value); }
    void emitSpeed(const std::string& value) const { if (speed) speed(value); }
    void emitEta(const std::string& value) const { if (eta) eta(value); }
    void emitUrlComplete(const std::string& url, bool success, const std::string& message) const {
        if (urlComplete) urlComplete(url, success, message);
    }
    void emitFinished(bool success, const std::string& summary) const { if (finished) finished(success, summary); }
};

} // namespace media_grab::downloader
