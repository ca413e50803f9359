#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "DownloadOrchestrator.h"

namespace media_grab::downloader {

// A queued run: either single mode over inputs or bulk mode over a root folder
struct DownloadJob {
    RunMode mode = RunMode::SINGLE;
    std::vector<std::string> inputs;  // single mode
    std::string location;             // output folder (single) or bulk root

    static DownloadJob single(std::vector<std::string> inputs, std::string outputDir) {
        return {RunMode::SINGLE, std::move(inputs), std::move(outputDir)};
    }
    static DownloadJob bulk(std::string root) {
        return {RunMode::BULK, {}, std::move(root)};
    }
};

/**
 * Owns the worker thread of a run. At most one run is active per manager;
 * the controlling context talks to it only through events and cancel().
 */
class DownloadManager {
public:
    DownloadManager(DownloadConfig config, DownloadEvents events);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // False when a run is already active
    bool start(DownloadJob job);

    void cancel();

    // Blocks until the active run ends; returns its summary, if it got that far
    std::optional<RunSummary> wait();

    bool isRunning() const { return running_.load(); }

    // Hook to swap collaborators on each new orchestrator (tests)
    void setOrchestratorSetup(std::function<void(DownloadOrchestrator&)> setup) { setup_ = std::move(setup); }

private:
    void runJob(DownloadJob job);

    DownloadConfig config_;
    DownloadEvents events_;
    std::function<void(DownloadOrchestrator&)> setup_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::shared_ptr<std::atomic<bool>> cancelFlag_;

    std::mutex resultMutex_;
    std::optional<RunSummary> lastSummary_;
};

} // namespace media_grab::downloader
