#include "DownloadManager.h"
#include "../../include/Logger.h"

namespace media_grab::downloader {

DownloadManager::DownloadManager(DownloadConfig config, DownloadEvents events)
    : config_(std::move(config)), events_(std::move(events)) {
    LOG_DEBUG("DownloadManager initialized");
}

DownloadManager::~DownloadManager() {
    if (worker_.joinable()) {
        LOG_INFO("DownloadManager shutting down, cancelling active run");
        cancel();
        worker_.join();
    }
}

bool DownloadManager::start(DownloadJob job) {
    if (running_.load()) {
        LOG_WARNING("A download run is already active");
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> lock(resultMutex_);
        lastSummary_.reset();
    }
    cancelFlag_ = std::make_shared<std::atomic<bool>>(false);
    running_ = true;
    worker_ = std::thread(&DownloadManager::runJob, this, std::move(job));
    return true;
}

void DownloadManager::cancel() {
    if (cancelFlag_) {
        LOG_INFO("Cancellation requested");
        cancelFlag_->store(true);
    }
}

std::optional<RunSummary> DownloadManager::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(resultMutex_);
    return lastSummary_;
}

void DownloadManager::runJob(DownloadJob job) {
    const char* modeName = job.mode == RunMode::BULK ? "bulk" : "single";
    LOG_INFO(std::string("Starting ") + modeName + " run: " + job.location);

    try {
        DownloadOrchestrator orchestrator(config_, events_, cancelFlag_);
        if (setup_) {
            setup_(orchestrator);
        }

        RunSummary summary = job.mode == RunMode::BULK
            ? orchestrator.runBulk(job.location)
            : orchestrator.runSingle(job.inputs, job.location);

        std::lock_guard<std::mutex> lock(resultMutex_);
        lastSummary_ = std::move(summary);
    } catch (const PreconditionError& e) {
        LOG_ERROR(std::string("Run not started: ") + e.what());
        events_.emitFinished(false, e.what());
    } catch (const ConfigError& e) {
        LOG_ERROR(std::string("Invalid configuration: ") + e.what());
        events_.emitFinished(false, std::string("Invalid configuration: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error in download thread: ") + e.what());
        events_.emitFinished(false, std::string("Download run failed: ") + e.what());
    }

    running_ = false;
    LOG_INFO(std::string("Finished ") + modeName + " run");
}

} // namespace media_grab::downloader
