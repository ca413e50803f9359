#include "BackendRegistry.h"
#include "CommandLineBackend.h"
#include "HttpBackend.h"
#include "../../include/Logger.h"

namespace media_grab::downloader {

namespace {

std::string toolPath(const DownloadConfig& config, const std::string& tool) {
    auto it = config.toolPaths.find(tool);
    return it == config.toolPaths.end() ? "" : it->second;
}

} // namespace

BackendRegistry BackendRegistry::withDefaults(const DownloadConfig& config) {
    BackendRegistry registry;
    const std::string ytDlp = toolPath(config, "yt-dlp");

    registry.add(std::make_shared<CommandLineBackend>("yt-dlp", "yt-dlp", ytDlp, &CommandLineBackend::ytDlpArguments));
    registry.add(std::make_shared<CommandLineBackend>("yt-dlp-compat", "yt-dlp", ytDlp, &CommandLineBackend::ytDlpCompatArguments));
    registry.add(std::make_shared<CommandLineBackend>("yt-dlp-generic", "yt-dlp", ytDlp, &CommandLineBackend::ytDlpGenericArguments));
    registry.add(std::make_shared<CommandLineBackend>("gallery-dl", "gallery-dl", toolPath(config, "gallery-dl"),
                                                      &CommandLineBackend::galleryDlArguments));
    registry.add(std::make_shared<CommandLineBackend>("instaloader", "instaloader", toolPath(config, "instaloader"),
                                                      &CommandLineBackend::instaloaderArguments));
    registry.add(std::make_shared<StreamCopyBackend>(ytDlp, toolPath(config, "ffmpeg")));
    registry.add(std::make_shared<HttpBackend>());

    LOG_DEBUG("Registered " + std::to_string(registry.backends_.size()) + " download backends");
    return registry;
}

void BackendRegistry::add(std::shared_ptr<DownloadBackend> backend) {
    if (!backend) {
        return;
    }
    const std::string name = backend->name();
    backends_[name] = std::move(backend);
}

std::shared_ptr<DownloadBackend> BackendRegistry::find(const std::string& name) const {
    auto it = backends_.find(name);
    return it == backends_.end() ? nullptr : it->second;
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, backend] : backends_) {
        result.push_back(name);
    }
    return result;
}

} // namespace media_grab::downloader
