#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "../../include/media_grab/downloader/DownloadBackend.h"
#include "../../include/media_grab/downloader/models/DownloadConfig.h"

namespace media_grab::downloader {

// Backends by name, as referenced from the strategy table
class BackendRegistry {
public:
    BackendRegistry() = default;

    // Registry with every built-in backend, honouring configured tool paths
    static BackendRegistry withDefaults(const DownloadConfig& config);

    // Replaces any backend registered under the same name
    void add(std::shared_ptr<DownloadBackend> backend);

    // nullptr when no backend has that name
    std::shared_ptr<DownloadBackend> find(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, std::shared_ptr<DownloadBackend>> backends_;
};

} // namespace media_grab::downloader
