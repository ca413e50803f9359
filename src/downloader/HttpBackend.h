#pragma once

#include <string>
#include <curl/curl.h>
#include "../../include/media_grab/downloader/DownloadBackend.h"

namespace media_grab::downloader {

/**
 * Fetches a direct media link with libcurl into the output directory.
 * Data goes to a ".part" file that is renamed only after a complete transfer.
 */
class HttpBackend : public DownloadBackend {
public:
    HttpBackend();
    ~HttpBackend() override;

    std::string name() const override { return "direct-http"; }
    DownloadOutcome fetch(const FetchRequest& request) override;

    // File name for a URL: last path segment, or a hash-based name when there is none
    static std::string fileNameFor(const std::string& url);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
};

} // namespace media_grab::downloader
