#include "HttpBackend.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <mutex>

namespace fs = std::filesystem;

namespace media_grab::downloader {

namespace {

struct TransferState {
    FILE* file = nullptr;
    const FetchRequest* request = nullptr;
    bool aborted = false;
    bool rejected = false;  // response is a web page, not media
    CURL* curl = nullptr;
    bool checkedType = false;
};

std::once_flag curlInitFlag;

} // namespace

HttpBackend::HttpBackend() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpBackend::~HttpBackend() = default;

std::string HttpBackend::fileNameFor(const std::string& url) {
    std::string path = url;
    size_t schemeEnd = path.find("://");
    if (schemeEnd != std::string::npos) {
        size_t pathStart = path.find('/', schemeEnd + 3);
        path = pathStart == std::string::npos ? "" : path.substr(pathStart);
    }
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    std::string segment = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
    std::string safe;
    for (char c : segment) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_') {
            safe.push_back(c);
        } else {
            safe.push_back('_');
        }
    }
    if (safe.empty() || safe == "." || safe == ".." || safe.find('.') == std::string::npos) {
        std::string base = safe.empty() || safe == "." || safe == ".." ? "download" : safe;
        return base + "-" + std::to_string(std::hash<std::string>{}(url)) + ".bin";
    }
    return safe;
}

size_t HttpBackend::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t totalSize = size * nmemb;

    if (!state->checkedType) {
        state->checkedType = true;
        long status = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
        char* contentType = nullptr;
        curl_easy_getinfo(state->curl, CURLINFO_CONTENT_TYPE, &contentType);
        if (status < 400 && contentType && std::string(contentType).find("text/html") != std::string::npos) {
            state->rejected = true;
            return 0;
        }
    }
    return fwrite(contents, 1, totalSize, state->file);
}

int HttpBackend::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    (void)ultotal;
    (void)ulnow;

    auto* state = static_cast<TransferState*>(clientp);
    if (state->request->shouldAbort && state->request->shouldAbort()) {
        state->aborted = true;
        return 1;
    }
    if (state->request->onBytes && dlnow > 0) {
        state->request->onBytes(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

DownloadOutcome HttpBackend::fetch(const FetchRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    const std::string cleanedUrl = common::sanitizeUrl(request.url);
    const fs::path target = fs::path(request.outputDir) / fileNameFor(cleanedUrl);
    const fs::path partial = target.string() + ".part";

    LOG_INFO("[direct-http] Fetching " + cleanedUrl + " -> " + target.string());

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("Failed to initialize CURL");
        return DownloadOutcome::failure("failed to initialize curl");
    }

    FILE* file = fopen(partial.c_str(), "wb");
    if (!file) {
        curl_easy_cleanup(curl);
        return DownloadOutcome::failure("cannot open " + partial.string() + " for writing");
    }

    TransferState state;
    state.file = file;
    state.request = &request;
    state.curl = curl;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count() * 1000));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 15000L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

    if (request.proxy) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
    }
    if (!request.cookieCandidates.empty()) {
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, request.cookieCandidates.front().c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    curl_easy_cleanup(curl);

    bool closedCleanly = fclose(file) == 0;

    auto discardPartial = [&partial]() {
        std::error_code ec;
        fs::remove(partial, ec);
    };

    if (state.rejected) {
        discardPartial();
        return DownloadOutcome::failure("unsupported url: response is a web page, not a media file", elapsed());
    }

    if (res != CURLE_OK) {
        discardPartial();
        std::string message = std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
        if (state.aborted) {
            message = "direct-http stopped on cancellation";
        } else {
            LOG_DEBUG("CURL error: " + message + " | url_hex=" + common::hexDump(cleanedUrl));
        }
        DownloadOutcome outcome = DownloadOutcome::failure(message, elapsed());
        outcome.exitCode = static_cast<int>(res);
        outcome.timedOut = res == CURLE_OPERATION_TIMEDOUT;
        return outcome;
    }

    if (statusCode >= 400) {
        discardPartial();
        LOG_WARNING("HTTP CLIENT ERROR (" + std::to_string(statusCode) + "): " + cleanedUrl);
        DownloadOutcome outcome = DownloadOutcome::failure("HTTP Error " + std::to_string(statusCode), elapsed());
        outcome.exitCode = static_cast<int>(statusCode);
        return outcome;
    }

    if (!closedCleanly) {
        discardPartial();
        return DownloadOutcome::failure("failed writing " + partial.string(), elapsed());
    }

    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        discardPartial();
        return DownloadOutcome::failure("cannot move download into place: " + ec.message(), elapsed());
    }

    return DownloadOutcome::success(elapsed(), "saved " + target.filename().string());
}

} // namespace media_grab::downloader
