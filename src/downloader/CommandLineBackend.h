#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../../include/media_grab/downloader/DownloadBackend.h"
#include "ProcessRunner.h"

namespace media_grab::downloader {

/**
 * Backend that runs one external tool. What differs between tools is only the
 * argument list, supplied as data through an ArgumentBuilder.
 */
class CommandLineBackend : public DownloadBackend {
public:
    // Arguments after the executable; nullopt when the tool cannot handle the URL
    using ArgumentBuilder = std::function<std::optional<std::vector<std::string>>(const FetchRequest&)>;

    /**
     * @param name Backend name used by the strategy table
     * @param tool Executable name looked up on PATH
     * @param configuredPath Explicit executable path, empty to search PATH
     * @param builder Produces the tool arguments for a request
     */
    CommandLineBackend(std::string name, std::string tool, std::string configuredPath, ArgumentBuilder builder);

    std::string name() const override { return name_; }
    DownloadOutcome fetch(const FetchRequest& request) override;

    // yt-dlp with the default extractor selection
    static std::optional<std::vector<std::string>> ytDlpArguments(const FetchRequest& request);
    // yt-dlp with certificate checks off, geo bypass and alternate player clients
    static std::optional<std::vector<std::string>> ytDlpCompatArguments(const FetchRequest& request);
    // yt-dlp forced onto the generic extractor, useful for embedded players
    static std::optional<std::vector<std::string>> ytDlpGenericArguments(const FetchRequest& request);
    static std::optional<std::vector<std::string>> galleryDlArguments(const FetchRequest& request);
    static std::optional<std::vector<std::string>> instaloaderArguments(const FetchRequest& request);

private:
    std::string name_;
    std::string tool_;
    std::string configuredPath_;
    ArgumentBuilder builder_;
};

/**
 * Resolves the direct stream URL with yt-dlp, then copies the stream into a
 * file with ffmpeg. Works for HLS/DASH manifests the extractors cannot mux.
 */
class StreamCopyBackend : public DownloadBackend {
public:
    StreamCopyBackend(std::string resolverPath, std::string ffmpegPath);

    std::string name() const override { return "ffmpeg-stream"; }
    DownloadOutcome fetch(const FetchRequest& request) override;

private:
    std::string resolverPath_;
    std::string ffmpegPath_;
};

// Convert a finished tool run into an outcome
DownloadOutcome outcomeFromProcess(const std::string& tool, const ProcessResult& result);

} // namespace media_grab::downloader
