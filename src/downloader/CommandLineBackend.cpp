#include "CommandLineBackend.h"
#include "../../include/Logger.h"

#include <filesystem>
#include <functional>
#include <regex>

namespace fs = std::filesystem;

namespace media_grab::downloader {

namespace {

const char* PROGRESS_TEMPLATE =
    "download:progress:%(progress.downloaded_bytes)s:%(progress.total_bytes)s:"
    "%(progress.total_bytes_estimate)s";

std::vector<std::string> commonYtDlpArguments(const FetchRequest& request) {
    std::vector<std::string> args = {
        "-o", (fs::path(request.outputDir) / request.outputTemplate).string(),
        "--newline",
        "--no-color",
        "--continue",
        "--no-playlist",
        "--progress-template", PROGRESS_TEMPLATE
    };
    if (request.proxy) {
        args.push_back("--proxy");
        args.push_back(*request.proxy);
    }
    if (!request.cookieCandidates.empty()) {
        args.push_back("--cookies");
        args.push_back(request.cookieCandidates.front());
    }
    if (!request.userAgent.empty()) {
        args.push_back("--add-header");
        args.push_back("User-Agent:" + request.userAgent);
    }
    return args;
}

std::string lastLine(const std::string& text) {
    size_t end = text.find_last_not_of("\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = text.rfind('\n', end);
    return text.substr(start == std::string::npos ? 0 : start + 1, end - (start == std::string::npos ? 0 : start + 1) + 1);
}

} // namespace

DownloadOutcome outcomeFromProcess(const std::string& tool, const ProcessResult& result) {
    if (result.execFailed) {
        DownloadOutcome outcome = DownloadOutcome::failure(result.execError, result.elapsed);
        outcome.toolMissing = true;
        return outcome;
    }
    if (result.succeeded()) {
        return DownloadOutcome::success(result.elapsed, lastLine(result.outputTail));
    }

    std::string diagnostic = result.outputTail;
    if (result.timedOut) {
        diagnostic = tool + " timed out after " + std::to_string(result.elapsed.count() / 1000) + "s\n" + diagnostic;
    } else if (result.aborted) {
        diagnostic = tool + " stopped on cancellation\n" + diagnostic;
    } else if (diagnostic.empty()) {
        diagnostic = tool + " exited with code " + std::to_string(result.exitCode);
    }

    DownloadOutcome outcome = DownloadOutcome::failure(diagnostic, result.elapsed);
    outcome.exitCode = result.exitCode;
    outcome.timedOut = result.timedOut;
    return outcome;
}

CommandLineBackend::CommandLineBackend(std::string name, std::string tool, std::string configuredPath, ArgumentBuilder builder)
    : name_(std::move(name)), tool_(std::move(tool)), configuredPath_(std::move(configuredPath)), builder_(std::move(builder)) {
}

DownloadOutcome CommandLineBackend::fetch(const FetchRequest& request) {
    auto executable = ProcessRunner::findExecutable(configuredPath_.empty() ? tool_ : configuredPath_);
    if (!executable) {
        DownloadOutcome outcome = DownloadOutcome::failure(tool_ + " is not installed or not executable");
        outcome.toolMissing = true;
        return outcome;
    }

    auto arguments = builder_(request);
    if (!arguments) {
        DownloadOutcome outcome = DownloadOutcome::failure("unsupported url for " + name_);
        outcome.exitCode = -1;
        return outcome;
    }

    std::vector<std::string> argv;
    argv.reserve(arguments->size() + 1);
    argv.push_back(*executable);
    argv.insert(argv.end(), arguments->begin(), arguments->end());

    ProcessOptions options;
    options.timeout = request.timeout;
    options.onLine = request.onOutputLine;
    options.shouldAbort = request.shouldAbort;

    LOG_INFO("[" + name_ + "] Fetching " + request.url);
    return outcomeFromProcess(tool_, ProcessRunner::run(argv, options));
}

std::optional<std::vector<std::string>> CommandLineBackend::ytDlpArguments(const FetchRequest& request) {
    std::vector<std::string> args = commonYtDlpArguments(request);
    args.push_back("-f");
    args.push_back(request.formatPref.empty() ? "best" : request.formatPref);
    args.push_back("--merge-output-format");
    args.push_back("mp4");
    args.push_back(request.url);
    return args;
}

std::optional<std::vector<std::string>> CommandLineBackend::ytDlpCompatArguments(const FetchRequest& request) {
    std::vector<std::string> args = commonYtDlpArguments(request);
    args.insert(args.end(), {
        "-f", request.formatPref.empty() ? "best" : request.formatPref,
        "--no-check-certificate",
        "--geo-bypass",
        "--extractor-args", "youtube:player_client=android,web",
        "--retries", "3",
        request.url
    });
    return args;
}

std::optional<std::vector<std::string>> CommandLineBackend::ytDlpGenericArguments(const FetchRequest& request) {
    std::vector<std::string> args = commonYtDlpArguments(request);
    args.insert(args.end(), {"--force-generic-extractor", "-f", "best", request.url});
    return args;
}

std::optional<std::vector<std::string>> CommandLineBackend::galleryDlArguments(const FetchRequest& request) {
    std::vector<std::string> args = {"-D", request.outputDir};
    if (request.proxy) {
        args.push_back("--proxy");
        args.push_back(*request.proxy);
    }
    if (!request.cookieCandidates.empty()) {
        args.push_back("--cookies");
        args.push_back(request.cookieCandidates.front());
    }
    args.push_back(request.url);
    return args;
}

std::optional<std::vector<std::string>> CommandLineBackend::instaloaderArguments(const FetchRequest& request) {
    static const std::regex shortcodePattern(R"(/(?:p|reels?|tv)/([A-Za-z0-9_-]+))");
    std::smatch match;
    if (!std::regex_search(request.url, match, shortcodePattern)) {
        return std::nullopt;
    }

    return std::vector<std::string>{
        "--dirname-pattern", request.outputDir,
        "--no-metadata-json",
        "--no-captions",
        "--no-video-thumbnails",
        "--no-profile-pic",
        "--quiet",
        "--",
        "-" + match[1].str()
    };
}

StreamCopyBackend::StreamCopyBackend(std::string resolverPath, std::string ffmpegPath)
    : resolverPath_(std::move(resolverPath)), ffmpegPath_(std::move(ffmpegPath)) {
}

DownloadOutcome StreamCopyBackend::fetch(const FetchRequest& request) {
    auto resolver = ProcessRunner::findExecutable(resolverPath_.empty() ? "yt-dlp" : resolverPath_);
    auto ffmpeg = ProcessRunner::findExecutable(ffmpegPath_.empty() ? "ffmpeg" : ffmpegPath_);
    if (!resolver || !ffmpeg) {
        DownloadOutcome outcome = DownloadOutcome::failure(std::string(!resolver ? "yt-dlp" : "ffmpeg") +
                                                           " is not installed or not executable");
        outcome.toolMissing = true;
        return outcome;
    }

    const auto start = std::chrono::steady_clock::now();

    std::vector<std::string> resolveArgs = {*resolver, "-g", "--no-playlist", "--no-warnings",
                                            "-f", "best[ext=mp4]/best"};
    if (request.proxy) {
        resolveArgs.push_back("--proxy");
        resolveArgs.push_back(*request.proxy);
    }
    if (!request.cookieCandidates.empty()) {
        resolveArgs.push_back("--cookies");
        resolveArgs.push_back(request.cookieCandidates.front());
    }
    resolveArgs.push_back(request.url);

    std::string streamUrl;
    ProcessOptions resolveOptions;
    resolveOptions.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(request.timeout);
    resolveOptions.shouldAbort = request.shouldAbort;
    resolveOptions.onLine = [&streamUrl](const std::string& line) {
        if (streamUrl.empty() && line.rfind("http", 0) == 0) {
            streamUrl = line;
        }
    };

    ProcessResult resolved = ProcessRunner::run(resolveArgs, resolveOptions);
    if (!resolved.succeeded() || streamUrl.empty()) {
        DownloadOutcome outcome = outcomeFromProcess("yt-dlp -g", resolved);
        if (outcome.succeeded) {
            outcome = DownloadOutcome::failure("no stream url resolved", resolved.elapsed);
        }
        return outcome;
    }

    const auto spent = std::chrono::steady_clock::now() - start;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(request.timeout - spent);
    if (remaining.count() <= 0) {
        DownloadOutcome outcome = DownloadOutcome::failure("ffmpeg-stream timed out while resolving", resolved.elapsed);
        outcome.timedOut = true;
        return outcome;
    }

    const std::string fileName = "stream-" + std::to_string(std::hash<std::string>{}(request.url)) + ".mp4";
    const std::string target = (fs::path(request.outputDir) / fileName).string();

    std::vector<std::string> copyArgs = {*ffmpeg, "-y", "-loglevel", "error", "-nostdin"};
    if (!request.userAgent.empty()) {
        copyArgs.push_back("-user_agent");
        copyArgs.push_back(request.userAgent);
    }
    copyArgs.insert(copyArgs.end(), {"-i", streamUrl, "-c", "copy", target});

    ProcessOptions copyOptions;
    copyOptions.timeout = remaining;
    copyOptions.shouldAbort = request.shouldAbort;
    copyOptions.onLine = request.onOutputLine;

    LOG_INFO("[ffmpeg-stream] Copying stream for " + request.url);
    DownloadOutcome outcome = outcomeFromProcess("ffmpeg", ProcessRunner::run(copyArgs, copyOptions));
    if (!outcome.succeeded) {
        std::error_code ec;
        fs::remove(target, ec);
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return outcome;
}

} // namespace media_grab::downloader
