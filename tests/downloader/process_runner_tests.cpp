#include <catch2/catch_test_macros.hpp>
#include "ProcessRunner.h"
#include "CommandLineBackend.h"
#include "HttpBackend.h"
#include "BackendRegistry.h"
#include "PlatformClassifier.h"
#include <algorithm>

using namespace media_grab::downloader;
using namespace std::chrono;

TEST_CASE("ProcessRunner runs external tools", "[ProcessRunner]") {
    SECTION("Merged output is streamed line by line") {
        std::vector<std::string> lines;
        ProcessOptions options;
        options.onLine = [&lines](const std::string& line) { lines.push_back(line); };

        auto result = ProcessRunner::run({"/bin/sh", "-c", "echo one; echo two >&2; exit 3"}, options);

        REQUIRE_FALSE(result.execFailed);
        REQUIRE(result.exitCode == 3);
        REQUIRE_FALSE(result.succeeded());
        REQUIRE(std::find(lines.begin(), lines.end(), "one") != lines.end());
        REQUIRE(std::find(lines.begin(), lines.end(), "two") != lines.end());
        REQUIRE(result.outputTail.find("two") != std::string::npos);
    }

    SECTION("A missing executable is reported as such") {
        auto result = ProcessRunner::run({"/nonexistent/media-tool"}, ProcessOptions());
        REQUIRE(result.execFailed);
        REQUIRE_FALSE(result.execError.empty());
    }

    SECTION("Slow tools are stopped at the timeout") {
        ProcessOptions options;
        options.timeout = milliseconds(300);
        auto result = ProcessRunner::run({"/bin/sh", "-c", "sleep 5"}, options);

        REQUIRE(result.timedOut);
        REQUIRE(result.elapsed < seconds(4));
    }

    SECTION("An abort request stops the tool") {
        ProcessOptions options;
        options.shouldAbort = []() { return true; };
        auto result = ProcessRunner::run({"/bin/sh", "-c", "sleep 5"}, options);

        REQUIRE(result.aborted);
        REQUIRE_FALSE(result.succeeded());
    }

    SECTION("Executables are found on PATH") {
        REQUIRE(ProcessRunner::findExecutable("sh").has_value());
        REQUIRE_FALSE(ProcessRunner::findExecutable("media-grab-no-such-tool").has_value());
        REQUIRE_FALSE(ProcessRunner::findExecutable("/nonexistent/sh").has_value());
    }
}

TEST_CASE("CommandLineBackend reports tool results", "[CommandLineBackend]") {
    FetchRequest request;
    request.url = "https://example.com/v";
    request.outputDir = "/tmp";

    SECTION("A tool that is not installed is a configuration problem") {
        CommandLineBackend backend("missing", "media-grab-no-such-tool", "", CommandLineBackend::ytDlpArguments);
        auto outcome = backend.fetch(request);
        REQUIRE_FALSE(outcome.succeeded);
        REQUIRE(outcome.toolMissing);
    }

    SECTION("Tool output reaches the line callback") {
        std::vector<std::string> lines;
        request.onOutputLine = [&lines](const std::string& line) { lines.push_back(line); };
        CommandLineBackend backend("shell", "sh", "/bin/sh", [](const FetchRequest&) {
            return std::optional<std::vector<std::string>>(std::vector<std::string>{"-c", "echo download:progress:5:10:NA; echo saved"});
        });

        auto outcome = backend.fetch(request);
        REQUIRE(outcome.succeeded);
        REQUIRE(outcome.diagnosticText == "saved");
        REQUIRE(lines.size() == 2);
    }

    SECTION("URLs a tool cannot handle fail without running it") {
        CommandLineBackend backend("instaloader", "sh", "/bin/sh", CommandLineBackend::instaloaderArguments);
        auto outcome = backend.fetch(request);
        REQUIRE_FALSE(outcome.succeeded);
        REQUIRE(outcome.diagnosticText.find("unsupported url") != std::string::npos);
    }
}

TEST_CASE("CommandLineBackend builds tool arguments", "[CommandLineBackend]") {
    FetchRequest request;
    request.url = "https://www.instagram.com/p/ABC_123/";
    request.outputDir = "/media/out";
    request.outputTemplate = "%(id)s.%(ext)s";
    request.formatPref = "bestvideo+bestaudio/best";
    request.proxy = "http://p1:8080";
    request.cookieCandidates = {"/c/instagram.txt", "/c/cookies.txt"};

    auto contains = [](const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
        auto it = std::find(args.begin(), args.end(), flag);
        return it != args.end() && it + 1 != args.end() && *(it + 1) == value;
    };

    SECTION("yt-dlp") {
        auto args = CommandLineBackend::ytDlpArguments(request);
        REQUIRE(args.has_value());
        REQUIRE(contains(*args, "-o", "/media/out/%(id)s.%(ext)s"));
        REQUIRE(contains(*args, "-f", "bestvideo+bestaudio/best"));
        REQUIRE(contains(*args, "--proxy", "http://p1:8080"));
        REQUIRE(contains(*args, "--cookies", "/c/instagram.txt"));
        REQUIRE(args->back() == request.url);
    }

    SECTION("gallery-dl") {
        auto args = CommandLineBackend::galleryDlArguments(request);
        REQUIRE(args.has_value());
        REQUIRE(contains(*args, "-D", "/media/out"));
    }

    SECTION("instaloader needs a post shortcode") {
        auto args = CommandLineBackend::instaloaderArguments(request);
        REQUIRE(args.has_value());
        REQUIRE(args->back() == "-ABC_123");

        request.url = "https://www.instagram.com/someone/";
        REQUIRE_FALSE(CommandLineBackend::instaloaderArguments(request).has_value());
    }
}

TEST_CASE("Backend outcomes and registry", "[BackendRegistry]") {
    SECTION("Timed out runs carry the timeout hint") {
        ProcessResult result;
        result.exitCode = -1;
        result.timedOut = true;
        result.elapsed = seconds(30);
        auto outcome = outcomeFromProcess("yt-dlp", result);
        REQUIRE(outcome.timedOut);
        REQUIRE(outcome.diagnosticText.find("timed out") != std::string::npos);
    }

    SECTION("Default registry covers every name in the strategy table") {
        auto registry = BackendRegistry::withDefaults(DownloadConfig());
        for (const auto& [platformTag, names] : StrategyTable::defaultTable()) {
            for (const auto& name : names) {
                INFO(platformTag + " -> " + name);
                REQUIRE(registry.find(name) != nullptr);
            }
        }
        REQUIRE(registry.find("nope") == nullptr);
    }

    SECTION("Direct downloads are named after the URL path") {
        REQUIRE(HttpBackend::fileNameFor("https://cdn.example.com/media/clip.mp4?token=1") == "clip.mp4");
        REQUIRE(HttpBackend::fileNameFor("https://cdn.example.com/media/some%20clip.mp4") == "some_20clip.mp4");
        REQUIRE(HttpBackend::fileNameFor("https://cdn.example.com/").rfind("download-", 0) == 0);
    }
}
