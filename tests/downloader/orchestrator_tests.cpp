#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include "DownloadOrchestrator.h"
#include "DownloadManager.h"
#include "TrackingLog.h"
#include "TestSupport.h"
#include "Logger.h"
#include <optional>

using namespace media_grab::downloader;
using media_grab::testing::FakeBackend;
using media_grab::testing::TempDir;
using media_grab::testing::failedWith;
using media_grab::testing::listFiles;
using media_grab::testing::readFile;
using media_grab::testing::writeFile;

namespace {

DownloadConfig quietConfig(const TempDir& tmp) {
    DownloadConfig config;
    config.maxRetries = 0;
    config.blockedBackoffRetries = 0;
    config.rateLimits.clear();
    config.defaultRateLimit = std::chrono::milliseconds(0);
    config.cookiesDirectory = (tmp.path().parent_path() / "media_grab_test_no_cookies").string();
    config.convenienceCookieFile = (tmp.path().parent_path() / "media_grab_test_no_cookies.txt").string();
    return config;
}

// Events of one run, as seen by the controlling context
struct RunLog {
    std::vector<std::pair<std::string, bool>> completed;
    std::optional<std::pair<bool, std::string>> finished;

    DownloadEvents events() {
        DownloadEvents e;
        e.urlComplete = [this](const std::string& url, bool success, const std::string&) {
            completed.emplace_back(url, success);
        };
        e.finished = [this](bool success, const std::string& summary) {
            finished = std::make_pair(success, summary);
        };
        return e;
    }
};

// Two fake backends, used for every platform
struct FakeBackends {
    std::shared_ptr<FakeBackend> primary = std::make_shared<FakeBackend>("primary");
    std::shared_ptr<FakeBackend> secondary = std::make_shared<FakeBackend>("secondary");

    void install(DownloadOrchestrator& orchestrator) const {
        BackendRegistry registry;
        registry.add(primary);
        registry.add(secondary);
        orchestrator.setBackendRegistry(std::move(registry));

        std::map<std::string, std::vector<std::string>> table;
        for (const auto& tag : PlatformClassifier::knownPlatforms()) {
            table[tag] = {"primary", "secondary"};
        }
        orchestrator.setStrategyTable(StrategyTable(table));
        orchestrator.setSleepFunction([](std::chrono::milliseconds) {});
    }

    size_t callsFor(const std::string& url) const {
        size_t calls = 0;
        for (const auto* backend : {primary.get(), secondary.get()}) {
            for (const auto& request : backend->requests) {
                if (request.url == url) {
                    calls++;
                }
            }
        }
        return calls;
    }
};

} // namespace

TEST_CASE("Single run keeps going after a URL fails everywhere", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    auto broken = [](const FetchRequest& request) {
        return request.url.find("bad") != std::string::npos
            ? failedWith("ERROR: unable to extract video data")
            : DownloadOutcome::success(std::chrono::milliseconds(1));
    };
    backends.primary->responder = broken;
    backends.secondary->responder = broken;

    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());
    backends.install(orchestrator);

    auto summary = orchestrator.runSingle({"https://bad.example/2.mp4", "https://good.example/1.mp4"}, (tmp / "out").string());

    REQUIRE(summary.success);
    REQUIRE(summary.session.successCount == 1);
    REQUIRE(summary.session.failedUrls.size() == 1);
    REQUIRE(summary.session.failedUrls[0].url == "https://bad.example/2.mp4");
    REQUIRE_FALSE(summary.session.failedUrls[0].diagnostic.empty());
    REQUIRE(backends.callsFor("https://bad.example/2.mp4") == 2);
    REQUIRE(summary.message.find("https://bad.example/2.mp4") != std::string::npos);

    REQUIRE(log.completed.size() == 2);
    REQUIRE(log.finished.has_value());
    REQUIRE(log.finished->first);
}

TEST_CASE("Single run with nothing but failures is not a success", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    backends.primary->responder = [](const FetchRequest&) { return failedWith("ERROR: nope"); };
    backends.secondary->responder = backends.primary->responder;

    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());
    backends.install(orchestrator);

    auto summary = orchestrator.runSingle({"https://bad.example/2.mp4"}, (tmp / "out").string());
    REQUIRE_FALSE(summary.success);
    REQUIRE_FALSE(log.finished->first);
}

TEST_CASE("Single run writes nothing but the media", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    backends.primary->onFetch = [](const FetchRequest& request) {
        writeFile(std::filesystem::path(request.outputDir) / "media.mp4", "video");
    };

    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());
    backends.install(orchestrator);

    REQUIRE(listFiles(tmp.path()).empty());
    auto summary = orchestrator.runSingle({"https://www.youtube.com/watch?v=dQw4w9WgXcQ"}, (tmp / "out").string());

    REQUIRE(summary.success);
    REQUIRE(listFiles(tmp.path()) == std::vector<std::string>{"out/media.mp4"});
    REQUIRE(backends.primary->requests[0].outputDir == (tmp / "out").string());
}

TEST_CASE("Single run refuses to start without URLs", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());

    REQUIRE_THROWS_AS(orchestrator.runSingle({"no links in here"}, (tmp / "out").string()), PreconditionError);
    REQUIRE_THROWS_AS(orchestrator.runSingle({"https://a.example/1.mp4"}, ""), PreconditionError);
    REQUIRE_FALSE(std::filesystem::exists(tmp / "out"));
}

TEST_CASE("Bulk run skips tracked links", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    writeFile(tmp / "clips" / "links.txt",
              "https://media.example/one.mp4\n"
              "https://media.example/two.mp4\n"
              "https://media.example/three.mp4\n");
    writeFile(tmp / ".downloaded_links.txt", "https://media.example/two.mp4\n");

    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());
    backends.install(orchestrator);

    auto summary = orchestrator.runBulk(tmp.str());

    REQUIRE(backends.primary->callCount() == 2);
    REQUIRE(backends.primary->requests[0].url == "https://media.example/one.mp4");
    REQUIRE(backends.primary->requests[1].url == "https://media.example/three.mp4");
    REQUIRE(backends.secondary->callCount() == 0);
    REQUIRE(backends.primary->requests[0].outputDir == (tmp / "clips").string());

    REQUIRE(summary.success);
    REQUIRE(summary.session.successCount == 2);
    REQUIRE(summary.session.skippedCount == 1);

    SECTION("Downloads are tracked for the next run") {
        TrackingLog tracked((tmp / ".downloaded_links.txt").string());
        REQUIRE(tracked.isAlreadyDownloaded("https://media.example/one.mp4"));
        REQUIRE(tracked.isAlreadyDownloaded("https://media.example/three.mp4"));
    }

    SECTION("History and links file are updated at the end") {
        HistoryStore history((tmp / "history.json").string());
        auto entry = history.getEntry("clips");
        REQUIRE(entry.totalDownloaded == 2);
        REQUIRE(entry.lastStatus == "success");

        REQUIRE(readFile(tmp / "clips" / "links.txt").empty());
    }
}

TEST_CASE("Bulk run clears a link from every source listing it", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    backends.primary->responder = [](const FetchRequest& request) {
        return request.url.find("broken") != std::string::npos
            ? failedWith("ERROR: unable to extract video data")
            : DownloadOutcome::success(std::chrono::milliseconds(1));
    };
    backends.secondary->responder = backends.primary->responder;
    writeFile(tmp / "alpha" / "links.txt",
              "https://media.example/shared.mp4?utm_source=feed\n"
              "https://media.example/broken.mp4\n");
    writeFile(tmp / "beta" / "links.txt",
              "# saved from the feed\n"
              "https://media.example/shared.mp4\n"
              "https://media.example/old.mp4\n");
    writeFile(tmp / ".downloaded_links.txt", "https://media.example/old.mp4\n");

    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());
    backends.install(orchestrator);

    auto summary = orchestrator.runBulk(tmp.str());

    REQUIRE(summary.session.totalRequests == 3);
    REQUIRE(backends.callsFor("https://media.example/shared.mp4") == 1);
    REQUIRE(summary.session.successCount == 1);
    REQUIRE(summary.session.skippedCount == 1);

    REQUIRE(readFile(tmp / "alpha" / "links.txt") == "https://media.example/broken.mp4\n");
    REQUIRE(readFile(tmp / "beta" / "links.txt") == "# saved from the feed\n");
}

TEST_CASE("Bulk run honours the recent-download window", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    writeFile(tmp / "clips" / "links.txt", "https://media.example/one.mp4\n");
    writeFile(tmp / "fresh" / "links.txt", "https://media.example/new.mp4\n");
    {
        HistoryStore history((tmp / "history.json").string());
        history.updateSource("clips", 1, 0);
        REQUIRE(history.save().success);
    }

    auto config = quietConfig(tmp);
    config.skipRecentWindow = true;
    DownloadOrchestrator orchestrator(config, log.events());
    backends.install(orchestrator);

    auto summary = orchestrator.runBulk(tmp.str());

    REQUIRE(summary.session.totalRequests == 1);
    REQUIRE(backends.primary->requests[0].url == "https://media.example/new.mp4");
}

TEST_CASE("Bulk run refuses to start without links", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    DownloadOrchestrator orchestrator(quietConfig(tmp), log.events());

    REQUIRE_THROWS_AS(orchestrator.runBulk(tmp.str()), PreconditionError);
    REQUIRE_THROWS_AS(orchestrator.runBulk((tmp / "missing").string()), PreconditionError);

    writeFile(tmp / "empty" / "links.txt", "# nothing yet\n");
    REQUIRE_THROWS_AS(orchestrator.runBulk(tmp.str()), PreconditionError);
}

TEST_CASE("Cancelling between URLs stops before the next one", "[DownloadOrchestrator]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);

    DownloadEvents events = log.events();
    auto recordCompletion = events.urlComplete;
    events.urlComplete = [cancelFlag, recordCompletion](const std::string& url, bool success, const std::string& message) {
        recordCompletion(url, success, message);
        cancelFlag->store(true);
    };

    DownloadOrchestrator orchestrator(quietConfig(tmp), events, cancelFlag);
    backends.install(orchestrator);

    auto summary = orchestrator.runSingle({"https://media.example/first.mp4 https://media.example/second.mp4"},
                                          (tmp / "out").string());

    REQUIRE(backends.callsFor("https://media.example/first.mp4") == 1);
    REQUIRE(backends.callsFor("https://media.example/second.mp4") == 0);
    REQUIRE(summary.session.cancelled);
    REQUIRE(summary.session.successCount == 1);
    REQUIRE(summary.session.failedUrls.empty());
    REQUIRE(summary.message.rfind("Cancelled", 0) == 0);
    REQUIRE(log.completed.size() == 1);
}

TEST_CASE("Summary lists counts and failed URLs", "[DownloadOrchestrator]") {
    SessionState session;
    session.totalRequests = 4;
    session.successCount = 2;
    session.skippedCount = 1;
    session.failedUrls.push_back({"https://a.example/x", "primary: ERROR: gone\nsecondary: ERROR: gone too"});

    const std::string text = DownloadOrchestrator::formatSummary(session);
    REQUIRE(text.rfind("Downloaded 2, skipped 1, failed 1 of 4 URL(s)", 0) == 0);
    REQUIRE(text.find("https://a.example/x - primary: ERROR: gone") != std::string::npos);
    REQUIRE(text.find("gone too") == std::string::npos);
}

TEST_CASE("DownloadManager runs jobs on a worker thread", "[DownloadManager]") {
    TempDir tmp;
    RunLog log;
    FakeBackends backends;

    DownloadManager manager(quietConfig(tmp), log.events());
    manager.setOrchestratorSetup([&backends](DownloadOrchestrator& orchestrator) { backends.install(orchestrator); });

    SECTION("A finished job hands back its summary") {
        REQUIRE(manager.start(DownloadJob::single({"https://media.example/a.mp4"}, (tmp / "out").string())));
        auto summary = manager.wait();

        REQUIRE(summary.has_value());
        REQUIRE(summary->success);
        REQUIRE_FALSE(manager.isRunning());
        REQUIRE(log.finished.has_value());
    }

    SECTION("A job that cannot start reports through the finished event") {
        REQUIRE(manager.start(DownloadJob::bulk((tmp / "missing").string())));
        auto summary = manager.wait();

        REQUIRE_FALSE(summary.has_value());
        REQUIRE(log.finished.has_value());
        REQUIRE_FALSE(log.finished->first);
    }
}

// Main entry point for tests
int main(int argc, char* argv[]) {
    // Honour LOG_LEVEL so test output stays readable by default
    LogLevel logLevel = Logger::levelFromEnvironment(LogLevel::WARNING);
    Logger::getInstance().init(logLevel, true);

    return Catch::Session().run(argc, argv);
}
