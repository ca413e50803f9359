#include "downloader/DownloadManager.h"
#include "downloader/UrlNormalizer.h"
#include "../include/Logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <curl/curl.h>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace media_grab::downloader;

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void installInterruptHandler() {
    auto handler = [](int) { interruptRequested = 1; };
    std::signal(SIGINT, handler);
    std::signal(SIGTERM, handler);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [URL...]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE   JSON configuration file\n"
              << "  --output DIR    Single mode: save media into DIR (default: current directory)\n"
              << "  --links FILE    Single mode: read URLs from a text or JSON file\n"
              << "  --bulk ROOT     Bulk mode: download every source folder under ROOT\n"
              << "  --quality NAME  mobile, low, medium, hd, 4k or best\n"
              << "  --all-backends  Try every backend of the platform strategy\n"
              << "  -h, --help      Show this help\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw PreconditionError("Cannot read links file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Text files are passed through; JSON files are reduced to their URLs
std::vector<std::string> linksFromFile(const std::string& path) {
    const std::string content = readFile(path);
    const size_t first = content.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && content[first] == '[') {
        try {
            return UrlNormalizer::extractFromJson(nlohmann::json::parse(content));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARNING("Links file " + path + " is not valid JSON, reading it as text: " + e.what());
        }
    }
    return {content};
}

DownloadEvents consoleEvents() {
    DownloadEvents events;
    events.progressLine = [](const std::string& line) {
        std::cout << line << std::endl;
    };
    events.percent = [](int value) {
        std::cout << "\r" << value << "% " << std::flush;
    };
    events.urlComplete = [](const std::string& url, bool success, const std::string& message) {
        std::cout << (success ? "[OK]   " : "[FAIL] ") << url;
        if (!message.empty()) {
            std::cout << " - " << message.substr(0, message.find('\n'));
        }
        std::cout << std::endl;
    };
    events.finished = [](bool success, const std::string& summary) {
        std::cout << (success ? "\n" : "\nERROR: ") << summary << std::endl;
    };
    return events;
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();

    std::string configPath;
    std::string outputDir = ".";
    std::string bulkRoot;
    std::string quality;
    bool allBackends = false;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            configPath = next();
        } else if (arg == "--output") {
            outputDir = next();
        } else if (arg == "--bulk") {
            bulkRoot = next();
        } else if (arg == "--quality") {
            quality = next();
        } else if (arg == "--all-backends") {
            allBackends = true;
        } else if (arg == "--links") {
            const std::string path = next();
            try {
                auto links = linksFromFile(path);
                inputs.insert(inputs.end(), links.begin(), links.end());
            } catch (const PreconditionError& e) {
                std::cerr << e.what() << std::endl;
                return 2;
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            inputs.push_back(arg);
        }
    }

    DownloadConfig config;
    try {
        if (!configPath.empty()) {
            config = DownloadConfig::fromFile(configPath);
        }
        if (!quality.empty()) {
            config.quality = parseQuality(quality);
        }
        if (allBackends) {
            config.forceAllBackends = true;
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    LogLevel level = Logger::levelFromEnvironment(Logger::parseLevel(config.logLevel));
    Logger::getInstance().init(level, true, config.logFile);

    if (bulkRoot.empty() && inputs.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    installInterruptHandler();

    bool succeeded = false;
    {
        DownloadEvents events = consoleEvents();
        auto onFinished = events.finished;
        events.finished = [&succeeded, onFinished](bool success, const std::string& summary) {
            succeeded = success;
            onFinished(success, summary);
        };

        DownloadManager manager(config, events);
        DownloadJob job = bulkRoot.empty()
            ? DownloadJob::single(inputs, outputDir)
            : DownloadJob::bulk(bulkRoot);
        manager.start(std::move(job));

        bool cancelSent = false;
        while (manager.isRunning()) {
            if (interruptRequested && !cancelSent) {
                std::cout << "\nStopping after the current download..." << std::endl;
                manager.cancel();
                cancelSent = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        manager.wait();
    }

    curl_global_cleanup();
    Logger::getInstance().close();
    return succeeded ? 0 : 1;
}
