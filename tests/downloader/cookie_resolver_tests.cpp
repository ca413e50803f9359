#include <catch2/catch_test_macros.hpp>
#include "CookieResolver.h"
#include "TestSupport.h"

using namespace media_grab::downloader;
using media_grab::testing::TempDir;
using media_grab::testing::readFile;
using media_grab::testing::writeFile;

namespace {

const std::string NETSCAPE_JAR =
    "# Netscape HTTP Cookie File\n"
    ".youtube.com\tTRUE\t/\tTRUE\t0\tSID\tabc123\n";

DownloadConfig configFor(const TempDir& tmp) {
    DownloadConfig config;
    config.cookiesDirectory = (tmp / "cookies").string();
    config.convenienceCookieFile = (tmp / "desktop" / "cookies.txt").string();
    return config;
}

} // namespace

TEST_CASE("CookieResolver orders cookie candidates", "[CookieResolver]") {
    TempDir tmp;
    const auto cookies = tmp / "cookies";
    const auto source = tmp / "source";
    writeFile(cookies / "cookies.txt", NETSCAPE_JAR);
    writeFile(cookies / "youtube.txt", NETSCAPE_JAR);
    writeFile(cookies / "instagram_cookies.txt", NETSCAPE_JAR);
    writeFile(cookies / "session_cookies.txt", NETSCAPE_JAR);
    writeFile(tmp / "desktop" / "cookies.txt", NETSCAPE_JAR);
    writeFile(source / "cookies.txt", NETSCAPE_JAR);

    CookieResolver resolver(configFor(tmp), (tmp / "cache").string());

    SECTION("Master, platform, generic, convenience, then source folder") {
        auto candidates = resolver.resolve("https://www.youtube.com/watch?v=dQw4w9WgXcQ", source.string());

        REQUIRE(candidates == std::vector<std::string>{
            (cookies / "cookies.txt").string(),
            (cookies / "youtube.txt").string(),
            (cookies / "session_cookies.txt").string(),
            (tmp / "desktop" / "cookies.txt").string(),
            (source / "cookies.txt").string(),
        });
    }

    SECTION("Another platform's file is never offered") {
        auto candidates = resolver.resolve("https://www.youtube.com/watch?v=dQw4w9WgXcQ");
        for (const auto& candidate : candidates) {
            REQUIRE(candidate.find("instagram") == std::string::npos);
        }
    }

    SECTION("Platform files are found by alias") {
        auto candidates = resolver.resolve("https://www.instagram.com/p/ABC/");
        REQUIRE(candidates.size() == 4);
        REQUIRE(candidates[1] == (cookies / "instagram_cookies.txt").string());
    }
}

TEST_CASE("CookieResolver ignores unusable files", "[CookieResolver]") {
    TempDir tmp;
    writeFile(tmp / "cookies" / "cookies.txt", "x");
    writeFile(tmp / "cookies" / "yt.txt", NETSCAPE_JAR);

    CookieResolver resolver(configFor(tmp), (tmp / "cache").string());
    auto candidates = resolver.resolve("https://youtu.be/dQw4w9WgXcQ");

    REQUIRE(candidates == std::vector<std::string>{(tmp / "cookies" / "yt.txt").string()});
}

TEST_CASE("CookieResolver converts simple cookie files", "[CookieResolver]") {
    TempDir tmp;
    CookieResolver resolver(configFor(tmp), (tmp / "cache").string());

    SECTION("Netscape files are used as they are") {
        writeFile(tmp / "jar.txt", NETSCAPE_JAR);
        REQUIRE(resolver.ensureNetscape((tmp / "jar.txt").string(), "youtube") == (tmp / "jar.txt").string());
    }

    SECTION("name=value lines become a Netscape jar in the cache") {
        writeFile(tmp / "simple.txt", "SID=abc123\nHSID = def456\n# comment\n");
        auto converted = resolver.ensureNetscape((tmp / "simple.txt").string(), "youtube");

        REQUIRE(converted.has_value());
        REQUIRE(converted->find((tmp / "cache").string()) == 0);
        const std::string content = readFile(*converted);
        REQUIRE(content.find("# Netscape HTTP Cookie File") == 0);
        REQUIRE(content.find(".youtube.com\tTRUE\t/\tTRUE\t") != std::string::npos);
        REQUIRE(content.find("\tSID\tabc123\n") != std::string::npos);
        REQUIRE(content.find("\tHSID\tdef456\n") != std::string::npos);
    }

    SECTION("Simple files cannot be converted without a known platform") {
        writeFile(tmp / "simple.txt", "SID=abc123\n");
        REQUIRE_FALSE(resolver.ensureNetscape((tmp / "simple.txt").string(), "other").has_value());
    }

    SECTION("Missing files are rejected") {
        REQUIRE_FALSE(resolver.ensureNetscape((tmp / "missing.txt").string(), "youtube").has_value());
    }
}
