#include <catch2/catch_test_macros.hpp>
#include "RateLimiter.h"
#include <thread>

using namespace media_grab::downloader;
using namespace std::chrono;

TEST_CASE("RateLimiter spaces calls to the same domain", "[RateLimiter]") {
    RateLimiter limiter({{"example.com", milliseconds(200)}}, milliseconds(50));

    SECTION("First call passes straight through") {
        REQUIRE(limiter.blockUntilAllowed("example.com") < milliseconds(50));
    }

    SECTION("Consecutive calls are at least the interval apart") {
        limiter.blockUntilAllowed("example.com");
        auto first = steady_clock::now();
        limiter.blockUntilAllowed("example.com");
        auto second = steady_clock::now();

        REQUIRE(duration_cast<milliseconds>(second - first) >= milliseconds(195));
    }

    SECTION("Pending delay is reported without stamping") {
        limiter.blockUntilAllowed("example.com");
        auto delay = limiter.getDelay("example.com");
        REQUIRE(delay > milliseconds(0));
        REQUIRE(delay <= milliseconds(200));
        REQUIRE(limiter.getDelay("unseen.org") == milliseconds(0));
    }
}

TEST_CASE("RateLimiter keeps domains independent", "[RateLimiter]") {
    RateLimiter limiter({{"slow.com", milliseconds(500)}}, milliseconds(0));
    limiter.blockUntilAllowed("slow.com");

    // One thread waits on slow.com while another calls a different domain
    std::thread waiter([&limiter]() { limiter.blockUntilAllowed("slow.com"); });
    std::this_thread::sleep_for(milliseconds(50));

    auto start = steady_clock::now();
    limiter.blockUntilAllowed("fast.org");
    auto waited = duration_cast<milliseconds>(steady_clock::now() - start);
    waiter.join();

    REQUIRE(waited < milliseconds(200));
}

TEST_CASE("RateLimiter picks the most specific interval", "[RateLimiter]") {
    RateLimiter limiter({{"example.com", milliseconds(100)}, {"cdn.example.com", milliseconds(500)}}, milliseconds(10));

    REQUIRE(limiter.getInterval("example.com") == milliseconds(100));
    REQUIRE(limiter.getInterval("www.example.com") == milliseconds(100));
    REQUIRE(limiter.getInterval("a.cdn.example.com") == milliseconds(500));
    REQUIRE(limiter.getInterval("notexample.com") == milliseconds(10));

    SECTION("Configured defaults cover the supported platforms") {
        RateLimiter defaults{DownloadConfig()};
        REQUIRE(defaults.getInterval("instagram.com") == milliseconds(5000));
        REQUIRE(defaults.getInterval("vimeo.com") == DownloadConfig().defaultRateLimit);
    }
}
