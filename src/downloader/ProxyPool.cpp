#include "ProxyPool.h"
#include "../../include/media_grab/common/UrlSanitizer.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <fstream>
#include <regex>

namespace media_grab::downloader {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool isValidPort(const std::string& port) {
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    int value = std::stoi(port);
    return value > 0 && value <= 65535;
}

} // namespace

ProxyPool::ProxyPool(std::vector<std::string> proxies) : proxies_(std::move(proxies)) {
}

std::optional<std::string> ProxyPool::normalize(const std::string& line) {
    static const std::regex hostPattern(R"(^[A-Za-z0-9.-]+$)");

    std::string rest = trim(line);
    if (rest.empty()) {
        return std::nullopt;
    }

    std::string scheme = "http";
    size_t schemeEnd = rest.find("://");
    if (schemeEnd != std::string::npos) {
        scheme = rest.substr(0, schemeEnd);
        scheme = common::toLowerAscii(scheme);
        if (scheme != "http" && scheme != "https" && scheme != "socks4" &&
            scheme != "socks5" && scheme != "socks5h") {
            return std::nullopt;
        }
        rest = rest.substr(schemeEnd + 3);
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    std::string credentials;
    std::string hostPort;
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        credentials = rest.substr(0, at);
        hostPort = rest.substr(at + 1);
        if (credentials.find(':') == std::string::npos) {
            return std::nullopt;
        }
    } else {
        // host:port or host:port:user:pass
        std::vector<std::string> parts;
        size_t start = 0;
        size_t pos;
        while ((pos = rest.find(':', start)) != std::string::npos) {
            parts.push_back(rest.substr(start, pos - start));
            start = pos + 1;
        }
        parts.push_back(rest.substr(start));

        if (parts.size() == 2) {
            hostPort = rest;
        } else if (parts.size() == 4) {
            hostPort = parts[0] + ":" + parts[1];
            credentials = parts[2] + ":" + parts[3];
        } else {
            return std::nullopt;
        }
    }

    size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    std::string host = hostPort.substr(0, colon);
    std::string port = hostPort.substr(colon + 1);
    if (host.empty() || !std::regex_match(host, hostPattern) || !isValidPort(port)) {
        return std::nullopt;
    }
    if (!credentials.empty()) {
        size_t sep = credentials.find(':');
        if (sep == 0 || sep + 1 >= credentials.size()) {
            return std::nullopt;
        }
    }

    std::string normalized = scheme + "://";
    if (!credentials.empty()) {
        normalized += credentials + "@";
    }
    normalized += host + ":" + port;
    return normalized;
}

ProxyPool ProxyPool::fromFile(const std::string& path) {
    if (path.empty()) {
        return ProxyPool();
    }

    std::ifstream in(path);
    if (!in) {
        LOG_WARNING("Proxy list not readable, continuing without proxies: " + path);
        return ProxyPool();
    }

    std::vector<std::string> proxies;
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        lineNumber++;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }
        if (auto normalized = normalize(entry)) {
            if (std::find(proxies.begin(), proxies.end(), *normalized) == proxies.end()) {
                proxies.push_back(*normalized);
            }
        } else {
            LOG_WARNING("Skipping invalid proxy entry at " + path + ":" + std::to_string(lineNumber));
        }
    }

    LOG_INFO("Loaded " + std::to_string(proxies.size()) + " proxy entr" + (proxies.size() == 1 ? "y" : "ies") + " from " + path);
    return ProxyPool(std::move(proxies));
}

std::optional<std::string> ProxyPool::getCurrent() const {
    if (proxies_.empty()) {
        return std::nullopt;
    }
    return proxies_[activeIndex_];
}

void ProxyPool::rotate() {
    if (proxies_.size() <= 1) {
        return;
    }
    activeIndex_ = (activeIndex_ + 1) % proxies_.size();
    LOG_DEBUG("Rotated to proxy #" + std::to_string(activeIndex_ + 1) + " of " + std::to_string(proxies_.size()));
}

} // namespace media_grab::downloader
