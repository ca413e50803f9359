#pragma once

#include <optional>
#include <string>
#include <vector>

namespace media_grab::downloader {

/**
 * Ordered list of proxy URIs with a circular active index. The index only moves
 * through rotate(); the retry controller is the sole caller.
 */
class ProxyPool {
public:
    ProxyPool() = default;
    explicit ProxyPool(std::vector<std::string> proxies);

    /**
     * Load a proxy list file: one entry per line, '#' starts a comment.
     * A missing or empty path yields an empty pool. Invalid lines are logged and skipped.
     */
    static ProxyPool fromFile(const std::string& path);

    /**
     * Normalize one proxy line to scheme://[user:pass@]host:port.
     * Accepts host:port, user:pass@host:port and host:port:user:pass, with an
     * optional http, https, socks4, socks5 or socks5h scheme (default http).
     */
    static std::optional<std::string> normalize(const std::string& line);

    std::optional<std::string> getCurrent() const;
    void rotate();

    size_t size() const { return proxies_.size(); }
    bool empty() const { return proxies_.empty(); }

private:
    std::vector<std::string> proxies_;
    size_t activeIndex_ = 0;
};

} // namespace media_grab::downloader
