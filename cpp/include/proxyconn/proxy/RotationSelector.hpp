#pragma once

#include "proxyconn/proxy/ProxyPool.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace proxyconn::proxy {

struct Selection {
    std::shared_ptr<ProxyEntry> entry;
    std::chrono::milliseconds latency{};
    std::shared_ptr<const LiveSet> snapshot;
    std::size_t position{};
};

/**
 * Round-robin cursor over the pool's latest live set. The cursor goes back
 * to the fastest proxy whenever the live set changes size.
 */
class RotationSelector {
public:
    explicit RotationSelector(const ProxyPool& pool);

    // Empty when no proxy is live.
    std::optional<Selection> current();
    void advance();
    // current() followed by advance() under one lock.
    std::optional<Selection> next();

    [[nodiscard]] std::size_t cursor() const;

private:
    std::optional<Selection> currentLocked(const std::shared_ptr<const LiveSet>& snapshot);
    void advanceLocked(const std::shared_ptr<const LiveSet>& snapshot);

    const ProxyPool& pool_;
    mutable std::mutex mutex_;
    std::size_t cursor_{0};
    std::size_t lastSize_{0};
};

} // namespace proxyconn::proxy
