#pragma once

#include "proxyconn/proxy/ProxyEndpoint.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace proxyconn::proxy {

struct ProbeOutcome {
    bool alive{};
    std::optional<std::chrono::milliseconds> latency;
    std::optional<int> status;
    std::string error;
};

// Identity is fixed at construction. Probe fields are guarded by the owning
// ProxyPool's mutex; the failure counter is updated lock-free.
struct ProxyEntry {
    ProxyEntry(ProxyEndpoint endpointIn, std::size_t indexIn)
        : endpoint(std::move(endpointIn))
        , index(indexIn) {}

    const ProxyEndpoint endpoint;
    const std::size_t index;

    bool alive{false};
    std::optional<std::chrono::milliseconds> latency;
    std::optional<std::chrono::system_clock::time_point> lastCheckedAt;
    std::string lastProbeError;

    std::atomic<int> consecutiveFailures{0};
};

struct ProxyStatus {
    ProxyEndpoint endpoint;
    std::size_t index{};
    bool alive{};
    std::optional<std::chrono::milliseconds> latency;
    std::optional<std::chrono::system_clock::time_point> lastCheckedAt;
    std::string lastProbeError;
    int consecutiveFailures{};
};

struct LiveProxy {
    std::shared_ptr<ProxyEntry> entry;
    std::chrono::milliseconds latency{};
};

struct LiveSet {
    std::uint64_t generation{};
    std::chrono::system_clock::time_point publishedAt{};
    std::vector<LiveProxy> proxies;

    [[nodiscard]] std::size_t size() const noexcept { return proxies.size(); }
    [[nodiscard]] bool empty() const noexcept { return proxies.empty(); }
};

class ProxyPool {
public:
    explicit ProxyPool(std::vector<ProxyEndpoint> endpoints);

    ProxyPool(const ProxyPool&) = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    [[nodiscard]] const std::vector<std::shared_ptr<ProxyEntry>>& allEntries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    void updateProbe(ProxyEntry& entry, const ProbeOutcome& outcome);
    void recordDispatchOutcome(ProxyEntry& entry, bool success);

    // Alive entries sorted by latency, configuration order on ties. Not published.
    std::vector<LiveProxy> buildLiveSet() const;
    std::shared_ptr<const LiveSet> publishLiveSet(std::vector<LiveProxy> proxies);
    std::shared_ptr<const LiveSet> currentLiveSet() const;

    [[nodiscard]] bool hasPublished() const;
    // Returns false if the pool was closed before anything was published.
    bool waitForFirstPublish();
    bool waitForFirstPublish(std::chrono::milliseconds limit);
    void close();
    [[nodiscard]] bool closed() const;

    ProxyStatus status(const ProxyEntry& entry) const;
    std::vector<ProxyStatus> statuses() const;

private:
    ProxyStatus statusLocked(const ProxyEntry& entry) const;

    std::vector<std::shared_ptr<ProxyEntry>> entries_;
    mutable std::mutex mutex_;
    std::condition_variable publishedCv_;
    std::shared_ptr<const LiveSet> liveSet_;
    std::uint64_t generation_{0};
    bool published_{false};
    bool closed_{false};
};

} // namespace proxyconn::proxy
