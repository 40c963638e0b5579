#include "proxyconn/proxy/ProxyPool.hpp"

#include <algorithm>

namespace proxyconn::proxy {
namespace {

bool compareLive(const LiveProxy& lhs, const LiveProxy& rhs) {
    return lhs.latency < rhs.latency;
}

} // namespace

ProxyPool::ProxyPool(std::vector<ProxyEndpoint> endpoints)
    : liveSet_(std::make_shared<const LiveSet>()) {
    entries_.reserve(endpoints.size());
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        entries_.push_back(std::make_shared<ProxyEntry>(std::move(endpoints[i]), i));
    }
}

void ProxyPool::updateProbe(ProxyEntry& entry, const ProbeOutcome& outcome) {
    const bool alive = outcome.alive && outcome.latency && outcome.latency->count() >= 0;
    {
        std::scoped_lock lock(mutex_);
        entry.alive = alive;
        entry.lastCheckedAt = std::chrono::system_clock::now();
        if (alive) {
            entry.latency = outcome.latency;
            entry.lastProbeError.clear();
        } else {
            entry.lastProbeError = outcome.error.empty() && outcome.alive ? "probe reported no latency" : outcome.error;
        }
    }
    if (alive) {
        entry.consecutiveFailures.store(0);
    }
}

void ProxyPool::recordDispatchOutcome(ProxyEntry& entry, bool success) {
    if (success) {
        entry.consecutiveFailures.store(0);
    } else {
        entry.consecutiveFailures.fetch_add(1);
    }
}

std::vector<LiveProxy> ProxyPool::buildLiveSet() const {
    std::vector<LiveProxy> live;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry->alive && entry->latency) {
                live.push_back(LiveProxy{entry, *entry->latency});
            }
        }
    }
    std::stable_sort(live.begin(), live.end(), compareLive);
    return live;
}

std::shared_ptr<const LiveSet> ProxyPool::publishLiveSet(std::vector<LiveProxy> proxies) {
    auto next = std::make_shared<LiveSet>();
    next->publishedAt = std::chrono::system_clock::now();
    next->proxies = std::move(proxies);
    {
        std::scoped_lock lock(mutex_);
        next->generation = ++generation_;
        liveSet_ = next;
        published_ = true;
    }
    publishedCv_.notify_all();
    return next;
}

std::shared_ptr<const LiveSet> ProxyPool::currentLiveSet() const {
    std::scoped_lock lock(mutex_);
    return liveSet_;
}

bool ProxyPool::hasPublished() const {
    std::scoped_lock lock(mutex_);
    return published_;
}

bool ProxyPool::waitForFirstPublish() {
    std::unique_lock lock(mutex_);
    publishedCv_.wait(lock, [this] { return published_ || closed_; });
    return published_;
}

bool ProxyPool::waitForFirstPublish(std::chrono::milliseconds limit) {
    std::unique_lock lock(mutex_);
    publishedCv_.wait_for(lock, limit, [this] { return published_ || closed_; });
    return published_;
}

void ProxyPool::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    publishedCv_.notify_all();
}

bool ProxyPool::closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

ProxyStatus ProxyPool::statusLocked(const ProxyEntry& entry) const {
    ProxyStatus status;
    status.endpoint = entry.endpoint;
    status.index = entry.index;
    status.alive = entry.alive;
    status.latency = entry.latency;
    status.lastCheckedAt = entry.lastCheckedAt;
    status.lastProbeError = entry.lastProbeError;
    status.consecutiveFailures = entry.consecutiveFailures.load();
    return status;
}

ProxyStatus ProxyPool::status(const ProxyEntry& entry) const {
    std::scoped_lock lock(mutex_);
    return statusLocked(entry);
}

std::vector<ProxyStatus> ProxyPool::statuses() const {
    std::scoped_lock lock(mutex_);
    std::vector<ProxyStatus> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(statusLocked(*entry));
    }
    return result;
}

} // namespace proxyconn::proxy
