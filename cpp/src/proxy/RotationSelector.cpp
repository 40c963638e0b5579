#include "proxyconn/proxy/RotationSelector.hpp"

namespace proxyconn::proxy {

RotationSelector::RotationSelector(const ProxyPool& pool)
    : pool_(pool) {}

std::optional<Selection> RotationSelector::currentLocked(const std::shared_ptr<const LiveSet>& snapshot) {
    if (!snapshot || snapshot->empty()) {
        cursor_ = 0;
        lastSize_ = 0;
        return std::nullopt;
    }
    if (snapshot->size() != lastSize_ || cursor_ >= snapshot->size()) {
        cursor_ = 0;
        lastSize_ = snapshot->size();
    }
    const auto& live = snapshot->proxies[cursor_];
    return Selection{live.entry, live.latency, snapshot, cursor_};
}

void RotationSelector::advanceLocked(const std::shared_ptr<const LiveSet>& snapshot) {
    if (!snapshot || snapshot->empty()) {
        cursor_ = 0;
        return;
    }
    cursor_ = (cursor_ + 1) % snapshot->size();
}

std::optional<Selection> RotationSelector::current() {
    auto snapshot = pool_.currentLiveSet();
    std::scoped_lock lock(mutex_);
    return currentLocked(snapshot);
}

void RotationSelector::advance() {
    auto snapshot = pool_.currentLiveSet();
    std::scoped_lock lock(mutex_);
    currentLocked(snapshot);
    advanceLocked(snapshot);
}

std::optional<Selection> RotationSelector::next() {
    auto snapshot = pool_.currentLiveSet();
    std::scoped_lock lock(mutex_);
    auto selection = currentLocked(snapshot);
    if (selection) {
        advanceLocked(snapshot);
    }
    return selection;
}

std::size_t RotationSelector::cursor() const {
    std::scoped_lock lock(mutex_);
    return cursor_;
}

} // namespace proxyconn::proxy
