#pragma once

#include "proxyconn/config/ManagerConfig.hpp"
#include "proxyconn/model/RequestDescription.hpp"
#include "proxyconn/proxy/ProxyPool.hpp"
#include "proxyconn/transport/Transport.hpp"
#include "proxyconn/util/EventSink.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace proxyconn::service {

/**
 * Probes every configured proxy against the health-check URL on a fixed
 * cadence and publishes the resulting live set to the pool. The timer runs on
 * a private io_context thread; probes of one tick run in parallel on a
 * worker pool and the tick publishes once all of them have settled.
 */
class HealthMonitor {
public:
    HealthMonitor(proxy::ProxyPool& pool,
                  transport::Transport& transport,
                  const config::ManagerConfig& config,
                  std::shared_ptr<util::EventSink> sink);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // The first tick starts immediately.
    void start();
    // Waits for an in-flight tick, then joins the timer thread. Safe to repeat.
    void stop();

    [[nodiscard]] std::uint64_t tickCount() const noexcept { return ticks_.load(); }
    [[nodiscard]] bool running() const noexcept { return started_.load() && !stopped_.load(); }

private:
    void doRefresh();
    void scheduleNext();
    proxy::ProbeOutcome probe(const proxy::ProxyEndpoint& endpoint);

    proxy::ProxyPool& pool_;
    transport::Transport& transport_;
    const config::ManagerConfig& config_;
    std::shared_ptr<util::EventSink> sink_;
    model::RequestDescription probeRequest_;

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool probePool_;
    std::thread thread_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> ticks_{0};
};

} // namespace proxyconn::service
