#include "proxyconn/service/HealthMonitor.hpp"

#include "proxyconn/proxy/ProxyErrors.hpp"
#include "proxyconn/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace proxyconn::service {
namespace {

model::RequestDescription makeProbeRequest(const config::ManagerConfig& config) {
    model::RequestOptions options;
    options.method = "GET";
    options.headers.set("User-Agent", config.userAgent);
    options.timeout = config.maxTimeout;
    return model::makeRequestDescription(config.healthCheckUrl, std::move(options));
}

} // namespace

HealthMonitor::HealthMonitor(proxy::ProxyPool& pool,
                             transport::Transport& transport,
                             const config::ManagerConfig& config,
                             std::shared_ptr<util::EventSink> sink)
    : pool_(pool)
    , transport_(transport)
    , config_(config)
    , sink_(std::move(sink))
    , probeRequest_(makeProbeRequest(config))
    , timer_(io_)
    , probePool_(config::effectiveProbeConcurrency(config, pool.size())) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::scoped_lock lock(lifecycleMutex_);
    if (started_.load() || stopped_.load()) {
        return;
    }
    started_.store(true);
    boost::asio::post(io_, [this] { doRefresh(); });
    thread_ = std::thread([this] {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, std::string{"Health monitor stopped unexpectedly: "} + ex.what());
            // Release callers still waiting on the first health pass.
            pool_.close();
        }
    });
}

void HealthMonitor::stop() {
    std::scoped_lock lock(lifecycleMutex_);
    if (stopped_.exchange(true)) {
        return;
    }
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    probePool_.join();
}

void HealthMonitor::doRefresh() {
    if (stopped_.load()) {
        return;
    }
    const auto started = std::chrono::steady_clock::now();
    const auto& entries = pool_.allEntries();

    std::vector<std::future<proxy::ProbeOutcome>> pending;
    pending.reserve(entries.size());
    for (const auto& entry : entries) {
        std::packaged_task<proxy::ProbeOutcome()> task([this, entry] { return probe(entry->endpoint); });
        pending.push_back(task.get_future());
        boost::asio::post(probePool_, std::move(task));
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto outcome = pending[i].get();
        auto& entry = *entries[i];
        pool_.updateProbe(entry, outcome);
        if (!outcome.alive) {
            boost::json::object details{{"proxy", entry.endpoint.toString()}, {"error", outcome.error}};
            if (outcome.status) {
                details["status"] = *outcome.status;
            }
            sink_->record(util::EventKind::probe_failed, details);
        }
    }

    auto snapshot = pool_.publishLiveSet(pool_.buildLiveSet());
    const auto tick = ticks_.fetch_add(1) + 1;
    const auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    sink_->record(util::EventKind::health_check_completed,
                  boost::json::object{{"alive", snapshot->size()},
                                      {"total", entries.size()},
                                      {"durationMs", duration.count()},
                                      {"tick", tick},
                                      {"generation", snapshot->generation}});
    util::log(util::LogLevel::debug,
              "Health check #" + std::to_string(tick) + ": " + std::to_string(snapshot->size()) + "/" +
                  std::to_string(entries.size()) + " proxies alive");

    scheduleNext();
}

void HealthMonitor::scheduleNext() {
    if (stopped_.load()) {
        return;
    }
    timer_.expires_after(config_.healthCheckInterval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            doRefresh();
        }
    });
}

proxy::ProbeOutcome HealthMonitor::probe(const proxy::ProxyEndpoint& endpoint) {
    proxy::ProbeOutcome outcome;
    const auto started = std::chrono::steady_clock::now();
    try {
        auto response = transport_.exchange(probeRequest_, endpoint, config_.maxTimeout);
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        outcome.status = response.status();
        if (response.ok()) {
            outcome.alive = true;
            outcome.latency = latency;
        } else {
            outcome.error = "health check returned HTTP " + std::to_string(response.status());
        }
    } catch (const proxy::ProxyConnError& ex) {
        outcome.error = ex.what();
    } catch (const std::exception& ex) {
        outcome.error = std::string{"probe failed: "} + ex.what();
    }
    util::log(util::LogLevel::trace,
              "Probe " + endpoint.toString() + (outcome.alive ? " alive in " + std::to_string(outcome.latency->count()) + "ms"
                                                               : " dead: " + outcome.error));
    return outcome;
}

} // namespace proxyconn::service
