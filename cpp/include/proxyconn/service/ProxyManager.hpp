#pragma once

#include "proxyconn/config/ManagerConfig.hpp"
#include "proxyconn/model/RequestDescription.hpp"
#include "proxyconn/proxy/ProxyEndpoint.hpp"
#include "proxyconn/proxy/ProxyPool.hpp"
#include "proxyconn/proxy/RotationSelector.hpp"
#include "proxyconn/service/Dispatcher.hpp"
#include "proxyconn/service/HealthMonitor.hpp"
#include "proxyconn/transport/Response.hpp"
#include "proxyconn/transport/Transport.hpp"
#include "proxyconn/util/EventSink.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proxyconn::service {

// Correlation tokens from a process-local Snowflake generator.
std::function<std::string()> snowflakeCorrelation();

struct ManagerOptions {
    config::ManagerConfig config;
    // Null picks LoggingEventSink, or NullEventSink when config.disableLogging is set.
    std::shared_ptr<util::EventSink> sink;
    // Null picks SocksHttpTransport.
    std::shared_ptr<transport::Transport> transport;
    // Empty leaves events without a correlation id.
    std::function<std::string()> correlation{snowflakeCorrelation()};
};

struct LiveProxyInfo {
    std::string host;
    std::uint16_t port{};
    std::int64_t latencyMs{};
};

class ProxyManager {
public:
    // Throws config::ConfigError for an invalid configuration.
    explicit ProxyManager(std::vector<proxy::ProxyEndpoint> proxies, ManagerOptions options = {});
    ~ProxyManager();

    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    transport::Response request(const std::string& url, model::RequestOptions options = {});
    transport::Response request(const char* url, model::RequestOptions options = {});
    transport::Response request(const model::RequestDescription& description);
    transport::Response request(const model::RequestTarget& target,
                                std::optional<model::RequestOptions> options = std::nullopt);

    // Blocks until the first health pass has published.
    std::vector<LiveProxyInfo> getLiveProxiesList();
    std::vector<proxy::ProxyStatus> proxyStatuses() const;

    void stop();

    [[nodiscard]] const config::ManagerConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t healthCheckCount() const noexcept { return monitor_.tickCount(); }

private:
    transport::Response dispatch(const model::RequestDescription& description);

    const config::ManagerConfig config_;
    std::shared_ptr<util::EventSink> sink_;
    std::shared_ptr<transport::Transport> transport_;
    std::function<std::string()> correlation_;

    proxy::ProxyPool pool_;
    proxy::RotationSelector selector_;
    Dispatcher dispatcher_;
    HealthMonitor monitor_;
    std::atomic<bool> stopped_{false};
};

} // namespace proxyconn::service
