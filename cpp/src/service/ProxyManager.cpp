#include "proxyconn/service/ProxyManager.hpp"

#include "proxyconn/transport/SocksHttpTransport.hpp"
#include "proxyconn/util/Logging.hpp"
#include "proxyconn/util/SnowflakeId.hpp"

namespace proxyconn::service {
namespace {

const config::ManagerConfig& validated(const config::ManagerConfig& config) {
    config::validate(config);
    return config;
}

std::shared_ptr<transport::Transport> defaultTransport(const config::ManagerConfig& config) {
    transport::SocksHttpTransport::Options options;
    options.userAgent = config.userAgent;
    return std::make_shared<transport::SocksHttpTransport>(std::move(options));
}

} // namespace

std::function<std::string()> snowflakeCorrelation() {
    auto generator = std::make_shared<util::SnowflakeIdGenerator>();
    return [generator] { return generator->nextToken(); };
}

ProxyManager::ProxyManager(std::vector<proxy::ProxyEndpoint> proxies, ManagerOptions options)
    : config_(validated(options.config))
    , sink_(options.sink ? std::move(options.sink) : util::makeEventSink(config_.disableLogging))
    , transport_(options.transport ? std::move(options.transport) : defaultTransport(config_))
    , correlation_(std::move(options.correlation))
    , pool_(std::move(proxies))
    , selector_(pool_)
    , dispatcher_(pool_, selector_, *transport_, config_, sink_)
    , monitor_(pool_, *transport_, config_, sink_) {
    util::log(util::LogLevel::info,
              "Proxy manager starting with " + std::to_string(pool_.size()) + " proxies, health check " +
                  config_.healthCheckUrl + " every " + std::to_string(config_.healthCheckInterval.count()) + "ms");
    monitor_.start();
}

ProxyManager::~ProxyManager() {
    stop();
}

transport::Response ProxyManager::request(const std::string& url, model::RequestOptions options) {
    return dispatch(model::makeRequestDescription(url, std::move(options)));
}

transport::Response ProxyManager::request(const char* url, model::RequestOptions options) {
    return dispatch(model::makeRequestDescription(std::string(url), std::move(options)));
}

transport::Response ProxyManager::request(const model::RequestDescription& description) {
    return dispatch(model::resolveRequest(description));
}

transport::Response ProxyManager::request(const model::RequestTarget& target,
                                          std::optional<model::RequestOptions> options) {
    return dispatch(model::resolveRequest(target, std::move(options)));
}

transport::Response ProxyManager::dispatch(const model::RequestDescription& description) {
    std::string correlationId = correlation_ ? correlation_() : std::string{};
    return dispatcher_.dispatch(description, correlationId);
}

std::vector<LiveProxyInfo> ProxyManager::getLiveProxiesList() {
    pool_.waitForFirstPublish();
    auto snapshot = pool_.currentLiveSet();
    std::vector<LiveProxyInfo> result;
    result.reserve(snapshot->size());
    for (const auto& live : snapshot->proxies) {
        result.push_back(LiveProxyInfo{live.entry->endpoint.host, live.entry->endpoint.port, live.latency.count()});
    }
    return result;
}

std::vector<proxy::ProxyStatus> ProxyManager::proxyStatuses() const {
    return pool_.statuses();
}

void ProxyManager::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    monitor_.stop();
    pool_.close();
    sink_->record(util::EventKind::manager_stopped,
                  boost::json::object{{"healthChecks", monitor_.tickCount()}, {"proxies", pool_.size()}});
}

} // namespace proxyconn::service
