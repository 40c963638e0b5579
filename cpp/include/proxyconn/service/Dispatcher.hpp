#pragma once

#include "proxyconn/config/ManagerConfig.hpp"
#include "proxyconn/model/RequestDescription.hpp"
#include "proxyconn/proxy/ProxyPool.hpp"
#include "proxyconn/proxy/RotationSelector.hpp"
#include "proxyconn/transport/Response.hpp"
#include "proxyconn/transport/Transport.hpp"
#include "proxyconn/util/EventSink.hpp"

#include <memory>
#include <string>

namespace proxyconn::service {

/**
 * Runs one logical request against the live set. A completed exchange is a
 * success whatever its HTTP status. Timeouts and transport errors retry on
 * the same proxy while its budget lasts, then rotate.
 *
 * The shared selector picks only the first proxy. Rotation walks the latest
 * live set onward from the failed proxy and skips proxies this request has
 * already used in the current pass, so concurrent requests moving the shared
 * cursor never send it back to a proxy that just failed. Rotation stops after
 * changeProxyLoop full passes over the live set.
 *
 * Throws proxy::NoLiveProxiesError when nothing is live at selection time and
 * proxy::AllProxiesFailedError once the rotation budget is spent.
 */
class Dispatcher {
public:
    Dispatcher(proxy::ProxyPool& pool,
               proxy::RotationSelector& selector,
               transport::Transport& transport,
               const config::ManagerConfig& config,
               std::shared_ptr<util::EventSink> sink);

    transport::Response dispatch(const model::RequestDescription& request, const std::string& correlationId = {});

private:
    void record(util::EventKind kind, boost::json::object details, const std::string& correlationId);

    proxy::ProxyPool& pool_;
    proxy::RotationSelector& selector_;
    transport::Transport& transport_;
    const config::ManagerConfig& config_;
    std::shared_ptr<util::EventSink> sink_;
};

} // namespace proxyconn::service
