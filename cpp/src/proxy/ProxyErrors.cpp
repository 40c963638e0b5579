#include "proxyconn/proxy/ProxyErrors.hpp"

namespace proxyconn::proxy {
namespace {

std::string describeExhaustion(std::size_t attempts,
                               std::size_t proxiesTried,
                               const std::optional<ProxyEndpoint>& lastProxy,
                               const std::string& lastErrorMessage) {
    std::string message = "All proxies failed after " + std::to_string(attempts) + " attempt(s) across " +
                          std::to_string(proxiesTried) + " prox" + (proxiesTried == 1 ? "y" : "ies");
    if (lastProxy) {
        message += ", last proxy " + lastProxy->toString();
    }
    if (!lastErrorMessage.empty()) {
        message += ": " + lastErrorMessage;
    }
    return message;
}

} // namespace

const char* toString(ProxyTransportError::Type type) {
    switch (type) {
    case ProxyTransportError::Type::connect_failed: return "connect_failed";
    case ProxyTransportError::Type::authentication_failed: return "authentication_failed";
    case ProxyTransportError::Type::tunnel_rejected: return "tunnel_rejected";
    case ProxyTransportError::Type::tls_failed: return "tls_failed";
    case ProxyTransportError::Type::io_failed: return "io_failed";
    case ProxyTransportError::Type::protocol_error: return "protocol_error";
    }
    return "unknown";
}

const char* toString(AttemptOutcome outcome) {
    switch (outcome) {
    case AttemptOutcome::success: return "success";
    case AttemptOutcome::timeout: return "timeout";
    case AttemptOutcome::error: return "error";
    }
    return "unknown";
}

AllProxiesFailedError::AllProxiesFailedError(std::size_t attempts,
                                             std::size_t proxiesTried,
                                             std::optional<ProxyEndpoint> lastProxy,
                                             std::exception_ptr lastError,
                                             std::string lastErrorMessage,
                                             std::vector<AttemptRecord> trace)
    : ProxyConnError(describeExhaustion(attempts, proxiesTried, lastProxy, lastErrorMessage))
    , attempts_(attempts)
    , proxiesTried_(proxiesTried)
    , lastProxy_(std::move(lastProxy))
    , lastError_(std::move(lastError))
    , lastErrorMessage_(std::move(lastErrorMessage))
    , trace_(std::move(trace)) {}

void AllProxiesFailedError::rethrowLast() const {
    if (lastError_) {
        std::rethrow_exception(lastError_);
    }
    throw ProxyConnError(lastErrorMessage_.empty() ? std::string{what()} : lastErrorMessage_);
}

} // namespace proxyconn::proxy
