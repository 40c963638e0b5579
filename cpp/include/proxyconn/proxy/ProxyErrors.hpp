#pragma once

#include "proxyconn/proxy/ProxyEndpoint.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxyconn::proxy {

class ProxyConnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NoLiveProxiesError : public ProxyConnError {
public:
    NoLiveProxiesError()
        : ProxyConnError("No live proxies available") {}
};

class ProxyTimeoutError : public ProxyConnError {
public:
    ProxyTimeoutError(ProxyEndpoint proxy, std::chrono::milliseconds timeout, const std::string& stage)
        : ProxyConnError("Request through " + proxy.toString() + " timed out after " +
                         std::to_string(timeout.count()) + "ms while " + stage)
        , proxy_(std::move(proxy))
        , timeout_(timeout) {}

    [[nodiscard]] const ProxyEndpoint& proxy() const noexcept { return proxy_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    ProxyEndpoint proxy_;
    std::chrono::milliseconds timeout_;
};

class ProxyTransportError : public ProxyConnError {
public:
    enum class Type {
        connect_failed,
        authentication_failed,
        tunnel_rejected,
        tls_failed,
        io_failed,
        protocol_error,
    };

    ProxyTransportError(Type type, ProxyEndpoint proxy, const std::string& message)
        : ProxyConnError(message + " (proxy " + proxy.toString() + ")")
        , type_(type)
        , proxy_(std::move(proxy)) {}

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] const ProxyEndpoint& proxy() const noexcept { return proxy_; }

private:
    Type type_;
    ProxyEndpoint proxy_;
};

const char* toString(ProxyTransportError::Type type);

enum class AttemptOutcome {
    success,
    timeout,
    error,
};

const char* toString(AttemptOutcome outcome);

struct AttemptRecord {
    ProxyEndpoint proxy;
    AttemptOutcome outcome{AttemptOutcome::success};
    std::string message;
    std::chrono::milliseconds elapsed{};
};

class AllProxiesFailedError : public ProxyConnError {
public:
    AllProxiesFailedError(std::size_t attempts,
                          std::size_t proxiesTried,
                          std::optional<ProxyEndpoint> lastProxy,
                          std::exception_ptr lastError,
                          std::string lastErrorMessage,
                          std::vector<AttemptRecord> trace);

    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] std::size_t proxiesTried() const noexcept { return proxiesTried_; }
    [[nodiscard]] const std::optional<ProxyEndpoint>& lastProxy() const noexcept { return lastProxy_; }
    [[nodiscard]] std::exception_ptr lastError() const noexcept { return lastError_; }
    [[nodiscard]] const std::string& lastErrorMessage() const noexcept { return lastErrorMessage_; }
    [[nodiscard]] const std::vector<AttemptRecord>& trace() const noexcept { return trace_; }

    // Rethrows the last underlying ProxyTimeoutError / ProxyTransportError.
    [[noreturn]] void rethrowLast() const;

private:
    std::size_t attempts_;
    std::size_t proxiesTried_;
    std::optional<ProxyEndpoint> lastProxy_;
    std::exception_ptr lastError_;
    std::string lastErrorMessage_;
    std::vector<AttemptRecord> trace_;
};

class BodyAlreadyConsumedError : public ProxyConnError {
public:
    BodyAlreadyConsumedError()
        : ProxyConnError("Body has already been consumed") {}
};

} // namespace proxyconn::proxy
