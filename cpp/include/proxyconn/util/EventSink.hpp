#pragma once

#include "proxyconn/util/Logging.hpp"

#include <boost/json.hpp>

#include <memory>

namespace proxyconn::util {

enum class EventKind {
    proxy_selected,
    proxy_failed,
    request_succeeded,
    request_exhausted,
    probe_failed,
    health_check_completed,
    manager_stopped
};

const char* toString(EventKind kind);

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void record(EventKind kind, const boost::json::object& details) = 0;
};

class NullEventSink final : public EventSink {
public:
    void record(EventKind, const boost::json::object&) override {}
};

// Writes each event as one log line; failures and exhaustion at warn, the rest at debug/info.
class LoggingEventSink final : public EventSink {
public:
    void record(EventKind kind, const boost::json::object& details) override;

    static LogLevel levelFor(EventKind kind) noexcept;
};

std::shared_ptr<EventSink> makeEventSink(bool disableLogging);

} // namespace proxyconn::util
