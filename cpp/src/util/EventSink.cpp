#include "proxyconn/util/EventSink.hpp"

#include "proxyconn/util/JsonUtil.hpp"

namespace proxyconn::util {

const char* toString(EventKind kind) {
    switch (kind) {
    case EventKind::proxy_selected: return "proxy_selected";
    case EventKind::proxy_failed: return "proxy_failed";
    case EventKind::request_succeeded: return "request_succeeded";
    case EventKind::request_exhausted: return "request_exhausted";
    case EventKind::probe_failed: return "probe_failed";
    case EventKind::health_check_completed: return "health_check_completed";
    case EventKind::manager_stopped: return "manager_stopped";
    }
    return "unknown";
}

LogLevel LoggingEventSink::levelFor(EventKind kind) noexcept {
    switch (kind) {
    case EventKind::proxy_failed:
    case EventKind::request_exhausted:
        return LogLevel::warn;
    case EventKind::health_check_completed:
    case EventKind::manager_stopped:
        return LogLevel::info;
    case EventKind::proxy_selected:
    case EventKind::request_succeeded:
    case EventKind::probe_failed:
        return LogLevel::debug;
    }
    return LogLevel::info;
}

void LoggingEventSink::record(EventKind kind, const boost::json::object& details) {
    auto level = levelFor(kind);
    if (!shouldLog(level)) {
        return;
    }
    log(level, std::string{"["} + toString(kind) + "] " + stringifyJson(details));
}

std::shared_ptr<EventSink> makeEventSink(bool disableLogging) {
    if (disableLogging) {
        return std::make_shared<NullEventSink>();
    }
    return std::make_shared<LoggingEventSink>();
}

} // namespace proxyconn::util
