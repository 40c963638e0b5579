#include "proxyconn/service/Dispatcher.hpp"

#include "proxyconn/proxy/ProxyErrors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <vector>

namespace proxyconn::service {
namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

// Where a rotating request goes next: the first live entry after its current
// one that it has not used in this pass. When every live entry has been used
// the pass restarts.
proxy::Selection rotateFrom(const proxy::Selection& current,
                            const std::shared_ptr<const proxy::LiveSet>& live,
                            std::vector<bool>& used) {
    const auto size = live->size();
    std::size_t start = current.position;
    bool found = false;
    for (std::size_t i = 0; i < size; ++i) {
        if (live->proxies[i].entry->index == current.entry->index) {
            start = i + 1;
            found = true;
            break;
        }
    }
    if (!found) {
        // The failed proxy left the live set; its slot now holds the next one.
        start = current.position;
    }

    for (std::size_t step = 0; step < size; ++step) {
        const auto position = (start + step) % size;
        const auto& candidate = live->proxies[position];
        if (!used[candidate.entry->index]) {
            used[candidate.entry->index] = true;
            return proxy::Selection{candidate.entry, candidate.latency, live, position};
        }
    }

    std::fill(used.begin(), used.end(), false);
    const auto position = start % size;
    const auto& candidate = live->proxies[position];
    used[candidate.entry->index] = true;
    return proxy::Selection{candidate.entry, candidate.latency, live, position};
}

} // namespace

Dispatcher::Dispatcher(proxy::ProxyPool& pool,
                       proxy::RotationSelector& selector,
                       transport::Transport& transport,
                       const config::ManagerConfig& config,
                       std::shared_ptr<util::EventSink> sink)
    : pool_(pool)
    , selector_(selector)
    , transport_(transport)
    , config_(config)
    , sink_(std::move(sink)) {}

void Dispatcher::record(util::EventKind kind, boost::json::object details, const std::string& correlationId) {
    if (!correlationId.empty()) {
        details["correlationId"] = correlationId;
    }
    sink_->record(kind, details);
}

transport::Response Dispatcher::dispatch(const model::RequestDescription& request, const std::string& correlationId) {
    pool_.waitForFirstPublish();

    auto selection = selector_.next();
    if (!selection) {
        record(util::EventKind::request_exhausted,
               boost::json::object{{"url", request.urlString()}, {"attempts", 0}, {"reason", "no live proxies"}},
               correlationId);
        throw proxy::NoLiveProxiesError();
    }

    const auto timeout = request.timeout.value_or(config_.maxTimeout);
    // Only the starting position comes from the shared selector; rotation
    // follows this request's own path through the live set.
    std::vector<bool> used(pool_.size(), false);
    used[selection->entry->index] = true;
    std::vector<proxy::AttemptRecord> trace;
    std::size_t attempts = 0;
    std::size_t proxiesTried = 0;
    std::exception_ptr lastError;
    std::string lastMessage;
    std::optional<proxy::ProxyEndpoint> lastProxy;

    while (true) {
        auto entry = selection->entry;
        const auto& endpoint = entry->endpoint;
        lastProxy = endpoint;
        record(util::EventKind::proxy_selected,
               boost::json::object{{"proxy", endpoint.toString()},
                                   {"position", selection->position},
                                   {"generation", selection->snapshot->generation},
                                   {"latencyMs", selection->latency.count()},
                                   {"method", request.method},
                                   {"url", request.urlString()}},
               correlationId);

        int timeoutRetries = 0;
        int errorRetries = 0;
        bool rotate = false;
        while (!rotate) {
            ++attempts;
            const auto started = std::chrono::steady_clock::now();
            proxy::AttemptOutcome outcome = proxy::AttemptOutcome::error;
            bool retrySame = false;
            try {
                auto response = transport_.exchange(request, endpoint, timeout);
                const auto elapsed = elapsedSince(started);
                trace.push_back({endpoint, proxy::AttemptOutcome::success, {}, elapsed});
                pool_.recordDispatchOutcome(*entry, true);
                record(util::EventKind::request_succeeded,
                       boost::json::object{{"proxy", endpoint.toString()},
                                           {"status", response.status()},
                                           {"attempts", attempts},
                                           {"proxiesTried", proxiesTried + 1},
                                           {"elapsedMs", elapsed.count()}},
                       correlationId);
                return response;
            } catch (const proxy::ProxyTimeoutError& ex) {
                outcome = proxy::AttemptOutcome::timeout;
                lastError = std::current_exception();
                lastMessage = ex.what();
                retrySame = timeoutRetries < config_.onTimeoutRetries;
                if (retrySame) {
                    ++timeoutRetries;
                }
            } catch (const proxy::ProxyConnError& ex) {
                outcome = proxy::AttemptOutcome::error;
                lastError = std::current_exception();
                lastMessage = ex.what();
                retrySame = errorRetries < config_.onErrorRetries;
                if (retrySame) {
                    ++errorRetries;
                }
            }

            const auto elapsed = elapsedSince(started);
            trace.push_back({endpoint, outcome, lastMessage, elapsed});
            record(util::EventKind::proxy_failed,
                   boost::json::object{{"proxy", endpoint.toString()},
                                       {"outcome", proxy::toString(outcome)},
                                       {"error", lastMessage},
                                       {"attempt", attempts},
                                       {"elapsedMs", elapsed.count()},
                                       {"action", retrySame ? "retry" : "rotate"}},
                   correlationId);
            rotate = !retrySame;
        }

        pool_.recordDispatchOutcome(*entry, false);
        ++proxiesTried;

        // Re-read the live set: the budget follows its size at this step.
        const auto live = pool_.currentLiveSet();
        const auto budget = static_cast<std::size_t>(config_.changeProxyLoop) * live->size();
        if (live->empty() || proxiesTried >= budget) {
            record(util::EventKind::request_exhausted,
                   boost::json::object{{"url", request.urlString()},
                                       {"attempts", attempts},
                                       {"proxiesTried", proxiesTried},
                                       {"lastProxy", endpoint.toString()},
                                       {"error", lastMessage}},
                   correlationId);
            throw proxy::AllProxiesFailedError(attempts, proxiesTried, lastProxy, lastError, lastMessage,
                                               std::move(trace));
        }
        selection = rotateFrom(*selection, live, used);
    }
}

} // namespace proxyconn::service
