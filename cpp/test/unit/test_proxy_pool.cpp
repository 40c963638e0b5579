#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "proxyconn/proxy/ProxyPool.hpp"
#include "support/FakeTransport.hpp"

#include <future>
#include <thread>

using namespace proxyconn::proxy;
using proxyconn::testing::endpoint;
using namespace std::chrono_literals;

namespace {

ProbeOutcome aliveAfter(std::chrono::milliseconds latency) {
    return ProbeOutcome{true, latency, 200, {}};
}

ProbeOutcome dead(const std::string& error) {
    return ProbeOutcome{false, std::nullopt, std::nullopt, error};
}

} // namespace

TEST_CASE("ProxyPool keeps every configured entry")
{
    ProxyPool pool({endpoint("a"), endpoint("b"), endpoint("a")});
    REQUIRE(pool.size() == 3);
    CHECK(pool.allEntries()[0]->index == 0);
    CHECK(pool.allEntries()[2]->index == 2);
    CHECK(pool.allEntries()[2]->endpoint.host == "a");

    for (const auto& status : pool.statuses()) {
        CHECK_FALSE(status.alive);
        CHECK_FALSE(status.latency.has_value());
        CHECK_FALSE(status.lastCheckedAt.has_value());
    }
}

TEST_CASE("ProxyPool records probe outcomes")
{
    ProxyPool pool({endpoint("a")});
    auto& entry = *pool.allEntries()[0];

    pool.updateProbe(entry, aliveAfter(40ms));
    auto status = pool.status(entry);
    CHECK(status.alive);
    CHECK(status.latency == 40ms);
    CHECK(status.lastCheckedAt.has_value());
    CHECK(status.lastProbeError.empty());

    SUBCASE("failed probe marks dead and keeps the error")
    {
        pool.updateProbe(entry, dead("connection refused"));
        status = pool.status(entry);
        CHECK_FALSE(status.alive);
        CHECK(status.lastProbeError == "connection refused");
    }

    SUBCASE("success without latency is not alive")
    {
        pool.updateProbe(entry, ProbeOutcome{true, std::nullopt, 200, {}});
        CHECK_FALSE(pool.status(entry).alive);
    }

    SUBCASE("successful probe resets the failure counter")
    {
        pool.recordDispatchOutcome(entry, false);
        pool.recordDispatchOutcome(entry, false);
        CHECK(pool.status(entry).consecutiveFailures == 2);
        pool.updateProbe(entry, aliveAfter(10ms));
        CHECK(pool.status(entry).consecutiveFailures == 0);
    }
}

TEST_CASE("ProxyPool dispatch outcomes drive the failure counter")
{
    ProxyPool pool({endpoint("a")});
    auto& entry = *pool.allEntries()[0];
    pool.recordDispatchOutcome(entry, false);
    pool.recordDispatchOutcome(entry, false);
    pool.recordDispatchOutcome(entry, false);
    CHECK(entry.consecutiveFailures.load() == 3);
    pool.recordDispatchOutcome(entry, true);
    CHECK(entry.consecutiveFailures.load() == 0);
}

TEST_CASE("buildLiveSet sorts by latency with configuration order on ties")
{
    ProxyPool pool({endpoint("slow"), endpoint("dead"), endpoint("fast"), endpoint("tie-first"), endpoint("tie-second")});
    const auto& entries = pool.allEntries();
    pool.updateProbe(*entries[0], aliveAfter(300ms));
    pool.updateProbe(*entries[1], dead("timeout"));
    pool.updateProbe(*entries[2], aliveAfter(5ms));
    pool.updateProbe(*entries[3], aliveAfter(50ms));
    pool.updateProbe(*entries[4], aliveAfter(50ms));

    auto live = pool.buildLiveSet();
    REQUIRE(live.size() == 4);
    CHECK(live[0].entry->endpoint.host == "fast");
    CHECK(live[1].entry->endpoint.host == "tie-first");
    CHECK(live[2].entry->endpoint.host == "tie-second");
    CHECK(live[3].entry->endpoint.host == "slow");
    CHECK(live[3].latency == 300ms);
}

TEST_CASE("publishLiveSet swaps snapshots with increasing generations")
{
    ProxyPool pool({endpoint("a"), endpoint("b")});
    CHECK_FALSE(pool.hasPublished());
    auto initial = pool.currentLiveSet();
    REQUIRE(initial);
    CHECK(initial->empty());

    pool.updateProbe(*pool.allEntries()[0], aliveAfter(20ms));
    auto first = pool.publishLiveSet(pool.buildLiveSet());
    CHECK(pool.hasPublished());
    CHECK(first->size() == 1);

    pool.updateProbe(*pool.allEntries()[1], aliveAfter(10ms));
    auto second = pool.publishLiveSet(pool.buildLiveSet());
    CHECK(second->generation > first->generation);
    CHECK(pool.currentLiveSet() == second);

    // Readers holding the old snapshot still see it unchanged.
    CHECK(first->size() == 1);
    CHECK(second->proxies.front().entry->endpoint.host == "b");
}

TEST_CASE("waitForFirstPublish blocks until publish or close")
{
    SUBCASE("publish wakes waiters")
    {
        ProxyPool pool({endpoint("a")});
        auto waiter = std::async(std::launch::async, [&pool] { return pool.waitForFirstPublish(); });
        CHECK(waiter.wait_for(50ms) == std::future_status::timeout);
        pool.publishLiveSet({});
        CHECK(waiter.get());
    }

    SUBCASE("close releases waiters")
    {
        ProxyPool pool({endpoint("a")});
        auto waiter = std::async(std::launch::async, [&pool] { return pool.waitForFirstPublish(); });
        pool.close();
        CHECK_FALSE(waiter.get());
    }

    SUBCASE("bounded wait")
    {
        ProxyPool pool({endpoint("a")});
        CHECK_FALSE(pool.waitForFirstPublish(20ms));
        pool.publishLiveSet({});
        CHECK(pool.waitForFirstPublish(20ms));
    }
}
