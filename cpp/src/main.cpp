#include "proxyconn/config/ManagerConfig.hpp"
#include "proxyconn/proxy/ProxyErrors.hpp"
#include "proxyconn/proxy/ProxyListLoader.hpp"
#include "proxyconn/service/ProxyManager.hpp"
#include "proxyconn/util/Logging.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "usage: " << program << " <proxies.json> [config.json] [url]\n"
              << "  Probes every proxy in the list, prints the live ones sorted by latency\n"
              << "  and, when a URL is given, fetches it through the pool.\n";
}

void printLiveProxies(const std::vector<proxyconn::service::LiveProxyInfo>& live, std::size_t total) {
    std::cout << "live proxies: " << live.size() << "/" << total << "\n";
    for (const auto& proxy : live) {
        std::cout << "  " << proxy.host << ":" << proxy.port << "  " << proxy.latencyMs << "ms\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace proxyconn;
    util::initLogging(util::LogLevel::info);

    if (argc < 2 || argc > 4) {
        printUsage(argv[0]);
        return 2;
    }

    const std::filesystem::path proxiesPath = argv[1];
    const std::filesystem::path configPath = argc >= 3 ? argv[2] : "proxyconn.json";
    const std::string url = argc == 4 ? argv[3] : "";

    try {
        auto proxies = proxy::loadProxyList(proxiesPath);
        const auto total = proxies.size();

        service::ManagerOptions options;
        options.config = config::loadManagerConfig(configPath);
        util::initLogging(options.config.logLevel);
        service::ProxyManager manager{std::move(proxies), std::move(options)};

        printLiveProxies(manager.getLiveProxiesList(), total);

        if (!url.empty()) {
            auto response = manager.request(url);
            std::cout << "HTTP " << response.status() << " " << response.statusText() << "\n";
            for (const auto& [name, value] : response.headers()) {
                std::cout << name << ": " << value << "\n";
            }
            std::cout << "\n" << response.text() << "\n";
        }

        manager.stop();
        return 0;
    } catch (const config::ConfigError& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid configuration: "} + ex.what());
        return 2;
    } catch (const proxy::AllProxiesFailedError& ex) {
        util::log(util::LogLevel::error, std::string{ex.what()} + "; attempts=" + std::to_string(ex.attempts()));
        for (const auto& attempt : ex.trace()) {
            util::log(util::LogLevel::info, "  " + attempt.proxy.toString() + " " + proxy::toString(attempt.outcome) +
                                                " after " + std::to_string(attempt.elapsed.count()) + "ms: " +
                                                attempt.message);
        }
        return 1;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, ex.what());
        return 1;
    }
}
