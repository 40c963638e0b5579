#pragma once

#include "proxyconn/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace proxyconn::config {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct ManagerConfig {
    int onErrorRetries{0};
    int onTimeoutRetries{0};
    std::chrono::milliseconds maxTimeout{5000};
    std::string healthCheckUrl{"https://httpbin.org/ip"};
    std::chrono::milliseconds healthCheckInterval{60000};
    int changeProxyLoop{2};
    bool disableLogging{false};
    std::string userAgent{"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36"};
    // 0 runs every probe of a tick in parallel, up to 64 threads.
    unsigned int probeConcurrency{0};
    // Applied by the application through util::initLogging; managers never
    // touch the process-wide level.
    util::LogLevel logLevel{util::LogLevel::info};
};

// Keys missing from the object keep their defaults. Wrongly typed values throw ConfigError.
ManagerConfig loadConfig(const boost::json::object& json);
ManagerConfig loadConfig(const boost::json::object& json, ManagerConfig base);

// Reads a JSON file if present, then PROXYCONN_* environment overrides.
ManagerConfig loadManagerConfig(const std::filesystem::path& path);
void applyEnvironment(ManagerConfig& config);

void validate(const ManagerConfig& config);

unsigned int effectiveProbeConcurrency(const ManagerConfig& config, std::size_t proxyCount);

} // namespace proxyconn::config
