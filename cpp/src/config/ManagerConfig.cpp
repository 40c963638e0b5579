#include "proxyconn/config/ManagerConfig.hpp"

#include "proxyconn/util/JsonUtil.hpp"
#include "proxyconn/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace proxyconn::config {
namespace {

std::int64_t readInteger(const boost::json::value& value, const char* key) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double() && value.as_double() == static_cast<double>(static_cast<std::int64_t>(value.as_double()))) {
        return static_cast<std::int64_t>(value.as_double());
    }
    throw ConfigError(std::string{"config key '"} + key + "' must be an integer");
}

bool readBool(const boost::json::value& value, const char* key) {
    if (value.is_bool()) {
        return value.as_bool();
    }
    if (value.is_int64()) {
        return value.as_int64() != 0;
    }
    throw ConfigError(std::string{"config key '"} + key + "' must be a boolean");
}

std::string readString(const boost::json::value& value, const char* key) {
    if (!value.is_string()) {
        throw ConfigError(std::string{"config key '"} + key + "' must be a string");
    }
    return std::string(value.as_string());
}

bool parseBoolText(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text == "true" || text == "1" || text == "yes";
}

long parseLongEnv(const char* name, const char* value) {
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        throw ConfigError(std::string{"environment variable "} + name + " must be an integer");
    }
    return parsed;
}

} // namespace

ManagerConfig loadConfig(const boost::json::object& json) {
    return loadConfig(json, ManagerConfig{});
}

ManagerConfig loadConfig(const boost::json::object& json, ManagerConfig cfg) {
    if (auto it = json.if_contains("onErrorRetries")) cfg.onErrorRetries = static_cast<int>(readInteger(*it, "onErrorRetries"));
    if (auto it = json.if_contains("onTimeoutRetries")) cfg.onTimeoutRetries = static_cast<int>(readInteger(*it, "onTimeoutRetries"));
    if (auto it = json.if_contains("maxTimeout")) cfg.maxTimeout = std::chrono::milliseconds(readInteger(*it, "maxTimeout"));
    if (auto it = json.if_contains("healthCheckUrl")) cfg.healthCheckUrl = readString(*it, "healthCheckUrl");
    if (auto it = json.if_contains("healthCheckInterval")) cfg.healthCheckInterval = std::chrono::milliseconds(readInteger(*it, "healthCheckInterval"));
    if (auto it = json.if_contains("changeProxyLoop")) cfg.changeProxyLoop = static_cast<int>(readInteger(*it, "changeProxyLoop"));
    if (auto it = json.if_contains("disableLogging")) cfg.disableLogging = readBool(*it, "disableLogging");
    if (auto it = json.if_contains("userAgent")) cfg.userAgent = readString(*it, "userAgent");
    if (auto it = json.if_contains("probeConcurrency")) {
        auto count = readInteger(*it, "probeConcurrency");
        if (count < 0) {
            throw ConfigError("probeConcurrency must not be negative");
        }
        cfg.probeConcurrency = static_cast<unsigned int>(count);
    }
    if (auto it = json.if_contains("logLevel")) cfg.logLevel = util::parseLogLevel(readString(*it, "logLevel"));
    return cfg;
}

void applyEnvironment(ManagerConfig& config) {
    if (const char* value = std::getenv("PROXYCONN_HEALTH_CHECK_URL")) {
        config.healthCheckUrl = value;
    }
    if (const char* value = std::getenv("PROXYCONN_HEALTH_CHECK_INTERVAL")) {
        config.healthCheckInterval = std::chrono::milliseconds(parseLongEnv("PROXYCONN_HEALTH_CHECK_INTERVAL", value));
    }
    if (const char* value = std::getenv("PROXYCONN_TIMEOUT")) {
        config.maxTimeout = std::chrono::milliseconds(parseLongEnv("PROXYCONN_TIMEOUT", value));
    }
    if (const char* value = std::getenv("PROXYCONN_ON_ERROR_RETRIES")) {
        config.onErrorRetries = static_cast<int>(parseLongEnv("PROXYCONN_ON_ERROR_RETRIES", value));
    }
    if (const char* value = std::getenv("PROXYCONN_ON_TIMEOUT_RETRIES")) {
        config.onTimeoutRetries = static_cast<int>(parseLongEnv("PROXYCONN_ON_TIMEOUT_RETRIES", value));
    }
    if (const char* value = std::getenv("PROXYCONN_CHANGE_PROXY_LOOP")) {
        config.changeProxyLoop = static_cast<int>(parseLongEnv("PROXYCONN_CHANGE_PROXY_LOOP", value));
    }
    if (const char* value = std::getenv("PROXYCONN_DISABLE_LOGGING")) {
        config.disableLogging = parseBoolText(value);
    }
    if (const char* value = std::getenv("PROXYCONN_LOG_LEVEL")) {
        config.logLevel = util::parseLogLevel(value);
    }
}

ManagerConfig loadManagerConfig(const std::filesystem::path& path) {
    ManagerConfig config;

    if (std::filesystem::exists(path)) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigError("cannot open config file " + path.string());
        }
        std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (!content.empty()) {
            auto json = util::tryParseJson(content);
            if (!json || !json->is_object()) {
                throw ConfigError("config file " + path.string() + " is not a JSON object");
            }
            config = loadConfig(json->as_object(), config);
        }
    }

    applyEnvironment(config);
    validate(config);
    return config;
}

void validate(const ManagerConfig& config) {
    if (config.onErrorRetries < 0) {
        throw ConfigError("onErrorRetries must not be negative");
    }
    if (config.onTimeoutRetries < 0) {
        throw ConfigError("onTimeoutRetries must not be negative");
    }
    if (config.maxTimeout.count() <= 0) {
        throw ConfigError("maxTimeout must be positive");
    }
    if (config.healthCheckInterval.count() <= 0) {
        throw ConfigError("healthCheckInterval must be positive");
    }
    if (config.changeProxyLoop < 1) {
        throw ConfigError("changeProxyLoop must be at least 1");
    }
    if (config.healthCheckUrl.empty()) {
        throw ConfigError("healthCheckUrl must not be empty");
    }
    try {
        util::parseUrl(config.healthCheckUrl);
    } catch (const std::invalid_argument& ex) {
        throw ConfigError(std::string{"healthCheckUrl is invalid: "} + ex.what());
    }
}

unsigned int effectiveProbeConcurrency(const ManagerConfig& config, std::size_t proxyCount) {
    constexpr unsigned int kMaxProbeThreads = 64;
    unsigned int threads = config.probeConcurrency != 0
                               ? config.probeConcurrency
                               : static_cast<unsigned int>(std::min<std::size_t>(proxyCount, kMaxProbeThreads));
    return std::max(1u, threads);
}

} // namespace proxyconn::config
