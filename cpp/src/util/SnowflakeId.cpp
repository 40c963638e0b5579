#include "proxyconn/util/SnowflakeId.hpp"

#include <functional>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace proxyconn::util {

SnowflakeIdGenerator::SnowflakeIdGenerator(std::uint32_t machineId)
    : machineId_(machineId) {
    if (machineId_ > kMaxMachineId) {
        throw std::invalid_argument("machine id must be in [0, " + std::to_string(kMaxMachineId) + "]");
    }
}

SnowflakeIdGenerator::SnowflakeIdGenerator()
    : SnowflakeIdGenerator(autoMachineId()) {}

std::uint32_t SnowflakeIdGenerator::autoMachineId() {
    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    auto seed = std::hash<std::string>{}(std::string(hostname) + ":" + std::to_string(::getpid()));
    return static_cast<std::uint32_t>(seed & kMaxMachineId);
}

std::int64_t SnowflakeIdGenerator::nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t SnowflakeIdGenerator::timestampOf(std::uint64_t id) noexcept {
    return static_cast<std::int64_t>(id >> (kMachineIdBits + kSequenceBits)) + kEpochMs;
}

std::uint64_t SnowflakeIdGenerator::nextId() {
    std::scoped_lock lock(mutex_);
    auto timestamp = nowMs();
    // Clock stepped back: keep issuing ids from the last seen millisecond.
    if (timestamp < lastTimestamp_) {
        timestamp = lastTimestamp_;
    }
    if (timestamp == lastTimestamp_) {
        sequence_ = (sequence_ + 1) & kMaxSequence;
        if (sequence_ == 0) {
            while (timestamp <= lastTimestamp_) {
                std::this_thread::yield();
                timestamp = nowMs();
            }
        }
    } else {
        sequence_ = 0;
    }
    lastTimestamp_ = timestamp;

    return (static_cast<std::uint64_t>(timestamp - kEpochMs) << (kMachineIdBits + kSequenceBits)) |
           (static_cast<std::uint64_t>(machineId_) << kSequenceBits) |
           static_cast<std::uint64_t>(sequence_);
}

std::string SnowflakeIdGenerator::nextToken() {
    return std::to_string(nextId());
}

} // namespace proxyconn::util
