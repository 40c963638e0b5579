#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace proxyconn::util {

/**
 * 64-bit time-ordered ids: 41 bits of milliseconds since kEpoch, 10 bits of
 * machine id, 12 bits of per-millisecond sequence.
 */
class SnowflakeIdGenerator {
public:
    static constexpr std::int64_t kEpochMs = 1420070400000; // 2015-01-01T00:00:00Z
    static constexpr int kMachineIdBits = 10;
    static constexpr int kSequenceBits = 12;
    static constexpr std::uint32_t kMaxMachineId = (1u << kMachineIdBits) - 1;
    static constexpr std::uint32_t kMaxSequence = (1u << kSequenceBits) - 1;

    explicit SnowflakeIdGenerator(std::uint32_t machineId);
    SnowflakeIdGenerator();

    std::uint64_t nextId();
    std::string nextToken();

    [[nodiscard]] std::uint32_t machineId() const noexcept { return machineId_; }

    static std::uint32_t autoMachineId();
    static std::int64_t timestampOf(std::uint64_t id) noexcept;

private:
    static std::int64_t nowMs();

    std::uint32_t machineId_;
    std::mutex mutex_;
    std::int64_t lastTimestamp_{-1};
    std::uint32_t sequence_{0};
};

} // namespace proxyconn::util
