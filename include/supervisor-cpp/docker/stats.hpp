#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace supervisor_cpp {

/**
 * @brief Resource usage computed from an engine stats document
 *
 * Missing sections leave the matching values at zero.
 */
class DockerStats {
public:
    DockerStats() = default;
    explicit DockerStats(const nlohmann::json& stats);

    // Rounded to two decimals
    double cpuPercent() const;
    double memoryPercent() const;

    uint64_t memoryUsage() const
    {
        return memory_usage_;
    }
    uint64_t memoryLimit() const
    {
        return memory_limit_;
    }
    uint64_t networkRx() const
    {
        return network_rx_;
    }
    uint64_t networkTx() const
    {
        return network_tx_;
    }
    uint64_t blkRead() const
    {
        return blk_read_;
    }
    uint64_t blkWrite() const
    {
        return blk_write_;
    }

private:
    void calcCpuPercent(const nlohmann::json& stats);
    void calcMemory(const nlohmann::json& memory_stats);
    void calcNetwork(const nlohmann::json& networks);
    void calcBlockIo(const nlohmann::json& blkio_stats);

    double cpu_ = 0.0;
    uint64_t memory_usage_ = 0;
    uint64_t memory_limit_ = 0;
    uint64_t network_rx_ = 0;
    uint64_t network_tx_ = 0;
    uint64_t blk_read_ = 0;
    uint64_t blk_write_ = 0;
};

} // namespace supervisor_cpp
