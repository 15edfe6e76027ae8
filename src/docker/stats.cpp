#include <cmath>
#include <supervisor-cpp/docker/stats.hpp>

namespace supervisor_cpp {

namespace {

double round2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

// Null when any step of the path is missing
const nlohmann::json* lookup(const nlohmann::json& root, std::initializer_list<const char*> path)
{
    const nlohmann::json* current = &root;
    for (const char* key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

uint64_t numberAt(const nlohmann::json& root, std::initializer_list<const char*> path)
{
    const nlohmann::json* value = lookup(root, path);
    if (value == nullptr || !value->is_number()) {
        return 0;
    }
    return value->get<uint64_t>();
}

} // namespace

DockerStats::DockerStats(const nlohmann::json& stats)
{
    if (!stats.is_object()) {
        return;
    }

    if (auto it = stats.find("memory_stats"); it != stats.end()) {
        calcMemory(*it);
    }
    calcCpuPercent(stats);
    if (auto it = stats.find("networks"); it != stats.end()) {
        calcNetwork(*it);
    }
    if (auto it = stats.find("blkio_stats"); it != stats.end()) {
        calcBlockIo(*it);
    }
}

double DockerStats::cpuPercent() const
{
    return round2(cpu_);
}

double DockerStats::memoryPercent() const
{
    if (memory_limit_ == 0) {
        return 0.0;
    }
    return round2(static_cast<double>(memory_usage_) / static_cast<double>(memory_limit_) * 100.0);
}

void DockerStats::calcCpuPercent(const nlohmann::json& stats)
{
    const nlohmann::json* total = lookup(stats, {"cpu_stats", "cpu_usage", "total_usage"});
    const nlohmann::json* pre_total = lookup(stats, {"precpu_stats", "cpu_usage", "total_usage"});
    const nlohmann::json* system = lookup(stats, {"cpu_stats", "system_cpu_usage"});
    const nlohmann::json* pre_system = lookup(stats, {"precpu_stats", "system_cpu_usage"});
    for (const nlohmann::json* value : {total, pre_total, system, pre_system}) {
        if (value == nullptr || !value->is_number()) {
            return;
        }
    }

    double cpu_delta = total->get<double>() - pre_total->get<double>();
    double system_delta = system->get<double>() - pre_system->get<double>();

    double online_cpus = static_cast<double>(numberAt(stats, {"cpu_stats", "online_cpus"}));
    if (online_cpus == 0.0) {
        const nlohmann::json* percpu = lookup(stats, {"cpu_stats", "cpu_usage", "percpu_usage"});
        if (percpu != nullptr && percpu->is_array()) {
            online_cpus = static_cast<double>(percpu->size());
        }
    }

    if (system_delta > 0.0 && cpu_delta > 0.0) {
        cpu_ = (cpu_delta / system_delta) * online_cpus * 100.0;
    }
}

void DockerStats::calcMemory(const nlohmann::json& memory_stats)
{
    uint64_t usage = numberAt(memory_stats, {"usage"});
    // cgroup v2 reports inactive_file, v1 reports cache
    uint64_t cache = numberAt(memory_stats, {"stats", "inactive_file"});
    if (cache == 0) {
        cache = numberAt(memory_stats, {"stats", "cache"});
    }

    memory_usage_ = usage > cache ? usage - cache : 0;
    memory_limit_ = numberAt(memory_stats, {"limit"});
}

void DockerStats::calcNetwork(const nlohmann::json& networks)
{
    if (!networks.is_object()) {
        return;
    }
    for (const auto& [name, stats] : networks.items()) {
        network_rx_ += numberAt(stats, {"rx_bytes"});
        network_tx_ += numberAt(stats, {"tx_bytes"});
    }
}

void DockerStats::calcBlockIo(const nlohmann::json& blkio_stats)
{
    const nlohmann::json* entries = lookup(blkio_stats, {"io_service_bytes_recursive"});
    if (entries == nullptr || !entries->is_array()) {
        return;
    }

    for (const auto& entry : *entries) {
        auto op = entry.find("op");
        if (op == entry.end() || !op->is_string()) {
            continue;
        }
        std::string name = op->get<std::string>();
        if (name == "Read" || name == "read") {
            blk_read_ += numberAt(entry, {"value"});
        }
        else if (name == "Write" || name == "write") {
            blk_write_ += numberAt(entry, {"value"});
        }
    }
}

} // namespace supervisor_cpp
