#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <supervisor-cpp/core/event.hpp>
#include <supervisor-cpp/core/executor.hpp>
#include <supervisor-cpp/docker/const.hpp>
#include <supervisor-cpp/docker/daemon_client.hpp>

namespace supervisor_cpp {

constexpr std::chrono::seconds DEFAULT_MONITOR_INTERVAL{5};

/**
 * @brief Build a docker.container_state_change event
 *
 * Metadata: name, state, id and time (seconds since the epoch).
 */
Event makeContainerStateEvent(const std::string& name, ContainerState state, const std::string& id);

/**
 * @brief Watches containers and reports state changes on the bus
 *
 * Each poll inspects the watched containers through the Executor and
 * publishes an event for every container whose classified state differs
 * from the last one seen. A container that disappeared is reported as
 * stopped once and then forgotten.
 */
class ContainerMonitor {
public:
    ContainerMonitor(DaemonClient& client, Executor& executor, EventBus& bus);
    ~ContainerMonitor();

    ContainerMonitor(const ContainerMonitor&) = delete;
    ContainerMonitor& operator=(const ContainerMonitor&) = delete;

    void watchContainer(const ContainerInfo& container);
    void unwatchContainer(const std::string& name);
    bool isWatched(const std::string& name) const;
    std::vector<std::string> watchedContainers() const;

    /**
     * @brief Inspect every watched container once
     * @return Number of state-change events published
     */
    size_t poll();

    void start(std::chrono::milliseconds interval = DEFAULT_MONITOR_INTERVAL);
    void stop();

    bool isRunning() const
    {
        return running_;
    }

private:
    struct Watched {
        std::string id;
        ContainerState state = ContainerState::UNKNOWN;
    };

    void monitorLoop(std::chrono::milliseconds interval);

    DaemonClient& client_;
    Executor& executor_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    std::map<std::string, Watched> watched_;

    std::mutex loop_mutex_;
    std::condition_variable loop_condition_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace supervisor_cpp
