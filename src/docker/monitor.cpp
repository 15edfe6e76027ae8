#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/monitor.hpp>
#include <supervisor-cpp/docker/state_classifier.hpp>

namespace supervisor_cpp {

Event makeContainerStateEvent(const std::string& name, ContainerState state, const std::string& id)
{
    auto now = std::chrono::system_clock::now();

    Event event(EVENT_CONTAINER_STATE_CHANGE, name, now);
    event.setMetadata("name", name);
    event.setMetadata("state", toString(state));
    event.setMetadata("id", id);
    event.setMetadata(
        "time", static_cast<int64_t>(
                    std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count()));
    return event;
}

ContainerMonitor::ContainerMonitor(DaemonClient& client, Executor& executor, EventBus& bus)
    : client_(client), executor_(executor), bus_(bus)
{}

ContainerMonitor::~ContainerMonitor()
{
    stop();
}

void ContainerMonitor::watchContainer(const ContainerInfo& container)
{
    std::lock_guard<std::mutex> lock(mutex_);

    Watched& entry = watched_[container.name];
    entry.id = container.id;
    entry.state = classifyContainerState(statusViewFromInspect(container.attrs));
}

void ContainerMonitor::unwatchContainer(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    watched_.erase(name);
}

bool ContainerMonitor::isWatched(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return watched_.count(name) > 0;
}

std::vector<std::string> ContainerMonitor::watchedContainers() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, entry] : watched_) {
        names.push_back(name);
    }
    return names;
}

size_t ContainerMonitor::poll()
{
    auto logger = Logger::getInstance("docker.monitor");
    size_t published = 0;

    for (const auto& name : watchedContainers()) {
        std::optional<ContainerInfo> container;
        try {
            container = executor_.run([this, &name]() { return client_.getContainer(name); });
        }
        catch (const ContainerError& e) {
            if (e.getErrorCode() == ErrorCode::JOB_EXECUTOR_STOPPED) {
                throw;
            }
            logger->warning("Can't inspect {}: {}", name, e.getMessage());
            continue;
        }

        std::string id;
        ContainerState state = ContainerState::STOPPED;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = watched_.find(name);
            if (it == watched_.end()) {
                continue;
            }

            if (container) {
                state = classifyContainerState(statusViewFromInspect(container->attrs));
                id = container->id;
            }
            else {
                id = it->second.id;
            }

            if (it->second.state != state || it->second.id != id) {
                changed = it->second.state != state;
                it->second.state = state;
                it->second.id = id;
            }
            if (!container) {
                watched_.erase(it);
            }
        }

        if (changed) {
            logger->debug("Container {} changed state to {}", name, state);
            bus_.publish(makeContainerStateEvent(name, state, id));
            ++published;
        }
    }

    return published;
}

void ContainerMonitor::start(std::chrono::milliseconds interval)
{
    if (running_.exchange(true)) {
        return;
    }
    // A loop that ended on its own still has to be joined
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread([this, interval]() { monitorLoop(interval); });
    Logger::getInstance("docker.monitor")->info("Started docker events monitor");
}

void ContainerMonitor::stop()
{
    bool was_running = running_.exchange(false);
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
    }
    loop_condition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (was_running) {
        Logger::getInstance("docker.monitor")->info("Stopped docker events monitor");
    }
}

void ContainerMonitor::monitorLoop(std::chrono::milliseconds interval)
{
    while (running_) {
        try {
            poll();
        }
        catch (const ContainerError& e) {
            // Executor shut down underneath us
            Logger::getInstance("docker.monitor")->error("Monitor poll failed: {}", e.what());
            running_ = false;
            break;
        }

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_condition_.wait_for(lock, interval, [this]() { return !running_; });
    }
}

} // namespace supervisor_cpp
