#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace supervisor_cpp {

using EventId = uint64_t;

constexpr size_t DEFAULT_MAX_QUEUE_SIZE = 10000;

// Bus event types
constexpr const char* EVENT_CONTAINER_STATE_CHANGE = "docker.container_state_change";

class Event {
public:
    Event(std::string type,
          std::string data,
          const std::chrono::system_clock::time_point& timestamp = std::chrono::system_clock::now());

    Event(const Event& other) = default;
    Event(Event&& other) noexcept = default;
    Event& operator=(const Event& other) = default;
    Event& operator=(Event&& other) noexcept = default;

    const std::string& getType() const
    {
        return type_;
    }
    const std::string& getData() const
    {
        return data_;
    }
    std::chrono::system_clock::time_point getTimestamp() const
    {
        return timestamp_;
    }
    EventId getId() const
    {
        return id_;
    }

    template <typename T>
    void setMetadata(const std::string& key, const T& value);

    template <typename T>
    T getMetadata(const std::string& key) const;

    bool hasMetadata(const std::string& key) const;

private:
    std::string type_;
    std::string data_;
    std::chrono::system_clock::time_point timestamp_;
    EventId id_;
    std::unordered_map<std::string, std::variant<std::string, int64_t, double, bool>> metadata_;

    static std::atomic<EventId> next_id_;
};

using EventListener = std::function<void(const Event&)>;

// Asynchronous publish/subscribe bus. One dispatch thread delivers events in
// publish order; listeners must not block for long.
class EventBus {
public:
    explicit EventBus(size_t max_queue_size = DEFAULT_MAX_QUEUE_SIZE);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // Pattern is an exact type, "*" or a wildcard such as "docker.*"
    void subscribe(const std::string& event_type_pattern, EventListener listener);
    // Drops the event with a warning when the queue is full
    void publish(const Event& event);

    // Blocks until every event published before the call has been delivered
    void flush();
    void shutdown();

private:
    struct Subscription {
        std::string event_type_pattern;
        EventListener listener;
    };

    void processEventQueue();
    void dispatch(const Event& event);
    static bool matchesPattern(const std::string& event_type, const std::string& pattern);

    std::mutex subscriptions_mutex_;
    std::mutex queue_mutex_;

    std::vector<Subscription> subscriptions_;
    std::deque<Event> event_queue_;
    size_t in_flight_ = 0;
    size_t max_queue_size_;

    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    bool should_stop_ = false;

    std::thread processing_thread_;
};

template <typename T>
void Event::setMetadata(const std::string& key, const T& value)
{
    metadata_[key] = value;
}

template <typename T>
T Event::getMetadata(const std::string& key) const
{
    auto it = metadata_.find(key);
    if (it == metadata_.end()) {
        throw std::runtime_error("Metadata key not found: " + key);
    }

    try {
        return std::get<T>(it->second);
    }
    catch (const std::bad_variant_access&) {
        throw std::runtime_error("Invalid type for metadata key: " + key);
    }
}

} // namespace supervisor_cpp
