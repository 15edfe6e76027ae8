#include <regex>
#include <supervisor-cpp/core/event.hpp>
#include <supervisor-cpp/core/logger.hpp>

namespace supervisor_cpp {

std::atomic<EventId> Event::next_id_{1};

Event::Event(std::string type,
             std::string data,
             const std::chrono::system_clock::time_point& timestamp)
    : type_(std::move(type)), data_(std::move(data)), timestamp_(timestamp), id_(next_id_++)
{}

bool Event::hasMetadata(const std::string& key) const
{
    return metadata_.find(key) != metadata_.end();
}

EventBus::EventBus(size_t max_queue_size) : max_queue_size_(max_queue_size)
{
    processing_thread_ = std::thread(&EventBus::processEventQueue, this);
}

EventBus::~EventBus()
{
    shutdown();
}

void EventBus::subscribe(const std::string& event_type_pattern, EventListener listener)
{
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_.push_back({event_type_pattern, std::move(listener)});
}

void EventBus::publish(const Event& event)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (should_stop_) {
            return;
        }

        if (event_queue_.size() >= max_queue_size_) {
            Logger::getInstance("core.event")
                ->warning("Event queue is full, dropping event: {}", event.getType());
            return;
        }

        event_queue_.push_back(event);
    }

    queue_condition_.notify_one();
}

void EventBus::flush()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return should_stop_ || (event_queue_.empty() && in_flight_ == 0);
    });
}

void EventBus::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (should_stop_ && !processing_thread_.joinable()) {
            return;
        }
        should_stop_ = true;
    }

    queue_condition_.notify_all();
    idle_condition_.notify_all();

    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
}

void EventBus::processEventQueue()
{
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_condition_.wait(lock, [this] { return !event_queue_.empty() || should_stop_; });

        if (should_stop_) {
            break;
        }

        Event event = std::move(event_queue_.front());
        event_queue_.pop_front();
        in_flight_++;
        lock.unlock();

        dispatch(event);

        lock.lock();
        in_flight_--;
        if (event_queue_.empty() && in_flight_ == 0) {
            idle_condition_.notify_all();
        }
    }
}

void EventBus::dispatch(const Event& event)
{
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& subscription : subscriptions_) {
            if (matchesPattern(event.getType(), subscription.event_type_pattern)) {
                listeners.push_back(subscription.listener);
            }
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        }
        catch (const std::exception& e) {
            Logger::getInstance("core.event")
                ->error("Exception in listener for {}: {}", event.getType(), e.what());
        }
    }
}

bool EventBus::matchesPattern(const std::string& event_type, const std::string& pattern)
{
    if (pattern == "*") {
        return true;
    }

    if (pattern.find('*') == std::string::npos) {
        return event_type == pattern;
    }

    std::string regex_pattern;
    for (char c : pattern) {
        if (c == '*') {
            regex_pattern += ".*";
        }
        else if (std::string("\\^$.|?+()[]{}").find(c) != std::string::npos) {
            regex_pattern += '\\';
            regex_pattern += c;
        }
        else {
            regex_pattern += c;
        }
    }

    return std::regex_match(event_type, std::regex(regex_pattern));
}

} // namespace supervisor_cpp
