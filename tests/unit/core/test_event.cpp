#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <supervisor-cpp/core/event.hpp>
#include <supervisor-cpp/core/logger.hpp>

using namespace supervisor_cpp;

class EventTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::setGlobalLevel(LogLevel::CRITICAL);
        bus = std::make_unique<EventBus>();
    }

    void TearDown() override
    {
        bus.reset();
        Logger::setGlobalLevel(LogLevel::INFO);
    }

    std::unique_ptr<EventBus> bus;
};

TEST_F(EventTest, BasicEventCreation)
{
    Event event("test.event", "Test event data");

    EXPECT_EQ(event.getType(), "test.event");
    EXPECT_EQ(event.getData(), "Test event data");
    EXPECT_NE(event.getTimestamp().time_since_epoch().count(), 0);
    EXPECT_GT(event.getId(), 0u);
}

TEST_F(EventTest, EventWithCustomTimestamp)
{
    auto custom_time = std::chrono::system_clock::now() - std::chrono::hours(1);
    Event event("test.event", "Test data", custom_time);

    EXPECT_EQ(event.getTimestamp(), custom_time);
}

TEST_F(EventTest, EventIdsAreUnique)
{
    Event first("a", "");
    Event second("a", "");

    EXPECT_NE(first.getId(), second.getId());
}

TEST_F(EventTest, Metadata)
{
    Event event(EVENT_CONTAINER_STATE_CHANGE, "hassio_audio");
    event.setMetadata("name", std::string("hassio_audio"));
    event.setMetadata("time", int64_t{1700000000});

    EXPECT_TRUE(event.hasMetadata("name"));
    EXPECT_EQ(event.getMetadata<std::string>("name"), "hassio_audio");
    EXPECT_EQ(event.getMetadata<int64_t>("time"), 1700000000);

    EXPECT_FALSE(event.hasMetadata("state"));
    EXPECT_THROW(event.getMetadata<std::string>("state"), std::runtime_error);
    EXPECT_THROW(event.getMetadata<bool>("name"), std::runtime_error);
}

TEST_F(EventTest, PublishReachesSubscriber)
{
    std::vector<std::string> received;
    bus->subscribe("test.event", [&](const Event& event) { received.push_back(event.getData()); });

    bus->publish(Event("test.event", "payload"));
    bus->flush();

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], "payload");
}

TEST_F(EventTest, DeliveryKeepsPublishOrder)
{
    std::vector<std::string> received;
    bus->subscribe("*", [&](const Event& event) { received.push_back(event.getData()); });

    for (int i = 0; i < 20; ++i) {
        bus->publish(Event("order", std::to_string(i)));
    }
    bus->flush();

    ASSERT_EQ(received.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(received[i], std::to_string(i));
    }
}

TEST_F(EventTest, WildcardPatterns)
{
    std::atomic<int> docker_events{0};
    std::atomic<int> all_events{0};
    bus->subscribe("docker.*", [&](const Event&) { docker_events++; });
    bus->subscribe("*", [&](const Event&) { all_events++; });

    bus->publish(Event(EVENT_CONTAINER_STATE_CHANGE, ""));
    bus->publish(Event("jobs.started", ""));
    bus->flush();

    EXPECT_EQ(docker_events.load(), 1);
    EXPECT_EQ(all_events.load(), 2);
}

TEST_F(EventTest, ThrowingListenerDoesNotStopDelivery)
{
    std::atomic<int> count{0};
    bus->subscribe("test", [](const Event&) { throw std::runtime_error("listener failed"); });
    bus->subscribe("test", [&](const Event&) { count++; });

    bus->publish(Event("test", ""));
    bus->publish(Event("test", ""));
    bus->flush();

    EXPECT_EQ(count.load(), 2);
}

TEST_F(EventTest, PublishAfterShutdownIsDropped)
{
    std::atomic<int> count{0};
    bus->subscribe("test", [&](const Event&) { count++; });

    bus->shutdown();
    bus->shutdown();
    bus->publish(Event("test", ""));
    bus->flush();

    EXPECT_EQ(count.load(), 0);
}

TEST_F(EventTest, FullQueueDropsEvents)
{
    EventBus small(1);
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::mutex delivered_mutex;
    std::vector<std::string> delivered;
    small.subscribe("test", [&](const Event& event) {
        if (event.getData() == "1") {
            entered.set_value();
            released.wait();
        }
        std::lock_guard<std::mutex> lock(delivered_mutex);
        delivered.push_back(event.getData());
    });

    // The first event is taken by the dispatcher and blocks there
    small.publish(Event("test", "1"));
    entered.get_future().wait();
    small.publish(Event("test", "2"));
    small.publish(Event("test", "3"));

    release.set_value();
    small.flush();

    std::lock_guard<std::mutex> lock(delivered_mutex);
    EXPECT_EQ(delivered, (std::vector<std::string>{"1", "2"}));
}

TEST_F(EventTest, ConcurrentPublishers)
{
    std::atomic<int> count{0};
    bus->subscribe("test", [&](const Event&) { count++; });

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([this]() {
            for (int i = 0; i < 50; ++i) {
                bus->publish(Event("test", ""));
            }
        });
    }
    for (auto& publisher : publishers) {
        publisher.join();
    }
    bus->flush();

    EXPECT_EQ(count.load(), 200);
}
