#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <supervisor-cpp/jobs/job_group.hpp>

using namespace supervisor_cpp;

class JobGroupTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        group = std::make_unique<JobGroup>("container_hassio_audio");
    }

    void TearDown() override
    {
        group.reset();
    }

    void waitForWaiters(size_t count)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (group->waitingCount() < count && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ASSERT_EQ(group->waitingCount(), count);
    }

    std::unique_ptr<JobGroup> group;
};

TEST_F(JobGroupTest, StartsIdle)
{
    EXPECT_EQ(group->name(), "container_hassio_audio");
    EXPECT_FALSE(group->inProgress());
    EXPECT_FALSE(group->activeJobName().has_value());
    EXPECT_EQ(group->waitingCount(), 0u);
}

TEST_F(JobGroupTest, AcquireAndRelease)
{
    group->acquire("docker_interface_stop");
    EXPECT_TRUE(group->inProgress());
    EXPECT_EQ(group->activeJobName(), "docker_interface_stop");

    group->release();
    EXPECT_FALSE(group->inProgress());
}

TEST_F(JobGroupTest, ReentrantForOwnerThread)
{
    group->acquire("docker_interface_update");
    EXPECT_TRUE(group->tryAcquire("docker_interface_install"));
    group->acquire("docker_interface_stop");

    // The outermost job is reported
    EXPECT_EQ(group->activeJobName(), "docker_interface_update");

    group->release();
    group->release();
    EXPECT_TRUE(group->inProgress());

    group->release();
    EXPECT_FALSE(group->inProgress());
}

TEST_F(JobGroupTest, TryAcquireFailsWhileHeldByOtherThread)
{
    group->acquire("docker_interface_run");

    bool acquired = true;
    std::thread other([&]() { acquired = group->tryAcquire("docker_interface_stop"); });
    other.join();

    EXPECT_FALSE(acquired);
    group->release();
}

TEST_F(JobGroupTest, TryAcquireDoesNotJumpWaiters)
{
    group->acquire("docker_interface_run");

    std::thread waiter([&]() {
        group->acquire("docker_interface_stop");
        group->release();
    });
    waitForWaiters(1);

    bool acquired = true;
    std::thread impatient([&]() { acquired = group->tryAcquire("docker_interface_remove"); });
    impatient.join();
    EXPECT_FALSE(acquired);

    group->release();
    waiter.join();

    EXPECT_FALSE(group->inProgress());
    EXPECT_EQ(group->waitingCount(), 0u);
}

TEST_F(JobGroupTest, WaitersServedInArrivalOrder)
{
    std::mutex order_mutex;
    std::vector<int> order;

    group->acquire("holder");

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() {
            group->acquire("waiter_" + std::to_string(i));
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }
            group->release();
        });
        waitForWaiters(static_cast<size_t>(i) + 1);
    }

    group->release();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(JobGroupTest, ReleaseFromNonOwnerIsIgnored)
{
    group->acquire("docker_interface_run");

    std::thread other([&]() { group->release(); });
    other.join();

    EXPECT_TRUE(group->inProgress());
    group->release();
    EXPECT_FALSE(group->inProgress());
}
