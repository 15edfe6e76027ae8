#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>
#include <supervisor-cpp/core/error.hpp>

namespace supervisor_cpp {

constexpr size_t DEFAULT_EXECUTOR_WORKERS = 4;

/**
 * @brief Bounded worker pool for blocking daemon calls
 *
 * Callers never talk to the engine client directly. Every blocking call is
 * submitted here and the caller waits on the returned future, so the number
 * of concurrent engine requests is bounded by the worker count. A caller that
 * stops waiting does not cancel the task: it runs to completion and its
 * result is discarded with the future.
 */
class Executor {
public:
    /**
     * @brief Start the worker threads
     * @param workers Number of worker threads (at least one)
     */
    explicit Executor(size_t workers = DEFAULT_EXECUTOR_WORKERS);

    /**
     * @brief Drains queued tasks and joins the workers
     */
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&&) = delete;

    /**
     * @brief Queue a task
     * @return Future carrying the result or the exception thrown by the task
     * @throws ContainerError JOB_EXECUTOR_STOPPED after shutdown()
     */
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /**
     * @brief Queue a task and wait for it
     *
     * Rethrows whatever the task threw.
     */
    template <typename F>
    auto run(F&& task) -> std::invoke_result_t<std::decay_t<F>>;

    /**
     * @brief Stop accepting work, finish queued tasks, join workers
     */
    void shutdown();

    size_t getWorkerCount() const
    {
        return workers_.size();
    }

private:
    void enqueue(std::function<void()> job);
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

template <typename F>
auto Executor::submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> future = packaged->get_future();

    enqueue([packaged]() { (*packaged)(); });
    return future;
}

template <typename F>
auto Executor::run(F&& task) -> std::invoke_result_t<std::decay_t<F>>
{
    return submit(std::forward<F>(task)).get();
}

} // namespace supervisor_cpp
