#include <supervisor-cpp/core/executor.hpp>
#include <supervisor-cpp/core/logger.hpp>

namespace supervisor_cpp {

Executor::Executor(size_t workers)
{
    if (workers == 0) {
        workers = 1;
    }

    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&Executor::workerLoop, this);
    }

    Logger::getInstance("core.executor")->debug("Executor started with {} workers", workers);
}

Executor::~Executor()
{
    shutdown();
}

void Executor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void Executor::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ContainerError(ErrorCode::JOB_EXECUTOR_STOPPED,
                                 "Cannot submit work after executor shutdown");
        }
        queue_.push_back(std::move(job));
    }
    condition_.notify_one();
}

void Executor::workerLoop()
{
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            if (queue_.empty()) {
                // stopping_ and drained
                return;
            }

            job = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task stores exceptions in the future
        job();
    }
}

} // namespace supervisor_cpp
