#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/jobs/job_group.hpp>

namespace supervisor_cpp {

JobGroup::JobGroup(std::string name) : name_(std::move(name)) {}

bool JobGroup::inProgress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !job_stack_.empty();
}

std::optional<std::string> JobGroup::activeJobName() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (job_stack_.empty()) {
        return std::nullopt;
    }
    return job_stack_.front();
}

size_t JobGroup::waitingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_;
}

bool JobGroup::tryAcquire(const std::string& job_name)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (heldByCurrentThread()) {
        job_stack_.push_back(job_name);
        return true;
    }

    if (!job_stack_.empty() || waiters_ > 0) {
        return false;
    }

    enter(job_name);
    return true;
}

void JobGroup::acquire(const std::string& job_name)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (heldByCurrentThread()) {
        job_stack_.push_back(job_name);
        return;
    }

    const uint64_t ticket = next_ticket_++;
    ++waiters_;
    released_.wait(lock, [this, ticket]() {
        return job_stack_.empty() && serving_ticket_ == ticket;
    });
    --waiters_;
    ++serving_ticket_;

    enter(job_name);
}

void JobGroup::release()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!heldByCurrentThread()) {
            Logger::getInstance("jobs")->error("Job group {} released by a thread that does not hold it",
                                               name_);
            return;
        }

        job_stack_.pop_back();
        if (!job_stack_.empty()) {
            return;
        }
        owner_ = std::thread::id();
    }
    released_.notify_all();
}

bool JobGroup::heldByCurrentThread() const
{
    return !job_stack_.empty() && owner_ == std::this_thread::get_id();
}

void JobGroup::enter(const std::string& job_name)
{
    owner_ = std::this_thread::get_id();
    job_stack_.push_back(job_name);
}

} // namespace supervisor_cpp
