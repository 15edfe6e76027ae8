#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace supervisor_cpp {

/**
 * @brief Named concurrency domain for one resource
 *
 * At most one thread owns a group at a time. The owning thread may enter the
 * group again (update -> install -> stop); nested entries are tracked as a
 * stack of job names and the group is free again once the outermost job
 * leaves.
 *
 * Waiters are served in arrival order. A fail-fast acquisition never jumps
 * ahead of queued waiters.
 */
class JobGroup {
public:
    explicit JobGroup(std::string name);

    JobGroup(const JobGroup&) = delete;
    JobGroup& operator=(const JobGroup&) = delete;

    const std::string& name() const
    {
        return name_;
    }

    bool inProgress() const;

    /**
     * @brief Outermost job currently holding the group
     */
    std::optional<std::string> activeJobName() const;

    size_t waitingCount() const;

    /**
     * @brief Enter without waiting
     * @return false if another thread holds the group or is queued for it
     */
    bool tryAcquire(const std::string& job_name);

    /**
     * @brief Enter, waiting in FIFO order behind earlier callers
     */
    void acquire(const std::string& job_name);

    /**
     * @brief Leave the innermost entry held by the calling thread
     */
    void release();

private:
    bool heldByCurrentThread() const;
    void enter(const std::string& job_name);

    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::thread::id owner_;
    std::vector<std::string> job_stack_;

    uint64_t next_ticket_ = 0;
    uint64_t serving_ticket_ = 0;
    size_t waiters_ = 0;
};

} // namespace supervisor_cpp
