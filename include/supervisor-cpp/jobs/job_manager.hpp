#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <supervisor-cpp/core/error.hpp>
#include <supervisor-cpp/jobs/job_group.hpp>

namespace supervisor_cpp {

enum class JobExecutionLimit : std::uint8_t {
    UNLIMITED,  // no coordination
    ONCE,       // single flight per job name, across all groups
    GROUP_ONCE, // fail fast while the group is busy
    GROUP_WAIT  // queue behind the group in arrival order
};

std::string toString(JobExecutionLimit limit);

struct JobDescriptor {
    std::string name;
    JobExecutionLimit limit = JobExecutionLimit::UNLIMITED;
};

/**
 * @brief Owns the job groups and admits lifecycle operations
 *
 * Usage:
 * @code
 * auto& group = jobs.getGroup("container_hassio_audio");
 * jobs.run({"docker_interface_stop", JobExecutionLimit::GROUP_ONCE}, group, "hassio_audio",
 *          [&]() { ... });
 * @endcode
 */
class JobManager {
public:
    /**
     * @brief Admission held for the duration of one job
     *
     * Releases the group entry and unregisters the job when destroyed, on
     * success and on error alike.
     */
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

        uint64_t jobId() const
        {
            return job_id_;
        }

    private:
        friend class JobManager;
        Slot(JobManager* manager, JobGroup* group, uint64_t job_id);

        void reset();

        JobManager* manager_ = nullptr;
        JobGroup* group_ = nullptr;
        uint64_t job_id_ = 0;
    };

    JobManager() = default;
    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * @brief Group for a resource, created on first use
     *
     * Groups live as long as the manager.
     */
    JobGroup& getGroup(const std::string& name);

    /**
     * @brief Admit a job according to its limit
     * @throws JobConflictError when a fail-fast limit rejects the job
     */
    Slot admit(const JobDescriptor& job, JobGroup& group, const std::string& reference);

    /**
     * @brief Admit, run and release
     */
    template <typename F>
    auto run(const JobDescriptor& job, JobGroup& group, const std::string& reference, F&& fn)
        -> std::invoke_result_t<F>;

private:
    uint64_t registerJob(const JobDescriptor& job, const JobGroup& group,
                         const std::string& reference);
    uint64_t registerJobLocked(const JobDescriptor& job, const JobGroup& group,
                               const std::string& reference);
    void unregisterJob(uint64_t job_id);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<JobGroup>> groups_;
    // Job names by id, for the ONCE limit
    std::map<uint64_t, std::string> running_;
    uint64_t next_job_id_ = 1;
};

template <typename F>
auto JobManager::run(const JobDescriptor& job, JobGroup& group, const std::string& reference,
                     F&& fn) -> std::invoke_result_t<F>
{
    Slot slot = admit(job, group, reference);
    return std::forward<F>(fn)();
}

} // namespace supervisor_cpp
