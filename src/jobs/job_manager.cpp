#include <algorithm>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/jobs/job_manager.hpp>

namespace supervisor_cpp {

std::string toString(JobExecutionLimit limit)
{
    switch (limit) {
        case JobExecutionLimit::UNLIMITED:
            return "unlimited";
        case JobExecutionLimit::ONCE:
            return "once";
        case JobExecutionLimit::GROUP_ONCE:
            return "group_once";
        case JobExecutionLimit::GROUP_WAIT:
            return "group_wait";
    }
    return "unknown";
}

JobManager::Slot::Slot(JobManager* manager, JobGroup* group, uint64_t job_id)
    : manager_(manager), group_(group), job_id_(job_id)
{}

JobManager::Slot::Slot(Slot&& other) noexcept
    : manager_(std::exchange(other.manager_, nullptr)),
      group_(std::exchange(other.group_, nullptr)),
      job_id_(std::exchange(other.job_id_, 0))
{}

JobManager::Slot& JobManager::Slot::operator=(Slot&& other) noexcept
{
    if (this != &other) {
        reset();
        manager_ = std::exchange(other.manager_, nullptr);
        group_ = std::exchange(other.group_, nullptr);
        job_id_ = std::exchange(other.job_id_, 0);
    }
    return *this;
}

JobManager::Slot::~Slot()
{
    reset();
}

void JobManager::Slot::reset()
{
    if (manager_ != nullptr) {
        manager_->unregisterJob(job_id_);
        manager_ = nullptr;
    }
    if (group_ != nullptr) {
        group_->release();
        group_ = nullptr;
    }
    job_id_ = 0;
}

JobGroup& JobManager::getGroup(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = groups_.find(name);
    if (it == groups_.end()) {
        it = groups_.emplace(name, std::make_unique<JobGroup>(name)).first;
    }
    return *it->second;
}

JobManager::Slot JobManager::admit(const JobDescriptor& job, JobGroup& group,
                                   const std::string& reference)
{
    auto logger = Logger::getInstance("jobs");

    switch (job.limit) {
        case JobExecutionLimit::UNLIMITED:
            return Slot(this, nullptr, registerJob(job, group, reference));

        case JobExecutionLimit::ONCE: {
            std::lock_guard<std::mutex> lock(mutex_);
            bool active = std::any_of(running_.begin(), running_.end(),
                                      [&](const auto& entry) { return entry.second == job.name; });
            if (active) {
                logger->warning("Job {} is already running", job.name);
                throw JobConflictError(job.name, job.name);
            }
            return Slot(this, nullptr, registerJobLocked(job, group, reference));
        }

        case JobExecutionLimit::GROUP_ONCE:
            if (!group.tryAcquire(job.name)) {
                logger->warning("Job {} rejected, {} is busy with {}", job.name, group.name(),
                                group.activeJobName().value_or("queued jobs"));
                throw JobConflictError(job.name, group.name());
            }
            break;

        case JobExecutionLimit::GROUP_WAIT:
            logger->trace("Job {} waiting for {}", job.name, group.name());
            group.acquire(job.name);
            break;
    }

    // Group entry is held from here; a Slot owns it even if registration fails
    Slot slot(nullptr, &group, 0);
    slot.job_id_ = registerJob(job, group, reference);
    slot.manager_ = this;
    return slot;
}

uint64_t JobManager::registerJob(const JobDescriptor& job, const JobGroup& group,
                                 const std::string& reference)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registerJobLocked(job, group, reference);
}

uint64_t JobManager::registerJobLocked(const JobDescriptor& job, const JobGroup& group,
                                       const std::string& reference)
{
    uint64_t id = next_job_id_++;
    running_[id] = job.name;

    Logger::getInstance("jobs")->debug("Job {} started on {} in {} ({})", job.name, reference,
                                       group.name(), toString(job.limit));
    return id;
}

void JobManager::unregisterJob(uint64_t job_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(job_id);
}

} // namespace supervisor_cpp
