#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <supervisor-cpp/core/ip_address.hpp>
#include <supervisor-cpp/core/version.hpp>
#include <supervisor-cpp/docker/const.hpp>
#include <supervisor-cpp/docker/metadata.hpp>
#include <supervisor-cpp/docker/run_config.hpp>
#include <supervisor-cpp/docker/stats.hpp>
#include <supervisor-cpp/jobs/job_manager.hpp>

namespace supervisor_cpp {

class ContainerInterface;
class SupervisorContext;

/**
 * @brief Optional one-shot command execution of a role
 */
class CommandCapability {
public:
    virtual ~CommandCapability() = default;

    virtual CommandReturn execute(ContainerInterface& container,
                                  const std::vector<std::string>& command) = 0;
};

/**
 * @brief Everything that distinguishes one supervised container from another
 */
struct RoleSpec {
    std::string name;
    // Repository without tag, empty to take it from the container metadata
    std::string image;
    int timeout = DEFAULT_CONTAINER_TIMEOUT;
    std::optional<IPv4Address> address;
    std::function<RunConfig(const ContainerInterface&)> run_config;
    std::shared_ptr<CommandCapability> command;
};

/**
 * @brief Lifecycle of one named container and its image
 *
 * Mutating operations are admitted through the container's job group
 * ("container_<name>"): install, run, stop, start, restart, remove,
 * checkImage, update, executeCommand, runInside and checkTrust fail fast
 * with JobConflictError while another of them is active; attach and
 * cleanup queue behind it. Operations nest on the thread that holds the
 * group, so update can call install and stop.
 *
 * Engine calls never run on the calling thread. They are handed to the
 * context's Executor and the caller waits for the result.
 */
class ContainerInterface {
public:
    ContainerInterface(SupervisorContext& context, RoleSpec role);
    virtual ~ContainerInterface() = default;

    ContainerInterface(const ContainerInterface&) = delete;
    ContainerInterface& operator=(const ContainerInterface&) = delete;

    const std::string& name() const
    {
        return role_.name;
    }

    int timeout() const
    {
        return role_.timeout;
    }

    const std::optional<IPv4Address>& ipAddress() const
    {
        return role_.address;
    }

    SupervisorContext& context()
    {
        return context_;
    }

    JobGroup& group()
    {
        return group_;
    }

    // Snapshot projections
    ContainerMetadata metadata() const;
    std::optional<std::string> image() const;
    std::optional<Version> version() const;
    std::optional<std::string> arch() const;
    std::optional<RestartPolicy> restartPolicy() const;
    std::map<std::string, std::string> metaLabels() const;
    std::vector<nlohmann::json> metaMounts() const;
    std::optional<nlohmann::json> healthcheck() const;

    bool inProgress() const;

    /**
     * @brief Pull image:version, verify its content and optionally tag it latest
     *
     * An image found untrusted is removed again before the trust error is
     * thrown. When the verification itself fails the image is kept.
     *
     * @param image Repository, defaults to image()
     * @param arch Platform to pull, defaults to the supervisor architecture
     * @throws DockerAPIError engine rejected the pull (429 also records a rate limit issue)
     * @throws DockerTrustError TRUST_UNTRUSTED or TRUST_VERIFICATION_FAILED
     * @throws ContainerError DOCKER_ERROR when the engine can't be reached
     */
    void install(const Version& version,
                 const std::optional<std::string>& image = std::nullopt,
                 bool latest = false,
                 const std::optional<CpuArch>& arch = std::nullopt);

    /**
     * @brief Adopt an existing container, or the local image when none exists
     *
     * Publishes the current state on the bus unless skip_state_event_if_down
     * is set and the container is stopped or failed.
     *
     * @throws ContainerError DOCKER_ERROR when neither is available
     */
    virtual void attach(const Version& version, bool skip_state_event_if_down = false);

    /**
     * @brief Run with the role's own configuration
     * @throws ContainerError NOT_IMPLEMENTED for roles without one
     */
    void run();

    /**
     * @brief Replace the container with a fresh one unless it is already running
     * @throws DockerNotFound IMAGE_NOT_FOUND when the image disappeared since install
     */
    void run(const RunConfig& config);

    void stop(bool remove_container = true);

    /**
     * @brief Start (restart) the existing container
     *
     * The engine call is bounded by timeout() (twice that for restart). An
     * overrun throws ContainerError DOCKER_ERROR, but only after the engine
     * call has returned, so the job group stays held while the engine works.
     */
    void start();
    void restart();

    // Safe to call on an absent container. The monitor stops watching it.
    void remove(bool remove_image = true);

    /**
     * @brief Make sure expected_image:version for expected_arch is what we track
     *
     * Reinstalls when the repository or the platform differs.
     */
    void checkImage(const Version& version,
                    const std::string& expected_image,
                    const std::optional<CpuArch>& expected_arch = std::nullopt);

    void update(const Version& version,
                const std::optional<std::string>& image = std::nullopt,
                bool latest = false);

    void cleanup(const std::optional<std::string>& old_image = std::nullopt,
                 const std::optional<std::string>& image = std::nullopt,
                 const std::optional<Version>& version = std::nullopt);

    CommandReturn executeCommand(const std::vector<std::string>& command);
    CommandReturn runInside(const std::vector<std::string>& command);

    /**
     * @brief Highest comparable version among the local tags of image()
     * @throws DockerNotFound IMAGE_NOT_FOUND when no tag parses as a version
     * @throws DockerRequestError when the engine can't be reached
     */
    Version getLatestVersion();

    bool isRunning();
    ContainerState currentState();
    bool isFailed();
    bool exists();

    // Returns quietly when the tracked image is gone
    void checkTrust();

    std::string logs();
    DockerStats stats();

protected:
    template <typename F>
    auto runJob(const std::string& job_name, JobExecutionLimit limit, F&& fn)
        -> std::invoke_result_t<F>;

    void setMetadata(nlohmann::json attrs);
    void clearMetadata();

    void validateTrust(const std::string& image_id, const std::string& reference);

    SupervisorContext& context_;
    RoleSpec role_;
    JobManager& jobs_;
    JobGroup& group_;

private:
    void dockerLogin(const std::string& image);
    void removePulledImage(const std::string& reference);

    mutable std::mutex meta_mutex_;
    ContainerMetadata meta_;
    std::string image_;
};

template <typename F>
auto ContainerInterface::runJob(const std::string& job_name, JobExecutionLimit limit, F&& fn)
    -> std::invoke_result_t<F>
{
    return jobs_.run({job_name, limit}, group_, name(), std::forward<F>(fn));
}

} // namespace supervisor_cpp
