#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <supervisor-cpp/config/supervisor_options.hpp>
#include <supervisor-cpp/core/event.hpp>
#include <supervisor-cpp/core/executor.hpp>
#include <supervisor-cpp/core/version.hpp>
#include <supervisor-cpp/docker/daemon_client.hpp>
#include <supervisor-cpp/docker/monitor.hpp>
#include <supervisor-cpp/docker/network.hpp>
#include <supervisor-cpp/docker/stats.hpp>

namespace supervisor_cpp {

constexpr int DEFAULT_LOG_TAIL = 100;

/**
 * @brief High level engine operations shared by all role containers
 *
 * Wraps a DaemonClient with the supervisor's conventions: role containers
 * join the private network, missing targets become DockerNotFound and image
 * tags are moved under a per-repository lock.
 *
 * Every method except the accessors blocks on the engine and is meant to be
 * called from an Executor task. The private network is created through the
 * Executor during construction.
 */
class DockerAPI {
public:
    DockerAPI(std::shared_ptr<DaemonClient> client,
              Executor& executor,
              EventBus& bus,
              std::map<std::string, RegistryCredentials> registries = {});
    ~DockerAPI();

    DockerAPI(const DockerAPI&) = delete;
    DockerAPI& operator=(const DockerAPI&) = delete;

    DaemonClient& client()
    {
        return *client_;
    }
    Executor& executor()
    {
        return executor_;
    }
    DockerNetwork& network()
    {
        return *network_;
    }
    ContainerMonitor& monitor()
    {
        return *monitor_;
    }
    const std::map<std::string, RegistryCredentials>& registries() const
    {
        return registries_;
    }

    /**
     * @brief Create and start a role container from image:config.tag
     *
     * Unless config.network_mode is set the container is linked to the
     * private network (aliases default to the hostname) and removed from
     * the engine's default bridge.
     *
     * @throws DockerNotFound IMAGE_NOT_FOUND when the image is not available locally
     * @throws DockerAPIError when the container can't be created or started
     */
    ContainerInfo run(const std::string& image, const RunConfig& config);

    /**
     * @throws DockerNotFound CONTAINER_NOT_FOUND
     */
    void stopContainer(const std::string& name, int timeout, bool remove_container = true);
    void startContainer(const std::string& name);
    void restartContainer(const std::string& name, int timeout);

    /**
     * @brief Remove image:version and the latest tag when it points at the same image
     *
     * A missing image is not an error.
     */
    void removeImage(const std::string& image, const std::optional<Version>& version);

    /**
     * @brief Remove every local image of image and old_images except image:version
     * @throws ContainerError DOCKER_ERROR when image:version itself is missing
     */
    void cleanupOldImages(const std::string& image,
                          const Version& version,
                          const std::set<std::string>& old_images = {});

    std::string containerLogs(const std::string& name, int tail = DEFAULT_LOG_TAIL);

    DockerStats containerStats(const std::string& name);

    CommandReturn containerRunInside(const std::string& name, const std::vector<std::string>& command);

    /**
     * @brief Run a command in a throwaway container of image:version on the private network
     */
    CommandReturn runCommand(const std::string& image,
                             const Version& version,
                             const std::vector<std::string>& command,
                             RunConfig config = {});

    /**
     * @brief Point repository:tag at source for every tag, under the repository lock
     * @throws DockerNotFound IMAGE_NOT_FOUND when source is missing
     */
    void tagImage(const std::string& source,
                  const std::string& repository,
                  const std::vector<std::string>& tags);

private:
    std::mutex& repositoryLock(const std::string& repository);

    std::shared_ptr<DaemonClient> client_;
    Executor& executor_;
    std::map<std::string, RegistryCredentials> registries_;

    std::mutex repository_locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> repository_locks_;

    std::unique_ptr<DockerNetwork> network_;
    std::unique_ptr<ContainerMonitor> monitor_;
};

} // namespace supervisor_cpp
