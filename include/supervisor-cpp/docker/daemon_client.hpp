#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <supervisor-cpp/core/error.hpp>
#include <supervisor-cpp/core/ip_address.hpp>
#include <supervisor-cpp/docker/const.hpp>
#include <supervisor-cpp/docker/run_config.hpp>

namespace supervisor_cpp {

/**
 * @brief Outcome of a mutation that may target a missing object
 */
enum class DaemonResult : std::uint8_t { DONE, NOT_FOUND };

struct ImageInfo {
    std::string id;                // "sha256:..."
    std::vector<std::string> tags; // "repository:tag"
    nlohmann::json attrs;          // inspect document, may be empty for listings
};

struct ContainerInfo {
    std::string id;
    std::string name;
    std::string status;
    std::string image_id;
    nlohmann::json attrs;
};

struct NetworkInfo {
    std::string id;
    std::string name;
    nlohmann::json attrs;

    // Member container id -> container name
    std::map<std::string, std::string> members() const;
};

struct NetworkCreateOptions {
    std::string name;
    std::string driver = "bridge";
    std::string subnet;
    std::string gateway;
    std::string ip_range;
    bool enable_ipv6 = false;
    std::map<std::string, std::string> options;
};

/**
 * @brief Blocking container engine API
 *
 * Only called from Executor tasks. Lookups return nullopt and mutations
 * return NOT_FOUND when the target is absent. Everything else that goes
 * wrong throws DockerAPIError (the engine rejected the request) or
 * DockerRequestError (the engine could not be reached).
 */
class DaemonClient {
public:
    virtual ~DaemonClient() = default;

    // Images
    virtual std::optional<ImageInfo> getImage(const std::string& reference) = 0;
    virtual ImageInfo pullImage(const std::string& reference, const std::string& platform) = 0;
    virtual std::vector<ImageInfo> listImages(const std::string& repository) = 0;
    virtual DaemonResult removeImage(const std::string& reference, bool force) = 0;
    virtual DaemonResult tagImage(const std::string& source,
                                  const std::string& repository,
                                  const std::string& tag) = 0;

    // Docker Hub when registry is nullopt
    virtual void login(const std::optional<std::string>& registry,
                       const std::string& username,
                       const std::string& password) = 0;

    // Containers
    virtual std::optional<ContainerInfo> getContainer(const std::string& name) = 0;

    // nullopt when the image is missing locally
    virtual std::optional<ContainerInfo> createContainer(const std::string& image_reference,
                                                         const RunConfig& config) = 0;
    virtual DaemonResult startContainer(const std::string& name) = 0;
    virtual DaemonResult stopContainer(const std::string& name, int timeout) = 0;
    virtual DaemonResult restartContainer(const std::string& name, int timeout) = 0;
    virtual DaemonResult removeContainer(const std::string& name, bool force) = 0;
    virtual std::optional<std::string> containerLogs(const std::string& name, int tail) = 0;

    // Engine stats document (cpu_stats, memory_stats, networks, blkio_stats)
    virtual std::optional<nlohmann::json> containerStats(const std::string& name) = 0;

    virtual std::optional<CommandReturn> execInContainer(const std::string& name,
                                                         const std::vector<std::string>& command) = 0;

    // Throwaway container removed after the command exits; nullopt when the image is missing
    virtual std::optional<CommandReturn> runOnce(const std::string& image_reference,
                                                 const std::vector<std::string>& command,
                                                 const RunConfig& config) = 0;

    // Networks
    virtual std::optional<NetworkInfo> getNetwork(const std::string& name) = 0;
    virtual NetworkInfo createNetwork(const NetworkCreateOptions& options) = 0;
    virtual DaemonResult connectNetwork(const std::string& network,
                                        const std::string& container,
                                        const std::vector<std::string>& aliases,
                                        const std::optional<IPv4Address>& ipv4) = 0;
    virtual DaemonResult disconnectNetwork(const std::string& network,
                                           const std::string& container,
                                           bool force) = 0;
};

} // namespace supervisor_cpp
