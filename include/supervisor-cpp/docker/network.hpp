#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <supervisor-cpp/core/ip_address.hpp>
#include <supervisor-cpp/docker/daemon_client.hpp>

namespace supervisor_cpp {

constexpr const char* DOCKER_NETWORK = "hassio";
constexpr const char* DOCKER_NETWORK_MASK = "172.30.32.0/23";
constexpr const char* DOCKER_NETWORK_RANGE = "172.30.33.0/24";
constexpr const char* DOCKER_DEFAULT_BRIDGE = "bridge";

/**
 * @brief The private bridge every role container joins
 *
 * Role addresses are fixed offsets into the network: gateway .1,
 * supervisor .2, dns .3, audio .4, cli .5, observer .6 and a reserved .7.
 * The bridge is created on construction when missing and never deleted.
 *
 * All methods block on the engine and must run on the Executor. Mutations
 * are serialized internally.
 */
class DockerNetwork {
public:
    /**
     * @throws ContainerError NETWORK_CREATION_FAILED if the bridge can't be created
     */
    explicit DockerNetwork(DaemonClient& client);

    DockerNetwork(const DockerNetwork&) = delete;
    DockerNetwork& operator=(const DockerNetwork&) = delete;

    std::string name() const
    {
        return DOCKER_NETWORK;
    }

    /**
     * @brief Ids of the containers attached as of the last reload
     */
    std::vector<std::string> containers() const;

    /**
     * @brief Re-read membership from the engine, failures are logged and ignored
     */
    void reload();

    /**
     * @brief Connect a container, clearing a stale entry with the same name first
     * @throws ContainerError NETWORK_CONFIG_FAILED when the engine rejects the link
     */
    void attachContainer(const std::string& container_name,
                         const std::vector<std::string>& aliases = {},
                         const std::optional<IPv4Address>& ipv4 = std::nullopt);

    /**
     * @brief Disconnect from the engine's default bridge; a missing link is fine
     * @throws ContainerError NETWORK_CONFIG_FAILED on other rejections
     */
    void detachDefaultBridge(const std::string& container_name);

    /**
     * @brief Force a container name off the network; a missing entry is fine
     * @throws DockerAPIError, DockerRequestError
     */
    void staleCleanup(const std::string& container_name);

    static const IPv4Network& subnet();
    static const IPv4Network& ipRange();

    static IPv4Address gateway();
    static IPv4Address supervisor();
    static IPv4Address dns();
    static IPv4Address audio();
    static IPv4Address cli();
    static IPv4Address observer();
    static IPv4Address reserved();

private:
    NetworkInfo ensureNetwork();
    void reloadLocked();

    DaemonClient& client_;
    mutable std::mutex mutex_;
    NetworkInfo network_;
};

} // namespace supervisor_cpp
