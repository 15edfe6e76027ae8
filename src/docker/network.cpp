#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/network.hpp>

namespace supervisor_cpp {

namespace {

constexpr uint64_t GATEWAY_INDEX = 1;
constexpr uint64_t SUPERVISOR_INDEX = 2;
constexpr uint64_t DNS_INDEX = 3;
constexpr uint64_t AUDIO_INDEX = 4;
constexpr uint64_t CLI_INDEX = 5;
constexpr uint64_t OBSERVER_INDEX = 6;
constexpr uint64_t RESERVED_INDEX = 7;

IPv4Network parseNetwork(const char* cidr)
{
    auto network = IPv4Network::parse(cidr);
    if (!network) {
        throw ContainerError(ErrorCode::NETWORK_CONFIG_FAILED,
                             std::string("Invalid network definition ") + cidr);
    }
    return *network;
}

} // namespace

DockerNetwork::DockerNetwork(DaemonClient& client) : client_(client)
{
    network_ = ensureNetwork();
}

std::vector<std::string> DockerNetwork::containers() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, name] : network_.members()) {
        ids.push_back(id);
    }
    return ids;
}

void DockerNetwork::reload()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reloadLocked();
}

void DockerNetwork::attachContainer(const std::string& container_name,
                                    const std::vector<std::string>& aliases,
                                    const std::optional<IPv4Address>& ipv4)
{
    auto logger = Logger::getInstance("docker.network");
    std::lock_guard<std::mutex> lock(mutex_);

    reloadLocked();

    // A leftover entry with the same name blocks a new link
    for (const auto& [id, name] : network_.members()) {
        if (name == container_name) {
            logger->warning("Stale entry of {} found on {}, cleaning up", container_name,
                            DOCKER_NETWORK);
            staleCleanup(container_name);
            break;
        }
    }

    try {
        if (client_.connectNetwork(DOCKER_NETWORK, container_name, aliases, ipv4)
            == DaemonResult::NOT_FOUND) {
            throw ContainerError(ErrorCode::NETWORK_CONFIG_FAILED,
                                 "Can't link " + container_name + " to " + DOCKER_NETWORK
                                     + ": not found");
        }
    }
    catch (const DockerAPIError& e) {
        logger->error("Can't link container to {}: {}", DOCKER_NETWORK, e.getMessage());
        throw ContainerError(ErrorCode::NETWORK_CONFIG_FAILED,
                             "Can't link " + container_name + " to " + DOCKER_NETWORK + ": "
                                 + e.getMessage());
    }

    reloadLocked();
}

void DockerNetwork::detachDefaultBridge(const std::string& container_name)
{
    try {
        if (client_.disconnectNetwork(DOCKER_DEFAULT_BRIDGE, container_name, false)
            == DaemonResult::NOT_FOUND) {
            return;
        }
    }
    catch (const DockerAPIError& e) {
        Logger::getInstance("docker.network")
            ->warning("Can't disconnect {} from default: {}", container_name, e.getMessage());
        throw ContainerError(ErrorCode::NETWORK_CONFIG_FAILED,
                             "Can't disconnect " + container_name + " from default: "
                                 + e.getMessage());
    }
}

void DockerNetwork::staleCleanup(const std::string& container_name)
{
    if (client_.disconnectNetwork(DOCKER_NETWORK, container_name, true)
        == DaemonResult::NOT_FOUND) {
        Logger::getInstance("docker.network")
            ->debug("{} already gone from {}", container_name, DOCKER_NETWORK);
    }
}

const IPv4Network& DockerNetwork::subnet()
{
    static const IPv4Network network = parseNetwork(DOCKER_NETWORK_MASK);
    return network;
}

const IPv4Network& DockerNetwork::ipRange()
{
    static const IPv4Network network = parseNetwork(DOCKER_NETWORK_RANGE);
    return network;
}

IPv4Address DockerNetwork::gateway()
{
    return subnet().at(GATEWAY_INDEX);
}

IPv4Address DockerNetwork::supervisor()
{
    return subnet().at(SUPERVISOR_INDEX);
}

IPv4Address DockerNetwork::dns()
{
    return subnet().at(DNS_INDEX);
}

IPv4Address DockerNetwork::audio()
{
    return subnet().at(AUDIO_INDEX);
}

IPv4Address DockerNetwork::cli()
{
    return subnet().at(CLI_INDEX);
}

IPv4Address DockerNetwork::observer()
{
    return subnet().at(OBSERVER_INDEX);
}

IPv4Address DockerNetwork::reserved()
{
    return subnet().at(RESERVED_INDEX);
}

NetworkInfo DockerNetwork::ensureNetwork()
{
    auto logger = Logger::getInstance("docker.network");

    if (auto existing = client_.getNetwork(DOCKER_NETWORK)) {
        return *existing;
    }

    logger->info("Can't find Supervisor network, creating a new network");

    NetworkCreateOptions options;
    options.name = DOCKER_NETWORK;
    options.driver = "bridge";
    options.subnet = subnet().toString();
    options.gateway = gateway().toString();
    options.ip_range = ipRange().toString();
    options.enable_ipv6 = false;
    options.options["com.docker.network.bridge.name"] = DOCKER_NETWORK;

    try {
        return client_.createNetwork(options);
    }
    catch (const DockerAPIError& e) {
        logger->error("Can't create Supervisor network: {}", e.getMessage());
        throw ContainerError(ErrorCode::NETWORK_CREATION_FAILED,
                             "Can't create Supervisor network: " + e.getMessage());
    }
}

void DockerNetwork::reloadLocked()
{
    try {
        if (auto current = client_.getNetwork(DOCKER_NETWORK)) {
            network_ = std::move(*current);
        }
    }
    catch (const ContainerError& e) {
        Logger::getInstance("docker.network")
            ->debug("Can't reload {}: {}", DOCKER_NETWORK, e.getMessage());
    }
}

} // namespace supervisor_cpp
