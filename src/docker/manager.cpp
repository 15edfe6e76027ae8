#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/manager.hpp>

namespace supervisor_cpp {

namespace {

std::string imageReference(const std::string& image, const std::string& tag)
{
    return image + ":" + tag;
}

} // namespace

DockerAPI::DockerAPI(std::shared_ptr<DaemonClient> client,
                     Executor& executor,
                     EventBus& bus,
                     std::map<std::string, RegistryCredentials> registries)
    : client_(std::move(client)), executor_(executor), registries_(std::move(registries))
{
    if (!client_) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Docker API needs a daemon client");
    }

    network_ = executor_.run([this]() { return std::make_unique<DockerNetwork>(*client_); });
    monitor_ = std::make_unique<ContainerMonitor>(*client_, executor_, bus);
}

DockerAPI::~DockerAPI()
{
    monitor_->stop();
}

ContainerInfo DockerAPI::run(const std::string& image, const RunConfig& config)
{
    auto logger = Logger::getInstance("docker.manager");
    const std::string reference =
        imageReference(image, config.tag.empty() ? std::string(LATEST_TAG) : config.tag);

    auto created = client_->createContainer(reference, config);
    if (!created) {
        throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND,
                             "Image " + reference + " does not exist for " + config.name);
    }

    if (config.network_mode.empty()) {
        std::vector<std::string> aliases = config.aliases;
        if (aliases.empty() && !config.hostname.empty()) {
            aliases.push_back(config.hostname);
        }

        bool attached = true;
        try {
            network_->attachContainer(config.name, aliases, config.ipv4);
        }
        catch (const ContainerError& e) {
            attached = false;
            logger->warning("Can't attach {} to {}: {}", config.name, DOCKER_NETWORK,
                            e.getMessage());
        }

        // The default bridge stays when the private network is unavailable
        if (attached) {
            try {
                network_->detachDefaultBridge(config.name);
            }
            catch (const ContainerError& e) {
                logger->debug("Keeping {} on the default bridge: {}", config.name, e.getMessage());
            }
        }
    }

    logger->info("Starting {}", config.name);
    try {
        if (client_->startContainer(config.name) == DaemonResult::NOT_FOUND) {
            throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND,
                                 "Container " + config.name + " vanished before start");
        }
    }
    catch (const DockerAPIError& e) {
        logger->error("Can't start {}: {}", config.name, e.getMessage());
        throw DockerAPIError("Can't start " + config.name + ": " + e.getMessage(),
                             e.getStatusCode());
    }

    auto started = client_->getContainer(config.name);
    if (!started) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND,
                             "Container " + config.name + " vanished after start");
    }
    return *started;
}

void DockerAPI::stopContainer(const std::string& name, int timeout, bool remove_container)
{
    auto logger = Logger::getInstance("docker.manager");

    auto container = client_->getContainer(name);
    if (!container) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }

    if (container->status == "running") {
        logger->info("Stopping {} application", name);
        if (client_->stopContainer(name, timeout) == DaemonResult::NOT_FOUND) {
            throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
        }
    }

    if (remove_container) {
        logger->info("Cleaning {} application", name);
        if (client_->removeContainer(name, true) == DaemonResult::NOT_FOUND) {
            logger->debug("{} already removed", name);
        }
    }
}

void DockerAPI::startContainer(const std::string& name)
{
    Logger::getInstance("docker.manager")->info("Starting {}", name);
    if (client_->startContainer(name) == DaemonResult::NOT_FOUND) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
}

void DockerAPI::restartContainer(const std::string& name, int timeout)
{
    Logger::getInstance("docker.manager")->info("Restarting {}", name);
    if (client_->restartContainer(name, timeout) == DaemonResult::NOT_FOUND) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
}

void DockerAPI::removeImage(const std::string& image, const std::optional<Version>& version)
{
    auto logger = Logger::getInstance("docker.manager");
    if (!version || version->empty()) {
        logger->debug("No version known for {}, nothing to remove", image);
        return;
    }

    const std::string reference = imageReference(image, version->string());
    logger->info("Removing image {}", reference);

    std::lock_guard<std::mutex> lock(repositoryLock(image));

    // Drop latest only when it still names the image being removed
    try {
        auto latest = client_->getImage(imageReference(image, LATEST_TAG));
        auto current = client_->getImage(reference);
        if (latest && current && latest->id == current->id) {
            client_->removeImage(imageReference(image, LATEST_TAG), true);
        }
    }
    catch (const ContainerError& e) {
        logger->debug("Can't remove latest tag of {}: {}", image, e.getMessage());
    }

    try {
        if (client_->removeImage(reference, true) == DaemonResult::NOT_FOUND) {
            logger->debug("Image {} already removed", reference);
        }
    }
    catch (const DockerAPIError& e) {
        logger->warning("Can't remove image {}: {}", reference, e.getMessage());
        throw ContainerError(ErrorCode::DOCKER_ERROR,
                             "Can't remove image " + reference + ": " + e.getMessage());
    }
}

void DockerAPI::cleanupOldImages(const std::string& image,
                                 const Version& version,
                                 const std::set<std::string>& old_images)
{
    auto logger = Logger::getInstance("docker.manager");
    const std::string reference = imageReference(image, version.string());

    std::optional<ImageInfo> current;
    try {
        current = client_->getImage(reference);
    }
    catch (const ContainerError& e) {
        logger->warning("Can't find {} for cleanup: {}", reference, e.getMessage());
        throw ContainerError(ErrorCode::DOCKER_ERROR,
                             "Can't find " + reference + " for cleanup: " + e.getMessage());
    }
    if (!current) {
        logger->warning("Can't find {} for cleanup", reference);
        throw ContainerError(ErrorCode::DOCKER_ERROR, "Can't find " + reference + " for cleanup");
    }

    std::set<std::string> repositories = old_images;
    repositories.insert(image);

    for (const auto& repository : repositories) {
        std::vector<ImageInfo> images;
        try {
            images = client_->listImages(repository);
        }
        catch (const ContainerError& e) {
            logger->warning("Can't list images of {}: {}", repository, e.getMessage());
            continue;
        }

        std::lock_guard<std::mutex> lock(repositoryLock(repository));
        for (const auto& candidate : images) {
            if (candidate.id == current->id) {
                continue;
            }
            logger->info("Cleanup images: {}", candidate.id);
            try {
                client_->removeImage(candidate.id, true);
            }
            catch (const ContainerError& e) {
                logger->warning("Can't remove image {}: {}", candidate.id, e.getMessage());
            }
        }
    }
}

std::string DockerAPI::containerLogs(const std::string& name, int tail)
{
    auto logs = client_->containerLogs(name, tail);
    if (!logs) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
    return *logs;
}

DockerStats DockerAPI::containerStats(const std::string& name)
{
    auto container = client_->getContainer(name);
    if (!container) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
    if (container->status != "running") {
        throw ContainerError(ErrorCode::DOCKER_ERROR, "Container " + name + " is not running");
    }

    auto stats = client_->containerStats(name);
    if (!stats) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
    return DockerStats(*stats);
}

CommandReturn DockerAPI::containerRunInside(const std::string& name,
                                            const std::vector<std::string>& command)
{
    auto result = client_->execInContainer(name, command);
    if (!result) {
        throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND, "Container " + name + " not found");
    }
    return *result;
}

CommandReturn DockerAPI::runCommand(const std::string& image,
                                    const Version& version,
                                    const std::vector<std::string>& command,
                                    RunConfig config)
{
    const std::string reference = imageReference(image, version.string());
    if (config.network_mode.empty()) {
        config.network_mode = DOCKER_NETWORK;
    }

    Logger::getInstance("docker.manager")->info("Running command on {}", reference);
    auto result = client_->runOnce(reference, command, config);
    if (!result) {
        throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "Image " + reference + " not found");
    }
    return *result;
}

void DockerAPI::tagImage(const std::string& source,
                         const std::string& repository,
                         const std::vector<std::string>& tags)
{
    std::lock_guard<std::mutex> lock(repositoryLock(repository));

    for (const auto& tag : tags) {
        Logger::getInstance("docker.manager")->debug("Tagging {} as {}:{}", source, repository, tag);
        if (client_->tagImage(source, repository, tag) == DaemonResult::NOT_FOUND) {
            throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "Image " + source + " not found");
        }
    }
}

std::mutex& DockerAPI::repositoryLock(const std::string& repository)
{
    std::lock_guard<std::mutex> lock(repository_locks_mutex_);

    auto& entry = repository_locks_[repository];
    if (!entry) {
        entry = std::make_unique<std::mutex>();
    }
    return *entry;
}

} // namespace supervisor_cpp
