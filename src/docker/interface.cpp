#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/context.hpp>
#include <supervisor-cpp/docker/interface.hpp>
#include <supervisor-cpp/docker/monitor.hpp>
#include <supervisor-cpp/docker/state_classifier.hpp>

namespace supervisor_cpp {

namespace {

constexpr const char* RATELIMIT_NOTICE =
    "Your IP address has made too many requests to Docker Hub which activated a rate limit. "
    "For more details see https://www.home-assistant.io/more-info/dockerhub-rate-limit";

std::string imageReference(const std::string& image, const std::string& tag)
{
    return image + ":" + tag;
}

// Tag part of "repository:tag", empty when the reference carries none
std::string tagOf(const std::string& reference)
{
    auto colon = reference.rfind(':');
    auto slash = reference.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return "";
    }
    return reference.substr(colon + 1);
}

// Waits for an engine task bounded by the container timeout. An overrun is
// reported as DOCKER_ERROR, but only once the task is over: the caller still
// holds the job group and must not let the next operation in while the engine
// is busy with this one.
template <typename T>
T waitBounded(std::future<T> future, std::chrono::seconds bound, const std::string& what)
{
    if (future.wait_for(bound) != std::future_status::timeout) {
        return future.get();
    }

    const std::string overrun =
        what + " did not finish within " + std::to_string(bound.count()) + "s";
    Logger::getInstance("docker.interface")->warning("{}, waiting for the engine", overrun);
    future.wait();

    try {
        future.get();
    }
    catch (const ContainerError& e) {
        throw ContainerError(ErrorCode::DOCKER_ERROR, overrun + ": " + e.getMessage());
    }
    throw ContainerError(ErrorCode::DOCKER_ERROR, overrun);
}

} // namespace

ContainerInterface::ContainerInterface(SupervisorContext& context, RoleSpec role)
    : context_(context),
      role_(std::move(role)),
      jobs_(context.jobs()),
      group_(jobs_.getGroup("container_" + role_.name)),
      image_(role_.image)
{
    if (role_.name.empty()) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Container role needs a name");
    }
}

ContainerMetadata ContainerInterface::metadata() const
{
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return meta_;
}

std::optional<std::string> ContainerInterface::image() const
{
    std::lock_guard<std::mutex> lock(meta_mutex_);
    if (!image_.empty()) {
        return image_;
    }
    return meta_.image();
}

std::optional<Version> ContainerInterface::version() const
{
    return metadata().version();
}

std::optional<std::string> ContainerInterface::arch() const
{
    return metadata().arch();
}

std::optional<RestartPolicy> ContainerInterface::restartPolicy() const
{
    return metadata().restartPolicy();
}

std::map<std::string, std::string> ContainerInterface::metaLabels() const
{
    return metadata().labels();
}

std::vector<nlohmann::json> ContainerInterface::metaMounts() const
{
    return metadata().mounts();
}

std::optional<nlohmann::json> ContainerInterface::healthcheck() const
{
    return metadata().healthcheck();
}

bool ContainerInterface::inProgress() const
{
    return group_.inProgress();
}

void ContainerInterface::install(const Version& version,
                                 const std::optional<std::string>& image,
                                 bool latest,
                                 const std::optional<CpuArch>& arch)
{
    runJob("docker_interface_install", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto logger = Logger::getInstance("docker.interface");
        auto& docker = context_.docker();

        const std::string repository = image ? *image : this->image().value_or("");
        if (repository.empty()) {
            throw ContainerError(ErrorCode::DOCKER_ERROR, "No image known to install for " + name());
        }
        const CpuArch platform_arch = arch.value_or(context_.options().arch);
        const std::string reference = imageReference(repository, version.string());

        logger->info("Downloading docker image {} with tag {}.", repository, version);

        ImageInfo pulled;
        try {
            dockerLogin(repository);

            pulled = context_.executor().run([&docker, &reference, platform_arch]() {
                return docker.client().pullImage(reference, platformForArch(platform_arch));
            });

            try {
                validateTrust(pulled.id, reference);
            }
            catch (const DockerTrustError& e) {
                // A verifier that could not decide leaves the image in place
                if (e.getErrorCode() == ErrorCode::TRUST_UNTRUSTED) {
                    removePulledImage(reference);
                }
                throw;
            }

            if (latest) {
                logger->info("Tagging image {} with version {} as latest", repository, version);
                context_.executor().run([&docker, &pulled, &repository]() {
                    docker.tagImage(pulled.id, repository, {LATEST_TAG});
                });
            }
        }
        catch (const DockerAPIError& e) {
            if (e.getStatusCode() == 429) {
                context_.resolution().createIssue(IssueType::DOCKER_RATELIMIT, ContextType::SYSTEM,
                                                  {SuggestionType::REGISTRY_LOGIN});
                logger->info(RATELIMIT_NOTICE);
            }
            logger->error("Can't install {}: {}", reference, e.getMessage());
            throw DockerAPIError("Can't install " + reference + ": " + e.getMessage(),
                                 e.getStatusCode());
        }
        catch (const DockerRequestError& e) {
            logger->error("Unknown error with {} -> {}", reference, e.getMessage());
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Unknown error with " + reference + " -> " + e.getMessage());
        }

        setMetadata(pulled.attrs);
        std::lock_guard<std::mutex> lock(meta_mutex_);
        image_ = repository;
    });
}

void ContainerInterface::attach(const Version& version, bool skip_state_event_if_down)
{
    runJob("docker_interface_attach", JobExecutionLimit::GROUP_WAIT, [&]() {
        auto logger = Logger::getInstance("docker.interface");
        auto& docker = context_.docker();

        std::optional<ContainerInfo> container;
        try {
            container = context_.executor().run(
                [&docker, this]() { return docker.client().getContainer(name()); });
        }
        catch (const ContainerError& e) {
            logger->debug("Can't inspect {}: {}", name(), e.getMessage());
        }

        if (container) {
            setMetadata(container->attrs);
            docker.monitor().watchContainer(*container);

            ContainerState state = classifyContainerState(statusViewFromInspect(container->attrs));
            bool down = state == ContainerState::STOPPED || state == ContainerState::FAILED;
            if (!(skip_state_event_if_down && down)) {
                context_.bus().publish(makeContainerStateEvent(name(), state, container->id));
            }
        }

        auto repository = image();
        if (metadata().empty() && repository) {
            const std::string reference = imageReference(*repository, version.string());
            try {
                auto local = context_.executor().run(
                    [&docker, &reference]() { return docker.client().getImage(reference); });
                if (local) {
                    setMetadata(local->attrs);
                }
            }
            catch (const ContainerError& e) {
                logger->debug("Can't inspect image {}: {}", reference, e.getMessage());
            }
        }

        if (metadata().empty()) {
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Can't attach to " + name() + ": no container or image found");
        }

        auto current = this->version();
        logger->info("Attaching to {} with version {}", image().value_or(name()),
                     current ? current->string() : version.string());
    });
}

void ContainerInterface::run()
{
    if (!role_.run_config) {
        throw ContainerError(ErrorCode::NOT_IMPLEMENTED, name() + " has no run configuration");
    }
    run(role_.run_config(*this));
}

void ContainerInterface::run(const RunConfig& config)
{
    runJob("docker_interface_run", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto logger = Logger::getInstance("docker.interface");
        auto& docker = context_.docker();

        if (isRunning()) {
            return;
        }

        // Clear out whatever is left of a previous container
        stop();

        auto repository = image();
        if (!repository) {
            throw ContainerError(ErrorCode::DOCKER_ERROR, "No image known to run " + name());
        }

        RunConfig effective = config;
        effective.name = name();
        if (effective.tag.empty()) {
            if (auto current = version()) {
                effective.tag = current->string();
            }
        }

        ContainerInfo container;
        try {
            container = context_.executor().run(
                [&docker, &repository, &effective]() { return docker.run(*repository, effective); });
        }
        catch (const DockerNotFound& e) {
            // install or checkImage should have put the image in place
            logger->error("Unexpected missing image for {}: {}", name(), e.getMessage());
            throw;
        }

        setMetadata(container.attrs);
        docker.monitor().watchContainer(container);
        logger->info("Started {} from {} with version {}", name(), *repository,
                     effective.tag.empty() ? std::string(LATEST_TAG) : effective.tag);
    });
}

void ContainerInterface::stop(bool remove_container)
{
    runJob("docker_interface_stop", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto& docker = context_.docker();
        try {
            context_.executor().run([&docker, this, remove_container]() {
                docker.stopContainer(name(), timeout(), remove_container);
            });
        }
        catch (const DockerNotFound&) {
            Logger::getInstance("docker.interface")->debug("{} is not there to stop", name());
        }
    });
}

void ContainerInterface::start()
{
    runJob("docker_interface_start", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto& docker = context_.docker();
        auto container_name = name();
        waitBounded(context_.executor().submit(
                        [&docker, container_name]() { docker.startContainer(container_name); }),
                    std::chrono::seconds(timeout()), "Start of " + container_name);
    });
}

void ContainerInterface::restart()
{
    runJob("docker_interface_restart", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto& docker = context_.docker();
        auto container_name = name();
        int stop_timeout = timeout();
        // The engine spends up to the stop timeout before starting again
        waitBounded(context_.executor().submit([&docker, container_name, stop_timeout]() {
                        docker.restartContainer(container_name, stop_timeout);
                    }),
                    std::chrono::seconds(2 * stop_timeout), "Restart of " + container_name);
    });
}

void ContainerInterface::remove(bool remove_image)
{
    runJob("docker_interface_remove", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto logger = Logger::getInstance("docker.interface");
        auto& docker = context_.docker();

        try {
            stop();
        }
        catch (const ContainerError& e) {
            logger->warning("Can't stop {} before removal: {}", name(), e.getMessage());
        }
        // A removed container is not reported as stopped later
        docker.monitor().unwatchContainer(name());

        auto repository = image();
        auto current = version();
        if (remove_image && repository && current) {
            context_.executor().run(
                [&docker, &repository, &current]() { docker.removeImage(*repository, current); });
        }

        clearMetadata();
    });
}

void ContainerInterface::checkImage(const Version& version,
                                    const std::string& expected_image,
                                    const std::optional<CpuArch>& expected_arch)
{
    runJob("docker_interface_check_image", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto logger = Logger::getInstance("docker.interface");
        auto& docker = context_.docker();

        const CpuArch arch = expected_arch.value_or(context_.options().arch);
        const std::string reference = imageReference(expected_image, version.string());

        if (image() == expected_image) {
            std::optional<ImageInfo> local;
            try {
                local = context_.executor().run(
                    [&docker, &reference]() { return docker.client().getImage(reference); });
            }
            catch (const ContainerError& e) {
                logger->error("Could not get {} for check due to: {}", reference, e.getMessage());
                throw ContainerError(ErrorCode::DOCKER_ERROR, "Could not get " + reference
                                                                  + " for check due to: "
                                                                  + e.getMessage());
            }
            if (!local) {
                logger->error("Could not get {} for check: not found", reference);
                throw ContainerError(ErrorCode::DOCKER_ERROR,
                                     "Could not get " + reference + " for check: not found");
            }

            if (ContainerMetadata(local->attrs).platform() == platformForArch(arch)) {
                return;
            }
        }

        logger->info("Image of {} is not {} for {}, reinstalling", name(), reference, arch);
        try {
            remove();
        }
        catch (const ContainerError& e) {
            logger->warning("Can't remove old image of {}: {}", name(), e.getMessage());
        }
        install(version, expected_image, false, arch);
    });
}

void ContainerInterface::update(const Version& version,
                                const std::optional<std::string>& image,
                                bool latest)
{
    runJob("docker_interface_update", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto logger = Logger::getInstance("docker.interface");

        auto current_image = this->image();
        auto current_version = this->version();
        const std::string repository = image ? *image : current_image.value_or("");

        logger->info("Updating image {}:{} to {}:{}", current_image.value_or("<none>"),
                     current_version ? current_version->string() : "<none>", repository,
                     version);

        install(version, repository, latest);

        try {
            stop();
        }
        catch (const ContainerError& e) {
            logger->warning("Can't stop {} after update: {}", name(), e.getMessage());
        }
    });
}

void ContainerInterface::cleanup(const std::optional<std::string>& old_image,
                                 const std::optional<std::string>& image,
                                 const std::optional<Version>& version)
{
    runJob("docker_interface_cleanup", JobExecutionLimit::GROUP_WAIT, [&]() {
        auto& docker = context_.docker();

        auto repository = image ? image : this->image();
        auto wanted = version ? version : this->version();
        if (!repository || !wanted) {
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Can't clean up images of " + name() + ": no image version known");
        }

        std::set<std::string> old_images;
        if (old_image) {
            old_images.insert(*old_image);
        }

        context_.executor().run([&docker, &repository, &wanted, &old_images]() {
            docker.cleanupOldImages(*repository, *wanted, old_images);
        });
    });
}

CommandReturn ContainerInterface::executeCommand(const std::vector<std::string>& command)
{
    return runJob("docker_interface_execute_command", JobExecutionLimit::GROUP_ONCE, [&]() {
        if (!role_.command) {
            throw ContainerError(ErrorCode::NOT_IMPLEMENTED,
                                 name() + " does not support running commands");
        }
        return role_.command->execute(*this, command);
    });
}

CommandReturn ContainerInterface::runInside(const std::vector<std::string>& command)
{
    return runJob("docker_interface_run_inside", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto& docker = context_.docker();
        return context_.executor().run(
            [&docker, &command, this]() { return docker.containerRunInside(name(), command); });
    });
}

Version ContainerInterface::getLatestVersion()
{
    auto logger = Logger::getInstance("docker.interface");
    auto& docker = context_.docker();

    auto repository = image();
    if (!repository) {
        throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "No version found for " + name());
    }

    std::vector<ImageInfo> images;
    try {
        images = context_.executor().run(
            [&docker, &repository]() { return docker.client().listImages(*repository); });
    }
    catch (const DockerRequestError& e) {
        logger->warning("Communication issues with dockerd on Host: {}", e.getMessage());
        throw DockerRequestError("Communication issues with dockerd on Host: " + e.getMessage());
    }
    catch (const DockerAPIError& e) {
        logger->info("No version found for {}: {}", *repository, e.getMessage());
        throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "No version found for " + *repository);
    }

    std::vector<Version> available;
    for (const auto& local : images) {
        for (const auto& tag : local.tags) {
            if (auto parsed = Version::parse(tagOf(tag))) {
                available.push_back(*parsed);
            }
        }
    }

    if (available.empty()) {
        logger->info("No version found for {}", *repository);
        throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "No version found for " + *repository);
    }

    std::sort(available.begin(), available.end());

    std::ostringstream found;
    for (size_t i = 0; i < available.size(); ++i) {
        found << (i > 0 ? ", " : "") << available[i];
    }
    logger->info("Found {} versions: {}", *repository, found.str());

    return available.back();
}

bool ContainerInterface::isRunning()
{
    auto& docker = context_.docker();
    auto container =
        context_.executor().run([&docker, this]() { return docker.client().getContainer(name()); });
    return container && container->status == "running";
}

ContainerState ContainerInterface::currentState()
{
    auto& docker = context_.docker();
    auto container =
        context_.executor().run([&docker, this]() { return docker.client().getContainer(name()); });
    if (!container) {
        return ContainerState::UNKNOWN;
    }
    return classifyContainerState(statusViewFromInspect(container->attrs));
}

bool ContainerInterface::isFailed()
{
    auto& docker = context_.docker();

    std::optional<ContainerInfo> container;
    try {
        container = context_.executor().run(
            [&docker, this]() { return docker.client().getContainer(name()); });
    }
    catch (const ContainerError& e) {
        throw ContainerError(ErrorCode::DOCKER_ERROR,
                             "Can't read state of " + name() + ": " + e.getMessage());
    }

    if (!container || container->status != "exited") {
        return false;
    }
    return statusViewFromInspect(container->attrs).exit_code != 0;
}

bool ContainerInterface::exists()
{
    auto& docker = context_.docker();

    auto repository = image();
    auto current = version();
    if (!repository || !current) {
        return false;
    }

    const std::string reference = imageReference(*repository, current->string());
    try {
        return context_.executor()
            .run([&docker, &reference]() { return docker.client().getImage(reference); })
            .has_value();
    }
    catch (const ContainerError& e) {
        Logger::getInstance("docker.interface")
            ->debug("Can't inspect image {}: {}", reference, e.getMessage());
        return false;
    }
}

void ContainerInterface::checkTrust()
{
    runJob("docker_interface_check_trust", JobExecutionLimit::GROUP_ONCE, [&]() {
        auto& docker = context_.docker();

        auto repository = image();
        auto current = version();
        if (!repository || !current) {
            return;
        }

        const std::string reference = imageReference(*repository, current->string());
        std::optional<ImageInfo> local;
        try {
            local = context_.executor().run(
                [&docker, &reference]() { return docker.client().getImage(reference); });
        }
        catch (const ContainerError& e) {
            Logger::getInstance("docker.interface")
                ->debug("Skipping trust check of {}: {}", reference, e.getMessage());
            return;
        }
        if (!local) {
            return;
        }

        validateTrust(local->id, reference);
    });
}

std::string ContainerInterface::logs()
{
    auto& docker = context_.docker();
    try {
        return context_.executor().run([&docker, this]() { return docker.containerLogs(name()); });
    }
    catch (const ContainerError& e) {
        Logger::getInstance("docker.interface")
            ->debug("Can't read logs of {}: {}", name(), e.getMessage());
        return "";
    }
}

DockerStats ContainerInterface::stats()
{
    auto& docker = context_.docker();
    return context_.executor().run([&docker, this]() { return docker.containerStats(name()); });
}

void ContainerInterface::setMetadata(nlohmann::json attrs)
{
    std::lock_guard<std::mutex> lock(meta_mutex_);
    meta_ = ContainerMetadata(std::move(attrs));
}

void ContainerInterface::clearMetadata()
{
    std::lock_guard<std::mutex> lock(meta_mutex_);
    meta_.clear();
}

void ContainerInterface::validateTrust(const std::string& image_id, const std::string& reference)
{
    auto logger = Logger::getInstance("docker.interface");

    auto colon = image_id.find(':');
    const std::string checksum = colon == std::string::npos ? "" : image_id.substr(colon + 1);

    auto& verifier = context_.verifier();
    TrustResult result =
        context_.executor().run([&verifier, &checksum]() { return verifier.verify(checksum); });

    switch (result.status) {
        case TrustStatus::OK:
            return;
        case TrustStatus::UNTRUSTED:
            logger->critical("Pulled image {} failed on content-trust verification!", reference);
            throw DockerTrustError(ErrorCode::TRUST_UNTRUSTED,
                                   "Pulled image " + reference
                                       + " failed on content-trust verification!");
        case TrustStatus::ERROR:
            break;
    }

    logger->error("Error happened on Content-Trust check for {}: {}", reference, result.message);
    throw DockerTrustError(ErrorCode::TRUST_VERIFICATION_FAILED,
                           "Error happened on Content-Trust check for " + reference + ": "
                               + result.message);
}

void ContainerInterface::dockerLogin(const std::string& image)
{
    auto& docker = context_.docker();
    const auto& registries = docker.registries();
    if (registries.empty()) {
        return;
    }

    std::optional<std::string> registry;
    const RegistryCredentials* credentials = nullptr;
    if (auto host = registryFromImage(image)) {
        auto it = registries.find(*host);
        if (it != registries.end()) {
            registry = *host;
            credentials = &it->second;
        }
    }
    else if (auto it = registries.find(DOCKER_HUB); it != registries.end()) {
        credentials = &it->second;
    }

    if (credentials == nullptr) {
        return;
    }

    Logger::getInstance("docker.interface")
        ->debug("Logging in to {} as {}", registry.value_or(DOCKER_HUB), credentials->username);
    context_.executor().run([&docker, &registry, credentials]() {
        docker.client().login(registry, credentials->username, credentials->password);
    });
}

void ContainerInterface::removePulledImage(const std::string& reference)
{
    auto& docker = context_.docker();
    try {
        context_.executor().run(
            [&docker, &reference]() { docker.client().removeImage(reference, true); });
    }
    catch (const ContainerError& e) {
        Logger::getInstance("docker.interface")
            ->warning("Can't remove untrusted image {}: {}", reference, e.getMessage());
    }
}

} // namespace supervisor_cpp
