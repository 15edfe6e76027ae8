#include <algorithm>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/context.hpp>
#include <supervisor-cpp/docker/supervisor.hpp>

namespace supervisor_cpp {

SupervisorContainer::SupervisorContainer(SupervisorContext& context, RoleSpec role)
    : ContainerInterface(context, std::move(role))
{}

void SupervisorContainer::attach(const Version& version, bool /*skip_state_event_if_down*/)
{
    runJob("docker_supervisor_attach", JobExecutionLimit::GROUP_WAIT, [&]() {
        auto logger = Logger::getInstance("docker.supervisor");
        auto& docker = context_.docker();

        std::optional<ContainerInfo> container;
        try {
            container = context_.executor().run(
                [&docker, this]() { return docker.client().getContainer(name()); });
        }
        catch (const ContainerError& e) {
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Can't inspect Supervisor " + name() + ": " + e.getMessage());
        }
        if (!container) {
            throw ContainerError(ErrorCode::DOCKER_ERROR, "Supervisor " + name() + " not found");
        }

        setMetadata(container->attrs);
        logger->info("Attaching to Supervisor {} with version {}", image().value_or(name()),
                     version);

        auto members = docker.network().containers();
        if (std::find(members.begin(), members.end(), container->id) != members.end()) {
            return;
        }

        logger->info("Connecting Supervisor to {}-network", DOCKER_NETWORK);
        context_.executor().run([&docker, this]() {
            docker.network().attachContainer(name(), {"supervisor"}, DockerNetwork::supervisor());
        });
    });
}

void SupervisorContainer::retag()
{
    runJob("docker_supervisor_retag", JobExecutionLimit::GROUP_WAIT, [&]() {
        auto& docker = context_.docker();

        auto repository = image();
        auto current = version();
        if (!repository || !current) {
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Can't retag Supervisor version: image or version unknown");
        }

        try {
            context_.executor().run([&docker, &repository, &current, this]() {
                auto container = docker.client().getContainer(name());
                if (!container) {
                    throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND,
                                         "Container " + name() + " not found");
                }
                docker.tagImage(container->image_id, *repository, {current->string(), LATEST_TAG});
            });
        }
        catch (const ContainerError& e) {
            Logger::getInstance("docker.supervisor")
                ->error("Can't retag Supervisor version: {}", e.getMessage());
            throw ContainerError(ErrorCode::DOCKER_ERROR,
                                 "Can't retag Supervisor version: " + e.getMessage());
        }
    });
}

void SupervisorContainer::updateStartTag(const std::string& image, const Version& version)
{
    runJob("docker_supervisor_update_start_tag", JobExecutionLimit::GROUP_WAIT, [&]() {
        auto& docker = context_.docker();
        const std::string reference = image + ":" + version.string();

        try {
            context_.executor().run([&docker, &reference, &version, this]() {
                auto container = docker.client().getContainer(name());
                if (!container) {
                    throw DockerNotFound(ErrorCode::CONTAINER_NOT_FOUND,
                                         "Container " + name() + " not found");
                }
                auto target = docker.client().getImage(reference);
                if (!target) {
                    throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND, "Image " + reference + " not found");
                }
                auto running = docker.client().getImage(container->image_id);
                if (!running) {
                    throw DockerNotFound(ErrorCode::IMAGE_NOT_FOUND,
                                         "Image " + container->image_id + " not found");
                }

                // The host starts us through the latest tag of whatever repository it used
                for (const auto& tag : running->tags) {
                    auto colon = tag.rfind(':');
                    std::string start_image = tag.substr(0, colon);
                    std::string start_tag =
                        colon == std::string::npos ? std::string(LATEST_TAG) : tag.substr(colon + 1);
                    if (start_tag != LATEST_TAG) {
                        continue;
                    }
                    docker.tagImage(target->id, start_image, {start_tag, version.string()});
                }
            });
        }
        catch (const ContainerError& e) {
            Logger::getInstance("docker.supervisor")->error("Can't fix start tag: {}", e.getMessage());
            throw ContainerError(ErrorCode::DOCKER_ERROR, "Can't fix start tag: " + e.getMessage());
        }
    });
}

bool SupervisorContainer::privileged() const
{
    return metadata().privileged();
}

bool SupervisorContainer::hostMountsAvailable() const
{
    ContainerMetadata meta = metadata();
    if (meta.empty()) {
        return false;
    }

    for (const auto& mount : meta.mounts()) {
        if (mount.is_object() && mount.value("Destination", "") == "/data"
            && mount.value("Propagation", "") == toString(PropagationMode::SLAVE)) {
            return true;
        }
    }
    return false;
}

} // namespace supervisor_cpp
