#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/context.hpp>

namespace supervisor_cpp {

namespace {

std::shared_ptr<TrustVerifier> requireVerifier(std::shared_ptr<TrustVerifier> verifier)
{
    if (!verifier) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Supervisor context needs a trust verifier");
    }
    return verifier;
}

} // namespace

SupervisorContext::SupervisorContext(SupervisorOptions options,
                                     std::shared_ptr<DaemonClient> client,
                                     std::shared_ptr<TrustVerifier> verifier)
    : options_(std::move(options)),
      verifier_(requireVerifier(std::move(verifier))),
      executor_(options_.executor_workers)
{
    docker_ = std::make_unique<DockerAPI>(std::move(client), executor_, bus_, options_.registries);

    Logger::getInstance("supervisor")
        ->info("Supervisor context ready for {} with {} workers", options_.arch,
               executor_.getWorkerCount());
}

SupervisorContext::~SupervisorContext()
{
    shutdown();
}

void SupervisorContext::shutdown()
{
    if (docker_) {
        docker_->monitor().stop();
    }
    bus_.flush();
    bus_.shutdown();
    executor_.shutdown();
}

} // namespace supervisor_cpp
