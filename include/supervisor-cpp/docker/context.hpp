#pragma once

#include <memory>
#include <supervisor-cpp/config/supervisor_options.hpp>
#include <supervisor-cpp/core/event.hpp>
#include <supervisor-cpp/core/executor.hpp>
#include <supervisor-cpp/docker/daemon_client.hpp>
#include <supervisor-cpp/docker/manager.hpp>
#include <supervisor-cpp/jobs/job_manager.hpp>
#include <supervisor-cpp/resolution/resolution.hpp>
#include <supervisor-cpp/security/trust.hpp>

namespace supervisor_cpp {

/**
 * @brief Process-wide collaborators of the container layer
 *
 * Created once at startup and passed to every container interface. The
 * private network is looked up (or created) during construction, so the
 * engine must be reachable.
 */
class SupervisorContext {
public:
    /**
     * @throws ContainerError CONFIG_INVALID when client or verifier is missing
     * @throws ContainerError NETWORK_CREATION_FAILED when the private network can't be set up
     */
    SupervisorContext(SupervisorOptions options,
                      std::shared_ptr<DaemonClient> client,
                      std::shared_ptr<TrustVerifier> verifier);
    ~SupervisorContext();

    SupervisorContext(const SupervisorContext&) = delete;
    SupervisorContext& operator=(const SupervisorContext&) = delete;

    const SupervisorOptions& options() const
    {
        return options_;
    }
    Executor& executor()
    {
        return executor_;
    }
    EventBus& bus()
    {
        return bus_;
    }
    JobManager& jobs()
    {
        return jobs_;
    }
    ResolutionCenter& resolution()
    {
        return resolution_;
    }
    TrustVerifier& verifier()
    {
        return *verifier_;
    }
    DockerAPI& docker()
    {
        return *docker_;
    }

    /**
     * @brief Stop monitoring, deliver pending events and drain the executor
     */
    void shutdown();

private:
    SupervisorOptions options_;
    std::shared_ptr<TrustVerifier> verifier_;
    Executor executor_;
    EventBus bus_;
    JobManager jobs_;
    ResolutionCenter resolution_;
    // Declared last so it goes before the executor it uses
    std::unique_ptr<DockerAPI> docker_;
};

} // namespace supervisor_cpp
