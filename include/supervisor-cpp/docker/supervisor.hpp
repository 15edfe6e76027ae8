#pragma once

#include <string>
#include <supervisor-cpp/docker/interface.hpp>

namespace supervisor_cpp {

/**
 * @brief The container this process runs in
 *
 * It is started by the host, never by us, so run is not used. Attaching
 * links it to the private network under the "supervisor" alias.
 */
class SupervisorContainer : public ContainerInterface {
public:
    SupervisorContainer(SupervisorContext& context, RoleSpec role);

    /**
     * @throws ContainerError DOCKER_ERROR when the container can't be inspected
     */
    void attach(const Version& version, bool skip_state_event_if_down = false) override;

    // Point the version tag and latest at the running image
    void retag();

    /**
     * @brief Move the start tag onto image:version
     * @throws ContainerError DOCKER_ERROR when either image is missing
     */
    void updateStartTag(const std::string& image, const Version& version);

    bool privileged() const;

    // /data mounted with slave propagation
    bool hostMountsAvailable() const;
};

} // namespace supervisor_cpp
