#pragma once

#include <string>
#include <vector>
#include <supervisor-cpp/config/supervisor_options.hpp>
#include <supervisor-cpp/docker/interface.hpp>

namespace supervisor_cpp {

constexpr const char* AUDIO_DOCKER_NAME = "hassio_audio";
constexpr const char* HOMEASSISTANT_DOCKER_NAME = "homeassistant";

// Core shutdown writes its database, give it time
constexpr int HOMEASSISTANT_TIMEOUT = 260;

/**
 * @brief Runs commands in a throwaway container of the role's image and version
 *
 * The base configuration supplies mounts, environment and privileges of
 * the throwaway container.
 */
class EphemeralCommandCapability : public CommandCapability {
public:
    explicit EphemeralCommandCapability(RunConfig base);

    CommandReturn execute(ContainerInterface& container,
                          const std::vector<std::string>& command) override;

private:
    RunConfig base_;
};

// Audio plugin: realtime scheduling, sound devices and the host dbus/udev
RoleSpec makeAudioRole(const SupervisorOptions& options);

// Core application: privileged on the host network with its config directory
RoleSpec makeHomeAssistantRole(const SupervisorOptions& options);

RoleSpec makeSupervisorRole(const SupervisorOptions& options);

RunConfig audioRunConfig(const SupervisorOptions& options);
RunConfig homeAssistantRunConfig(const SupervisorOptions& options);

} // namespace supervisor_cpp
