#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace supervisor_cpp {

/**
 * @brief State of a supervisor managed container
 *
 * Always recomputed from the daemon, never cached as truth.
 */
enum class ContainerState : std::uint8_t {
    UNKNOWN,
    STOPPED,
    RUNNING,
    PAUSED,
    RESTARTING,
    REMOVING,
    DEAD,
    HEALTHY,
    UNHEALTHY,
    FAILED
};

enum class RestartPolicy : std::uint8_t { NO, ON_FAILURE, ALWAYS, UNLESS_STOPPED };

// Linux capabilities granted to role containers
enum class Capability : std::uint8_t {
    BPF,
    DAC_READ_SEARCH,
    IPC_LOCK,
    NET_ADMIN,
    NET_RAW,
    PERFMON,
    SYS_ADMIN,
    SYS_MODULE,
    SYS_NICE,
    SYS_PTRACE,
    SYS_RAWIO,
    SYS_RESOURCE,
    SYS_TIME
};

enum class MountType : std::uint8_t { BIND, VOLUME, TMPFS, NPIPE };

// Propagation mode, bind mounts only
enum class PropagationMode : std::uint8_t { PRIVATE, SHARED, SLAVE, RPRIVATE, RSHARED, RSLAVE };

enum class CpuArch : std::uint8_t { ARMV7, ARMHF, AARCH64, I386, AMD64 };

std::string toString(ContainerState state);
std::string toString(RestartPolicy policy);
std::string toString(Capability capability);
std::string toString(MountType type);
std::string toString(PropagationMode mode);
std::string toString(CpuArch arch);

std::ostream& operator<<(std::ostream& os, ContainerState state);
std::ostream& operator<<(std::ostream& os, CpuArch arch);

// Empty policy name means "no"; unknown names yield nullopt
std::optional<RestartPolicy> restartPolicyFromString(const std::string& name);
std::optional<PropagationMode> propagationModeFromString(const std::string& name);
std::optional<CpuArch> cpuArchFromString(const std::string& name);

/**
 * @brief Engine platform string for an architecture
 *
 * armv7 -> linux/arm/v7, armhf -> linux/arm/v6, aarch64 -> linux/arm64,
 * i386 -> linux/386, amd64 -> linux/amd64.
 */
std::string platformForArch(CpuArch arch);

constexpr const char* LABEL_VERSION = "io.hass.version";
constexpr const char* LABEL_ARCH = "io.hass.arch";
constexpr const char* LABEL_MANAGED = "supervisor_managed";

constexpr const char* ENV_TIME = "TZ";
constexpr const char* ENV_TOKEN = "SUPERVISOR_TOKEN";

constexpr const char* DOCKER_HUB = "hub.docker.com";
constexpr const char* LATEST_TAG = "latest";

constexpr int DEFAULT_CONTAINER_TIMEOUT = 10; // seconds

/**
 * @brief Registry host prefix of an image reference
 *
 * "ghcr.io/home-assistant/amd64-hassio-audio" -> "ghcr.io"; images without a
 * host part ("homeassistant/amd64-base") yield nullopt.
 */
std::optional<std::string> registryFromImage(const std::string& image);

/**
 * @brief Result of a command executed in or through a container
 */
struct CommandReturn {
    std::string stdout_data;
    std::string stderr_data;
    int returncode = 0;

    bool operator==(const CommandReturn& other) const
    {
        return stdout_data == other.stdout_data && stderr_data == other.stderr_data
               && returncode == other.returncode;
    }
};

struct Mount {
    MountType type = MountType::BIND;
    std::string source;
    std::string target;
    bool read_only = false;
    std::optional<PropagationMode> propagation;
    bool read_only_non_recursive = false;

    bool operator==(const Mount& other) const
    {
        return type == other.type && source == other.source && target == other.target
               && read_only == other.read_only && propagation == other.propagation
               && read_only_non_recursive == other.read_only_non_recursive;
    }
};

struct Ulimit {
    std::string name;
    int64_t soft = 0;
    int64_t hard = 0;
};

// Common host mounts
Mount mountDev();
Mount mountDbus();
Mount mountUdev();
Mount mountMachineId(const std::string& path);

} // namespace supervisor_cpp
