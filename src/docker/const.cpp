#include <regex>
#include <supervisor-cpp/docker/const.hpp>

namespace supervisor_cpp {

namespace {

// Registry host must contain a dot ("ghcr.io", "registry.local:5000")
const std::regex IMAGE_WITH_HOST(R"(^([a-zA-Z\-\.:\d{}]+\.[a-zA-Z\-\.:\d{}]+)/.*)");

} // namespace

std::string toString(ContainerState state)
{
    switch (state) {
        case ContainerState::UNKNOWN:
            return "unknown";
        case ContainerState::STOPPED:
            return "stopped";
        case ContainerState::RUNNING:
            return "running";
        case ContainerState::PAUSED:
            return "paused";
        case ContainerState::RESTARTING:
            return "restarting";
        case ContainerState::REMOVING:
            return "removing";
        case ContainerState::DEAD:
            return "dead";
        case ContainerState::HEALTHY:
            return "healthy";
        case ContainerState::UNHEALTHY:
            return "unhealthy";
        case ContainerState::FAILED:
            return "failed";
    }
    return "unknown";
}

std::string toString(RestartPolicy policy)
{
    switch (policy) {
        case RestartPolicy::NO:
            return "no";
        case RestartPolicy::ON_FAILURE:
            return "on-failure";
        case RestartPolicy::ALWAYS:
            return "always";
        case RestartPolicy::UNLESS_STOPPED:
            return "unless-stopped";
    }
    return "no";
}

std::string toString(Capability capability)
{
    switch (capability) {
        case Capability::BPF:
            return "BPF";
        case Capability::DAC_READ_SEARCH:
            return "DAC_READ_SEARCH";
        case Capability::IPC_LOCK:
            return "IPC_LOCK";
        case Capability::NET_ADMIN:
            return "NET_ADMIN";
        case Capability::NET_RAW:
            return "NET_RAW";
        case Capability::PERFMON:
            return "PERFMON";
        case Capability::SYS_ADMIN:
            return "SYS_ADMIN";
        case Capability::SYS_MODULE:
            return "SYS_MODULE";
        case Capability::SYS_NICE:
            return "SYS_NICE";
        case Capability::SYS_PTRACE:
            return "SYS_PTRACE";
        case Capability::SYS_RAWIO:
            return "SYS_RAWIO";
        case Capability::SYS_RESOURCE:
            return "SYS_RESOURCE";
        case Capability::SYS_TIME:
            return "SYS_TIME";
    }
    return "";
}

std::string toString(MountType type)
{
    switch (type) {
        case MountType::BIND:
            return "bind";
        case MountType::VOLUME:
            return "volume";
        case MountType::TMPFS:
            return "tmpfs";
        case MountType::NPIPE:
            return "npipe";
    }
    return "bind";
}

std::string toString(PropagationMode mode)
{
    switch (mode) {
        case PropagationMode::PRIVATE:
            return "private";
        case PropagationMode::SHARED:
            return "shared";
        case PropagationMode::SLAVE:
            return "slave";
        case PropagationMode::RPRIVATE:
            return "rprivate";
        case PropagationMode::RSHARED:
            return "rshared";
        case PropagationMode::RSLAVE:
            return "rslave";
    }
    return "private";
}

std::string toString(CpuArch arch)
{
    switch (arch) {
        case CpuArch::ARMV7:
            return "armv7";
        case CpuArch::ARMHF:
            return "armhf";
        case CpuArch::AARCH64:
            return "aarch64";
        case CpuArch::I386:
            return "i386";
        case CpuArch::AMD64:
            return "amd64";
    }
    return "amd64";
}

std::ostream& operator<<(std::ostream& os, ContainerState state)
{
    return os << toString(state);
}

std::ostream& operator<<(std::ostream& os, CpuArch arch)
{
    return os << toString(arch);
}

std::optional<RestartPolicy> restartPolicyFromString(const std::string& name)
{
    if (name.empty() || name == "no")
        return RestartPolicy::NO;
    if (name == "on-failure")
        return RestartPolicy::ON_FAILURE;
    if (name == "always")
        return RestartPolicy::ALWAYS;
    if (name == "unless-stopped")
        return RestartPolicy::UNLESS_STOPPED;
    return std::nullopt;
}

std::optional<PropagationMode> propagationModeFromString(const std::string& name)
{
    for (auto mode : {PropagationMode::PRIVATE, PropagationMode::SHARED, PropagationMode::SLAVE,
                      PropagationMode::RPRIVATE, PropagationMode::RSHARED,
                      PropagationMode::RSLAVE}) {
        if (toString(mode) == name) {
            return mode;
        }
    }
    return std::nullopt;
}

std::optional<CpuArch> cpuArchFromString(const std::string& name)
{
    for (auto arch :
         {CpuArch::ARMV7, CpuArch::ARMHF, CpuArch::AARCH64, CpuArch::I386, CpuArch::AMD64}) {
        if (toString(arch) == name) {
            return arch;
        }
    }
    return std::nullopt;
}

std::string platformForArch(CpuArch arch)
{
    switch (arch) {
        case CpuArch::ARMV7:
            return "linux/arm/v7";
        case CpuArch::ARMHF:
            return "linux/arm/v6";
        case CpuArch::AARCH64:
            return "linux/arm64";
        case CpuArch::I386:
            return "linux/386";
        case CpuArch::AMD64:
            return "linux/amd64";
    }
    return "linux/amd64";
}

std::optional<std::string> registryFromImage(const std::string& image)
{
    std::smatch match;
    if (std::regex_search(image, match, IMAGE_WITH_HOST)) {
        return match[1].str();
    }
    return std::nullopt;
}

Mount mountDev()
{
    Mount mount{MountType::BIND, "/dev", "/dev", true, std::nullopt, true};
    return mount;
}

Mount mountDbus()
{
    return Mount{MountType::BIND, "/run/dbus", "/run/dbus", true, std::nullopt, false};
}

Mount mountUdev()
{
    return Mount{MountType::BIND, "/run/udev", "/run/udev", true, std::nullopt, false};
}

Mount mountMachineId(const std::string& path)
{
    return Mount{MountType::BIND, path, path, true, std::nullopt, false};
}

} // namespace supervisor_cpp
