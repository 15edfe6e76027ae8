#include <filesystem>
#include <supervisor-cpp/docker/context.hpp>
#include <supervisor-cpp/docker/network.hpp>
#include <supervisor-cpp/docker/roles.hpp>

namespace supervisor_cpp {

namespace {

// Sound devices (ALSA) and the legacy OSS nodes
const std::vector<std::string> AUDIO_CGROUP_RULES = {"c 116:* rwm", "c 14:* rwm"};

constexpr const char* SECCOMP_UNCONFINED = "seccomp=unconfined";

bool machineIdAvailable(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

Mount bindMount(const std::filesystem::path& source, const std::string& target)
{
    Mount mount;
    mount.type = MountType::BIND;
    mount.source = source.string();
    mount.target = target;
    mount.read_only = false;
    return mount;
}

using RunConfigFactory = RunConfig (*)(const SupervisorOptions&);

// Tags the configuration with the version the container is tracking
std::function<RunConfig(const ContainerInterface&)> versionedBuilder(RunConfigFactory build,
                                                                     SupervisorOptions options)
{
    return [build, options](const ContainerInterface& container) {
        RunConfig config = build(options);
        if (auto version = container.version()) {
            config.tag = version->string();
        }
        return config;
    };
}

} // namespace

EphemeralCommandCapability::EphemeralCommandCapability(RunConfig base) : base_(std::move(base)) {}

CommandReturn EphemeralCommandCapability::execute(ContainerInterface& container,
                                                  const std::vector<std::string>& command)
{
    auto image = container.image();
    auto version = container.version();
    if (!image || !version) {
        throw ContainerError(ErrorCode::DOCKER_ERROR,
                             "No image version of " + container.name() + " to run a command in");
    }

    auto& docker = container.context().docker();
    const RunConfig& base = base_;
    return container.context().executor().run([&docker, &image, &version, &command, &base]() {
        return docker.runCommand(*image, *version, command, base);
    });
}

RunConfig audioRunConfig(const SupervisorOptions& options)
{
    RunConfig config;
    config.name = AUDIO_DOCKER_NAME;
    config.hostname = "hassio-audio";
    config.init = false;
    config.ipv4 = DockerNetwork::audio();

    config.cap_add = {Capability::SYS_NICE, Capability::SYS_RESOURCE};
    config.security_opt = {SECCOMP_UNCONFINED};
    // Pulseaudio asks for realtime priority 5 by default
    config.ulimits = {Ulimit{"rtprio", 10, 10}};
    config.cpu_rt_runtime = options.audio_cpu_rt_runtime;
    config.device_cgroup_rules = AUDIO_CGROUP_RULES;
    config.environment[ENV_TIME] = options.timezone;

    config.mounts = {mountDev(), bindMount(options.audio_data_path, "/data"), mountDbus(),
                     mountUdev()};
    if (machineIdAvailable(options.machine_id)) {
        config.mounts.push_back(mountMachineId(options.machine_id.string()));
    }
    return config;
}

RunConfig homeAssistantRunConfig(const SupervisorOptions& options)
{
    RunConfig config;
    config.name = HOMEASSISTANT_DOCKER_NAME;
    config.hostname = HOMEASSISTANT_DOCKER_NAME;
    config.privileged = true;
    config.init = true;
    // Reached through the gateway of the private network
    config.network_mode = "host";

    config.environment[ENV_TIME] = options.timezone;
    config.environment[ENV_TOKEN] = options.supervisor_token;

    config.mounts = {mountDev(), bindMount(options.homeassistant_config_path, "/config"),
                     mountDbus(), mountUdev()};
    if (machineIdAvailable(options.machine_id)) {
        config.mounts.push_back(mountMachineId(options.machine_id.string()));
    }
    return config;
}

RoleSpec makeAudioRole(const SupervisorOptions& options)
{
    RoleSpec role;
    role.name = AUDIO_DOCKER_NAME;
    role.image = options.audio_image;
    role.timeout = DEFAULT_CONTAINER_TIMEOUT;
    role.address = DockerNetwork::audio();
    role.run_config = versionedBuilder(&audioRunConfig, options);
    return role;
}

RoleSpec makeHomeAssistantRole(const SupervisorOptions& options)
{
    RoleSpec role;
    role.name = HOMEASSISTANT_DOCKER_NAME;
    role.image = options.homeassistant_image;
    role.timeout = HOMEASSISTANT_TIMEOUT;
    role.address = DockerNetwork::gateway();
    role.run_config = versionedBuilder(&homeAssistantRunConfig, options);

    RunConfig base;
    base.privileged = true;
    base.init = true;
    base.environment[ENV_TIME] = options.timezone;
    base.mounts = {bindMount(options.homeassistant_config_path, "/config")};
    role.command = std::make_shared<EphemeralCommandCapability>(std::move(base));
    return role;
}

RoleSpec makeSupervisorRole(const SupervisorOptions& options)
{
    RoleSpec role;
    role.name = options.supervisor_name;
    role.image = options.supervisor_image;
    role.timeout = DEFAULT_CONTAINER_TIMEOUT;
    role.address = DockerNetwork::supervisor();
    return role;
}

} // namespace supervisor_cpp
