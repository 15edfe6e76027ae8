#include <supervisor-cpp/config/supervisor_options.hpp>
#include <supervisor-cpp/core/executor.hpp>

namespace supervisor_cpp {

namespace {

constexpr const char* REGISTRIES_PREFIX = "docker.registries.";

std::string expandArch(std::string image, CpuArch arch)
{
    const std::string placeholder = "{arch}";
    size_t pos = image.find(placeholder);
    while (pos != std::string::npos) {
        image.replace(pos, placeholder.length(), toString(arch));
        pos = image.find(placeholder, pos);
    }
    return image;
}

std::map<std::string, RegistryCredentials> loadRegistries(const ConfigManager& config)
{
    std::map<std::string, RegistryCredentials> registries;
    const std::string prefix = REGISTRIES_PREFIX;

    // Host names contain dots, so split on the last one
    for (const auto& key : config.getKeysWithPrefix(prefix)) {
        std::string rest = key.substr(prefix.length());
        size_t dot = rest.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            throw ContainerError(ErrorCode::CONFIG_INVALID, "Malformed registry entry: " + key);
        }

        std::string host = rest.substr(0, dot);
        std::string field = rest.substr(dot + 1);
        if (field == "username") {
            registries[host].username = config.get<std::string>(key);
        }
        else if (field == "password") {
            registries[host].password = config.get<std::string>(key);
        }
        else {
            throw ContainerError(ErrorCode::CONFIG_INVALID,
                                 "Unknown registry field '" + field + "' for " + host);
        }
    }

    for (const auto& [host, credentials] : registries) {
        if (credentials.username.empty()) {
            throw ContainerError(ErrorCode::CONFIG_INVALID,
                                 "Registry " + host + " has no username");
        }
    }

    return registries;
}

} // namespace

SupervisorOptions SupervisorOptions::fromConfig(const ConfigManager& config)
{
    SupervisorOptions options;

    std::string arch_name = config.get<std::string>("supervisor.arch", toString(options.arch));
    auto arch = cpuArchFromString(arch_name);
    if (!arch) {
        throw ContainerError(ErrorCode::CONFIG_INVALID,
                             "Unsupported architecture: " + arch_name);
    }
    options.arch = *arch;

    options.timezone = config.get<std::string>("supervisor.timezone", options.timezone);
    options.machine_id =
        config.get<std::string>("supervisor.machine_id", options.machine_id.string());
    options.supervisor_token = config.get<std::string>("supervisor.token", "");
    options.supervisor_name = config.get<std::string>("supervisor.name", options.supervisor_name);
    options.supervisor_image = expandArch(
        config.get<std::string>("supervisor.image", DEFAULT_SUPERVISOR_IMAGE), options.arch);

    options.docker_binary = config.get<std::string>("docker.binary", options.docker_binary);
    options.registries = loadRegistries(config);

    int64_t workers = config.get<int64_t>("executor.workers",
                                          static_cast<int64_t>(DEFAULT_EXECUTOR_WORKERS));
    if (workers < 1) {
        throw ContainerError(ErrorCode::CONFIG_INVALID,
                             "executor.workers must be at least 1, got " + std::to_string(workers));
    }
    options.executor_workers = static_cast<size_t>(workers);

    options.content_trust = config.get<bool>("security.content_trust", options.content_trust);
    options.verify_command = config.get<std::string>("security.verify_command", "");
    if (options.content_trust && options.verify_command.empty()) {
        throw ContainerError(ErrorCode::CONFIG_MISSING,
                             "security.content_trust requires security.verify_command");
    }

    options.audio_image =
        expandArch(config.get<std::string>("audio.image", DEFAULT_AUDIO_IMAGE), options.arch);
    options.audio_data_path =
        config.get<std::string>("audio.data_path", options.audio_data_path.string());
    if (config.has("audio.cpu_rt_runtime")) {
        options.audio_cpu_rt_runtime = config.get<int64_t>("audio.cpu_rt_runtime");
    }

    options.homeassistant_image = expandArch(
        config.get<std::string>("homeassistant.image", DEFAULT_HOMEASSISTANT_IMAGE),
        options.arch);
    options.homeassistant_config_path = config.get<std::string>(
        "homeassistant.config_path", options.homeassistant_config_path.string());

    options.log_level = logLevelFromString(config.get<std::string>("logging.level", "info"));
    if (config.has("logging.file")) {
        options.log_file = config.get<std::string>("logging.file");
    }
    options.log_pattern = config.get<std::string>("logging.pattern", options.log_pattern);

    return options;
}

} // namespace supervisor_cpp
