#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <supervisor-cpp/config/config_manager.hpp>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/const.hpp>

namespace supervisor_cpp {

constexpr const char* DEFAULT_DOCKER_BINARY = "docker";
constexpr const char* DEFAULT_TIMEZONE = "UTC";
constexpr const char* DEFAULT_MACHINE_ID = "/etc/machine-id";
constexpr const char* DEFAULT_AUDIO_DATA_PATH = "/usr/share/hassio/audio";
constexpr const char* DEFAULT_HOMEASSISTANT_CONFIG_PATH = "/usr/share/hassio/homeassistant";
constexpr const char* DEFAULT_SUPERVISOR_NAME = "hassio_supervisor";
// "{arch}" is replaced with the supervisor architecture
constexpr const char* DEFAULT_SUPERVISOR_IMAGE = "ghcr.io/home-assistant/{arch}-hassio-supervisor";
constexpr const char* DEFAULT_AUDIO_IMAGE = "ghcr.io/home-assistant/{arch}-hassio-audio";
constexpr const char* DEFAULT_HOMEASSISTANT_IMAGE = "ghcr.io/home-assistant/{arch}-homeassistant";

struct RegistryCredentials {
    std::string username;
    std::string password;
};

/**
 * @brief Typed view of the configuration file
 *
 * Example:
 * @code
 * {
 *   "supervisor": {"arch": "amd64", "timezone": "Europe/Berlin"},
 *   "docker": {"registries": {"ghcr.io": {"username": "u", "password": "${GHCR_TOKEN}"}}},
 *   "security": {"content_trust": true, "verify_command": "cas-verify"},
 *   "logging": {"level": "debug", "pattern": "%t [%l] %n: %v"}
 * }
 * @endcode
 */
struct SupervisorOptions {
    CpuArch arch = CpuArch::AMD64;
    std::string timezone = DEFAULT_TIMEZONE;
    std::filesystem::path machine_id = DEFAULT_MACHINE_ID;
    std::string supervisor_token;
    std::string supervisor_name = DEFAULT_SUPERVISOR_NAME;
    std::string supervisor_image;

    std::string docker_binary = DEFAULT_DOCKER_BINARY;
    // Keyed by registry host, "hub.docker.com" for Docker Hub
    std::map<std::string, RegistryCredentials> registries;

    size_t executor_workers = 4;

    bool content_trust = false;
    std::string verify_command;

    std::string audio_image;
    std::filesystem::path audio_data_path = DEFAULT_AUDIO_DATA_PATH;
    std::optional<int64_t> audio_cpu_rt_runtime;
    std::string homeassistant_image;
    std::filesystem::path homeassistant_config_path = DEFAULT_HOMEASSISTANT_CONFIG_PATH;

    LogLevel log_level = LogLevel::INFO;
    std::optional<std::filesystem::path> log_file;
    std::string log_pattern = DEFAULT_LOG_PATTERN;

    /**
     * @brief Build from a loaded configuration, applying defaults for absent keys
     * @throws ContainerError CONFIG_INVALID for unknown enum values
     */
    static SupervisorOptions fromConfig(const ConfigManager& config);
};

} // namespace supervisor_cpp
