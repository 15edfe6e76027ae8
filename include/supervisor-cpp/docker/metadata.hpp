#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <supervisor-cpp/core/version.hpp>
#include <supervisor-cpp/docker/const.hpp>

namespace supervisor_cpp {

/**
 * @brief Last-known daemon inspection snapshot of a container or image
 *
 * Every projection tolerates an empty snapshot and missing sections.
 */
class ContainerMetadata {
public:
    ContainerMetadata() = default;
    explicit ContainerMetadata(nlohmann::json attrs);

    bool empty() const;
    void clear();

    const nlohmann::json& raw() const
    {
        return attrs_;
    }

    std::string id() const;

    // "Config" and "HostConfig" sections, empty objects when absent
    nlohmann::json config() const;
    nlohmann::json hostConfig() const;

    std::map<std::string, std::string> labels() const;
    std::vector<nlohmann::json> mounts() const;

    // Config.Image up to the first ':'
    std::optional<std::string> image() const;

    // io.hass.version label
    std::optional<Version> version() const;

    // io.hass.arch label
    std::optional<std::string> arch() const;

    // Absent HostConfig.RestartPolicy yields nullopt, an empty name yields NO
    std::optional<RestartPolicy> restartPolicy() const;

    std::optional<nlohmann::json> healthcheck() const;

    bool privileged() const;

    /**
     * @brief Engine platform string of an image snapshot
     *
     * "Os/Architecture" with "/Variant" appended when present.
     */
    std::optional<std::string> platform() const;

private:
    nlohmann::json section(const char* name) const;

    nlohmann::json attrs_;
};

} // namespace supervisor_cpp
