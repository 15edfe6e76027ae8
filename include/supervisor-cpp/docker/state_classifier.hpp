#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <supervisor-cpp/docker/const.hpp>

namespace supervisor_cpp {

/**
 * @brief The daemon attributes that decide a container's state
 */
struct ContainerStatusView {
    std::string status;                // "running", "exited", "created", ...
    int exit_code = 0;
    std::optional<std::string> health; // present only with a health check
};

/**
 * @brief Map raw daemon attributes to a ContainerState
 *
 * Rules in order: running with a health check is healthy or unhealthy,
 * running is running, a positive exit code is failed, anything else is
 * stopped. Total and free of side effects.
 */
ContainerState classifyContainerState(const ContainerStatusView& view) noexcept;

/**
 * @brief Extract the status view from a container inspect document
 *
 * Missing fields read as empty status, exit code 0 and no health check.
 */
ContainerStatusView statusViewFromInspect(const nlohmann::json& attrs);

} // namespace supervisor_cpp
