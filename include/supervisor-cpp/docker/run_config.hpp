#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <supervisor-cpp/core/ip_address.hpp>
#include <supervisor-cpp/docker/const.hpp>

namespace supervisor_cpp {

/**
 * @brief Arguments for creating and starting a role container
 *
 * The container joins the private network with ipv4 and aliases; when no
 * alias is given the hostname is used.
 */
struct RunConfig {
    std::string name;
    std::string tag; // image tag, usually the version
    std::string hostname;
    bool init = false;
    bool privileged = false;
    std::optional<IPv4Address> ipv4;
    std::vector<std::string> aliases;

    std::vector<Capability> cap_add;
    std::vector<std::string> security_opt;
    std::vector<Ulimit> ulimits;
    std::optional<int64_t> cpu_rt_runtime; // microseconds
    std::vector<std::string> device_cgroup_rules;
    std::map<std::string, std::string> environment;
    std::vector<Mount> mounts;

    std::optional<RestartPolicy> restart_policy;
    std::map<std::string, std::string> labels;
    std::vector<std::string> command;
    // Empty joins the private network, anything else ("host") skips it
    std::string network_mode;
};

} // namespace supervisor_cpp
