#include <supervisor-cpp/docker/daemon_client.hpp>

namespace supervisor_cpp {

std::map<std::string, std::string> NetworkInfo::members() const
{
    std::map<std::string, std::string> result;

    if (!attrs.is_object()) {
        return result;
    }
    auto containers = attrs.find("Containers");
    if (containers == attrs.end() || !containers->is_object()) {
        return result;
    }

    for (const auto& [id, member] : containers->items()) {
        std::string name;
        if (member.is_object()) {
            auto it = member.find("Name");
            if (it != member.end() && it->is_string()) {
                name = it->get<std::string>();
            }
        }
        result[id] = name;
    }
    return result;
}

} // namespace supervisor_cpp
