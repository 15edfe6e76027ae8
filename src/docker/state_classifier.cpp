#include <supervisor-cpp/docker/state_classifier.hpp>

namespace supervisor_cpp {

ContainerState classifyContainerState(const ContainerStatusView& view) noexcept
{
    if (view.status == "running") {
        if (view.health) {
            return *view.health == "healthy" ? ContainerState::HEALTHY
                                             : ContainerState::UNHEALTHY;
        }
        return ContainerState::RUNNING;
    }

    if (view.exit_code > 0) {
        return ContainerState::FAILED;
    }

    return ContainerState::STOPPED;
}

ContainerStatusView statusViewFromInspect(const nlohmann::json& attrs)
{
    ContainerStatusView view;

    if (!attrs.is_object()) {
        return view;
    }

    auto state = attrs.find("State");
    if (state == attrs.end() || !state->is_object()) {
        return view;
    }

    if (auto status = state->find("Status"); status != state->end() && status->is_string()) {
        view.status = status->get<std::string>();
    }

    if (auto exit_code = state->find("ExitCode");
        exit_code != state->end() && exit_code->is_number_integer()) {
        view.exit_code = exit_code->get<int>();
    }

    if (auto health = state->find("Health"); health != state->end() && health->is_object()) {
        if (auto health_status = health->find("Status");
            health_status != health->end() && health_status->is_string()) {
            view.health = health_status->get<std::string>();
        }
    }

    return view;
}

} // namespace supervisor_cpp
