#include <supervisor-cpp/docker/metadata.hpp>

namespace supervisor_cpp {

namespace {

std::optional<std::string> stringField(const nlohmann::json& object, const char* key)
{
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

ContainerMetadata::ContainerMetadata(nlohmann::json attrs) : attrs_(std::move(attrs)) {}

bool ContainerMetadata::empty() const
{
    return !attrs_.is_object() || attrs_.empty();
}

void ContainerMetadata::clear()
{
    attrs_ = nlohmann::json();
}

std::string ContainerMetadata::id() const
{
    return stringField(attrs_, "Id").value_or("");
}

nlohmann::json ContainerMetadata::config() const
{
    return section("Config");
}

nlohmann::json ContainerMetadata::hostConfig() const
{
    return section("HostConfig");
}

std::map<std::string, std::string> ContainerMetadata::labels() const
{
    std::map<std::string, std::string> result;

    auto cfg = config();
    auto it = cfg.find("Labels");
    if (it == cfg.end() || !it->is_object()) {
        return result;
    }

    for (const auto& [key, value] : it->items()) {
        if (value.is_string()) {
            result[key] = value.get<std::string>();
        }
    }
    return result;
}

std::vector<nlohmann::json> ContainerMetadata::mounts() const
{
    std::vector<nlohmann::json> result;
    if (empty()) {
        return result;
    }

    auto it = attrs_.find("Mounts");
    if (it != attrs_.end() && it->is_array()) {
        result.assign(it->begin(), it->end());
    }
    return result;
}

std::optional<std::string> ContainerMetadata::image() const
{
    auto image = stringField(config(), "Image");
    if (!image || image->empty()) {
        return std::nullopt;
    }
    return image->substr(0, image->find(':'));
}

std::optional<Version> ContainerMetadata::version() const
{
    auto all_labels = labels();
    auto it = all_labels.find(LABEL_VERSION);
    if (it == all_labels.end()) {
        return std::nullopt;
    }
    return Version(it->second);
}

std::optional<std::string> ContainerMetadata::arch() const
{
    auto all_labels = labels();
    auto it = all_labels.find(LABEL_ARCH);
    if (it == all_labels.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RestartPolicy> ContainerMetadata::restartPolicy() const
{
    auto host = hostConfig();
    auto it = host.find("RestartPolicy");
    if (it == host.end() || !it->is_object()) {
        return std::nullopt;
    }
    return restartPolicyFromString(stringField(*it, "Name").value_or(""));
}

std::optional<nlohmann::json> ContainerMetadata::healthcheck() const
{
    auto cfg = config();
    auto it = cfg.find("Healthcheck");
    if (it == cfg.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

bool ContainerMetadata::privileged() const
{
    auto host = hostConfig();
    auto it = host.find("Privileged");
    return it != host.end() && it->is_boolean() && it->get<bool>();
}

std::optional<std::string> ContainerMetadata::platform() const
{
    auto os = stringField(attrs_, "Os");
    auto architecture = stringField(attrs_, "Architecture");
    if (!os || !architecture) {
        return std::nullopt;
    }

    std::string result = *os + "/" + *architecture;
    if (auto variant = stringField(attrs_, "Variant"); variant && !variant->empty()) {
        result += "/" + *variant;
    }
    return result;
}

nlohmann::json ContainerMetadata::section(const char* name) const
{
    if (empty()) {
        return nlohmann::json::object();
    }
    auto it = attrs_.find(name);
    if (it == attrs_.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

} // namespace supervisor_cpp
