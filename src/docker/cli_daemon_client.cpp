#include <algorithm>
#include <regex>
#include <sstream>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/core/process_runner.hpp>
#include <supervisor-cpp/docker/cli_daemon_client.hpp>

namespace supervisor_cpp {

namespace {

constexpr std::chrono::seconds DIAL_STDIO_TIMEOUT{30};
constexpr int HTTP_OK = 200;
constexpr int HTTP_NOT_FOUND = 404;
constexpr int HTTP_CONFLICT = 409;
constexpr int HTTP_TOO_MANY_REQUESTS = 429;

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

std::string stringOr(const nlohmann::json& object, const char* key, const std::string& fallback = "")
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

ImageInfo imageFromInspect(nlohmann::json attrs)
{
    ImageInfo info;
    info.id = stringOr(attrs, "Id");

    auto tags = attrs.find("RepoTags");
    if (tags != attrs.end() && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (tag.is_string()) {
                info.tags.push_back(tag.get<std::string>());
            }
        }
    }

    info.attrs = std::move(attrs);
    return info;
}

ContainerInfo containerFromInspect(nlohmann::json attrs)
{
    ContainerInfo info;
    info.id = stringOr(attrs, "Id");
    info.name = stringOr(attrs, "Name");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }
    info.image_id = stringOr(attrs, "Image");

    auto state = attrs.find("State");
    if (state != attrs.end() && state->is_object()) {
        info.status = stringOr(*state, "Status");
    }

    info.attrs = std::move(attrs);
    return info;
}

NetworkInfo networkFromInspect(nlohmann::json attrs)
{
    NetworkInfo info;
    info.id = stringOr(attrs, "Id");
    info.name = stringOr(attrs, "Name");
    info.attrs = std::move(attrs);
    return info;
}

// Inspect commands print an array with one document per argument
nlohmann::json firstDocument(const nlohmann::json& documents, const std::string& operation)
{
    if (!documents.is_array() || documents.empty() || !documents.front().is_object()) {
        throw DockerAPIError("Unexpected output from " + operation);
    }
    return documents.front();
}

std::string mountArgument(const Mount& mount)
{
    std::string argument = "type=" + toString(mount.type) + ",source=" + mount.source
                           + ",target=" + mount.target;
    if (mount.read_only) {
        argument += ",readonly";
        if (mount.read_only_non_recursive) {
            argument += ",bind-recursive=writable";
        }
    }
    if (mount.propagation) {
        argument += ",bind-propagation=" + toString(*mount.propagation);
    }
    return argument;
}

} // namespace

DockerCliClient::DockerCliClient(std::shared_ptr<ProcessRunner> runner, std::string binary)
    : runner_(std::move(runner)), binary_(std::move(binary))
{
    if (!runner_) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Docker client needs a process runner");
    }
}

std::optional<ImageInfo> DockerCliClient::getImage(const std::string& reference)
{
    auto result = invoke({"image", "inspect", reference});
    if (result.exit_code != 0) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("image inspect " + reference, result);
    }
    return imageFromInspect(
        firstDocument(parseJson(result.stdout_data, "image inspect"), "image inspect"));
}

ImageInfo DockerCliClient::pullImage(const std::string& reference, const std::string& platform)
{
    std::vector<std::string> args = {"image", "pull"};
    if (!platform.empty()) {
        args.insert(args.end(), {"--platform", platform});
    }
    args.push_back(reference);

    auto result = invoke(args, DOCKER_PULL_TIMEOUT);
    if (result.exit_code != 0) {
        raiseFailure("image pull " + reference, result);
    }

    auto image = getImage(reference);
    if (!image) {
        throw DockerAPIError("Pulled image " + reference + " is not available", HTTP_NOT_FOUND);
    }
    return *image;
}

std::vector<ImageInfo> DockerCliClient::listImages(const std::string& repository)
{
    auto result = invoke({"image", "ls", "--no-trunc", "--format", "{{json .}}", repository});
    if (result.exit_code != 0) {
        raiseFailure("image ls " + repository, result);
    }

    // One JSON object per line, one line per tag
    std::vector<ImageInfo> images;
    std::istringstream lines(result.stdout_data);
    std::string line;
    while (std::getline(lines, line)) {
        if (trimmed(line).empty()) {
            continue;
        }
        auto entry = parseJson(line, "image ls");
        std::string id = stringOr(entry, "ID");
        std::string repo = stringOr(entry, "Repository");
        std::string tag = stringOr(entry, "Tag");

        auto it = std::find_if(images.begin(), images.end(),
                               [&](const ImageInfo& image) { return image.id == id; });
        if (it == images.end()) {
            images.push_back(ImageInfo{id, {}, nlohmann::json::object()});
            it = images.end() - 1;
        }
        if (!repo.empty() && repo != "<none>" && !tag.empty() && tag != "<none>") {
            it->tags.push_back(repo + ":" + tag);
        }
    }
    return images;
}

DaemonResult DockerCliClient::removeImage(const std::string& reference, bool force)
{
    std::vector<std::string> args = {"image", "rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(reference);
    return simpleMutation("image rm " + reference, args);
}

DaemonResult DockerCliClient::tagImage(const std::string& source,
                                       const std::string& repository,
                                       const std::string& tag)
{
    return simpleMutation("image tag " + source,
                          {"image", "tag", source, repository + ":" + tag});
}

void DockerCliClient::login(const std::optional<std::string>& registry,
                            const std::string& username,
                            const std::string& password)
{
    std::vector<std::string> args = {"login", "--username", username, "--password-stdin"};
    if (registry) {
        args.push_back(*registry);
    }

    auto result = invoke(args, DOCKER_CLI_TIMEOUT, password);
    if (result.exit_code != 0) {
        raiseFailure("login " + registry.value_or(DOCKER_HUB), result);
    }
}

std::optional<ContainerInfo> DockerCliClient::getContainer(const std::string& name)
{
    auto result = invoke({"container", "inspect", name});
    if (result.exit_code != 0) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("container inspect " + name, result);
    }
    return containerFromInspect(
        firstDocument(parseJson(result.stdout_data, "container inspect"), "container inspect"));
}

std::optional<ContainerInfo> DockerCliClient::createContainer(const std::string& image_reference,
                                                              const RunConfig& config)
{
    std::vector<std::string> args = {"container", "create", "--pull", "never"};
    auto run_args = runArguments(config);
    args.insert(args.end(), run_args.begin(), run_args.end());
    args.push_back(image_reference);
    args.insert(args.end(), config.command.begin(), config.command.end());

    auto result = invoke(args);
    if (result.exit_code != 0) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("container create " + config.name, result);
    }

    std::string id = trimmed(result.stdout_data);
    auto container = getContainer(id.empty() ? config.name : id);
    if (!container) {
        throw DockerAPIError("Created container " + config.name + " disappeared", HTTP_NOT_FOUND);
    }
    return container;
}

DaemonResult DockerCliClient::startContainer(const std::string& name)
{
    return simpleMutation("container start " + name, {"container", "start", name});
}

DaemonResult DockerCliClient::stopContainer(const std::string& name, int timeout)
{
    return simpleMutation("container stop " + name,
                          {"container", "stop", "--time", std::to_string(timeout), name});
}

DaemonResult DockerCliClient::restartContainer(const std::string& name, int timeout)
{
    return simpleMutation("container restart " + name,
                          {"container", "restart", "--time", std::to_string(timeout), name});
}

DaemonResult DockerCliClient::removeContainer(const std::string& name, bool force)
{
    std::vector<std::string> args = {"container", "rm", "--volumes"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(name);
    return simpleMutation("container rm " + name, args);
}

std::optional<std::string> DockerCliClient::containerLogs(const std::string& name, int tail)
{
    auto result = invoke({"container", "logs", "--tail", std::to_string(tail), name});
    if (result.exit_code != 0) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("container logs " + name, result);
    }
    // The container's own stderr arrives on ours
    return result.stdout_data + result.stderr_data;
}

std::optional<nlohmann::json> DockerCliClient::containerStats(const std::string& name)
{
    std::string request = "GET /containers/" + name
                          + "/stats?stream=false HTTP/1.0\r\nHost: docker\r\n\r\n";

    auto result = invoke({"system", "dial-stdio"}, DIAL_STDIO_TIMEOUT, request);
    if (result.exit_code != 0) {
        raiseFailure("stats " + name, result);
    }

    const std::string& response = result.stdout_data;
    size_t header_end = response.find("\r\n\r\n");
    size_t status_start = response.find(' ');
    if (header_end == std::string::npos || status_start == std::string::npos) {
        throw DockerRequestError("Malformed engine response for stats " + name);
    }

    int status = 0;
    try {
        status = std::stoi(response.substr(status_start + 1, 3));
    }
    catch (const std::exception&) {
        throw DockerRequestError("Malformed engine status line for stats " + name);
    }

    std::string body = response.substr(header_end + 4);
    if (status == HTTP_NOT_FOUND) {
        return std::nullopt;
    }
    if (status != HTTP_OK) {
        throw DockerAPIError("Can't read stats of " + name + ": " + trimmed(body), status);
    }
    return parseJson(body, "stats " + name);
}

std::optional<CommandReturn> DockerCliClient::execInContainer(
    const std::string& name, const std::vector<std::string>& command)
{
    std::vector<std::string> args = {"container", "exec", name};
    args.insert(args.end(), command.begin(), command.end());

    auto result = invoke(args);
    if (result.exit_code != 0 && contains(result.stderr_data, "No such container")) {
        return std::nullopt;
    }
    if (result.timed_out) {
        throw DockerRequestError("Timeout executing command in " + name);
    }
    return CommandReturn{result.stdout_data, result.stderr_data, result.exit_code};
}

std::optional<CommandReturn> DockerCliClient::runOnce(const std::string& image_reference,
                                                      const std::vector<std::string>& command,
                                                      const RunConfig& config)
{
    // Exit status 125 is reserved for failures of docker itself
    constexpr int DOCKER_RUN_FAILURE = 125;

    std::vector<std::string> args = {"container", "run", "--rm", "--pull", "never"};
    auto run_args = runArguments(config);
    args.insert(args.end(), run_args.begin(), run_args.end());
    args.push_back(image_reference);
    args.insert(args.end(), command.begin(), command.end());

    auto result = invoke(args);
    if (result.exit_code == DOCKER_RUN_FAILURE) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("container run " + image_reference, result);
    }
    if (result.timed_out) {
        throw DockerRequestError("Timeout running command in " + image_reference);
    }
    return CommandReturn{result.stdout_data, result.stderr_data, result.exit_code};
}

std::optional<NetworkInfo> DockerCliClient::getNetwork(const std::string& name)
{
    auto result = invoke({"network", "inspect", name});
    if (result.exit_code != 0) {
        if (isNotFound(result)) {
            return std::nullopt;
        }
        raiseFailure("network inspect " + name, result);
    }
    return networkFromInspect(
        firstDocument(parseJson(result.stdout_data, "network inspect"), "network inspect"));
}

NetworkInfo DockerCliClient::createNetwork(const NetworkCreateOptions& options)
{
    std::vector<std::string> args = {"network", "create", "--driver", options.driver};
    if (!options.subnet.empty()) {
        args.insert(args.end(), {"--subnet", options.subnet});
    }
    if (!options.gateway.empty()) {
        args.insert(args.end(), {"--gateway", options.gateway});
    }
    if (!options.ip_range.empty()) {
        args.insert(args.end(), {"--ip-range", options.ip_range});
    }
    args.push_back(options.enable_ipv6 ? "--ipv6=true" : "--ipv6=false");
    for (const auto& [key, value] : options.options) {
        args.insert(args.end(), {"--opt", key + "=" + value});
    }
    args.push_back(options.name);

    auto result = invoke(args);
    if (result.exit_code != 0) {
        raiseFailure("network create " + options.name, result);
    }

    auto network = getNetwork(options.name);
    if (!network) {
        throw DockerAPIError("Created network " + options.name + " is not available",
                             HTTP_NOT_FOUND);
    }
    return *network;
}

DaemonResult DockerCliClient::connectNetwork(const std::string& network,
                                             const std::string& container,
                                             const std::vector<std::string>& aliases,
                                             const std::optional<IPv4Address>& ipv4)
{
    std::vector<std::string> args = {"network", "connect"};
    for (const auto& alias : aliases) {
        args.insert(args.end(), {"--alias", alias});
    }
    if (ipv4) {
        args.insert(args.end(), {"--ip", ipv4->toString()});
    }
    args.insert(args.end(), {network, container});
    return simpleMutation("network connect " + container, args);
}

DaemonResult DockerCliClient::disconnectNetwork(const std::string& network,
                                                const std::string& container,
                                                bool force)
{
    std::vector<std::string> args = {"network", "disconnect"};
    if (force) {
        args.push_back("--force");
    }
    args.insert(args.end(), {network, container});
    return simpleMutation("network disconnect " + container, args);
}

std::vector<std::string> DockerCliClient::runArguments(const RunConfig& config)
{
    std::vector<std::string> args;

    if (!config.name.empty()) {
        args.insert(args.end(), {"--name", config.name});
    }
    if (!config.hostname.empty()) {
        args.insert(args.end(), {"--hostname", config.hostname});
    }
    if (config.init) {
        args.push_back("--init");
    }
    if (config.privileged) {
        args.push_back("--privileged");
    }
    for (auto capability : config.cap_add) {
        args.insert(args.end(), {"--cap-add", toString(capability)});
    }
    for (const auto& option : config.security_opt) {
        args.insert(args.end(), {"--security-opt", option});
    }
    for (const auto& ulimit : config.ulimits) {
        args.insert(args.end(), {"--ulimit", ulimit.name + "=" + std::to_string(ulimit.soft) + ":"
                                                 + std::to_string(ulimit.hard)});
    }
    if (config.cpu_rt_runtime) {
        args.insert(args.end(), {"--cpu-rt-runtime", std::to_string(*config.cpu_rt_runtime)});
    }
    for (const auto& rule : config.device_cgroup_rules) {
        args.insert(args.end(), {"--device-cgroup-rule", rule});
    }
    for (const auto& [key, value] : config.environment) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }
    for (const auto& mount : config.mounts) {
        args.insert(args.end(), {"--mount", mountArgument(mount)});
    }
    if (config.restart_policy) {
        args.insert(args.end(), {"--restart", toString(*config.restart_policy)});
    }
    for (const auto& [key, value] : config.labels) {
        args.insert(args.end(), {"--label", key + "=" + value});
    }
    if (!config.network_mode.empty()) {
        args.insert(args.end(), {"--network", config.network_mode});
    }

    return args;
}

ProcessResult DockerCliClient::invoke(const std::vector<std::string>& args,
                                      std::chrono::seconds timeout,
                                      const std::string& stdin_data)
{
    ProcessConfig config;
    config.executable = binary_;
    config.args = args;
    config.stdin_data = stdin_data;
    config.timeout = timeout;

    Logger::getInstance("docker.cli")->trace("{} {}", binary_, args.empty() ? "" : args.front());

    ProcessResult result;
    try {
        result = runner_->run(config);
    }
    catch (const ContainerError& e) {
        throw DockerRequestError("Can't run " + binary_ + ": " + e.getMessage());
    }

    if (result.timed_out) {
        throw DockerRequestError("Timeout waiting for " + binary_ + " "
                                 + (args.empty() ? std::string() : args.front()));
    }
    return result;
}

void DockerCliClient::raiseFailure(const std::string& operation, const ProcessResult& result)
{
    std::string detail = trimmed(result.stderr_data);
    std::string message = operation + ": " + detail;

    if (contains(detail, "Cannot connect to the Docker daemon")
        || contains(detail, "error during connect") || contains(detail, "connection refused")) {
        throw DockerRequestError(message);
    }
    if (contains(detail, "toomanyrequests") || contains(detail, "429 Too Many Requests")) {
        throw DockerAPIError(message, HTTP_TOO_MANY_REQUESTS);
    }
    if (isNotFound(result)) {
        throw DockerAPIError(message, HTTP_NOT_FOUND);
    }
    if (contains(detail, "Conflict") || contains(detail, "is already in use")) {
        throw DockerAPIError(message, HTTP_CONFLICT);
    }
    throw DockerAPIError(message);
}

bool DockerCliClient::isNotFound(const ProcessResult& result)
{
    // Newer engines word a missing network as "network <name> not found"
    static const std::regex missing_network(R"(network \S+ not found)");

    const std::string& detail = result.stderr_data;
    return contains(detail, "No such image") || contains(detail, "No such container")
           || contains(detail, "No such network") || contains(detail, "No such object")
           || std::regex_search(detail, missing_network)
           || contains(detail, "is not connected to") || contains(detail, "Unable to find image");
}

nlohmann::json DockerCliClient::parseJson(const std::string& text, const std::string& operation)
{
    try {
        return nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw DockerAPIError("Can't parse output of " + operation + ": " + e.what());
    }
}

DaemonResult DockerCliClient::simpleMutation(const std::string& operation,
                                             const std::vector<std::string>& args)
{
    auto result = invoke(args);
    if (result.exit_code == 0) {
        return DaemonResult::DONE;
    }
    if (isNotFound(result)) {
        return DaemonResult::NOT_FOUND;
    }
    raiseFailure(operation, result);
}

} // namespace supervisor_cpp
