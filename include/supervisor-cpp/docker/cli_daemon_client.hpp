#pragma once

#include <memory>
#include <string>
#include <vector>
#include <supervisor-cpp/core/process_runner.hpp>
#include <supervisor-cpp/docker/daemon_client.hpp>

namespace supervisor_cpp {

constexpr std::chrono::seconds DOCKER_CLI_TIMEOUT{60};
// Pulls of large images on slow links
constexpr std::chrono::seconds DOCKER_PULL_TIMEOUT{3600};

/**
 * @brief DaemonClient driving the docker command line tool
 *
 * Inspect and listing output is requested as JSON and parsed with
 * nlohmann/json. The raw stats document, which the CLI cannot print, is
 * fetched from the engine API through "docker system dial-stdio".
 */
class DockerCliClient : public DaemonClient {
public:
    explicit DockerCliClient(std::shared_ptr<ProcessRunner> runner, std::string binary = "docker");

    std::optional<ImageInfo> getImage(const std::string& reference) override;
    ImageInfo pullImage(const std::string& reference, const std::string& platform) override;
    std::vector<ImageInfo> listImages(const std::string& repository) override;
    DaemonResult removeImage(const std::string& reference, bool force) override;
    DaemonResult tagImage(const std::string& source,
                          const std::string& repository,
                          const std::string& tag) override;

    void login(const std::optional<std::string>& registry,
               const std::string& username,
               const std::string& password) override;

    std::optional<ContainerInfo> getContainer(const std::string& name) override;
    std::optional<ContainerInfo> createContainer(const std::string& image_reference,
                                                 const RunConfig& config) override;
    DaemonResult startContainer(const std::string& name) override;
    DaemonResult stopContainer(const std::string& name, int timeout) override;
    DaemonResult restartContainer(const std::string& name, int timeout) override;
    DaemonResult removeContainer(const std::string& name, bool force) override;
    std::optional<std::string> containerLogs(const std::string& name, int tail) override;
    std::optional<nlohmann::json> containerStats(const std::string& name) override;
    std::optional<CommandReturn> execInContainer(const std::string& name,
                                                 const std::vector<std::string>& command) override;
    std::optional<CommandReturn> runOnce(const std::string& image_reference,
                                         const std::vector<std::string>& command,
                                         const RunConfig& config) override;

    std::optional<NetworkInfo> getNetwork(const std::string& name) override;
    NetworkInfo createNetwork(const NetworkCreateOptions& options) override;
    DaemonResult connectNetwork(const std::string& network,
                                const std::string& container,
                                const std::vector<std::string>& aliases,
                                const std::optional<IPv4Address>& ipv4) override;
    DaemonResult disconnectNetwork(const std::string& network,
                                   const std::string& container,
                                   bool force) override;

    /**
     * @brief Arguments shared by "container create" and "container run"
     */
    static std::vector<std::string> runArguments(const RunConfig& config);

private:
    ProcessResult invoke(const std::vector<std::string>& args,
                         std::chrono::seconds timeout = DOCKER_CLI_TIMEOUT,
                         const std::string& stdin_data = "");

    // Throws DockerAPIError or DockerRequestError describing a failed call
    [[noreturn]] static void raiseFailure(const std::string& operation, const ProcessResult& result);
    static bool isNotFound(const ProcessResult& result);
    static nlohmann::json parseJson(const std::string& text, const std::string& operation);

    DaemonResult simpleMutation(const std::string& operation, const std::vector<std::string>& args);

    std::shared_ptr<ProcessRunner> runner_;
    std::string binary_;
};

} // namespace supervisor_cpp
