#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/cli_daemon_client.hpp>
#include "fakes/fake_process_runner.hpp"

using namespace supervisor_cpp;

namespace {

bool hasSequence(const std::vector<std::string>& args, const std::vector<std::string>& sequence)
{
    return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

} // namespace

class DockerCliClientTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::setGlobalLevel(LogLevel::CRITICAL);
        runner = std::make_shared<fakes::FakeProcessRunner>();
        client = std::make_unique<DockerCliClient>(runner, "/usr/bin/docker");
    }

    void TearDown() override
    {
        client.reset();
        Logger::setGlobalLevel(LogLevel::INFO);
    }

    std::vector<std::string> lastArgs() const
    {
        return runner->lastCall().args;
    }

    std::shared_ptr<fakes::FakeProcessRunner> runner;
    std::unique_ptr<DockerCliClient> client;
};

TEST_F(DockerCliClientTest, RequiresRunner)
{
    try {
        DockerCliClient invalid(nullptr);
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(DockerCliClientTest, GetImageParsesInspect)
{
    runner->push(0, R"([{"Id": "sha256:abc", "RepoTags": ["ghcr.io/x/audio:1.0", "ghcr.io/x/audio:latest"],
                        "Os": "linux", "Architecture": "amd64"}])");

    auto image = client->getImage("ghcr.io/x/audio:1.0");

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->id, "sha256:abc");
    EXPECT_EQ(image->tags.size(), 2u);
    EXPECT_EQ(image->attrs["Architecture"], "amd64");
    EXPECT_EQ(runner->lastCall().executable, "/usr/bin/docker");
    EXPECT_EQ(lastArgs(), (std::vector<std::string>{"image", "inspect", "ghcr.io/x/audio:1.0"}));
}

TEST_F(DockerCliClientTest, MissingObjectsReadAsAbsent)
{
    runner->push(1, "", "Error: No such image: ghcr.io/x/audio:1.0\n");
    EXPECT_FALSE(client->getImage("ghcr.io/x/audio:1.0").has_value());

    runner->push(1, "", "Error response from daemon: No such container: hassio_audio\n");
    EXPECT_FALSE(client->getContainer("hassio_audio").has_value());

    runner->push(1, "", "Error response from daemon: network hassio not found\n");
    EXPECT_FALSE(client->getNetwork("hassio").has_value());

    runner->push(1, "", "Error response from daemon: No such container: hassio_audio\n");
    EXPECT_EQ(client->stopContainer("hassio_audio", 10), DaemonResult::NOT_FOUND);
}

TEST_F(DockerCliClientTest, OtherNotFoundMessagesAreFailures)
{
    runner->push(1, "",
                 "Error response from daemon: manifest for ghcr.io/x/audio:9.9 not found: "
                 "manifest unknown\n");
    try {
        client->pullImage("ghcr.io/x/audio:9.9", "linux/amd64");
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_NE(e.getStatusCode(), 404);
    }

    runner->push(1, "", "Error response from daemon: plugin \"local-persist\" not found\n");
    EXPECT_THROW(client->getContainer("hassio_audio"), DockerAPIError);

    runner->push(1, "", "Error response from daemon: No such object: hassio_audio\n");
    EXPECT_FALSE(client->getContainer("hassio_audio").has_value());
}

TEST_F(DockerCliClientTest, UnreachableDaemonIsRequestError)
{
    runner->push(1, "", "Cannot connect to the Docker daemon at unix:///var/run/docker.sock.\n");

    try {
        client->getContainer("hassio_audio");
        FAIL() << "Expected DockerRequestError";
    }
    catch (const DockerRequestError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DAEMON_REQUEST_ERROR);
    }
}

TEST_F(DockerCliClientTest, RunnerFailuresAreRequestErrors)
{
    runner->pushTimeout();
    EXPECT_THROW(client->startContainer("hassio_audio"), DockerRequestError);

    runner->failToStart(true);
    EXPECT_THROW(client->startContainer("hassio_audio"), DockerRequestError);
}

TEST_F(DockerCliClientTest, PullRateLimitCarriesStatus)
{
    runner->push(1, "",
                 "Error response from daemon: toomanyrequests: You have reached your pull rate limit.");

    try {
        client->pullImage("homeassistant/amd64-base:latest", "linux/amd64");
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_EQ(e.getStatusCode(), 429);
    }
    EXPECT_EQ(lastArgs(), (std::vector<std::string>{"image", "pull", "--platform", "linux/amd64",
                                                    "homeassistant/amd64-base:latest"}));
}

TEST_F(DockerCliClientTest, PullInspectsResult)
{
    runner->push(0, "1.0: Pulling from x/audio\nStatus: Downloaded newer image\n");
    runner->push(0, R"([{"Id": "sha256:def", "RepoTags": ["ghcr.io/x/audio:1.0"]}])");

    ImageInfo image = client->pullImage("ghcr.io/x/audio:1.0", "");

    EXPECT_EQ(image.id, "sha256:def");
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].args, (std::vector<std::string>{"image", "pull", "ghcr.io/x/audio:1.0"}));
    EXPECT_TRUE(calls[0].timeout == DOCKER_PULL_TIMEOUT);
}

TEST_F(DockerCliClientTest, ListImagesGroupsTagsById)
{
    runner->push(0,
                 "{\"ID\":\"sha256:a\",\"Repository\":\"ghcr.io/x/audio\",\"Tag\":\"1.0\"}\n"
                 "{\"ID\":\"sha256:a\",\"Repository\":\"ghcr.io/x/audio\",\"Tag\":\"latest\"}\n"
                 "\n"
                 "{\"ID\":\"sha256:b\",\"Repository\":\"ghcr.io/x/audio\",\"Tag\":\"0.9\"}\n"
                 "{\"ID\":\"sha256:c\",\"Repository\":\"<none>\",\"Tag\":\"<none>\"}\n");

    auto images = client->listImages("ghcr.io/x/audio");

    ASSERT_EQ(images.size(), 3u);
    EXPECT_EQ(images[0].id, "sha256:a");
    EXPECT_EQ(images[0].tags,
              (std::vector<std::string>{"ghcr.io/x/audio:1.0", "ghcr.io/x/audio:latest"}));
    EXPECT_EQ(images[1].tags, (std::vector<std::string>{"ghcr.io/x/audio:0.9"}));
    EXPECT_TRUE(images[2].tags.empty());
    EXPECT_TRUE(hasSequence(lastArgs(), {"--format", "{{json .}}", "ghcr.io/x/audio"}));
}

TEST_F(DockerCliClientTest, RemoveAndTagImage)
{
    EXPECT_EQ(client->removeImage("ghcr.io/x/audio:1.0", true), DaemonResult::DONE);
    EXPECT_EQ(lastArgs(),
              (std::vector<std::string>{"image", "rm", "--force", "ghcr.io/x/audio:1.0"}));

    EXPECT_EQ(client->tagImage("sha256:a", "ghcr.io/x/audio", "latest"), DaemonResult::DONE);
    EXPECT_EQ(lastArgs(), (std::vector<std::string>{"image", "tag", "sha256:a",
                                                    "ghcr.io/x/audio:latest"}));

    runner->push(1, "", "Error: No such image: sha256:zz");
    EXPECT_EQ(client->tagImage("sha256:zz", "ghcr.io/x/audio", "latest"), DaemonResult::NOT_FOUND);
}

TEST_F(DockerCliClientTest, LoginPassesPasswordOnStdin)
{
    client->login(std::string("ghcr.io"), "user", "s3cret");

    ProcessConfig call = runner->lastCall();
    EXPECT_EQ(call.args, (std::vector<std::string>{"login", "--username", "user",
                                                   "--password-stdin", "ghcr.io"}));
    EXPECT_EQ(call.stdin_data, "s3cret");

    runner->push(1, "", "Error response from daemon: Get \"https://registry-1.docker.io\": unauthorized");
    EXPECT_THROW(client->login(std::nullopt, "user", "bad"), DockerAPIError);
    EXPECT_FALSE(hasSequence(lastArgs(), {"ghcr.io"}));
}

TEST_F(DockerCliClientTest, CreateContainerBuildsArguments)
{
    RunConfig config;
    config.name = "hassio_audio";
    config.hostname = "hassio-audio";
    config.init = false;
    config.privileged = false;
    config.cap_add = {Capability::SYS_NICE, Capability::SYS_RESOURCE};
    config.security_opt = {"apparmor=hassio-audio"};
    config.ulimits = {Ulimit{"rtprio", 10, 10}};
    config.cpu_rt_runtime = 950000;
    config.device_cgroup_rules = {"c 116:* rmw"};
    config.environment = {{"TZ", "UTC"}};
    config.mounts = {mountDev()};
    config.restart_policy = RestartPolicy::NO;
    config.labels = {{"supervisor_managed", ""}};
    config.command = {"run.sh"};

    runner->push(0, "cid-123\n");
    runner->push(0, R"([{"Id": "cid-123", "Name": "/hassio_audio", "Image": "sha256:a",
                        "State": {"Status": "created", "ExitCode": 0}}])");

    auto container = client->createContainer("ghcr.io/x/audio:1.0", config);

    ASSERT_TRUE(container.has_value());
    EXPECT_EQ(container->id, "cid-123");
    EXPECT_EQ(container->name, "hassio_audio");
    EXPECT_EQ(container->status, "created");
    EXPECT_EQ(container->image_id, "sha256:a");

    auto args = runner->calls()[0].args;
    EXPECT_TRUE(hasSequence(args, {"container", "create", "--pull", "never"}));
    EXPECT_TRUE(hasSequence(args, {"--name", "hassio_audio"}));
    EXPECT_TRUE(hasSequence(args, {"--hostname", "hassio-audio"}));
    EXPECT_TRUE(hasSequence(args, {"--cap-add", "SYS_NICE", "--cap-add", "SYS_RESOURCE"}));
    EXPECT_TRUE(hasSequence(args, {"--security-opt", "apparmor=hassio-audio"}));
    EXPECT_TRUE(hasSequence(args, {"--ulimit", "rtprio=10:10"}));
    EXPECT_TRUE(hasSequence(args, {"--cpu-rt-runtime", "950000"}));
    EXPECT_TRUE(hasSequence(args, {"--device-cgroup-rule", "c 116:* rmw"}));
    EXPECT_TRUE(hasSequence(args, {"--env", "TZ=UTC"}));
    EXPECT_TRUE(hasSequence(
        args, {"--mount", "type=bind,source=/dev,target=/dev,readonly,bind-recursive=writable"}));
    EXPECT_TRUE(hasSequence(args, {"--restart", "no"}));
    EXPECT_TRUE(hasSequence(args, {"--label", "supervisor_managed="}));
    EXPECT_TRUE(hasSequence(args, {"ghcr.io/x/audio:1.0", "run.sh"}));
    EXPECT_EQ(args.back(), "run.sh");
    EXPECT_FALSE(hasSequence(args, {"--privileged"}));
    EXPECT_FALSE(hasSequence(args, {"--network"}));

    EXPECT_EQ(runner->calls()[1].args,
              (std::vector<std::string>{"container", "inspect", "cid-123"}));
}

TEST_F(DockerCliClientTest, CreateContainerFailures)
{
    RunConfig config;
    config.name = "hassio_audio";

    runner->push(1, "", "Unable to find image 'ghcr.io/x/audio:1.0' locally");
    EXPECT_FALSE(client->createContainer("ghcr.io/x/audio:1.0", config).has_value());

    runner->push(1, "",
                 "Error response from daemon: Conflict. The container name \"/hassio_audio\" is "
                 "already in use by container \"abc\".");
    try {
        client->createContainer("ghcr.io/x/audio:1.0", config);
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_EQ(e.getStatusCode(), 409);
    }
}

TEST_F(DockerCliClientTest, ContainerMutations)
{
    EXPECT_EQ(client->stopContainer("hassio_audio", 10), DaemonResult::DONE);
    EXPECT_EQ(lastArgs(),
              (std::vector<std::string>{"container", "stop", "--time", "10", "hassio_audio"}));

    EXPECT_EQ(client->restartContainer("hassio_audio", 30), DaemonResult::DONE);
    EXPECT_TRUE(hasSequence(lastArgs(), {"restart", "--time", "30"}));

    EXPECT_EQ(client->removeContainer("hassio_audio", true), DaemonResult::DONE);
    EXPECT_EQ(lastArgs(), (std::vector<std::string>{"container", "rm", "--volumes", "--force",
                                                    "hassio_audio"}));

    runner->push(1, "", "Error response from daemon: something odd");
    try {
        client->startContainer("hassio_audio");
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_EQ(e.getStatusCode(), 0);
        EXPECT_NE(e.getMessage().find("something odd"), std::string::npos);
    }
}

TEST_F(DockerCliClientTest, LogsCombineStreams)
{
    runner->push(0, "out line\n", "err line\n");

    auto logs = client->containerLogs("hassio_audio", 100);

    ASSERT_TRUE(logs.has_value());
    EXPECT_EQ(*logs, "out line\nerr line\n");
    EXPECT_EQ(lastArgs(),
              (std::vector<std::string>{"container", "logs", "--tail", "100", "hassio_audio"}));
}

TEST_F(DockerCliClientTest, StatsThroughDialStdio)
{
    runner->push(0, "HTTP/1.0 200 OK\r\nContent-Type: application/json\r\n\r\n"
                    "{\"memory_stats\": {\"usage\": 10}}");

    auto stats = client->containerStats("hassio_audio");

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ((*stats)["memory_stats"]["usage"], 10);
    ProcessConfig call = runner->lastCall();
    EXPECT_EQ(call.args, (std::vector<std::string>{"system", "dial-stdio"}));
    EXPECT_EQ(call.stdin_data.rfind("GET /containers/hassio_audio/stats?stream=false HTTP/1.0\r\n", 0),
              0u);
}

TEST_F(DockerCliClientTest, StatsStatusHandling)
{
    runner->push(0, "HTTP/1.0 404 Not Found\r\n\r\n{\"message\": \"No such container\"}");
    EXPECT_FALSE(client->containerStats("hassio_audio").has_value());

    runner->push(0, "HTTP/1.0 500 Internal Server Error\r\n\r\n{\"message\": \"boom\"}");
    try {
        client->containerStats("hassio_audio");
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_EQ(e.getStatusCode(), 500);
    }

    runner->push(0, "garbage");
    EXPECT_THROW(client->containerStats("hassio_audio"), DockerRequestError);
}

TEST_F(DockerCliClientTest, ExecReturnsCommandResult)
{
    runner->push(2, "partial", "failed");

    auto result = client->execInContainer("hassio_audio", {"pactl", "info"});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->returncode, 2);
    EXPECT_EQ(result->stdout_data, "partial");
    EXPECT_EQ(lastArgs(),
              (std::vector<std::string>{"container", "exec", "hassio_audio", "pactl", "info"}));

    runner->push(1, "", "Error response from daemon: No such container: hassio_audio");
    EXPECT_FALSE(client->execInContainer("hassio_audio", {"true"}).has_value());
}

TEST_F(DockerCliClientTest, RunOnceSeparatesDockerFailures)
{
    RunConfig config;
    config.network_mode = "host";

    runner->push(3, "", "command failed");
    auto result = client->runOnce("ghcr.io/x/cli:1.0", {"check"}, config);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->returncode, 3);
    EXPECT_TRUE(hasSequence(lastArgs(), {"container", "run", "--rm", "--pull", "never"}));
    EXPECT_TRUE(hasSequence(lastArgs(), {"--network", "host", "ghcr.io/x/cli:1.0", "check"}));

    runner->push(125, "", "Unable to find image 'ghcr.io/x/cli:1.0' locally");
    EXPECT_FALSE(client->runOnce("ghcr.io/x/cli:1.0", {"check"}, config).has_value());

    runner->push(125, "", "docker: invalid reference format.");
    EXPECT_THROW(client->runOnce("ghcr.io/x/cli:1.0", {"check"}, config), DockerAPIError);
}

TEST_F(DockerCliClientTest, CreateNetworkArguments)
{
    NetworkCreateOptions options;
    options.name = "hassio";
    options.subnet = "172.30.32.0/23";
    options.gateway = "172.30.32.1";
    options.ip_range = "172.30.33.0/24";
    options.options = {{"com.docker.network.bridge.name", "hassio"}};

    runner->push(0, "netid\n");
    runner->push(0, R"([{"Id": "netid", "Name": "hassio", "Containers": {}}])");

    NetworkInfo network = client->createNetwork(options);

    EXPECT_EQ(network.id, "netid");
    EXPECT_EQ(network.name, "hassio");
    EXPECT_EQ(runner->calls()[0].args,
              (std::vector<std::string>{"network", "create", "--driver", "bridge", "--subnet",
                                        "172.30.32.0/23", "--gateway", "172.30.32.1",
                                        "--ip-range", "172.30.33.0/24", "--ipv6=false", "--opt",
                                        "com.docker.network.bridge.name=hassio", "hassio"}));
}

TEST_F(DockerCliClientTest, ConnectAndDisconnect)
{
    auto address = IPv4Address::parse("172.30.32.4");

    EXPECT_EQ(client->connectNetwork("hassio", "hassio_audio", {"audio", "hassio_audio"}, address),
              DaemonResult::DONE);
    EXPECT_EQ(lastArgs(),
              (std::vector<std::string>{"network", "connect", "--alias", "audio", "--alias",
                                        "hassio_audio", "--ip", "172.30.32.4", "hassio",
                                        "hassio_audio"}));

    runner->push(1, "", "Error response from daemon: container abc is not connected to network bridge");
    EXPECT_EQ(client->disconnectNetwork("bridge", "hassio_audio", true), DaemonResult::NOT_FOUND);
    EXPECT_EQ(lastArgs(), (std::vector<std::string>{"network", "disconnect", "--force", "bridge",
                                                    "hassio_audio"}));
}

TEST_F(DockerCliClientTest, MembersFromNetworkDocument)
{
    runner->push(0, R"([{"Id": "netid", "Name": "hassio",
                        "Containers": {"c1": {"Name": "hassio_audio"}, "c2": {"Name": "hassio_dns"}}}])");

    auto network = client->getNetwork("hassio");

    ASSERT_TRUE(network.has_value());
    auto members = network->members();
    EXPECT_EQ(members.size(), 2u);
    EXPECT_EQ(members["c1"], "hassio_audio");
}
