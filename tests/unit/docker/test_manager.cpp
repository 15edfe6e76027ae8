#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <supervisor-cpp/docker/manager.hpp>
#include "fakes/test_environment.hpp"

using namespace supervisor_cpp;

class DockerAPITest : public ::testing::Test {
protected:
    void SetUp() override
    {
        env = std::make_unique<fakes::TestEnvironment>();
        client = env->client;
        client->addImage("sha256:audio1", {AUDIO + ":1.0"}, fakes::imageAttrs("sha256:audio1", "1.0"));
    }

    void TearDown() override
    {
        client.reset();
        env.reset();
    }

    DockerAPI& docker()
    {
        return env->context->docker();
    }

    RunConfig audioConfig()
    {
        RunConfig config;
        config.name = "hassio_audio";
        config.tag = "1.0";
        config.hostname = "hassio-audio";
        config.ipv4 = DockerNetwork::audio();
        return config;
    }

    const std::string AUDIO = "ghcr.io/home-assistant/amd64-hassio-audio";

    std::unique_ptr<fakes::TestEnvironment> env;
    std::shared_ptr<fakes::FakeDaemonClient> client;
};

TEST_F(DockerAPITest, RequiresClient)
{
    try {
        DockerAPI invalid(nullptr, env->context->executor(), env->context->bus());
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(DockerAPITest, RunJoinsPrivateNetwork)
{
    ContainerInfo container = docker().run(AUDIO, audioConfig());

    EXPECT_EQ(container.name, "hassio_audio");
    EXPECT_EQ(container.status, "running");
    EXPECT_EQ(container.image_id, "sha256:audio1");

    auto members = client->networkMembers(DOCKER_NETWORK);
    EXPECT_EQ(members[container.id], "hassio_audio");

    auto connections = client->connections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].aliases, (std::vector<std::string>{"hassio-audio"}));
    EXPECT_EQ(connections[0].ipv4, DockerNetwork::audio());
    // Default bridge detach was attempted
    EXPECT_GE(client->callCount("disconnectNetwork"), 1);
}

TEST_F(DockerAPITest, RunKeepsExplicitAliases)
{
    RunConfig config = audioConfig();
    config.aliases = {"audio", "hassio_audio"};

    docker().run(AUDIO, config);

    auto connections = client->connections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].aliases, (std::vector<std::string>{"audio", "hassio_audio"}));
}

TEST_F(DockerAPITest, RunOnHostNetworkSkipsPrivateNetwork)
{
    RunConfig config = audioConfig();
    config.network_mode = "host";

    docker().run(AUDIO, config);

    EXPECT_EQ(client->callCount("connectNetwork"), 0);
    EXPECT_EQ(client->callCount("disconnectNetwork"), 0);
}

TEST_F(DockerAPITest, RunStartsEvenWhenNetworkLinkFails)
{
    client->failOn("connectNetwork", []() { throw DockerAPIError("no address left", 403); });

    ContainerInfo container = docker().run(AUDIO, audioConfig());

    EXPECT_EQ(container.status, "running");
    EXPECT_EQ(client->callCount("disconnectNetwork"), 0);
}

TEST_F(DockerAPITest, RunWithoutImage)
{
    RunConfig config = audioConfig();
    config.tag = "2.0";

    try {
        docker().run(AUDIO, config);
        FAIL() << "Expected DockerNotFound";
    }
    catch (const DockerNotFound& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::IMAGE_NOT_FOUND);
    }
    EXPECT_FALSE(client->hasContainer("hassio_audio"));
}

TEST_F(DockerAPITest, RunDefaultsToLatestTag)
{
    client->addImage("sha256:audio1", {AUDIO + ":latest"});
    RunConfig config = audioConfig();
    config.tag.clear();

    EXPECT_NO_THROW(docker().run(AUDIO, config));
}

TEST_F(DockerAPITest, RunStartFailureCarriesStatus)
{
    client->failOn("startContainer", []() { throw DockerAPIError("port is already allocated", 500); });

    try {
        docker().run(AUDIO, audioConfig());
        FAIL() << "Expected DockerAPIError";
    }
    catch (const DockerAPIError& e) {
        EXPECT_EQ(e.getStatusCode(), 500);
    }
}

TEST_F(DockerAPITest, StopRemovesContainer)
{
    docker().run(AUDIO, audioConfig());

    docker().stopContainer("hassio_audio", 10);

    EXPECT_FALSE(client->hasContainer("hassio_audio"));
    EXPECT_EQ(client->callCount("stopContainer"), 1);
    EXPECT_TRUE(client->networkMembers(DOCKER_NETWORK).empty());
}

TEST_F(DockerAPITest, StopKeepsContainerOnRequest)
{
    docker().run(AUDIO, audioConfig());

    docker().stopContainer("hassio_audio", 10, false);

    auto container = client->getContainer("hassio_audio");
    ASSERT_TRUE(container.has_value());
    EXPECT_EQ(container->status, "exited");
}

TEST_F(DockerAPITest, StoppedContainerIsOnlyRemoved)
{
    docker().run(AUDIO, audioConfig());
    client->setContainerState("hassio_audio", "exited");

    docker().stopContainer("hassio_audio", 10);

    EXPECT_EQ(client->callCount("stopContainer"), 0);
    EXPECT_FALSE(client->hasContainer("hassio_audio"));
}

TEST_F(DockerAPITest, MissingContainerOperations)
{
    EXPECT_THROW(docker().stopContainer("hassio_audio", 10), DockerNotFound);
    EXPECT_THROW(docker().startContainer("hassio_audio"), DockerNotFound);
    EXPECT_THROW(docker().restartContainer("hassio_audio", 10), DockerNotFound);
    EXPECT_THROW(docker().containerLogs("hassio_audio"), DockerNotFound);
    EXPECT_THROW(docker().containerStats("hassio_audio"), DockerNotFound);
    EXPECT_THROW(docker().containerRunInside("hassio_audio", {"true"}), DockerNotFound);
}

TEST_F(DockerAPITest, RemoveImageDropsLatestWhenSameImage)
{
    client->addImage("sha256:audio1", {AUDIO + ":1.0", AUDIO + ":latest"});

    docker().removeImage(AUDIO, Version("1.0"));

    EXPECT_FALSE(client->hasImage(AUDIO + ":1.0"));
    EXPECT_FALSE(client->hasImage(AUDIO + ":latest"));
}

TEST_F(DockerAPITest, RemoveImageKeepsForeignLatest)
{
    client->addImage("sha256:audio2", {AUDIO + ":2.0", AUDIO + ":latest"});

    docker().removeImage(AUDIO, Version("1.0"));

    EXPECT_FALSE(client->hasImage(AUDIO + ":1.0"));
    EXPECT_EQ(client->imageIdOf(AUDIO + ":latest"), "sha256:audio2");
}

TEST_F(DockerAPITest, RemoveImageWithoutVersionDoesNothing)
{
    docker().removeImage(AUDIO, std::nullopt);
    docker().removeImage(AUDIO, Version());

    EXPECT_EQ(client->callCount("removeImage"), 0);
    EXPECT_TRUE(client->hasImage(AUDIO + ":1.0"));

    // Already gone is fine
    EXPECT_NO_THROW(docker().removeImage(AUDIO, Version("9.9")));
}

TEST_F(DockerAPITest, CleanupKeepsOnlyCurrentImage)
{
    const std::string old_repository = "homeassistant/amd64-hassio-audio";
    client->addImage("sha256:audio0", {AUDIO + ":0.9"});
    client->addImage("sha256:legacy", {old_repository + ":0.1"});
    client->addImage("sha256:other", {"ghcr.io/home-assistant/amd64-hassio-dns:1.0"});

    docker().cleanupOldImages(AUDIO, Version("1.0"), {old_repository});

    EXPECT_TRUE(client->hasImage(AUDIO + ":1.0"));
    EXPECT_FALSE(client->hasImage(AUDIO + ":0.9"));
    EXPECT_FALSE(client->hasImage(old_repository + ":0.1"));
    EXPECT_TRUE(client->hasImage("ghcr.io/home-assistant/amd64-hassio-dns:1.0"));
}

TEST_F(DockerAPITest, CleanupNeedsCurrentImage)
{
    try {
        docker().cleanupOldImages(AUDIO, Version("2.0"));
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DOCKER_ERROR);
    }
    EXPECT_TRUE(client->hasImage(AUDIO + ":1.0"));
}

TEST_F(DockerAPITest, LogsAndStats)
{
    docker().run(AUDIO, audioConfig());
    client->setLogs("hassio_audio", "pulseaudio ready\n");
    client->setStats("hassio_audio", {{"memory_stats", {{"usage", 2048}, {"limit", 4096}}}});

    EXPECT_EQ(docker().containerLogs("hassio_audio"), "pulseaudio ready\n");

    DockerStats stats = docker().containerStats("hassio_audio");
    EXPECT_EQ(stats.memoryUsage(), 2048u);
    EXPECT_DOUBLE_EQ(stats.memoryPercent(), 50.0);

    client->setContainerState("hassio_audio", "exited");
    try {
        docker().containerStats("hassio_audio");
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DOCKER_ERROR);
    }
}

TEST_F(DockerAPITest, RunInsideContainer)
{
    docker().run(AUDIO, audioConfig());
    client->setCommandResult(CommandReturn{"ok\n", "", 0});

    CommandReturn result = docker().containerRunInside("hassio_audio", {"pactl", "info"});

    EXPECT_EQ(result.stdout_data, "ok\n");
    EXPECT_EQ(client->lastCommand(), (std::vector<std::string>{"pactl", "info"}));
}

TEST_F(DockerAPITest, RunCommandOnPrivateNetwork)
{
    client->setCommandResult(CommandReturn{"", "bad config", 1});

    CommandReturn result = docker().runCommand(AUDIO, Version("1.0"), {"check_config"});

    EXPECT_EQ(result.returncode, 1);
    auto config = client->lastRunConfig();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->network_mode, DOCKER_NETWORK);

    RunConfig host;
    host.network_mode = "host";
    docker().runCommand(AUDIO, Version("1.0"), {"check_config"}, host);
    EXPECT_EQ(client->lastRunConfig()->network_mode, "host");

    EXPECT_THROW(docker().runCommand(AUDIO, Version("5.0"), {"true"}), DockerNotFound);
}

TEST_F(DockerAPITest, TagImage)
{
    docker().tagImage("sha256:audio1", AUDIO, {"stable", LATEST_TAG});

    EXPECT_EQ(client->imageIdOf(AUDIO + ":stable"), "sha256:audio1");
    EXPECT_EQ(client->imageIdOf(AUDIO + ":latest"), "sha256:audio1");

    try {
        docker().tagImage("sha256:missing", AUDIO, {LATEST_TAG});
        FAIL() << "Expected DockerNotFound";
    }
    catch (const DockerNotFound& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::IMAGE_NOT_FOUND);
    }
}

TEST_F(DockerAPITest, ConcurrentTagAndRemoveKeepConsistentTags)
{
    client->addImage("sha256:audio2", {AUDIO + ":2.0"});

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this]() { docker().tagImage("sha256:audio2", AUDIO, {LATEST_TAG}); });
        threads.emplace_back([this]() { docker().removeImage(AUDIO, Version("1.0")); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(client->hasImage(AUDIO + ":1.0"));
    EXPECT_EQ(client->imageIdOf(AUDIO + ":latest"), "sha256:audio2");
}
