#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/docker/network.hpp>
#include "fakes/fake_daemon_client.hpp"

using namespace supervisor_cpp;

class DockerNetworkTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::setGlobalLevel(LogLevel::CRITICAL);
        client = std::make_shared<fakes::FakeDaemonClient>();
        client->addNetwork(DOCKER_NETWORK);
        client->addNetwork(DOCKER_DEFAULT_BRIDGE);

        fakes::FakeDaemonClient::FakeContainer audio;
        audio.id = "cid-audio";
        audio.name = "hassio_audio";
        audio.status = "running";
        client->addContainer(audio);
    }

    void TearDown() override
    {
        client.reset();
        Logger::setGlobalLevel(LogLevel::INFO);
    }

    std::shared_ptr<fakes::FakeDaemonClient> client;
};

TEST_F(DockerNetworkTest, RoleAddresses)
{
    EXPECT_EQ(DockerNetwork::subnet().toString(), "172.30.32.0/23");
    EXPECT_EQ(DockerNetwork::ipRange().toString(), "172.30.33.0/24");
    EXPECT_EQ(DockerNetwork::gateway().toString(), "172.30.32.1");
    EXPECT_EQ(DockerNetwork::supervisor().toString(), "172.30.32.2");
    EXPECT_EQ(DockerNetwork::dns().toString(), "172.30.32.3");
    EXPECT_EQ(DockerNetwork::audio().toString(), "172.30.32.4");
    EXPECT_EQ(DockerNetwork::cli().toString(), "172.30.32.5");
    EXPECT_EQ(DockerNetwork::observer().toString(), "172.30.32.6");
    EXPECT_EQ(DockerNetwork::reserved().toString(), "172.30.32.7");
}

TEST_F(DockerNetworkTest, UsesExistingNetwork)
{
    DockerNetwork network(*client);

    EXPECT_EQ(network.name(), "hassio");
    EXPECT_EQ(client->callCount("createNetwork"), 0);
}

TEST_F(DockerNetworkTest, CreatesMissingNetwork)
{
    fakes::FakeDaemonClient empty;

    DockerNetwork network(empty);

    auto options = empty.lastNetworkCreate();
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->name, "hassio");
    EXPECT_EQ(options->driver, "bridge");
    EXPECT_EQ(options->subnet, "172.30.32.0/23");
    EXPECT_EQ(options->gateway, "172.30.32.1");
    EXPECT_EQ(options->ip_range, "172.30.33.0/24");
    EXPECT_FALSE(options->enable_ipv6);
    EXPECT_EQ(options->options.at("com.docker.network.bridge.name"), "hassio");
}

TEST_F(DockerNetworkTest, CreationFailure)
{
    fakes::FakeDaemonClient empty;
    empty.failOn("createNetwork", []() { throw DockerAPIError("pool overlaps", 403); });

    try {
        DockerNetwork network(empty);
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NETWORK_CREATION_FAILED);
    }
}

TEST_F(DockerNetworkTest, AttachContainer)
{
    DockerNetwork network(*client);

    network.attachContainer("hassio_audio", {"audio"}, DockerNetwork::audio());

    auto members = client->networkMembers(DOCKER_NETWORK);
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members["cid-audio"], "hassio_audio");

    auto connections = client->connections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].aliases, (std::vector<std::string>{"audio"}));
    ASSERT_TRUE(connections[0].ipv4.has_value());
    EXPECT_EQ(connections[0].ipv4->toString(), "172.30.32.4");

    EXPECT_EQ(network.containers(), (std::vector<std::string>{"cid-audio"}));
}

TEST_F(DockerNetworkTest, AttachClearsStaleEntry)
{
    client->addNetworkMember(DOCKER_NETWORK, "stale-id", "hassio_audio");
    DockerNetwork network(*client);

    network.attachContainer("hassio_audio");

    auto members = client->networkMembers(DOCKER_NETWORK);
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members.count("stale-id"), 0u);
    EXPECT_EQ(members["cid-audio"], "hassio_audio");
    EXPECT_EQ(client->callCount("disconnectNetwork"), 1);
}

TEST_F(DockerNetworkTest, AttachFailures)
{
    DockerNetwork network(*client);

    try {
        network.attachContainer("hassio_missing");
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NETWORK_CONFIG_FAILED);
    }

    client->failOn("connectNetwork", []() { throw DockerAPIError("Address already in use", 403); });
    try {
        network.attachContainer("hassio_audio");
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NETWORK_CONFIG_FAILED);
    }
}

TEST_F(DockerNetworkTest, DetachDefaultBridge)
{
    client->addNetworkMember(DOCKER_DEFAULT_BRIDGE, "cid-audio", "hassio_audio");
    DockerNetwork network(*client);

    network.detachDefaultBridge("hassio_audio");
    EXPECT_TRUE(client->networkMembers(DOCKER_DEFAULT_BRIDGE).empty());

    // Not linked anymore
    EXPECT_NO_THROW(network.detachDefaultBridge("hassio_audio"));

    client->failOn("disconnectNetwork", []() { throw DockerAPIError("forbidden", 403); });
    try {
        network.detachDefaultBridge("hassio_audio");
        FAIL() << "Expected ContainerError";
    }
    catch (const ContainerError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NETWORK_CONFIG_FAILED);
    }
}

TEST_F(DockerNetworkTest, StaleCleanupIgnoresMissingEntry)
{
    DockerNetwork network(*client);

    EXPECT_NO_THROW(network.staleCleanup("hassio_audio"));
}

TEST_F(DockerNetworkTest, ReloadIgnoresFailures)
{
    DockerNetwork network(*client);
    client->failOn("getNetwork", []() { throw DockerRequestError("daemon gone"); });

    EXPECT_NO_THROW(network.reload());
}
