#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <supervisor-cpp/docker/metadata.hpp>

using namespace supervisor_cpp;

class ContainerMetadataTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        attrs = nlohmann::json::parse(R"({
            "Id": "sha256:feedbeef",
            "Os": "linux",
            "Architecture": "arm",
            "Variant": "v7",
            "Config": {
                "Image": "ghcr.io/home-assistant/armv7-hassio-audio:2024.1.0",
                "Labels": {"io.hass.version": "2024.1.0", "io.hass.arch": "armv7", "count": 3},
                "Healthcheck": {"Test": ["CMD", "true"]}
            },
            "HostConfig": {"Privileged": true, "RestartPolicy": {"Name": "always"}},
            "Mounts": [{"Source": "/dev", "Destination": "/dev", "RW": false}]
        })");
    }

    nlohmann::json attrs;
};

TEST_F(ContainerMetadataTest, Projections)
{
    ContainerMetadata meta(attrs);

    EXPECT_FALSE(meta.empty());
    EXPECT_EQ(meta.id(), "sha256:feedbeef");
    EXPECT_EQ(meta.image(), "ghcr.io/home-assistant/armv7-hassio-audio");
    ASSERT_TRUE(meta.version().has_value());
    EXPECT_EQ(meta.version()->string(), "2024.1.0");
    EXPECT_EQ(meta.arch(), "armv7");
    EXPECT_EQ(meta.restartPolicy(), RestartPolicy::ALWAYS);
    EXPECT_TRUE(meta.privileged());
    EXPECT_TRUE(meta.healthcheck().has_value());
    EXPECT_EQ(meta.platform(), "linux/arm/v7");
    EXPECT_EQ(meta.mounts().size(), 1u);
}

TEST_F(ContainerMetadataTest, NonStringLabelsSkipped)
{
    ContainerMetadata meta(attrs);
    auto labels = meta.labels();

    EXPECT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels.count("count"), 0u);
}

TEST_F(ContainerMetadataTest, EmptySnapshot)
{
    ContainerMetadata meta;

    EXPECT_TRUE(meta.empty());
    EXPECT_EQ(meta.id(), "");
    EXPECT_FALSE(meta.image().has_value());
    EXPECT_FALSE(meta.version().has_value());
    EXPECT_FALSE(meta.arch().has_value());
    EXPECT_FALSE(meta.restartPolicy().has_value());
    EXPECT_FALSE(meta.healthcheck().has_value());
    EXPECT_FALSE(meta.privileged());
    EXPECT_FALSE(meta.platform().has_value());
    EXPECT_TRUE(meta.labels().empty());
    EXPECT_TRUE(meta.mounts().empty());
    EXPECT_TRUE(meta.config().is_object());
}

TEST_F(ContainerMetadataTest, ClearDropsSnapshot)
{
    ContainerMetadata meta(attrs);
    meta.clear();

    EXPECT_TRUE(meta.empty());
    EXPECT_FALSE(meta.image().has_value());
}

TEST_F(ContainerMetadataTest, EmptyRestartPolicyNameIsNo)
{
    attrs["HostConfig"]["RestartPolicy"]["Name"] = "";
    EXPECT_EQ(ContainerMetadata(attrs).restartPolicy(), RestartPolicy::NO);

    attrs["HostConfig"].erase("RestartPolicy");
    EXPECT_FALSE(ContainerMetadata(attrs).restartPolicy().has_value());
}

TEST_F(ContainerMetadataTest, PlatformWithoutVariant)
{
    attrs.erase("Variant");
    attrs["Architecture"] = "amd64";

    EXPECT_EQ(ContainerMetadata(attrs).platform(), "linux/amd64");
}

TEST_F(ContainerMetadataTest, ImageWithoutTag)
{
    attrs["Config"]["Image"] = "homeassistant/amd64-base";

    EXPECT_EQ(ContainerMetadata(attrs).image(), "homeassistant/amd64-base");
}
