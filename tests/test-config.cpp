#include "gtest/gtest.h"
#include "commonfixture.h"

#include <chrono>
#include <memory>

#include <featureprobe/config.hpp>

#include "test-utils/network.hpp"

// Inherit from the CommonFixture to give a reasonable name for the test output.
// Any custom setup and teardown would happen in this derived class.
class ConfigFixture : public CommonFixture {
};

TEST_F(ConfigFixture, Defaults) {
    const fp::Config config("http://localhost:4007", "server-key");

    ASSERT_EQ(config.remoteUrl(), "http://localhost:4007/");
    ASSERT_EQ(config.togglesUrl(), "http://localhost:4007/api/server-sdk/toggles");
    ASSERT_EQ(config.eventsUrl(), "http://localhost:4007/api/events");
    ASSERT_EQ(config.serverSdkKey(), "server-key");
    ASSERT_EQ(config.refreshInterval(), std::chrono::milliseconds(2000));
    ASSERT_TRUE(config.waitFirstResp());
    ASSERT_EQ(config.startWait(), std::chrono::milliseconds(5000));
    ASSERT_FALSE(config.dataSource());
    ASSERT_FALSE(config.httpClient());
    ASSERT_FALSE(config.validate());
}

TEST_F(ConfigFixture, TrailingSlashIsKept) {
    const fp::Config config("https://featureprobe.io/server/", "server-key");

    ASSERT_EQ(config.remoteUrl(), "https://featureprobe.io/server/");
    ASSERT_EQ(config.togglesUrl(), "https://featureprobe.io/server/api/server-sdk/toggles");
}

TEST_F(ConfigFixture, Overrides) {
    auto source = std::make_shared<StaticDataSource>();
    auto http = std::make_shared<MockHttpClient>();

    fp::Config config("http://localhost", "server-key");
    config.setTogglesUri("toggles")
        .setEventsUri("events")
        .setRefreshInterval(std::chrono::milliseconds(100))
        .setWaitFirstResp(false)
        .setStartWait(std::chrono::milliseconds(10))
        .setDataSource(source)
        .setHttpClient(http);

    ASSERT_EQ(config.togglesUrl(), "http://localhost/toggles");
    ASSERT_EQ(config.eventsUrl(), "http://localhost/events");
    ASSERT_EQ(config.refreshInterval(), std::chrono::milliseconds(100));
    ASSERT_FALSE(config.waitFirstResp());
    ASSERT_EQ(config.startWait(), std::chrono::milliseconds(10));
    ASSERT_EQ(config.dataSource(), source);
    ASSERT_EQ(config.httpClient(), http);
}

TEST_F(ConfigFixture, RejectsUrlWithoutScheme) {
    const std::optional<fp::Error> error = fp::Config("localhost:4007", "server-key").validate();

    ASSERT_TRUE(error);
    ASSERT_EQ(error->code, fp::ErrorCode::InvalidRemoteUrl);
    ASSERT_FALSE(error->msg.empty());
}

TEST_F(ConfigFixture, RejectsUrlWithoutHost) {
    ASSERT_EQ(fp::Config("http://", "server-key").validate()->code, fp::ErrorCode::InvalidRemoteUrl);
    ASSERT_EQ(fp::Config("https:///path", "server-key").validate()->code, fp::ErrorCode::InvalidRemoteUrl);
    ASSERT_EQ(fp::Config("", "server-key").validate()->code, fp::ErrorCode::InvalidRemoteUrl);
}

TEST_F(ConfigFixture, RejectsEmptyKeyWithoutCustomSource) {
    fp::Config config("http://localhost", "");

    ASSERT_EQ(config.validate()->code, fp::ErrorCode::InvalidSdkKey);

    config.setDataSource(std::make_shared<StaticDataSource>());
    ASSERT_FALSE(config.validate());
}

TEST_F(ConfigFixture, RejectsNonPositiveInterval) {
    fp::Config config("http://localhost", "server-key");

    config.setRefreshInterval(std::chrono::milliseconds(0));
    ASSERT_EQ(config.validate()->code, fp::ErrorCode::InvalidRefreshInterval);

    config.setRefreshInterval(std::chrono::milliseconds(-5));
    ASSERT_EQ(config.validate()->code, fp::ErrorCode::InvalidRefreshInterval);
}
