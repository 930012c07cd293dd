#include "gtest/gtest.h"
#include "commonfixture.h"

#include <chrono>
#include <memory>

#include "network.hpp"
#include "polling.hpp"
#include "test-utils/network.hpp"

// Inherit from the CommonFixture to give a reasonable name for the test output.
// Any custom setup and teardown would happen in this derived class.
class PollingFixture : public CommonFixture {
protected:
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();

    void respond(const long status, const std::string &body) {
        fp::HttpResponse response;
        response.status = status;
        response.body = body;
        http->setResponse(response);
    }
};

static const char *const TOGGLES_URL = "http://localhost/api/server-sdk/toggles";

TEST_F(PollingFixture, FetchesAndDecodesSnapshot) {
    respond(200, R"({"segments": {}, "toggles": {"t": {"key": "t", "enabled": true, "version": 9,
        "disabledServe": {"select": 0}, "defaultServe": {"select": 0}, "variations": [1]}}})");

    fp::PollingDataSource source(TOGGLES_URL, "sdk-key", std::chrono::milliseconds(1000), http);

    const std::optional<fp::Repository> repository = source.fetch();

    ASSERT_TRUE(repository);
    ASSERT_EQ(repository->toggles.at("t").version, 9u);

    const std::vector<fp::HttpRequest> gets = http->gets();
    ASSERT_EQ(gets.size(), 1u);
    ASSERT_EQ(gets[0].url, TOGGLES_URL);
    ASSERT_EQ(gets[0].headers, fp::sharedHeaders("sdk-key"));
    ASSERT_EQ(gets[0].timeout, std::chrono::milliseconds(1000));
    ASSERT_TRUE(gets[0].cancel);
    ASSERT_FALSE(gets[0].cancel->load());
}

TEST_F(PollingFixture, BadStatusFails) {
    respond(403, R"({"toggles": {}})");

    fp::PollingDataSource source(TOGGLES_URL, "sdk-key", std::chrono::milliseconds(1000), http);

    ASSERT_FALSE(source.fetch());
}

TEST_F(PollingFixture, TransportErrorFails) {
    fp::HttpResponse response;
    response.error = "Couldn't connect to server";
    http->setResponse(response);

    fp::PollingDataSource source(TOGGLES_URL, "sdk-key", std::chrono::milliseconds(1000), http);

    ASSERT_FALSE(source.fetch());
}

TEST_F(PollingFixture, MalformedBodyFails) {
    respond(200, "<html>oops</html>");

    fp::PollingDataSource source(TOGGLES_URL, "sdk-key", std::chrono::milliseconds(1000), http);

    ASSERT_FALSE(source.fetch());
}

TEST_F(PollingFixture, ClosedSourceDoesNotRequest) {
    respond(200, R"({"toggles": {}})");

    fp::PollingDataSource source(TOGGLES_URL, "sdk-key", std::chrono::milliseconds(1000), http);
    source.close();

    ASSERT_FALSE(source.fetch());
    ASSERT_TRUE(http->gets().empty());
}
