#include <gtest/gtest.h>
#include "api/health_handler.h"
#include "identity/identity_registry.h"
#include "test_support.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <memory>

using namespace drogon;

class HealthHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler_ = std::make_unique<HealthHandler>();
    }

    void TearDown() override {
        HealthHandler::setIdentityRegistry(nullptr);
        handler_.reset();
    }

    HttpResponsePtr getHealth() {
        auto req = HttpRequest::newHttpRequest();
        req->setPath("/v1/core/health");
        req->setMethod(Get);

        HttpResponsePtr response;
        handler_->getHealth(req, [&](const HttpResponsePtr &resp) {
            response = resp;
        });
        return response;
    }

    std::unique_ptr<HealthHandler> handler_;
};

// Test health endpoint reports registry state
TEST_F(HealthHandlerTest, HealthyWithRegistry) {
    IdentityRegistry registry(4, 0.5);
    registry.insert(testRecord("alice", {{0.0f, 0.0f, 0.0f, 0.0f}}));
    HealthHandler::setIdentityRegistry(&registry);

    auto response = getHealth();
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);

    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["status"].asString(), "healthy");
    EXPECT_EQ((*json)["service"].asString(), "face_auth_api");
    EXPECT_EQ((*json)["identities"].asUInt(), 1u);
    EXPECT_EQ((*json)["dimension"].asUInt(), 4u);
    EXPECT_DOUBLE_EQ((*json)["threshold"].asDouble(), 0.5);
    EXPECT_GE((*json)["uptime"].asInt64(), 0);
}

// Test health endpoint without registry
TEST_F(HealthHandlerTest, UnhealthyWithoutRegistry) {
    auto response = getHealth();
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k503ServiceUnavailable);

    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["status"].asString(), "unhealthy");
    EXPECT_FALSE((*json)["checks"]["registry"].asBool());
}
