#include <gtest/gtest.h>
#include "api/identity_handler.h"
#include "enrollment/enrollment_pipeline.h"
#include "identity/identity_registry.h"
#include "transfer/identity_transfer.h"
#include "test_support.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <memory>

using namespace drogon;

class IdentityHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler_ = std::make_unique<IdentityHandler>();
        registry_ = std::make_unique<IdentityRegistry>(3, 0.6);
        pipeline_ = std::make_unique<EnrollmentPipeline>(3, clock_);
        transfer_ = std::make_unique<IdentityTransfer>(*registry_, clock_);

        IdentityHandler::setIdentityRegistry(registry_.get());
        IdentityHandler::setEnrollmentPipeline(pipeline_.get());
        IdentityHandler::setIdentityTransfer(transfer_.get());
        IdentityHandler::setMinimumAcceptedSamples(1);
    }

    void TearDown() override {
        // Clear handler dependencies
        IdentityHandler::setIdentityRegistry(nullptr);
        IdentityHandler::setEnrollmentPipeline(nullptr);
        IdentityHandler::setIdentityTransfer(nullptr);
        handler_.reset();
    }

    static HttpRequestPtr makeRequest(const std::string& path, HttpMethod method,
                                      const Json::Value* body = nullptr) {
        auto req = HttpRequest::newHttpRequest();
        req->setPath(path);
        req->setMethod(method);
        if (body) {
            req->setBody(body->toStyledString());
            req->setContentTypeCode(CT_APPLICATION_JSON);
        }
        return req;
    }

    static Json::Value sample(std::initializer_list<double> values, const std::string& provenance = "") {
        Json::Value item(Json::objectValue);
        Json::Value vector(Json::arrayValue);
        for (double v : values) {
            vector.append(v);
        }
        item["vector"] = vector;
        if (!provenance.empty()) {
            item["provenance"] = provenance;
        }
        return item;
    }

    Json::Value enrollBody(const std::string& identityId, const std::vector<Json::Value>& samples) {
        Json::Value body(Json::objectValue);
        body["identity_id"] = identityId;
        body["samples"] = Json::Value(Json::arrayValue);
        for (const auto& s : samples) {
            body["samples"].append(s);
        }
        return body;
    }

    template <typename Method>
    HttpResponsePtr call(Method method, const HttpRequestPtr& req) {
        HttpResponsePtr response;
        bool callbackCalled = false;
        (handler_.get()->*method)(req, [&](const HttpResponsePtr& resp) {
            callbackCalled = true;
            response = resp;
        });
        EXPECT_TRUE(callbackCalled);
        return response;
    }

    void enroll(const std::string& identityId) {
        Json::Value body = enrollBody(identityId, {sample({0.1, 0.2, 0.3})});
        auto response = call(&IdentityHandler::enrollIdentity,
                             makeRequest("/v1/identities", Post, &body));
        ASSERT_NE(response, nullptr);
        ASSERT_EQ(response->statusCode(), k201Created);
    }

    ManualClock clock_;
    std::unique_ptr<IdentityHandler> handler_;
    std::unique_ptr<IdentityRegistry> registry_;
    std::unique_ptr<EnrollmentPipeline> pipeline_;
    std::unique_ptr<IdentityTransfer> transfer_;
};

// Test POST /v1/identities drops the invalid sample and reports it
TEST_F(IdentityHandlerTest, EnrollReportsRejectedSamples) {
    Json::Value body = enrollBody("bob", {sample({0.1, 0.2, 0.3}, "a.jpg"),
                                          sample({0.1, 0.2}, "b.jpg"),
                                          sample({0.4, 0.5, 0.6}, "c.jpg")});
    auto response = call(&IdentityHandler::enrollIdentity,
                         makeRequest("/v1/identities", Post, &body));

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k201Created);
    EXPECT_EQ(response->contentType(), CT_APPLICATION_JSON);

    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["identity"]["identity_id"].asString(), "bob");
    EXPECT_EQ((*json)["identity"]["sample_count"].asUInt(), 2u);
    EXPECT_EQ((*json)["accepted_count"].asUInt(), 2u);
    ASSERT_EQ((*json)["rejected"].size(), 1u);
    EXPECT_EQ((*json)["rejected"][0]["index"].asUInt(), 1u);
    EXPECT_EQ((*json)["rejected"][0]["error"].asString(), "DimensionMismatch");

    EXPECT_TRUE(registry_->contains("bob"));
}

// Test a component beyond float range rejects only its sample
TEST_F(IdentityHandlerTest, EnrollRejectsOutOfRangeComponent) {
    Json::Value body = enrollBody("bob", {sample({0.1, 1e300, 0.3}),
                                          sample({0.4, 0.5, 0.6})});
    auto response = call(&IdentityHandler::enrollIdentity,
                         makeRequest("/v1/identities", Post, &body));

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k201Created);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["accepted_count"].asUInt(), 1u);
    ASSERT_EQ((*json)["rejected"].size(), 1u);
    EXPECT_EQ((*json)["rejected"][0]["index"].asUInt(), 0u);
    EXPECT_EQ((*json)["rejected"][0]["error"].asString(), "InvalidValue");
}

// Test enrollment with no valid sample
TEST_F(IdentityHandlerTest, EnrollWithoutValidSamplesReturns422) {
    Json::Value body = enrollBody("bob", {sample({0.1})});
    auto response = call(&IdentityHandler::enrollIdentity,
                         makeRequest("/v1/identities", Post, &body));

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k422UnprocessableEntity);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["error"].asString(), "InsufficientSamples");
    EXPECT_FALSE(registry_->contains("bob"));
}

// Test duplicate enrollment
TEST_F(IdentityHandlerTest, DuplicateEnrollReturns409) {
    enroll("alice");

    Json::Value body = enrollBody("alice", {sample({0.3, 0.2, 0.1})});
    auto response = call(&IdentityHandler::enrollIdentity,
                         makeRequest("/v1/identities", Post, &body));

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k409Conflict);
    EXPECT_EQ((*response->getJsonObject())["error"].asString(), "DuplicateIdentity");
}

// Test request validation
TEST_F(IdentityHandlerTest, EnrollRejectsMalformedRequests) {
    auto noBody = call(&IdentityHandler::enrollIdentity, makeRequest("/v1/identities", Post));
    ASSERT_NE(noBody, nullptr);
    EXPECT_EQ(noBody->statusCode(), k400BadRequest);

    Json::Value missingId(Json::objectValue);
    missingId["samples"] = Json::Value(Json::arrayValue);
    auto noId = call(&IdentityHandler::enrollIdentity,
                     makeRequest("/v1/identities", Post, &missingId));
    ASSERT_NE(noId, nullptr);
    EXPECT_EQ(noId->statusCode(), k400BadRequest);

    Json::Value badId = enrollBody("no/slashes", {sample({0.1, 0.2, 0.3})});
    auto invalid = call(&IdentityHandler::enrollIdentity,
                        makeRequest("/v1/identities", Post, &badId));
    ASSERT_NE(invalid, nullptr);
    EXPECT_EQ(invalid->statusCode(), k400BadRequest);
    EXPECT_EQ((*invalid->getJsonObject())["error"].asString(), "InvalidIdentity");
}

// Test GET /v1/identities
TEST_F(IdentityHandlerTest, ListIdentitiesReturnsSummaries) {
    enroll("charlie");
    enroll("alice");

    auto response = call(&IdentityHandler::listIdentities, makeRequest("/v1/identities", Get));
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);

    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["total"].asUInt(), 2u);
    ASSERT_TRUE((*json)["identities"].isArray());
    EXPECT_EQ((*json)["identities"][0]["identity_id"].asString(), "alice");
    EXPECT_TRUE((*json)["identities"][0]["last_matched_at"].isNull());
    EXPECT_EQ((*json)["identities"][0]["match_count"].asUInt(), 0u);
}

// Test export then import into a fresh registry
TEST_F(IdentityHandlerTest, ExportThenImportRoundTrip) {
    enroll("alice");

    auto exportReq = makeRequest("/v1/identities/alice/export", Get);
    exportReq->setParameter("identityId", "alice");
    auto exported = call(&IdentityHandler::exportIdentity, exportReq);
    ASSERT_NE(exported, nullptr);
    ASSERT_EQ(exported->statusCode(), k200OK);
    Json::Value envelope = *exported->getJsonObject();
    EXPECT_EQ(envelope["format_version"].asString(), "1.0");

    auto deleteReq = makeRequest("/v1/identities/alice", Delete);
    auto deleted = call(&IdentityHandler::deleteIdentity, deleteReq);
    ASSERT_NE(deleted, nullptr);
    EXPECT_EQ(deleted->statusCode(), k200OK);
    EXPECT_FALSE(registry_->contains("alice"));

    auto imported = call(&IdentityHandler::importIdentity,
                         makeRequest("/v1/identities/import", Post, &envelope));
    ASSERT_NE(imported, nullptr);
    EXPECT_EQ(imported->statusCode(), k200OK);
    EXPECT_EQ((*imported->getJsonObject())["mode"].asString(), "import");
    EXPECT_TRUE(registry_->contains("alice"));
}

// Test import of an existing identity without and with overwrite
TEST_F(IdentityHandlerTest, ImportExistingNeedsOverwrite) {
    enroll("alice");
    Json::Value envelope = transfer_->exportRecord("alice");

    auto conflict = call(&IdentityHandler::importIdentity,
                         makeRequest("/v1/identities/import", Post, &envelope));
    ASSERT_NE(conflict, nullptr);
    EXPECT_EQ(conflict->statusCode(), k409Conflict);

    auto req = makeRequest("/v1/identities/import", Post, &envelope);
    req->setParameter("overwrite", "true");
    auto replaced = call(&IdentityHandler::importIdentity, req);
    ASSERT_NE(replaced, nullptr);
    EXPECT_EQ(replaced->statusCode(), k200OK);
    EXPECT_EQ((*replaced->getJsonObject())["mode"].asString(), "overwrite");

    auto both = makeRequest("/v1/identities/import", Post, &envelope);
    both->setParameter("overwrite", "true");
    both->setParameter("merge", "true");
    auto rejected = call(&IdentityHandler::importIdentity, both);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->statusCode(), k400BadRequest);
}

// Test merge import sums match counts
TEST_F(IdentityHandlerTest, MergeImportCombinesRecords) {
    enroll("alice");
    registry_->recordSuccessfulMatch("alice", testTime(1760000500));
    Json::Value envelope = transfer_->exportRecord("alice");

    auto req = makeRequest("/v1/identities/import", Post, &envelope);
    req->setParameter("merge", "true");
    auto merged = call(&IdentityHandler::importIdentity, req);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->statusCode(), k200OK);

    auto json = merged->getJsonObject();
    EXPECT_EQ((*json)["mode"].asString(), "merge");
    EXPECT_EQ((*json)["identity"]["sample_count"].asUInt(), 1u);
    EXPECT_EQ((*json)["identity"]["match_count"].asUInt(), 2u);
}

// Test malformed envelope
TEST_F(IdentityHandlerTest, ImportMalformedEnvelopeReturns400) {
    Json::Value envelope(Json::objectValue);
    envelope["identity_id"] = "alice";
    envelope["format_version"] = "1.0";

    auto response = call(&IdentityHandler::importIdentity,
                         makeRequest("/v1/identities/import", Post, &envelope));
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);
    EXPECT_EQ((*response->getJsonObject())["error"].asString(), "MalformedRecord");
    EXPECT_EQ(registry_->size(), 0u);
}

// Test POST /v1/identities/{identityId}/samples
TEST_F(IdentityHandlerTest, AppendSamplesToExistingIdentity) {
    enroll("alice");

    Json::Value body(Json::objectValue);
    body["samples"] = Json::Value(Json::arrayValue);
    body["samples"].append(sample({0.7, 0.8, 0.9}));
    body["samples"].append(sample({0.7}));

    auto req = makeRequest("/v1/identities/alice/samples", Post, &body);
    auto response = call(&IdentityHandler::appendSamples, req);
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);

    auto json = response->getJsonObject();
    EXPECT_EQ((*json)["identity"]["sample_count"].asUInt(), 2u);
    EXPECT_EQ((*json)["accepted_count"].asUInt(), 1u);
    EXPECT_EQ((*json)["rejected"].size(), 1u);

    auto missing = call(&IdentityHandler::appendSamples,
                        makeRequest("/v1/identities/ghost/samples", Post, &body));
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(missing->statusCode(), k404NotFound);
}

// Test export and delete of unknown identity
TEST_F(IdentityHandlerTest, UnknownIdentityReturns404) {
    auto exported = call(&IdentityHandler::exportIdentity,
                         makeRequest("/v1/identities/ghost/export", Get));
    ASSERT_NE(exported, nullptr);
    EXPECT_EQ(exported->statusCode(), k404NotFound);
    EXPECT_EQ((*exported->getJsonObject())["error"].asString(), "UnknownIdentity");

    auto deleted = call(&IdentityHandler::deleteIdentity,
                        makeRequest("/v1/identities/ghost", Delete));
    ASSERT_NE(deleted, nullptr);
    EXPECT_EQ(deleted->statusCode(), k404NotFound);
}

// Test handler without dependencies
TEST_F(IdentityHandlerTest, MissingDependenciesReturn500) {
    IdentityHandler::setIdentityRegistry(nullptr);
    IdentityHandler::setIdentityTransfer(nullptr);

    Json::Value body = enrollBody("alice", {sample({0.1, 0.2, 0.3})});
    auto enrollResp = call(&IdentityHandler::enrollIdentity,
                           makeRequest("/v1/identities", Post, &body));
    ASSERT_NE(enrollResp, nullptr);
    EXPECT_EQ(enrollResp->statusCode(), k500InternalServerError);

    auto listResp = call(&IdentityHandler::listIdentities, makeRequest("/v1/identities", Get));
    ASSERT_NE(listResp, nullptr);
    EXPECT_EQ(listResp->statusCode(), k500InternalServerError);
}

// Test CORS preflight
TEST_F(IdentityHandlerTest, OptionsReturnsCorsHeaders) {
    auto response = call(&IdentityHandler::handleOptions, makeRequest("/v1/identities", Options));
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    EXPECT_EQ(response->getHeader("Access-Control-Allow-Origin"), "*");
}
