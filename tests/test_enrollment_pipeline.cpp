#include <gtest/gtest.h>
#include "enrollment/enrollment_pipeline.h"
#include "matching/matching_engine.h"
#include "test_support.h"
#include <limits>
#include <memory>

namespace {

SampleCandidate candidate(std::vector<float> values, const std::string& provenance = "") {
    SampleCandidate c;
    c.values = std::move(values);
    c.provenance = provenance;
    return c;
}

/**
 * @brief Extractor that maps each raw byte to one component
 * An empty buffer fails extraction.
 */
class ByteExtractor : public IEmbeddingExtractor {
public:
    explicit ByteExtractor(size_t dimension) : dimension_(dimension) {}

    std::vector<float> extract(const std::vector<unsigned char>& data) override {
        if (data.empty()) {
            throw IdentityException(IdentityErrorCode::ExtractionFailed, "No face found");
        }
        std::vector<float> values;
        for (unsigned char byte : data) {
            values.push_back(static_cast<float>(byte) / 255.0f);
        }
        return values;
    }

    size_t dimension() const override { return dimension_; }

private:
    size_t dimension_;
};

} // namespace

class EnrollmentPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        pipeline_ = std::make_unique<EnrollmentPipeline>(3, clock_);
        registry_ = std::make_unique<IdentityRegistry>(3);
    }

    ManualClock clock_;
    std::unique_ptr<EnrollmentPipeline> pipeline_;
    std::unique_ptr<IdentityRegistry> registry_;
};

TEST_F(EnrollmentPipelineTest, DropsInvalidSampleAndKeepsTheRest) {
    std::vector<SampleCandidate> candidates = {
        candidate({0.1f, 0.2f, 0.3f}, "a.jpg"),
        candidate({0.1f, 0.2f}, "b.jpg"),
        candidate({0.4f, 0.5f, 0.6f}, "c.jpg"),
    };

    EnrollmentResult result = pipeline_->enroll("bob", candidates);

    EXPECT_EQ(result.record.identityId, "bob");
    EXPECT_EQ(result.record.sampleCount(), 2u);
    EXPECT_EQ(result.acceptedCount, 2u);
    ASSERT_EQ(result.rejections.size(), 1u);
    EXPECT_EQ(result.rejections[0].index, 1u);
    EXPECT_EQ(result.rejections[0].code, IdentityErrorCode::DimensionMismatch);

    EXPECT_EQ(result.record.samples[0].provenance, "a.jpg");
    EXPECT_EQ(result.record.samples[1].provenance, "c.jpg");
    EXPECT_EQ(result.record.enrolledAt, clock_.now());
    EXPECT_FALSE(result.record.lastMatchedAt.has_value());
    EXPECT_EQ(result.record.matchCount, 0u);
}

TEST_F(EnrollmentPipelineTest, NonFiniteSamplesAreRejectedAsInvalidValue) {
    std::vector<SampleCandidate> candidates = {
        candidate({std::numeric_limits<float>::quiet_NaN(), 0.2f, 0.3f}),
        candidate({0.1f, 0.2f, 0.3f}),
    };

    EnrollmentResult result = pipeline_->enroll("carol", candidates);
    ASSERT_EQ(result.rejections.size(), 1u);
    EXPECT_EQ(result.rejections[0].code, IdentityErrorCode::InvalidValue);
    EXPECT_EQ(result.record.sampleCount(), 1u);
}

TEST_F(EnrollmentPipelineTest, MissingCaptureTimeIsStampedFromClock) {
    SampleCandidate stamped = candidate({0.1f, 0.2f, 0.3f});
    stamped.capturedAt = testTime(42);
    SampleCandidate unstamped = candidate({0.4f, 0.5f, 0.6f});

    clock_.advance(std::chrono::seconds(10));
    EnrollmentResult result = pipeline_->enroll("dave", {stamped, unstamped});

    EXPECT_EQ(result.record.samples[0].capturedAt, testTime(42));
    EXPECT_EQ(result.record.samples[1].capturedAt, clock_.now());
}

TEST_F(EnrollmentPipelineTest, FailsBelowMinimumAcceptedSamples) {
    std::vector<SampleCandidate> candidates = {
        candidate({0.1f, 0.2f, 0.3f}),
        candidate({0.1f}),
    };

    EnrollmentPolicy policy;
    policy.minimumAcceptedSamples = 2;
    try {
        pipeline_->enroll("erin", candidates, policy);
        FAIL() << "Expected InsufficientSamples";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::InsufficientSamples);
    }
}

TEST_F(EnrollmentPipelineTest, NeverBuildsEmptyRecord) {
    EnrollmentPolicy policy;
    policy.minimumAcceptedSamples = 0;

    EXPECT_THROW(pipeline_->enroll("frank", {}, policy), IdentityException);
    EXPECT_THROW(pipeline_->enroll("frank", {candidate({1.0f})}, policy), IdentityException);
}

TEST_F(EnrollmentPipelineTest, RejectsInvalidIdentityId) {
    try {
        pipeline_->enroll("../escape", {candidate({0.1f, 0.2f, 0.3f})});
        FAIL() << "Expected InvalidIdentity";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::InvalidIdentity);
    }
}

TEST_F(EnrollmentPipelineTest, AcceptedSetDoesNotDependOnInputOrder) {
    std::vector<SampleCandidate> forward = {
        candidate({0.1f, 0.2f, 0.3f}, "x"),
        candidate({0.1f}, "bad"),
        candidate({0.7f, 0.8f, 0.9f}, "y"),
    };
    std::vector<SampleCandidate> reversed(forward.rbegin(), forward.rend());

    EnrollmentResult a = pipeline_->enroll("gina", forward);
    EnrollmentResult b = pipeline_->enroll("gina", reversed);

    ASSERT_EQ(a.record.sampleCount(), b.record.sampleCount());
    EXPECT_EQ(a.record.samples[0].provenance, "x");
    EXPECT_EQ(b.record.samples[0].provenance, "y");
    EXPECT_EQ(a.record.samples[0], b.record.samples[1]);
    EXPECT_EQ(a.record.samples[1], b.record.samples[0]);
    EXPECT_EQ(b.rejections[0].index, 1u);

    IdentityRegistry forwardRegistry(3, 0.6);
    IdentityRegistry reversedRegistry(3, 0.6);
    forwardRegistry.insert(a.record);
    reversedRegistry.insert(b.record);

    MatchingEngine engine;
    std::vector<float> probe = {0.4f, 0.5f, 0.6f};
    MatchResult fromForward = engine.authenticate(probe, forwardRegistry);
    MatchResult fromReversed = engine.authenticate(probe, reversedRegistry);
    ASSERT_EQ(fromForward.matchedIdentity.value_or(""), "gina");
    ASSERT_EQ(fromReversed.matchedIdentity.value_or(""), "gina");
    EXPECT_EQ(fromForward.score, fromReversed.score);
    EXPECT_EQ(fromForward.accepted, fromReversed.accepted);
}

TEST_F(EnrollmentPipelineTest, EnrollAndRegisterInsertsRecord) {
    EnrollmentResult result = pipeline_->enrollAndRegister(
        *registry_, "alice", {candidate({0.1f, 0.2f, 0.3f})});

    EXPECT_TRUE(registry_->contains("alice"));
    EXPECT_EQ(registry_->getRecord("alice").value(), result.record);

    try {
        pipeline_->enrollAndRegister(*registry_, "alice", {candidate({0.3f, 0.2f, 0.1f})});
        FAIL() << "Expected DuplicateIdentity";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::DuplicateIdentity);
    }
}

TEST_F(EnrollmentPipelineTest, EnrollAndRegisterChecksRegistryDimension) {
    IdentityRegistry other(5);
    try {
        pipeline_->enrollAndRegister(other, "alice", {candidate({0.1f, 0.2f, 0.3f})});
        FAIL() << "Expected DimensionMismatch";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::DimensionMismatch);
    }
    EXPECT_EQ(other.size(), 0u);
}

TEST_F(EnrollmentPipelineTest, EnrollFromRawCountsExtractionFailures) {
    ByteExtractor extractor(3);
    std::vector<RawSample> raws(3);
    raws[0].data = {10, 20, 30};
    raws[0].provenance = "frame-0";
    raws[1].data = {};
    raws[2].data = {1, 2};

    EnrollmentResult result = pipeline_->enrollFromRaw("henry", raws, extractor);

    EXPECT_EQ(result.record.sampleCount(), 1u);
    EXPECT_EQ(result.record.samples[0].provenance, "frame-0");
    ASSERT_EQ(result.rejections.size(), 2u);
    EXPECT_EQ(result.rejections[0].index, 1u);
    EXPECT_EQ(result.rejections[0].code, IdentityErrorCode::ExtractionFailed);
    EXPECT_EQ(result.rejections[1].index, 2u);
    EXPECT_EQ(result.rejections[1].code, IdentityErrorCode::DimensionMismatch);
}

TEST_F(EnrollmentPipelineTest, AppendSamplesExtendsExistingRecord) {
    pipeline_->enrollAndRegister(*registry_, "alice", {candidate({0.1f, 0.2f, 0.3f})});
    registry_->recordSuccessfulMatch("alice", testTime(99));

    EnrollmentResult result = pipeline_->appendSamples(
        *registry_, "alice", {candidate({0.4f, 0.5f, 0.6f}), candidate({0.1f})});

    EXPECT_EQ(result.acceptedCount, 1u);
    EXPECT_EQ(result.rejections.size(), 1u);
    EXPECT_EQ(result.record.sampleCount(), 2u);
    EXPECT_EQ(result.record.matchCount, 1u);
}

TEST_F(EnrollmentPipelineTest, AppendSamplesFailures) {
    try {
        pipeline_->appendSamples(*registry_, "ghost", {candidate({0.1f, 0.2f, 0.3f})});
        FAIL() << "Expected UnknownIdentity";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::UnknownIdentity);
    }

    pipeline_->enrollAndRegister(*registry_, "alice", {candidate({0.1f, 0.2f, 0.3f})});
    try {
        pipeline_->appendSamples(*registry_, "alice", {candidate({0.1f})});
        FAIL() << "Expected InsufficientSamples";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::InsufficientSamples);
    }
    EXPECT_EQ(registry_->getRecord("alice")->sampleCount(), 1u);
}
