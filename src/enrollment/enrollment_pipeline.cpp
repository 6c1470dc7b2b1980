#include "enrollment/enrollment_pipeline.h"
#include <algorithm>
#include <plog/Log.h>

EnrollmentPipeline::EnrollmentPipeline(size_t dimension, const IClock &clock)
    : dimension_(dimension), clock_(clock) {}

std::vector<Embedding> EnrollmentPipeline::acceptCandidates(
    const std::vector<SampleCandidate> &candidates,
    std::vector<SampleRejection> &rejections) const {
  std::vector<Embedding> accepted;
  accepted.reserve(candidates.size());

  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto &candidate = candidates[i];

    Embedding sample;
    sample.values = candidate.values;
    sample.capturedAt = candidate.capturedAt.value_or(clock_.now());
    sample.provenance = candidate.provenance;

    SampleRejection rejection;
    if (!sample.validate(dimension_, rejection.code, rejection.reason)) {
      rejection.index = i;
      PLOG_DEBUG << "[Enrollment] Dropped sample " << i << ": "
                 << rejection.reason;
      rejections.push_back(std::move(rejection));
      continue;
    }
    accepted.push_back(std::move(sample));
  }

  return accepted;
}

EnrollmentResult
EnrollmentPipeline::buildRecord(const std::string &identityId,
                                std::vector<Embedding> accepted,
                                std::vector<SampleRejection> rejections,
                                const EnrollmentPolicy &policy) const {
  // A record is never built without at least one sample
  size_t minimum = std::max<size_t>(1, policy.minimumAcceptedSamples);
  if (accepted.size() < minimum) {
    PLOG_WARNING << "[Enrollment] Identity " << identityId << ": only "
                 << accepted.size() << " of "
                 << accepted.size() + rejections.size()
                 << " samples accepted, " << minimum << " required";
    throw IdentityException(IdentityErrorCode::InsufficientSamples,
                            "Only " + std::to_string(accepted.size()) +
                                " valid samples for identity '" + identityId +
                                "', at least " + std::to_string(minimum) +
                                " required");
  }

  EnrollmentResult result;
  result.acceptedCount = accepted.size();
  result.rejections = std::move(rejections);
  result.record.identityId = identityId;
  result.record.samples = std::move(accepted);
  result.record.enrolledAt = clock_.now();
  result.record.lastMatchedAt = std::nullopt;
  result.record.matchCount = 0;

  PLOG_DEBUG << "[Enrollment] Built identity " << identityId << " with "
             << result.acceptedCount << " samples ("
             << result.rejections.size() << " rejected)";
  return result;
}

EnrollmentResult
EnrollmentPipeline::enroll(const std::string &identityId,
                           const std::vector<SampleCandidate> &candidates,
                           const EnrollmentPolicy &policy) const {
  std::string error;
  if (!IdentityRecord::isValidIdentityId(identityId, error)) {
    throw IdentityException(IdentityErrorCode::InvalidIdentity, error);
  }

  std::vector<SampleRejection> rejections;
  auto accepted = acceptCandidates(candidates, rejections);
  return buildRecord(identityId, std::move(accepted), std::move(rejections),
                     policy);
}

EnrollmentResult
EnrollmentPipeline::enrollFromRaw(const std::string &identityId,
                                  const std::vector<RawSample> &rawSamples,
                                  IEmbeddingExtractor &extractor,
                                  const EnrollmentPolicy &policy) const {
  std::string error;
  if (!IdentityRecord::isValidIdentityId(identityId, error)) {
    throw IdentityException(IdentityErrorCode::InvalidIdentity, error);
  }

  std::vector<Embedding> accepted;
  std::vector<SampleRejection> rejections;

  for (size_t i = 0; i < rawSamples.size(); ++i) {
    const auto &raw = rawSamples[i];

    Embedding sample;
    try {
      sample.values = extractor.extract(raw.data);
    } catch (const IdentityException &e) {
      PLOG_DEBUG << "[Enrollment] Extraction failed for sample " << i << ": "
                 << e.what();
      rejections.push_back({i, IdentityErrorCode::ExtractionFailed, e.what()});
      continue;
    }
    sample.capturedAt = raw.capturedAt.value_or(clock_.now());
    sample.provenance = raw.provenance;

    SampleRejection rejection;
    if (!sample.validate(dimension_, rejection.code, rejection.reason)) {
      rejection.index = i;
      rejections.push_back(std::move(rejection));
      continue;
    }
    accepted.push_back(std::move(sample));
  }

  return buildRecord(identityId, std::move(accepted), std::move(rejections),
                     policy);
}

EnrollmentResult EnrollmentPipeline::enrollAndRegister(
    IdentityRegistry &registry, const std::string &identityId,
    const std::vector<SampleCandidate> &candidates,
    const EnrollmentPolicy &policy, bool overwrite) const {
  if (registry.getDimension() != dimension_) {
    throw IdentityException(IdentityErrorCode::DimensionMismatch,
                            "Pipeline dimension " +
                                std::to_string(dimension_) +
                                " differs from registry dimension " +
                                std::to_string(registry.getDimension()));
  }

  EnrollmentResult result = enroll(identityId, candidates, policy);
  registry.insert(result.record, overwrite);

  PLOG_INFO << "[Enrollment] Enrolled identity " << identityId << " ("
            << result.acceptedCount << " samples, "
            << result.rejections.size() << " rejected)";
  return result;
}

EnrollmentResult EnrollmentPipeline::appendSamples(
    IdentityRegistry &registry, const std::string &identityId,
    const std::vector<SampleCandidate> &candidates) const {
  if (!registry.contains(identityId)) {
    throw IdentityException(IdentityErrorCode::UnknownIdentity,
                            "Identity '" + identityId + "' not found");
  }

  EnrollmentResult result;
  auto accepted = acceptCandidates(candidates, result.rejections);
  if (accepted.empty()) {
    throw IdentityException(IdentityErrorCode::InsufficientSamples,
                            "No valid samples to append to identity '" +
                                identityId + "'");
  }

  result.acceptedCount = accepted.size();
  result.record = registry.appendSamples(identityId, accepted);
  return result;
}
