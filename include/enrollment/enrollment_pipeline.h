#pragma once

#include "core/clock.h"
#include "core/identity_error.h"
#include "enrollment/embedding_extractor.h"
#include "identity/identity_registry.h"
#include "models/identity_record.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Per-call enrollment acceptance rules
 */
struct EnrollmentPolicy {
  size_t minimumAcceptedSamples = 1;
};

/**
 * @brief One externally supplied embedding awaiting validation
 */
struct SampleCandidate {
  std::vector<float> values;
  std::optional<Timestamp> capturedAt; // Stamped from the clock when absent
  std::string provenance;
};

/**
 * @brief One raw sample awaiting extraction
 */
struct RawSample {
  std::vector<unsigned char> data;
  std::optional<Timestamp> capturedAt;
  std::string provenance;
};

/**
 * @brief Reason a candidate was dropped
 */
struct SampleRejection {
  size_t index = 0; // Position in the input sequence
  IdentityErrorCode code = IdentityErrorCode::InvalidValue;
  std::string reason;
};

/**
 * @brief Enrollment outcome: the built record plus per-sample accounting
 */
struct EnrollmentResult {
  IdentityRecord record;
  size_t acceptedCount = 0;
  std::vector<SampleRejection> rejections;
};

/**
 * @brief Enrollment Pipeline
 *
 * Validates candidate samples one by one. Invalid candidates are dropped
 * and reported; the call only fails when fewer than the policy minimum
 * survive.
 */
class EnrollmentPipeline {
public:
  /**
   * @param dimension Embedding dimension accepted by the target registry
   * @param clock Source of enrolled_at and missing capture times
   */
  EnrollmentPipeline(size_t dimension, const IClock &clock);

  /**
   * @brief Build a new record from candidate embeddings
   * @throws IdentityException (InvalidIdentity, InsufficientSamples)
   */
  EnrollmentResult enroll(const std::string &identityId,
                          const std::vector<SampleCandidate> &candidates,
                          const EnrollmentPolicy &policy = {}) const;

  /**
   * @brief Build a new record from raw samples through an extractor
   *
   * Extraction failures and wrong output dimensions count as rejected
   * samples.
   *
   * @throws IdentityException (InvalidIdentity, InsufficientSamples)
   */
  EnrollmentResult enrollFromRaw(const std::string &identityId,
                                 const std::vector<RawSample> &rawSamples,
                                 IEmbeddingExtractor &extractor,
                                 const EnrollmentPolicy &policy = {}) const;

  /**
   * @brief enroll() followed by registry insertion
   * @throws IdentityException (DuplicateIdentity, StorageFailure and the
   * errors of enroll())
   */
  EnrollmentResult enrollAndRegister(
      IdentityRegistry &registry, const std::string &identityId,
      const std::vector<SampleCandidate> &candidates,
      const EnrollmentPolicy &policy = {}, bool overwrite = false) const;

  /**
   * @brief Append validated candidates to an existing record
   *
   * Counters and enrolled_at are kept. The result record is the stored
   * record after the append.
   *
   * @throws IdentityException (UnknownIdentity, InsufficientSamples,
   * StorageFailure)
   */
  EnrollmentResult appendSamples(
      IdentityRegistry &registry, const std::string &identityId,
      const std::vector<SampleCandidate> &candidates) const;

  size_t getDimension() const { return dimension_; }

private:
  std::vector<Embedding>
  acceptCandidates(const std::vector<SampleCandidate> &candidates,
                   std::vector<SampleRejection> &rejections) const;

  EnrollmentResult buildRecord(const std::string &identityId,
                               std::vector<Embedding> accepted,
                               std::vector<SampleRejection> rejections,
                               const EnrollmentPolicy &policy) const;

  size_t dimension_;
  const IClock &clock_;
};
