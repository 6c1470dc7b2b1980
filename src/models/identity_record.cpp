#include "models/identity_record.h"
#include <regex>

namespace {
constexpr size_t kMaxIdentityIdLength = 128;
}

bool IdentityRecord::isValidIdentityId(const std::string &identityId,
                                       std::string &error) {
  if (identityId.empty()) {
    error = "Identity ID cannot be empty";
    return false;
  }

  if (identityId.size() > kMaxIdentityIdLength) {
    error = "Identity ID cannot exceed " +
            std::to_string(kMaxIdentityIdLength) + " characters";
    return false;
  }

  static const std::regex pattern("^[A-Za-z0-9_-]+$");
  if (!std::regex_match(identityId, pattern)) {
    error = "Identity ID must contain only alphanumeric characters, "
            "underscores, and hyphens";
    return false;
  }

  return true;
}

bool IdentityRecord::validate(size_t dimension, IdentityErrorCode &code,
                              std::string &error) const {
  if (!isValidIdentityId(identityId, error)) {
    code = IdentityErrorCode::InvalidIdentity;
    return false;
  }

  if (samples.empty()) {
    code = IdentityErrorCode::InsufficientSamples;
    error = "Identity '" + identityId + "' has no samples";
    return false;
  }

  for (size_t i = 0; i < samples.size(); ++i) {
    std::string sampleError;
    if (!samples[i].validate(dimension, code, sampleError)) {
      error = "Identity '" + identityId + "' sample " + std::to_string(i) +
              ": " + sampleError;
      return false;
    }
  }

  return true;
}

bool IdentityRecord::operator==(const IdentityRecord &other) const {
  return identityId == other.identityId && samples == other.samples &&
         enrolledAt == other.enrolledAt &&
         lastMatchedAt == other.lastMatchedAt &&
         matchCount == other.matchCount;
}
