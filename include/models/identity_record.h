#pragma once

#include "core/clock.h"
#include "core/identity_error.h"
#include "models/embedding.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Identity record structure
 * One enrolled subject: its reference samples plus lifecycle counters
 */
struct IdentityRecord {
  std::string identityId;                 // Unique, immutable key
  std::vector<Embedding> samples;         // Insertion order preserved
  Timestamp enrolledAt;                   // Set once at creation
  std::optional<Timestamp> lastMatchedAt; // Last successful verification
  uint64_t matchCount = 0;                // Successful verifications

  size_t sampleCount() const { return samples.size(); }

  /**
   * @brief Validate record before it enters a registry
   * Checks the key format, that at least one sample exists and that every
   * sample is a valid embedding of the given dimension.
   */
  bool validate(size_t dimension, IdentityErrorCode &code,
                std::string &error) const;

  bool operator==(const IdentityRecord &other) const;
  bool operator!=(const IdentityRecord &other) const {
    return !(*this == other);
  }

  /**
   * @brief Validate identity key format: ^[A-Za-z0-9_-]+$, max 128 chars
   */
  static bool isValidIdentityId(const std::string &identityId,
                                std::string &error);
};

/**
 * @brief Read-only projection used by list operations
 */
struct IdentitySummary {
  std::string identityId;
  size_t sampleCount = 0;
  Timestamp enrolledAt;
  std::optional<Timestamp> lastMatchedAt;
  uint64_t matchCount = 0;
};
