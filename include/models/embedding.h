#pragma once

#include "core/clock.h"
#include "core/identity_error.h"
#include <string>
#include <vector>

/**
 * @brief One biometric sample as a fixed-dimension feature vector
 *
 * Values are stored and compared exactly as received (no normalization).
 * Provenance is kept for audit only and never takes part in matching.
 */
struct Embedding {
  std::vector<float> values; // D components
  Timestamp capturedAt;      // Acquisition time
  std::string provenance;    // Source sample reference (file path, capture id)

  size_t dimension() const { return values.size(); }

  /**
   * @brief Validate against the registry dimension
   * @param expectedDimension Fixed D of the registry
   * @param code Error code output on failure
   * @param error Error message output on failure
   * @return true if the vector has D finite components
   */
  bool validate(size_t expectedDimension, IdentityErrorCode &code,
                std::string &error) const;

  bool operator==(const Embedding &other) const;
  bool operator!=(const Embedding &other) const { return !(*this == other); }
};

/**
 * @brief Narrow a decoded number to a vector component
 * @return false if the value is not finite or outside the float range
 */
bool toComponent(double value, float &out);

/**
 * @brief Build a validated embedding
 * @throws IdentityException (DimensionMismatch, InvalidValue)
 */
Embedding makeEmbedding(std::vector<float> values, size_t expectedDimension,
                        Timestamp capturedAt, std::string provenance = "");
