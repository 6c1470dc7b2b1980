#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Per-identity aggregate of probe-to-sample distances
 */
struct IdentityScore {
  std::string identityId;
  double minDistance = 0.0;
  double meanDistance = 0.0;
  double maxDistance = 0.0;
  double score = 0.0; // 0.7 * min + 0.3 * mean
  size_t sampleCount = 0;
};

/**
 * @brief Outcome of one authentication call
 *
 * matchedIdentity names the best-ranked candidate even when it is rejected;
 * accepted tells whether it falls within the tolerance.
 */
struct MatchResult {
  std::optional<std::string> matchedIdentity;
  double score = std::numeric_limits<double>::infinity();
  double minDistance = std::numeric_limits<double>::infinity();
  double confidence = 0.0; // max(0, 1 - minDistance), display only
  bool accepted = false;
  double threshold = 0.0; // Tolerance actually applied
  size_t candidatesEvaluated = 0;
  std::vector<IdentityScore> ranking; // Best first
  bool cancelled = false;
  double processingTimeMs = 0.0;
};
