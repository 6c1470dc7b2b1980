#pragma once

#include "identity/identity_registry.h"
#include "models/match_result.h"
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

/// Weight of the closest sample in the aggregate score
constexpr double kMinDistanceWeight = 0.7;
/// Weight of the average sample distance in the aggregate score
constexpr double kMeanDistanceWeight = 0.3;

/**
 * @brief Euclidean distance accumulated in double precision
 * @throws IdentityException DimensionMismatch when the sizes differ
 */
double euclideanDistance(const std::vector<float> &a,
                         const std::vector<float> &b);

/**
 * @brief Aggregate the probe-to-sample distances of one identity
 * @throws IdentityException MalformedRecord for a record without samples,
 * DimensionMismatch for a sample not of the probe dimension
 */
IdentityScore scoreIdentity(const std::vector<float> &probe,
                            const IdentityRecord &record);

struct MatchingEngineConfig {
  size_t parallelThreshold = 64; // Identities before scoring fans out
  size_t maxWorkers = 4;
};

/**
 * @brief Per-call evaluation controls
 */
struct MatchOptions {
  std::optional<std::chrono::steady_clock::time_point> deadline;
  const std::atomic<bool> *cancelFlag = nullptr;
  size_t maxCandidates = 5; // Length of MatchResult::ranking
};

/**
 * @brief Matching Engine
 *
 * Scores every identity of a registry snapshot against a probe embedding
 * with score = 0.7 * min + 0.3 * mean over the per-sample distances, picks
 * the lowest score (ties go to the smaller identity ID) and accepts it when
 * the score is within the tolerance.
 *
 * Scoring is read-only. Recording a successful match is a separate registry
 * call made by the caller.
 */
class MatchingEngine {
public:
  explicit MatchingEngine(MatchingEngineConfig config = {});

  /**
   * @brief Rank a fixed snapshot against a probe
   * @param tolerance Decision tolerance (snapshot threshold when absent)
   * @throws IdentityException (DimensionMismatch, InvalidValue), or
   * MalformedRecord for a record with no samples
   */
  MatchResult authenticate(const std::vector<float> &probe,
                           const IdentityRegistry::Snapshot &snapshot,
                           std::optional<double> tolerance = std::nullopt,
                           const MatchOptions &options = {}) const;

  /**
   * @brief Rank the current registry snapshot against a probe
   * @throws IdentityException (DimensionMismatch, InvalidValue)
   */
  MatchResult authenticate(const std::vector<float> &probe,
                           const IdentityRegistry &registry,
                           std::optional<double> tolerance = std::nullopt,
                           const MatchOptions &options = {}) const;

  const MatchingEngineConfig &getConfig() const { return config_; }

private:
  MatchingEngineConfig config_;
};
