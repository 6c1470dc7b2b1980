#include "matching/matching_engine.h"
#include "core/logging_flags.h"
#include <algorithm>
#include <cmath>
#include <future>
#include <iterator>
#include <limits>
#include <plog/Log.h>

namespace {

using Candidate = std::pair<const std::string *, const IdentityRecord *>;

struct ChunkResult {
  std::vector<IdentityScore> scores;
  bool cancelled = false;
};

bool shouldStop(const MatchOptions &options) {
  if (options.cancelFlag && options.cancelFlag->load()) {
    return true;
  }
  return options.deadline.has_value() &&
         std::chrono::steady_clock::now() >= options.deadline.value();
}

ChunkResult scoreChunk(const std::vector<float> &probe,
                       const std::vector<Candidate> &candidates, size_t begin,
                       size_t end, const MatchOptions &options) {
  ChunkResult result;
  result.scores.reserve(end - begin);
  for (size_t i = begin; i < end; ++i) {
    if (shouldStop(options)) {
      result.cancelled = true;
      break;
    }
    result.scores.push_back(scoreIdentity(probe, *candidates[i].second));
  }
  return result;
}

bool rankBefore(const IdentityScore &a, const IdentityScore &b) {
  if (a.score != b.score) {
    return a.score < b.score;
  }
  return a.identityId < b.identityId;
}

} // namespace

double euclideanDistance(const std::vector<float> &a,
                         const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw IdentityException(IdentityErrorCode::DimensionMismatch,
                            "Cannot compare vectors of " +
                                std::to_string(a.size()) + " and " +
                                std::to_string(b.size()) + " components");
  }
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    sum += diff * diff;
  }
  return std::sqrt(sum);
}

IdentityScore scoreIdentity(const std::vector<float> &probe,
                            const IdentityRecord &record) {
  if (record.samples.empty()) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Identity '" + record.identityId +
                                "' has no samples");
  }
  IdentityScore score;
  score.identityId = record.identityId;
  score.sampleCount = record.samples.size();
  score.minDistance = std::numeric_limits<double>::infinity();
  score.maxDistance = 0.0;

  double total = 0.0;
  for (const auto &sample : record.samples) {
    if (sample.values.size() != probe.size()) {
      throw IdentityException(IdentityErrorCode::DimensionMismatch,
                              "Identity '" + record.identityId +
                                  "' holds a sample of " +
                                  std::to_string(sample.values.size()) +
                                  " components, expected " +
                                  std::to_string(probe.size()));
    }
    double d = euclideanDistance(probe, sample.values);
    score.minDistance = std::min(score.minDistance, d);
    score.maxDistance = std::max(score.maxDistance, d);
    total += d;
  }
  score.meanDistance = total / static_cast<double>(record.samples.size());
  score.score = kMinDistanceWeight * score.minDistance +
                kMeanDistanceWeight * score.meanDistance;

  // Rounding may push the weighted sum a hair outside [min, max]
  score.score = std::clamp(score.score, score.minDistance, score.maxDistance);
  return score;
}

MatchingEngine::MatchingEngine(MatchingEngineConfig config)
    : config_(config) {
  if (config_.maxWorkers == 0) {
    config_.maxWorkers = 1;
  }
}

MatchResult MatchingEngine::authenticate(const std::vector<float> &probe,
                                         const IdentityRegistry &registry,
                                         std::optional<double> tolerance,
                                         const MatchOptions &options) const {
  return authenticate(probe, registry.snapshot(), tolerance, options);
}

MatchResult
MatchingEngine::authenticate(const std::vector<float> &probe,
                             const IdentityRegistry::Snapshot &snapshot,
                             std::optional<double> tolerance,
                             const MatchOptions &options) const {
  auto start = std::chrono::steady_clock::now();

  if (probe.size() != snapshot.dimension) {
    throw IdentityException(IdentityErrorCode::DimensionMismatch,
                            "Probe has " + std::to_string(probe.size()) +
                                " components, expected " +
                                std::to_string(snapshot.dimension));
  }
  for (size_t i = 0; i < probe.size(); ++i) {
    if (!std::isfinite(probe[i])) {
      throw IdentityException(IdentityErrorCode::InvalidValue,
                              "Probe component " + std::to_string(i) +
                                  " is not finite");
    }
  }

  double applied = tolerance.value_or(snapshot.threshold);
  if (!std::isfinite(applied) || applied < 0.0) {
    throw IdentityException(IdentityErrorCode::InvalidValue,
                            "Tolerance must be a finite non-negative number");
  }

  MatchResult result;
  result.threshold = applied;

  std::vector<Candidate> candidates;
  if (snapshot.records) {
    candidates.reserve(snapshot.records->size());
    for (const auto &[id, record] : *snapshot.records) {
      candidates.emplace_back(&id, record.get());
    }
  }

  std::vector<ChunkResult> chunks;
  const size_t n = candidates.size();
  if (n >= config_.parallelThreshold && config_.maxWorkers > 1 && n > 1) {
    size_t workers = std::min(config_.maxWorkers, n);
    size_t chunkSize = (n + workers - 1) / workers;

    std::vector<std::future<ChunkResult>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < n; begin += chunkSize) {
      size_t end = std::min(n, begin + chunkSize);
      futures.push_back(std::async(std::launch::async, [&, begin, end]() {
        return scoreChunk(probe, candidates, begin, end, options);
      }));
    }
    for (auto &future : futures) {
      chunks.push_back(future.get());
    }
  } else {
    chunks.push_back(scoreChunk(probe, candidates, 0, n, options));
  }

  std::vector<IdentityScore> scores;
  scores.reserve(n);
  for (auto &chunk : chunks) {
    result.cancelled = result.cancelled || chunk.cancelled;
    std::move(chunk.scores.begin(), chunk.scores.end(),
              std::back_inserter(scores));
  }

  auto finish = [&]() {
    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start)
            .count();
  };

  if (result.cancelled) {
    result.candidatesEvaluated = scores.size();
    finish();
    PLOG_WARNING << "[Matching] Evaluation abandoned after "
                 << scores.size() << " of " << n << " identities";
    return result;
  }

  std::sort(scores.begin(), scores.end(), rankBefore);
  result.candidatesEvaluated = scores.size();

  if (!scores.empty()) {
    const IdentityScore &best = scores.front();
    result.matchedIdentity = best.identityId;
    result.score = best.score;
    result.minDistance = best.minDistance;
    result.confidence = std::max(0.0, 1.0 - best.minDistance);
    result.accepted = best.score <= applied;
  }

  if (scores.size() > options.maxCandidates) {
    scores.resize(options.maxCandidates);
  }
  result.ranking = std::move(scores);
  finish();

  if (isMatchingLoggingEnabled()) {
    PLOG_INFO << "[Matching] Evaluated " << result.candidatesEvaluated
              << " identities in " << result.processingTimeMs << " ms, best="
              << result.matchedIdentity.value_or("<none>")
              << " score=" << result.score << " tolerance=" << applied
              << (result.accepted ? " (accepted)" : " (rejected)");
  }
  return result;
}
