#include "api/authentication_handler.h"
#include "api/api_response.h"
#include "core/clock.h"
#include "core/logging_flags.h"
#include "identity/identity_registry.h"
#include "matching/matching_engine.h"
#include "models/embedding.h"
#include <cmath>
#include <limits>
#include <plog/Log.h>

IdentityRegistry *AuthenticationHandler::registry_ = nullptr;
MatchingEngine *AuthenticationHandler::engine_ = nullptr;
const IClock *AuthenticationHandler::clock_ = nullptr;
size_t AuthenticationHandler::default_max_candidates_ = 5;
int AuthenticationHandler::default_timeout_ms_ = 0;

namespace {

Json::Value finiteOrNull(double value) {
  return std::isfinite(value) ? Json::Value(value) : Json::Value::null;
}

} // namespace

void AuthenticationHandler::setIdentityRegistry(IdentityRegistry *registry) {
  registry_ = registry;
}

void AuthenticationHandler::setMatchingEngine(MatchingEngine *engine) {
  engine_ = engine;
}

void AuthenticationHandler::setClock(const IClock *clock) { clock_ = clock; }

void AuthenticationHandler::setDefaults(size_t maxCandidates, int timeoutMs) {
  default_max_candidates_ = maxCandidates;
  default_timeout_ms_ = timeoutMs;
}

Json::Value AuthenticationHandler::matchResultToJson(const MatchResult &result) {
  Json::Value json(Json::objectValue);
  json["matched_identity"] = result.matchedIdentity.has_value()
                                 ? Json::Value(result.matchedIdentity.value())
                                 : Json::Value::null;
  json["accepted"] = result.accepted;
  json["score"] = finiteOrNull(result.score);
  json["min_distance"] = finiteOrNull(result.minDistance);
  json["confidence"] = result.confidence;
  json["threshold"] = result.threshold;
  json["candidates_evaluated"] =
      static_cast<Json::UInt64>(result.candidatesEvaluated);
  json["cancelled"] = result.cancelled;
  json["processing_time_ms"] = result.processingTimeMs;

  Json::Value ranking(Json::arrayValue);
  for (const auto &entry : result.ranking) {
    Json::Value item(Json::objectValue);
    item["identity_id"] = entry.identityId;
    item["score"] = entry.score;
    item["min_distance"] = entry.minDistance;
    item["mean_distance"] = entry.meanDistance;
    item["max_distance"] = entry.maxDistance;
    item["sample_count"] = static_cast<Json::UInt64>(entry.sampleCount);
    ranking.append(item);
  }
  json["ranking"] = ranking;
  return json;
}

void AuthenticationHandler::authenticate(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/authenticate - Authenticate probe";
    PLOG_DEBUG << "[API] Request from: " << req->getPeerAddr().toIpPort();
  }

  if (!registry_ || !engine_ || !clock_) {
    PLOG_ERROR << "[API] POST /v1/authenticate - Error: Matching engine not "
                  "initialized";
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error", "Matching engine not initialized"));
    return;
  }

  Json::Value body;
  std::string error;
  if (!ApiResponse::parseJsonBody(req, body, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  if (!body.isMember("vector") || !body["vector"].isArray()) {
    callback(ApiResponse::createErrorResponse(
        400, "InvalidRequest", "Missing required field: vector (array)"));
    return;
  }

  std::vector<float> probe;
  probe.reserve(body["vector"].size());
  for (const auto &component : body["vector"]) {
    float value = 0.0f;
    if (!component.isNumeric() || !toComponent(component.asDouble(), value)) {
      callback(ApiResponse::createErrorResponse(
          400, identityErrorName(IdentityErrorCode::InvalidValue),
          "vector components must be finite numbers within float range"));
      return;
    }
    probe.push_back(value);
  }

  std::optional<double> tolerance;
  if (body.isMember("tolerance") && !body["tolerance"].isNull()) {
    if (!body["tolerance"].isNumeric()) {
      callback(ApiResponse::createErrorResponse(
          400, identityErrorName(IdentityErrorCode::InvalidValue),
          "tolerance must be a number"));
      return;
    }
    tolerance = body["tolerance"].asDouble();
  }

  bool recordMatch = true;
  if (body.isMember("record_match")) {
    if (!body["record_match"].isBool()) {
      callback(ApiResponse::createErrorResponse(
          400, "InvalidRequest", "record_match must be a boolean"));
      return;
    }
    recordMatch = body["record_match"].asBool();
  }

  MatchOptions options;
  options.maxCandidates = default_max_candidates_;
  if (body.isMember("max_candidates")) {
    if (!body["max_candidates"].isUInt()) {
      callback(ApiResponse::createErrorResponse(
          400, "InvalidRequest",
          "max_candidates must be a non-negative integer"));
      return;
    }
    options.maxCandidates = body["max_candidates"].asUInt();
  }

  int timeoutMs = default_timeout_ms_;
  if (body.isMember("timeout_ms")) {
    // isInt() also bounds the value to INT_MAX
    if (!body["timeout_ms"].isInt() || body["timeout_ms"].asInt() < 0) {
      callback(ApiResponse::createErrorResponse(
          400, "InvalidRequest",
          "timeout_ms must be an integer in [0, 2147483647]"));
      return;
    }
    timeoutMs = body["timeout_ms"].asInt();
  }
  if (timeoutMs > 0) {
    options.deadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(timeoutMs);
  }

  try {
    MatchResult result =
        engine_->authenticate(probe, *registry_, tolerance, options);

    bool matchRecorded = false;
    if (result.accepted && recordMatch && result.matchedIdentity.has_value()) {
      try {
        registry_->recordSuccessfulMatch(result.matchedIdentity.value(),
                                         clock_->now());
        matchRecorded = true;
      } catch (const IdentityException &e) {
        // Decision stands; the identity may have been removed meanwhile
        PLOG_WARNING << "[API] POST /v1/authenticate - Match not recorded for "
                     << result.matchedIdentity.value() << ": "
                     << identityErrorName(e.code()) << ": " << e.what();
      }
    }

    Json::Value response = matchResultToJson(result);
    response["match_recorded"] = matchRecorded;

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/authenticate - "
                << (result.accepted ? "Accepted " : "Rejected ")
                << result.matchedIdentity.value_or("<none>") << " - "
                << result.processingTimeMs << "ms";
    }
    callback(ApiResponse::createSuccessResponse(response));
  } catch (const IdentityException &e) {
    if (isApiLoggingEnabled()) {
      PLOG_WARNING << "[API] POST /v1/authenticate - "
                   << identityErrorName(e.code()) << ": " << e.what();
    }
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] POST /v1/authenticate - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AuthenticationHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(ApiResponse::createOptionsResponse());
}
