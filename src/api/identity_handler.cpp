#include "api/identity_handler.h"
#include "api/api_response.h"
#include "core/logging_flags.h"
#include "core/timestamp_utils.h"
#include "enrollment/enrollment_pipeline.h"
#include "identity/identity_codec.h"
#include "identity/identity_registry.h"
#include "models/embedding.h"
#include "transfer/identity_transfer.h"
#include <chrono>
#include <limits>
#include <plog/Log.h>

IdentityRegistry *IdentityHandler::registry_ = nullptr;
EnrollmentPipeline *IdentityHandler::pipeline_ = nullptr;
IdentityTransfer *IdentityHandler::transfer_ = nullptr;
size_t IdentityHandler::minimum_accepted_samples_ = 1;

namespace {

IdentitySummary summarize(const IdentityRecord &record) {
  IdentitySummary summary;
  summary.identityId = record.identityId;
  summary.sampleCount = record.samples.size();
  summary.enrolledAt = record.enrolledAt;
  summary.lastMatchedAt = record.lastMatchedAt;
  summary.matchCount = record.matchCount;
  return summary;
}

Json::Value enrollmentToJson(const EnrollmentResult &result) {
  Json::Value response(Json::objectValue);
  response["identity"] = IdentityCodec::summaryToJson(summarize(result.record));
  response["accepted_count"] = static_cast<Json::UInt64>(result.acceptedCount);

  Json::Value rejected(Json::arrayValue);
  for (const auto &rejection : result.rejections) {
    Json::Value item(Json::objectValue);
    item["index"] = static_cast<Json::UInt64>(rejection.index);
    item["error"] = identityErrorName(rejection.code);
    item["reason"] = rejection.reason;
    rejected.append(item);
  }
  response["rejected"] = rejected;
  return response;
}

double elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

void IdentityHandler::setIdentityRegistry(IdentityRegistry *registry) {
  registry_ = registry;
}

void IdentityHandler::setEnrollmentPipeline(EnrollmentPipeline *pipeline) {
  pipeline_ = pipeline;
}

void IdentityHandler::setIdentityTransfer(IdentityTransfer *transfer) {
  transfer_ = transfer;
}

void IdentityHandler::setMinimumAcceptedSamples(size_t minimum) {
  minimum_accepted_samples_ = minimum;
}

std::string
IdentityHandler::extractIdentityId(const HttpRequestPtr &req) const {
  std::string identityId = req->getParameter("identityId");

  if (identityId.empty()) {
    std::string path = req->getPath();
    size_t pos = path.find("/identities/");
    if (pos != std::string::npos) {
      size_t start = pos + 12; // length of "/identities/"
      size_t end = path.find("/", start);
      if (end == std::string::npos) {
        end = path.length();
      }
      identityId = path.substr(start, end - start);
    }
  }

  return identityId;
}

bool IdentityHandler::parseSamples(const Json::Value &body,
                                   std::vector<SampleCandidate> &candidates,
                                   std::string &error) const {
  if (!body.isMember("samples") || !body["samples"].isArray()) {
    error = "Missing required field: samples (array)";
    return false;
  }

  const Json::Value &samples = body["samples"];
  for (Json::ArrayIndex i = 0; i < samples.size(); ++i) {
    const Json::Value &item = samples[i];
    if (!item.isObject() || !item.isMember("vector") ||
        !item["vector"].isArray()) {
      error = "samples[" + std::to_string(i) +
              "] must be an object with a vector array";
      return false;
    }

    SampleCandidate candidate;
    const Json::Value &vector = item["vector"];
    candidate.values.reserve(vector.size());
    for (const auto &component : vector) {
      // A non-numeric or out-of-range component fails this sample only
      float value = std::numeric_limits<float>::quiet_NaN();
      if (component.isNumeric() && !toComponent(component.asDouble(), value)) {
        value = std::numeric_limits<float>::quiet_NaN();
      }
      candidate.values.push_back(value);
    }

    if (item.isMember("captured_at") && !item["captured_at"].isNull()) {
      auto capturedAt = item["captured_at"].isString()
                            ? TimestampUtils::fromIso8601(
                                  item["captured_at"].asString())
                            : std::nullopt;
      if (!capturedAt.has_value()) {
        error = "samples[" + std::to_string(i) +
                "].captured_at must be an ISO-8601 UTC timestamp";
        return false;
      }
      candidate.capturedAt = capturedAt;
    }

    if (item.isMember("provenance") && item["provenance"].isString()) {
      candidate.provenance = item["provenance"].asString();
    }

    candidates.push_back(std::move(candidate));
  }

  return true;
}

void IdentityHandler::enrollIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/identities - Enroll identity";
    PLOG_DEBUG << "[API] Request from: " << req->getPeerAddr().toIpPort();
  }

  if (!registry_ || !pipeline_) {
    PLOG_ERROR << "[API] POST /v1/identities - Error: Registry or enrollment "
                  "pipeline not initialized";
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error",
        "Registry or enrollment pipeline not initialized"));
    return;
  }

  Json::Value body;
  std::string error;
  if (!ApiResponse::parseJsonBody(req, body, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  if (!body.isMember("identity_id") || !body["identity_id"].isString()) {
    callback(ApiResponse::createErrorResponse(
        400, "InvalidRequest", "Missing required field: identity_id"));
    return;
  }
  std::string identityId = body["identity_id"].asString();

  std::vector<SampleCandidate> candidates;
  if (!parseSamples(body, candidates, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  EnrollmentPolicy policy;
  policy.minimumAcceptedSamples = minimum_accepted_samples_;
  if (body.isMember("minimum_accepted_samples")) {
    if (!body["minimum_accepted_samples"].isUInt()) {
      callback(ApiResponse::createErrorResponse(
          400, "InvalidRequest",
          "minimum_accepted_samples must be a non-negative integer"));
      return;
    }
    policy.minimumAcceptedSamples = body["minimum_accepted_samples"].asUInt();
  }

  try {
    EnrollmentResult result =
        pipeline_->enrollAndRegister(*registry_, identityId, candidates, policy);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/identities - Enrolled " << identityId
                << " with " << result.acceptedCount << " samples - "
                << elapsedMs(start_time) << "ms";
    }
    callback(ApiResponse::createSuccessResponse(enrollmentToJson(result), 201));
  } catch (const IdentityException &e) {
    if (isApiLoggingEnabled()) {
      PLOG_WARNING << "[API] POST /v1/identities - "
                   << identityErrorName(e.code()) << ": " << e.what();
    }
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] POST /v1/identities - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::listIdentities(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/identities - List identities";
    PLOG_DEBUG << "[API] Request from: " << req->getPeerAddr().toIpPort();
  }

  if (!transfer_) {
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error", "Identity transfer not initialized"));
    return;
  }

  try {
    Json::Value response(Json::objectValue);
    Json::Value identities(Json::arrayValue);
    for (const auto &summary : transfer_->list()) {
      identities.append(IdentityCodec::summaryToJson(summary));
    }
    response["total"] = identities.size();
    response["identities"] = identities;
    callback(ApiResponse::createSuccessResponse(response));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/identities - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::exportIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  std::string identityId = extractIdentityId(req);

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/identities/" << identityId
              << "/export - Export identity";
  }

  if (!transfer_) {
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error", "Identity transfer not initialized"));
    return;
  }

  try {
    callback(
        ApiResponse::createSuccessResponse(transfer_->exportRecord(identityId)));
  } catch (const IdentityException &e) {
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/identities/" << identityId
               << "/export - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::appendSamples(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  std::string identityId = extractIdentityId(req);

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/identities/" << identityId
              << "/samples - Append samples";
  }

  if (!registry_ || !pipeline_) {
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error",
        "Registry or enrollment pipeline not initialized"));
    return;
  }

  Json::Value body;
  std::string error;
  if (!ApiResponse::parseJsonBody(req, body, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  std::vector<SampleCandidate> candidates;
  if (!parseSamples(body, candidates, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  try {
    EnrollmentResult result =
        pipeline_->appendSamples(*registry_, identityId, candidates);
    callback(ApiResponse::createSuccessResponse(enrollmentToJson(result)));
  } catch (const IdentityException &e) {
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] POST /v1/identities/" << identityId
               << "/samples - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::deleteIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  std::string identityId = extractIdentityId(req);

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] DELETE /v1/identities/" << identityId
              << " - Delete identity";
  }

  if (!transfer_) {
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error", "Identity transfer not initialized"));
    return;
  }

  try {
    transfer_->removeRecord(identityId);

    Json::Value response(Json::objectValue);
    response["identity_id"] = identityId;
    response["message"] = "Identity deleted";
    callback(ApiResponse::createSuccessResponse(response));
  } catch (const IdentityException &e) {
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] DELETE /v1/identities/" << identityId
               << " - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::importIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  bool overwrite = ApiResponse::getBoolParameter(req, "overwrite");
  bool merge = ApiResponse::getBoolParameter(req, "merge");

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/identities/import - Import identity"
              << (merge ? " (merge)" : overwrite ? " (overwrite)" : "");
  }

  if (!transfer_) {
    callback(ApiResponse::createErrorResponse(
        500, "Internal server error", "Identity transfer not initialized"));
    return;
  }

  if (overwrite && merge) {
    callback(ApiResponse::createErrorResponse(
        400, "InvalidRequest", "overwrite and merge are mutually exclusive"));
    return;
  }

  Json::Value body;
  std::string error;
  if (!ApiResponse::parseJsonBody(req, body, error)) {
    callback(ApiResponse::createErrorResponse(400, "InvalidRequest", error));
    return;
  }

  try {
    IdentityRecord record = merge ? transfer_->mergeRecord(body)
                                  : transfer_->importRecord(body, overwrite);

    Json::Value response(Json::objectValue);
    response["identity"] = IdentityCodec::summaryToJson(summarize(record));
    response["mode"] = merge ? "merge" : overwrite ? "overwrite" : "import";
    callback(ApiResponse::createSuccessResponse(response));
  } catch (const IdentityException &e) {
    if (isApiLoggingEnabled()) {
      PLOG_WARNING << "[API] POST /v1/identities/import - "
                   << identityErrorName(e.code()) << ": " << e.what();
    }
    callback(ApiResponse::fromException(e));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] POST /v1/identities/import - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

void IdentityHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(ApiResponse::createOptionsResponse());
}
