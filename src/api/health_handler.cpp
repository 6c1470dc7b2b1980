#include "api/health_handler.h"
#include "api/api_response.h"
#include "core/timestamp_utils.h"
#include "identity/identity_registry.h"
#include <chrono>
#include <plog/Log.h>

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "1.0.0"
#endif

// Static start time for uptime calculation
static std::chrono::steady_clock::time_point g_start_time =
    std::chrono::steady_clock::now();

IdentityRegistry *HealthHandler::registry_ = nullptr;

void HealthHandler::setIdentityRegistry(IdentityRegistry *registry) {
  registry_ = registry;
}

void HealthHandler::getHealth(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  try {
    Json::Value response;
    Json::Value checks;

    int64_t uptime = getUptime();
    checks["uptime"] = uptime >= 0;
    checks["registry"] = registry_ != nullptr;

    std::string status = registry_ ? "healthy" : "unhealthy";

    response["status"] = status;
    response["timestamp"] =
        TimestampUtils::toIso8601(std::chrono::system_clock::now());
    response["uptime"] = static_cast<Json::Int64>(uptime);
    response["service"] = "face_auth_api";
    response["version"] = PROJECT_VERSION;
    response["checks"] = checks;

    if (registry_) {
      response["identities"] = static_cast<Json::UInt64>(registry_->size());
      response["dimension"] =
          static_cast<Json::UInt64>(registry_->getDimension());
      response["threshold"] = registry_->getThreshold();
    }

    callback(ApiResponse::createSuccessResponse(
        response, status == "healthy" ? 200 : 503));
  } catch (const std::exception &e) {
    PLOG_ERROR << "[API] GET /v1/core/health - Exception: " << e.what();
    callback(
        ApiResponse::createErrorResponse(500, "Internal server error", e.what()));
  }
}

int64_t HealthHandler::getUptime() const {
  auto now = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::seconds>(now - g_start_time);
  return duration.count();
}
