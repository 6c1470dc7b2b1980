#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

using namespace drogon;

class IdentityRegistry;

/**
 * @brief Health check endpoint handler
 *
 * Endpoint: GET /v1/core/health
 * Returns: JSON with status, timestamp, uptime, registry size and dimension
 */
class HealthHandler : public drogon::HttpController<HealthHandler> {
public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(HealthHandler::getHealth, "/v1/core/health", Get);
  METHOD_LIST_END

  /**
   * @brief Handle GET /v1/core/health
   *
   * @param req HTTP request
   * @param callback Response callback
   */
  void getHealth(const HttpRequestPtr &req,
                 std::function<void(const HttpResponsePtr &)> &&callback);

  static void setIdentityRegistry(IdentityRegistry *registry);

private:
  static IdentityRegistry *registry_;

  /**
   * @brief Get process uptime in seconds
   */
  int64_t getUptime() const;
};
