#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

using namespace drogon;

/**
 * @brief Version endpoint handler
 *
 * Endpoint: GET /v1/core/version
 * Returns: service version, build information and the identity record
 * format version understood by import
 */
class VersionHandler : public drogon::HttpController<VersionHandler> {
public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(VersionHandler::getVersion, "/v1/core/version", Get);
  METHOD_LIST_END

  void getVersion(const HttpRequestPtr &req,
                  std::function<void(const HttpResponsePtr &)> &&callback);
};
