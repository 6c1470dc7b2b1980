#include "api/version_handler.h"
#include "api/api_response.h"
#include <json/json.h>

// Version information - set by the build system
#ifndef PROJECT_VERSION
#define PROJECT_VERSION "1.0.0"
#endif

#ifndef BUILD_TIME
#define BUILD_TIME __DATE__ " " __TIME__
#endif

#ifndef GIT_COMMIT
#define GIT_COMMIT "unknown"
#endif

void VersionHandler::getVersion(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  Json::Value response;
  response["version"] = PROJECT_VERSION;
  response["build_time"] = BUILD_TIME;
  response["git_commit"] = GIT_COMMIT;
  response["api_version"] = "v1";
  response["service"] = "face_auth_api";
  response["record_format_version"] = "1.0";

  callback(ApiResponse::createSuccessResponse(response));
}
