#include "api/api_response.h"
#include <algorithm>
#include <sstream>

using namespace drogon;

namespace ApiResponse {

void addCorsHeaders(const HttpResponsePtr &resp) {
  resp->addHeader("Access-Control-Allow-Origin", "*");
  resp->addHeader("Access-Control-Allow-Methods",
                  "GET, POST, DELETE, OPTIONS");
  resp->addHeader("Access-Control-Allow-Headers",
                  "Content-Type, Authorization");
}

HttpResponsePtr createSuccessResponse(const Json::Value &data,
                                      int statusCode) {
  auto resp = HttpResponse::newHttpJsonResponse(data);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  addCorsHeaders(resp);
  return resp;
}

HttpResponsePtr createErrorResponse(int statusCode, const std::string &error,
                                    const std::string &message) {
  Json::Value response(Json::objectValue);
  response["error"] = error;
  if (!message.empty()) {
    response["message"] = message;
  }

  auto resp = HttpResponse::newHttpJsonResponse(response);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  addCorsHeaders(resp);
  return resp;
}

int statusForError(IdentityErrorCode code) {
  switch (code) {
  case IdentityErrorCode::InvalidIdentity:
  case IdentityErrorCode::DimensionMismatch:
  case IdentityErrorCode::InvalidValue:
  case IdentityErrorCode::MalformedRecord:
    return 400;
  case IdentityErrorCode::UnknownIdentity:
    return 404;
  case IdentityErrorCode::DuplicateIdentity:
    return 409;
  case IdentityErrorCode::InsufficientSamples:
    return 422;
  case IdentityErrorCode::ExtractionFailed:
    return 502;
  case IdentityErrorCode::StorageFailure:
    return 500;
  }
  return 500;
}

HttpResponsePtr fromException(const IdentityException &e) {
  return createErrorResponse(statusForError(e.code()),
                             identityErrorName(e.code()), e.what());
}

HttpResponsePtr createOptionsResponse() {
  auto resp = HttpResponse::newHttpResponse();
  resp->setStatusCode(k200OK);
  addCorsHeaders(resp);
  resp->addHeader("Access-Control-Max-Age", "3600");
  return resp;
}

bool parseJsonBody(const HttpRequestPtr &req, Json::Value &json,
                   std::string &error) {
  std::string body(req->getBody());
  if (body.empty()) {
    error = "Request body must be valid JSON";
    return false;
  }

  Json::CharReaderBuilder builder;
  std::istringstream stream(body);
  std::string errors;
  if (!Json::parseFromStream(builder, stream, &json, &errors)) {
    error = "Request body must be valid JSON: " + errors;
    return false;
  }

  if (!json.isObject()) {
    error = "Request body must be a JSON object";
    return false;
  }
  return true;
}

bool getBoolParameter(const HttpRequestPtr &req, const std::string &name,
                      bool defaultValue) {
  std::string value = req->getParameter(name);
  if (value.empty()) {
    return defaultValue;
  }
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return value == "true" || value == "1" || value == "yes";
}

} // namespace ApiResponse
