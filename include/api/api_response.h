#pragma once

#include "core/identity_error.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>

/**
 * @brief Response helpers shared by the REST handlers
 *
 * Every response carries "allow all" CORS headers. Error bodies are
 * {"error": <code name>, "message": <detail>}.
 */
namespace ApiResponse {

/**
 * @brief Add CORS headers with "allow all" to response
 */
void addCorsHeaders(const drogon::HttpResponsePtr &resp);

/**
 * @brief JSON response with CORS headers
 */
drogon::HttpResponsePtr createSuccessResponse(const Json::Value &data,
                                              int statusCode = 200);

/**
 * @brief JSON error response with CORS headers
 */
drogon::HttpResponsePtr createErrorResponse(int statusCode,
                                            const std::string &error,
                                            const std::string &message = "");

/**
 * @brief HTTP status of an engine error code
 *
 * 400 for input errors, 404 UnknownIdentity, 409 DuplicateIdentity,
 * 422 InsufficientSamples, 502 ExtractionFailed, 500 StorageFailure
 */
int statusForError(IdentityErrorCode code);

/**
 * @brief Error response for an engine exception
 */
drogon::HttpResponsePtr fromException(const IdentityException &e);

/**
 * @brief Create OPTIONS preflight response
 */
drogon::HttpResponsePtr createOptionsResponse();

/**
 * @brief Parse the request body as a JSON object
 * @return false with error set when the body is empty, unparsable or not an
 * object
 */
bool parseJsonBody(const drogon::HttpRequestPtr &req, Json::Value &json,
                   std::string &error);

/**
 * @brief Read a boolean query parameter ("true"/"1"/"yes")
 */
bool getBoolParameter(const drogon::HttpRequestPtr &req,
                      const std::string &name, bool defaultValue = false);

} // namespace ApiResponse
