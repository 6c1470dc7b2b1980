#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>
#include <vector>

using namespace drogon;

class IdentityRegistry;
class EnrollmentPipeline;
class IdentityTransfer;
struct SampleCandidate;

/**
 * @brief Identity management endpoints handler
 *
 * Endpoints:
 * - POST /v1/identities - Enroll a new identity
 * - GET /v1/identities - List identities
 * - GET /v1/identities/{identityId}/export - Export one identity envelope
 * - POST /v1/identities/{identityId}/samples - Append samples
 * - DELETE /v1/identities/{identityId} - Delete an identity
 * - POST /v1/identities/import - Import (?overwrite=true) or merge
 *   (?merge=true) an exported envelope
 */
class IdentityHandler : public drogon::HttpController<IdentityHandler> {
public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(IdentityHandler::enrollIdentity, "/v1/identities", Post);
  ADD_METHOD_TO(IdentityHandler::listIdentities, "/v1/identities", Get);
  ADD_METHOD_TO(IdentityHandler::importIdentity, "/v1/identities/import",
                Post);
  ADD_METHOD_TO(IdentityHandler::exportIdentity,
                "/v1/identities/{identityId}/export", Get);
  ADD_METHOD_TO(IdentityHandler::appendSamples,
                "/v1/identities/{identityId}/samples", Post);
  ADD_METHOD_TO(IdentityHandler::deleteIdentity, "/v1/identities/{identityId}",
                Delete);
  ADD_METHOD_TO(IdentityHandler::handleOptions, "/v1/identities", Options);
  ADD_METHOD_TO(IdentityHandler::handleOptions, "/v1/identities/import",
                Options);
  ADD_METHOD_TO(IdentityHandler::handleOptions, "/v1/identities/{identityId}",
                Options);
  ADD_METHOD_TO(IdentityHandler::handleOptions,
                "/v1/identities/{identityId}/export", Options);
  ADD_METHOD_TO(IdentityHandler::handleOptions,
                "/v1/identities/{identityId}/samples", Options);
  METHOD_LIST_END

  /**
   * @brief Handle POST /v1/identities
   *
   * Body: {"identity_id": "...", "samples": [{"vector": [...],
   * "captured_at": "...", "provenance": "..."}],
   * "minimum_accepted_samples": 1}
   */
  void enrollIdentity(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle GET /v1/identities
   */
  void listIdentities(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle GET /v1/identities/{identityId}/export
   */
  void exportIdentity(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle POST /v1/identities/{identityId}/samples
   *
   * Body: {"samples": [...]} in the enrollment sample format
   */
  void appendSamples(const HttpRequestPtr &req,
                     std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle DELETE /v1/identities/{identityId}
   */
  void deleteIdentity(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle POST /v1/identities/import
   *
   * Body: export envelope. Query: overwrite=true replaces an existing
   * identity, merge=true merges into it.
   */
  void importIdentity(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle OPTIONS request for CORS preflight
   */
  void handleOptions(const HttpRequestPtr &req,
                     std::function<void(const HttpResponsePtr &)> &&callback);

  static void setIdentityRegistry(IdentityRegistry *registry);
  static void setEnrollmentPipeline(EnrollmentPipeline *pipeline);
  static void setIdentityTransfer(IdentityTransfer *transfer);
  static void setMinimumAcceptedSamples(size_t minimum);

private:
  static IdentityRegistry *registry_;
  static EnrollmentPipeline *pipeline_;
  static IdentityTransfer *transfer_;
  static size_t minimum_accepted_samples_;

  /**
   * @brief Extract identity ID from request path
   */
  std::string extractIdentityId(const HttpRequestPtr &req) const;

  /**
   * @brief Parse the "samples" array of a request body
   * @return false with error set if the array is missing or a sample is not
   * an object
   */
  bool parseSamples(const Json::Value &body,
                    std::vector<SampleCandidate> &candidates,
                    std::string &error) const;
};
