#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

using namespace drogon;

class IdentityRegistry;
class MatchingEngine;
class IClock;
struct MatchResult;

/**
 * @brief Authentication endpoint handler
 *
 * Endpoint: POST /v1/authenticate
 * Body: {"vector": [...], "tolerance": 0.6, "record_match": true,
 *        "max_candidates": 5, "timeout_ms": 0}
 * Returns: match decision with ranking; an accepted match is recorded on the
 * identity unless record_match is false
 */
class AuthenticationHandler
    : public drogon::HttpController<AuthenticationHandler> {
public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(AuthenticationHandler::authenticate, "/v1/authenticate", Post);
  ADD_METHOD_TO(AuthenticationHandler::handleOptions, "/v1/authenticate",
                Options);
  METHOD_LIST_END

  /**
   * @brief Handle POST /v1/authenticate
   */
  void authenticate(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Handle OPTIONS request for CORS preflight
   */
  void handleOptions(const HttpRequestPtr &req,
                     std::function<void(const HttpResponsePtr &)> &&callback);

  static void setIdentityRegistry(IdentityRegistry *registry);
  static void setMatchingEngine(MatchingEngine *engine);
  static void setClock(const IClock *clock);

  /**
   * @brief Defaults applied when the request omits them
   * @param maxCandidates Ranking length
   * @param timeoutMs Evaluation deadline (0 = none)
   */
  static void setDefaults(size_t maxCandidates, int timeoutMs);

  /**
   * @brief Convert MatchResult to JSON
   * Non-finite scores (empty registry) are written as null
   */
  static Json::Value matchResultToJson(const MatchResult &result);

private:
  static IdentityRegistry *registry_;
  static MatchingEngine *engine_;
  static const IClock *clock_;
  static size_t default_max_candidates_;
  static int default_timeout_ms_;
};
