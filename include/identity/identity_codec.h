#pragma once

#include "core/identity_error.h"
#include "models/identity_record.h"
#include <json/json.h>
#include <optional>
#include <string>

/**
 * @brief JSON layout of identity records
 *
 * Shared by the file store, the transfer envelope and the REST layer.
 * Vector components are written with 17 significant digits so that the
 * float -> text -> float trip is exact.
 */
namespace IdentityCodec {

/**
 * @brief Convert IdentityRecord to JSON
 */
Json::Value recordToJson(const IdentityRecord &record);

/**
 * @brief Convert JSON to IdentityRecord
 * @param json JSON value
 * @param dimension Expected dimension of every sample
 * @param code Optional error code output (MalformedRecord or
 * DimensionMismatch)
 * @param error Optional error message output
 * @return IdentityRecord if valid, nullopt otherwise
 */
std::optional<IdentityRecord> jsonToRecord(const Json::Value &json,
                                           size_t dimension,
                                           IdentityErrorCode *code = nullptr,
                                           std::string *error = nullptr);

/**
 * @brief Convert IdentitySummary to JSON
 */
Json::Value summaryToJson(const IdentitySummary &summary);

/**
 * @brief Serialize JSON with float-exact precision
 * @param pretty Indent output (storage files) or emit a single line
 */
std::string toJsonString(const Json::Value &json, bool pretty = true);

/**
 * @brief Parse a JSON document
 * @return true on success, error receives the parser message otherwise
 */
bool parseJsonString(const std::string &text, Json::Value &json,
                     std::string *error = nullptr);

} // namespace IdentityCodec
