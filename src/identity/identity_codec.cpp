#include "identity/identity_codec.h"
#include "core/timestamp_utils.h"
#include "models/embedding.h"
#include <memory>
#include <sstream>

namespace IdentityCodec {

namespace {

void setError(IdentityErrorCode *code, std::string *error,
              IdentityErrorCode value, const std::string &message) {
  if (code)
    *code = value;
  if (error)
    *error = message;
}

std::optional<Timestamp> readTimestamp(const Json::Value &json,
                                       const std::string &field,
                                       std::string &error) {
  if (!json.isString()) {
    error = "Missing or invalid " + field;
    return std::nullopt;
  }
  auto ts = TimestampUtils::fromIso8601(json.asString());
  if (!ts.has_value()) {
    error = "Invalid timestamp in " + field + ": " + json.asString();
  }
  return ts;
}

} // namespace

Json::Value recordToJson(const IdentityRecord &record) {
  Json::Value json(Json::objectValue);
  json["identity_id"] = record.identityId;

  Json::Value samples(Json::arrayValue);
  for (const auto &sample : record.samples) {
    Json::Value item(Json::objectValue);
    Json::Value vector(Json::arrayValue);
    for (float v : sample.values) {
      vector.append(static_cast<double>(v));
    }
    item["vector"] = vector;
    item["captured_at"] = TimestampUtils::toIso8601(sample.capturedAt);
    item["provenance"] = sample.provenance;
    samples.append(item);
  }
  json["samples"] = samples;

  json["enrolled_at"] = TimestampUtils::toIso8601(record.enrolledAt);
  if (record.lastMatchedAt.has_value()) {
    json["last_matched_at"] =
        TimestampUtils::toIso8601(record.lastMatchedAt.value());
  } else {
    json["last_matched_at"] = Json::Value::null;
  }
  json["match_count"] = static_cast<Json::UInt64>(record.matchCount);

  return json;
}

std::optional<IdentityRecord> jsonToRecord(const Json::Value &json,
                                           size_t dimension,
                                           IdentityErrorCode *code,
                                           std::string *error) {
  const auto malformed = IdentityErrorCode::MalformedRecord;

  if (!json.isObject()) {
    setError(code, error, malformed, "Record must be a JSON object");
    return std::nullopt;
  }

  IdentityRecord record;

  if (!json.isMember("identity_id") || !json["identity_id"].isString()) {
    setError(code, error, malformed, "Missing or invalid identity_id");
    return std::nullopt;
  }
  record.identityId = json["identity_id"].asString();

  std::string message;
  if (!IdentityRecord::isValidIdentityId(record.identityId, message)) {
    setError(code, error, malformed, message);
    return std::nullopt;
  }

  if (!json.isMember("samples") || !json["samples"].isArray()) {
    setError(code, error, malformed, "Missing or invalid samples");
    return std::nullopt;
  }

  const Json::Value &samples = json["samples"];
  for (Json::ArrayIndex i = 0; i < samples.size(); ++i) {
    const Json::Value &item = samples[i];
    std::string prefix = "samples[" + std::to_string(i) + "]";
    if (!item.isObject()) {
      setError(code, error, malformed, prefix + " must be an object");
      return std::nullopt;
    }

    if (!item.isMember("vector") || !item["vector"].isArray()) {
      setError(code, error, malformed,
               "Missing or invalid " + prefix + ".vector");
      return std::nullopt;
    }

    Embedding sample;
    const Json::Value &vector = item["vector"];
    sample.values.reserve(vector.size());
    for (Json::ArrayIndex j = 0; j < vector.size(); ++j) {
      float component = 0.0f;
      if (!vector[j].isNumeric()) {
        setError(code, error, malformed,
                 prefix + ".vector[" + std::to_string(j) +
                     "] is not a number");
        return std::nullopt;
      }
      if (!toComponent(vector[j].asDouble(), component)) {
        setError(code, error, malformed,
                 prefix + ".vector[" + std::to_string(j) +
                     "] is outside the float range");
        return std::nullopt;
      }
      sample.values.push_back(component);
    }

    auto capturedAt =
        readTimestamp(item["captured_at"], prefix + ".captured_at", message);
    if (!capturedAt.has_value()) {
      setError(code, error, malformed, message);
      return std::nullopt;
    }
    sample.capturedAt = capturedAt.value();

    if (item.isMember("provenance")) {
      if (!item["provenance"].isString()) {
        setError(code, error, malformed, "Invalid " + prefix + ".provenance");
        return std::nullopt;
      }
      sample.provenance = item["provenance"].asString();
    }

    record.samples.push_back(std::move(sample));
  }

  auto enrolledAt = readTimestamp(json["enrolled_at"], "enrolled_at", message);
  if (!enrolledAt.has_value()) {
    setError(code, error, malformed, message);
    return std::nullopt;
  }
  record.enrolledAt = enrolledAt.value();

  if (json.isMember("last_matched_at") && !json["last_matched_at"].isNull()) {
    auto lastMatchedAt =
        readTimestamp(json["last_matched_at"], "last_matched_at", message);
    if (!lastMatchedAt.has_value()) {
      setError(code, error, malformed, message);
      return std::nullopt;
    }
    record.lastMatchedAt = lastMatchedAt;
  }

  if (!json.isMember("match_count") || !json["match_count"].isUInt64()) {
    setError(code, error, malformed, "Missing or invalid match_count");
    return std::nullopt;
  }
  record.matchCount = json["match_count"].asUInt64();

  IdentityErrorCode validationCode;
  if (!record.validate(dimension, validationCode, message)) {
    // Only a dimension conflict keeps its own code; everything else is drift
    setError(code, error,
             validationCode == IdentityErrorCode::DimensionMismatch
                 ? IdentityErrorCode::DimensionMismatch
                 : malformed,
             message);
    return std::nullopt;
  }

  return record;
}

Json::Value summaryToJson(const IdentitySummary &summary) {
  Json::Value json(Json::objectValue);
  json["identity_id"] = summary.identityId;
  json["sample_count"] = static_cast<Json::UInt64>(summary.sampleCount);
  json["enrolled_at"] = TimestampUtils::toIso8601(summary.enrolledAt);
  if (summary.lastMatchedAt.has_value()) {
    json["last_matched_at"] =
        TimestampUtils::toIso8601(summary.lastMatchedAt.value());
  } else {
    json["last_matched_at"] = Json::Value::null;
  }
  json["match_count"] = static_cast<Json::UInt64>(summary.matchCount);
  return json;
}

std::string toJsonString(const Json::Value &json, bool pretty) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "    " : "";
  builder["precision"] = 17;
  builder["precisionType"] = "significant";
  return Json::writeString(builder, json);
}

bool parseJsonString(const std::string &text, Json::Value &json,
                     std::string *error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::istringstream stream(text);
  std::string errors;
  if (!Json::parseFromStream(builder, stream, &json, &errors)) {
    if (error)
      *error = errors;
    return false;
  }
  return true;
}

} // namespace IdentityCodec
