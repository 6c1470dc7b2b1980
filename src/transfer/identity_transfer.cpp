#include "transfer/identity_transfer.h"
#include "core/timestamp_utils.h"
#include "identity/identity_codec.h"
#include <algorithm>
#include <plog/Log.h>

namespace {

Json::Value parseText(const std::string &text) {
  Json::Value json;
  std::string error;
  if (!IdentityCodec::parseJsonString(text, json, &error)) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Invalid JSON: " + error);
  }
  return json;
}

} // namespace

IdentityTransfer::IdentityTransfer(IdentityRegistry &registry,
                                   const IClock &clock)
    : registry_(registry), clock_(clock) {}

Json::Value IdentityTransfer::exportRecord(const std::string &identityId) const {
  auto record = registry_.getRecord(identityId);
  if (!record.has_value()) {
    throw IdentityException(IdentityErrorCode::UnknownIdentity,
                            "Identity '" + identityId + "' not found");
  }

  Json::Value envelope(Json::objectValue);
  envelope["identity_id"] = record->identityId;
  envelope["record"] = IdentityCodec::recordToJson(record.value());
  envelope["exported_at"] = TimestampUtils::toIso8601(clock_.now());
  envelope["format_version"] = kFormatVersion;

  PLOG_INFO << "[Transfer] Exported identity " << identityId << " ("
            << record->samples.size() << " samples)";
  return envelope;
}

std::string
IdentityTransfer::exportRecordToString(const std::string &identityId) const {
  return IdentityCodec::toJsonString(exportRecord(identityId));
}

IdentityRecord
IdentityTransfer::parseEnvelope(const Json::Value &envelope) const {
  if (!envelope.isObject()) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Envelope must be a JSON object");
  }

  if (!envelope.isMember("format_version") ||
      !envelope["format_version"].isString()) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Missing or invalid format_version");
  }
  if (envelope["format_version"].asString() != kFormatVersion) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Unsupported format_version: " +
                                envelope["format_version"].asString());
  }

  if (!envelope.isMember("identity_id") ||
      !envelope["identity_id"].isString()) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Missing or invalid identity_id");
  }

  if (!envelope.isMember("record")) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Missing record");
  }

  if (envelope.isMember("exported_at") &&
      (!envelope["exported_at"].isString() ||
       !TimestampUtils::fromIso8601(envelope["exported_at"].asString()))) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Invalid exported_at");
  }

  IdentityErrorCode code = IdentityErrorCode::MalformedRecord;
  std::string error;
  auto record = IdentityCodec::jsonToRecord(
      envelope["record"], registry_.getDimension(), &code, &error);
  if (!record.has_value()) {
    throw IdentityException(code, error);
  }

  if (record->identityId != envelope["identity_id"].asString()) {
    throw IdentityException(IdentityErrorCode::MalformedRecord,
                            "Envelope identity_id '" +
                                envelope["identity_id"].asString() +
                                "' does not match record identity_id '" +
                                record->identityId + "'");
  }

  return record.value();
}

IdentityRecord IdentityTransfer::importRecord(const Json::Value &envelope,
                                              bool overwrite) {
  IdentityRecord record = parseEnvelope(envelope);
  registry_.insert(record, overwrite);

  PLOG_INFO << "[Transfer] Imported identity " << record.identityId << " ("
            << record.samples.size() << " samples"
            << (overwrite ? ", overwrite allowed)" : ")");
  return record;
}

IdentityRecord IdentityTransfer::importRecordFromString(const std::string &text,
                                                        bool overwrite) {
  return importRecord(parseText(text), overwrite);
}

IdentityRecord IdentityTransfer::mergeRecords(const IdentityRecord &existing,
                                              const IdentityRecord &incoming) {
  IdentityRecord merged = existing;

  for (const auto &sample : incoming.samples) {
    if (std::find(merged.samples.begin(), merged.samples.end(), sample) ==
        merged.samples.end()) {
      merged.samples.push_back(sample);
    }
  }

  merged.enrolledAt = std::min(existing.enrolledAt, incoming.enrolledAt);

  if (incoming.lastMatchedAt.has_value() &&
      (!merged.lastMatchedAt.has_value() ||
       incoming.lastMatchedAt.value() > merged.lastMatchedAt.value())) {
    merged.lastMatchedAt = incoming.lastMatchedAt;
  }

  merged.matchCount = existing.matchCount + incoming.matchCount;
  return merged;
}

IdentityRecord IdentityTransfer::mergeRecord(const Json::Value &envelope) {
  IdentityRecord incoming = parseEnvelope(envelope);

  bool existed = false;
  IdentityRecord merged = registry_.update(
      incoming.identityId, [&](const IdentityRecord *existing) {
        if (!existing) {
          return incoming;
        }
        existed = true;
        return mergeRecords(*existing, incoming);
      });

  PLOG_INFO << "[Transfer] " << (existed ? "Merged" : "Imported")
            << " identity " << merged.identityId << " (now "
            << merged.samples.size() << " samples)";
  return merged;
}

IdentityRecord IdentityTransfer::mergeRecordFromString(const std::string &text) {
  return mergeRecord(parseText(text));
}

void IdentityTransfer::removeRecord(const std::string &identityId) {
  registry_.remove(identityId);
}

std::vector<IdentitySummary> IdentityTransfer::list() const {
  return registry_.list();
}
