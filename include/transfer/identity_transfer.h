#pragma once

#include "core/clock.h"
#include "identity/identity_registry.h"
#include <json/json.h>
#include <string>
#include <vector>

/**
 * @brief Identity Transfer
 *
 * Moves single identity records between registries through a versioned
 * JSON envelope:
 *   {"identity_id": ..., "record": {...}, "exported_at": ...,
 *    "format_version": "1.0"}
 *
 * Every import is fully parsed and validated before the registry is
 * touched.
 */
class IdentityTransfer {
public:
  static constexpr const char *kFormatVersion = "1.0";

  IdentityTransfer(IdentityRegistry &registry, const IClock &clock);

  /**
   * @brief Export one identity with full sample history and counters
   * @throws IdentityException (UnknownIdentity)
   */
  Json::Value exportRecord(const std::string &identityId) const;

  std::string exportRecordToString(const std::string &identityId) const;

  /**
   * @brief Import one envelope
   * @param overwrite Replace an existing identity atomically
   * @throws IdentityException (MalformedRecord, DimensionMismatch,
   * DuplicateIdentity, StorageFailure)
   */
  IdentityRecord importRecord(const Json::Value &envelope, bool overwrite);

  IdentityRecord importRecordFromString(const std::string &text,
                                        bool overwrite);

  /**
   * @brief Merge one envelope into the registry
   *
   * Inserts when absent. Otherwise appends the imported samples not already
   * present, keeps the earliest enrolled_at and the latest last_matched_at
   * and sums match_count.
   *
   * @throws IdentityException (MalformedRecord, DimensionMismatch,
   * StorageFailure)
   */
  IdentityRecord mergeRecord(const Json::Value &envelope);

  IdentityRecord mergeRecordFromString(const std::string &text);

  /**
   * @brief Delete one identity
   * @throws IdentityException (UnknownIdentity, StorageFailure)
   */
  void removeRecord(const std::string &identityId);

  std::vector<IdentitySummary> list() const;

  /**
   * @brief Decode and validate an envelope without touching the registry
   * @throws IdentityException (MalformedRecord, DimensionMismatch)
   */
  IdentityRecord parseEnvelope(const Json::Value &envelope) const;

  /**
   * @brief Combine an existing record with an imported copy
   */
  static IdentityRecord mergeRecords(const IdentityRecord &existing,
                                     const IdentityRecord &incoming);

private:
  IdentityRegistry &registry_;
  const IClock &clock_;
};
