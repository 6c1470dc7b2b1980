#pragma once

#include "models/identity_record.h"
#include <string>
#include <vector>

/**
 * @brief Identity Store Interface
 *
 * Persistence collaborator of the identity registry. Implementations must
 * preserve vector values bit for bit, sample order and all counters.
 */
class IIdentityStore {
public:
  virtual ~IIdentityStore() = default;

  /**
   * @brief Load every persisted record
   * @throws IdentityException (MalformedRecord, DimensionMismatch) on the
   * first bad record
   */
  virtual std::vector<IdentityRecord> loadAll() = 0;

  /**
   * @brief Create or replace the persisted copy of a record
   * @return true if the record is durable
   */
  virtual bool saveRecord(const IdentityRecord &record) = 0;

  /**
   * @brief Remove the persisted copy of a record
   * @return true if the record is gone from the store
   */
  virtual bool deleteRecord(const std::string &identityId) = 0;
};
