#pragma once

#include "identity/identity_store.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Identity Storage
 * Persists identities as one <identity_id>.json file per record
 */
class IdentityStorage : public IIdentityStore {
public:
  /**
   * @brief Constructor
   * @param storageDir Directory to store identity files
   * @param dimension Embedding dimension enforced on load
   */
  IdentityStorage(const std::string &storageDir, size_t dimension);

  /**
   * @brief Load all identities in file name order
   * @throws IdentityException (MalformedRecord, DimensionMismatch) naming the
   * first bad file
   */
  std::vector<IdentityRecord> loadAll() override;

  /**
   * @brief Save a record through a temporary file renamed over the target
   * @return true if successful
   */
  bool saveRecord(const IdentityRecord &record) override;

  /**
   * @brief Delete an identity file
   * @return true if the file is gone (including when it never existed)
   */
  bool deleteRecord(const std::string &identityId) override;

  /**
   * @brief Load a single identity file
   * @param identityId Identity ID
   * @param error Optional error message output
   * @return IdentityRecord if found and valid, nullopt otherwise
   */
  std::optional<IdentityRecord> loadRecord(const std::string &identityId,
                                           std::string *error = nullptr) const;

  /**
   * @brief Check if identity file exists
   */
  bool recordFileExists(const std::string &identityId) const;

  const std::string &getStorageDir() const { return storage_dir_; }

private:
  std::string storage_dir_;
  size_t dimension_;

  std::string getRecordFilePath(const std::string &identityId) const;

  /**
   * @brief Ensure storage directory exists (with fallback if needed)
   */
  void ensureStorageDir();
};
