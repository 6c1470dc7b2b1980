#pragma once

#include "identity/identity_store.h"
#include "models/identity_record.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief Identity Registry
 *
 * In-memory collection of identity records keyed by identity ID and
 * iterated in lexicographic order.
 *
 * The registry publishes an immutable snapshot: a map of shared immutable
 * records that is replaced as a whole on every mutation. Readers copy the
 * snapshot pointer under a brief shared lock and never wait for the store.
 * Writers are serialized by a writer lock held across the store call; the
 * new map is only published once the store has accepted the change, so a
 * failed write leaves the registry untouched.
 */
class IdentityRegistry {
public:
  using RecordPtr = std::shared_ptr<const IdentityRecord>;
  using RecordMap = std::map<std::string, RecordPtr>;

  /**
   * @brief Immutable view of the registry at one point in time
   */
  struct Snapshot {
    size_t dimension = 0;
    double threshold = 0.0;
    std::shared_ptr<const RecordMap> records;

    size_t size() const { return records ? records->size() : 0; }
  };

  /**
   * @brief Builds a new record from the current one (nullptr when absent)
   */
  using RecordMutator =
      std::function<IdentityRecord(const IdentityRecord *existing)>;

  /**
   * @brief Constructor
   * @param dimension Fixed embedding dimension of every member sample
   * @param threshold Default decision tolerance
   * @param store Persistence collaborator (nullptr for a memory-only
   * registry)
   * @throws IdentityException (InvalidValue) on zero dimension or a negative
   * threshold
   */
  IdentityRegistry(size_t dimension, double threshold = 0.6,
                   std::shared_ptr<IIdentityStore> store = nullptr);

  /**
   * @brief Replace the registry content with every record of the store
   * @return Number of records loaded
   * @throws IdentityException (MalformedRecord, DimensionMismatch) if any
   * persisted record is invalid; the registry is left unchanged
   */
  size_t loadFromStore();

  size_t getDimension() const { return dimension_; }

  double getThreshold() const;

  /**
   * @brief Change the default tolerance
   * @throws IdentityException (InvalidValue) if negative or not finite
   */
  void setThreshold(double threshold);

  /**
   * @brief Current published snapshot
   */
  Snapshot snapshot() const;

  /**
   * @brief Insert a validated record
   * @param overwrite Replace an existing record with the same ID
   * @throws IdentityException (DuplicateIdentity, InvalidIdentity,
   * InsufficientSamples, DimensionMismatch, InvalidValue, StorageFailure)
   */
  void insert(const IdentityRecord &record, bool overwrite = false);

  /**
   * @brief Atomically read-modify-write one record
   *
   * The mutator runs under the writer lock; its result is validated,
   * persisted and published. Exceptions thrown by the mutator propagate and
   * leave the registry unchanged.
   *
   * @return The published record
   */
  IdentityRecord update(const std::string &identityId,
                        const RecordMutator &mutator);

  /**
   * @brief Append samples to an existing record, keeping its counters
   * @throws IdentityException (UnknownIdentity, DimensionMismatch,
   * InvalidValue, StorageFailure)
   */
  IdentityRecord appendSamples(const std::string &identityId,
                               const std::vector<Embedding> &samples);

  /**
   * @brief Post-match callback: set last_matched_at and increment
   * match_count
   * @throws IdentityException (UnknownIdentity, StorageFailure)
   */
  IdentityRecord recordSuccessfulMatch(const std::string &identityId,
                                       Timestamp at);

  /**
   * @brief Remove a record
   * @throws IdentityException (UnknownIdentity, StorageFailure)
   */
  void remove(const std::string &identityId);

  std::optional<IdentityRecord> getRecord(const std::string &identityId) const;

  bool contains(const std::string &identityId) const;

  size_t size() const;

  /**
   * @brief Summaries of all records in identity ID order
   */
  std::vector<IdentitySummary> list() const;

private:
  std::shared_ptr<const RecordMap> currentRecords() const;
  void publish(std::shared_ptr<const RecordMap> records);
  void validateRecord(const IdentityRecord &record) const;
  void persist(const IdentityRecord &record);

  const size_t dimension_;
  std::shared_ptr<IIdentityStore> store_;

  std::mutex write_mutex_;
  mutable std::shared_mutex mutex_;
  double threshold_;
  std::shared_ptr<const RecordMap> records_;
};
