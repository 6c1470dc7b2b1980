#include "identity/identity_registry.h"
#include <cmath>
#include <plog/Log.h>

namespace {

void checkThreshold(double threshold) {
  if (!std::isfinite(threshold) || threshold < 0.0) {
    throw IdentityException(IdentityErrorCode::InvalidValue,
                            "Threshold must be a finite non-negative number");
  }
}

} // namespace

IdentityRegistry::IdentityRegistry(size_t dimension, double threshold,
                                   std::shared_ptr<IIdentityStore> store)
    : dimension_(dimension), store_(std::move(store)), threshold_(threshold),
      records_(std::make_shared<const RecordMap>()) {
  if (dimension_ == 0) {
    throw IdentityException(IdentityErrorCode::InvalidValue,
                            "Embedding dimension must be positive");
  }
  checkThreshold(threshold);
}

size_t IdentityRegistry::loadFromStore() {
  if (!store_) {
    return 0;
  }

  std::lock_guard<std::mutex> writeLock(write_mutex_);

  std::vector<IdentityRecord> loaded = store_->loadAll();

  auto records = std::make_shared<RecordMap>();
  for (auto &record : loaded) {
    IdentityErrorCode code;
    std::string error;
    if (!record.validate(dimension_, code, error)) {
      throw IdentityException(
          code == IdentityErrorCode::DimensionMismatch
              ? code
              : IdentityErrorCode::MalformedRecord,
          error);
    }
    std::string id = record.identityId;
    if (records->count(id) > 0) {
      throw IdentityException(IdentityErrorCode::MalformedRecord,
                              "Duplicate identity in store: " + id);
    }
    (*records)[id] = std::make_shared<const IdentityRecord>(std::move(record));
  }

  size_t count = records->size();
  publish(std::move(records));

  PLOG_INFO << "[Registry] Hydrated " << count << " identities (dimension "
            << dimension_ << ")";
  return count;
}

double IdentityRegistry::getThreshold() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return threshold_;
}

void IdentityRegistry::setThreshold(double threshold) {
  checkThreshold(threshold);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  threshold_ = threshold;
}

IdentityRegistry::Snapshot IdentityRegistry::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  Snapshot snap;
  snap.dimension = dimension_;
  snap.threshold = threshold_;
  snap.records = records_;
  return snap;
}

std::shared_ptr<const IdentityRegistry::RecordMap>
IdentityRegistry::currentRecords() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_;
}

void IdentityRegistry::publish(std::shared_ptr<const RecordMap> records) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  records_ = std::move(records);
}

void IdentityRegistry::validateRecord(const IdentityRecord &record) const {
  IdentityErrorCode code;
  std::string error;
  if (!record.validate(dimension_, code, error)) {
    throw IdentityException(code, error);
  }
}

void IdentityRegistry::persist(const IdentityRecord &record) {
  if (store_ && !store_->saveRecord(record)) {
    PLOG_ERROR << "[Registry] Store rejected identity " << record.identityId;
    throw IdentityException(IdentityErrorCode::StorageFailure,
                            "Failed to persist identity '" +
                                record.identityId + "'");
  }
}

void IdentityRegistry::insert(const IdentityRecord &record, bool overwrite) {
  validateRecord(record);

  std::lock_guard<std::mutex> writeLock(write_mutex_);
  auto current = currentRecords();

  bool exists = current->count(record.identityId) > 0;
  if (exists && !overwrite) {
    throw IdentityException(IdentityErrorCode::DuplicateIdentity,
                            "Identity '" + record.identityId +
                                "' already exists");
  }

  persist(record);

  auto next = std::make_shared<RecordMap>(*current);
  (*next)[record.identityId] = std::make_shared<const IdentityRecord>(record);
  publish(std::move(next));

  PLOG_INFO << "[Registry] " << (exists ? "Replaced" : "Inserted")
            << " identity " << record.identityId << " ("
            << record.samples.size() << " samples)";
}

IdentityRecord IdentityRegistry::update(const std::string &identityId,
                                        const RecordMutator &mutator) {
  std::lock_guard<std::mutex> writeLock(write_mutex_);
  auto current = currentRecords();

  auto it = current->find(identityId);
  const IdentityRecord *existing =
      it != current->end() ? it->second.get() : nullptr;

  IdentityRecord updated = mutator(existing);
  if (updated.identityId != identityId) {
    throw IdentityException(IdentityErrorCode::InvalidIdentity,
                            "Update cannot change identity_id '" + identityId +
                                "'");
  }
  validateRecord(updated);

  persist(updated);

  auto next = std::make_shared<RecordMap>(*current);
  (*next)[identityId] = std::make_shared<const IdentityRecord>(updated);
  publish(std::move(next));

  return updated;
}

IdentityRecord
IdentityRegistry::appendSamples(const std::string &identityId,
                                const std::vector<Embedding> &samples) {
  IdentityRecord record =
      update(identityId, [&](const IdentityRecord *existing) {
        if (!existing) {
          throw IdentityException(IdentityErrorCode::UnknownIdentity,
                                  "Identity '" + identityId + "' not found");
        }
        IdentityRecord next = *existing;
        next.samples.insert(next.samples.end(), samples.begin(),
                            samples.end());
        return next;
      });

  PLOG_INFO << "[Registry] Appended " << samples.size()
            << " samples to identity " << identityId << " (now "
            << record.samples.size() << ")";
  return record;
}

IdentityRecord
IdentityRegistry::recordSuccessfulMatch(const std::string &identityId,
                                        Timestamp at) {
  return update(identityId, [&](const IdentityRecord *existing) {
    if (!existing) {
      throw IdentityException(IdentityErrorCode::UnknownIdentity,
                              "Identity '" + identityId + "' not found");
    }
    IdentityRecord next = *existing;
    next.lastMatchedAt = at;
    next.matchCount += 1;
    return next;
  });
}

void IdentityRegistry::remove(const std::string &identityId) {
  std::lock_guard<std::mutex> writeLock(write_mutex_);
  auto current = currentRecords();

  if (current->count(identityId) == 0) {
    throw IdentityException(IdentityErrorCode::UnknownIdentity,
                            "Identity '" + identityId + "' not found");
  }

  if (store_ && !store_->deleteRecord(identityId)) {
    PLOG_ERROR << "[Registry] Store failed to delete identity " << identityId;
    throw IdentityException(IdentityErrorCode::StorageFailure,
                            "Failed to delete identity '" + identityId + "'");
  }

  auto next = std::make_shared<RecordMap>(*current);
  next->erase(identityId);
  publish(std::move(next));

  PLOG_INFO << "[Registry] Removed identity " << identityId;
}

std::optional<IdentityRecord>
IdentityRegistry::getRecord(const std::string &identityId) const {
  auto current = currentRecords();
  auto it = current->find(identityId);
  if (it == current->end()) {
    return std::nullopt;
  }
  return *it->second;
}

bool IdentityRegistry::contains(const std::string &identityId) const {
  return currentRecords()->count(identityId) > 0;
}

size_t IdentityRegistry::size() const { return currentRecords()->size(); }

std::vector<IdentitySummary> IdentityRegistry::list() const {
  auto current = currentRecords();

  std::vector<IdentitySummary> result;
  result.reserve(current->size());
  for (const auto &[id, record] : *current) {
    IdentitySummary summary;
    summary.identityId = id;
    summary.sampleCount = record->samples.size();
    summary.enrolledAt = record->enrolledAt;
    summary.lastMatchedAt = record->lastMatchedAt;
    summary.matchCount = record->matchCount;
    result.push_back(summary);
  }
  return result;
}
