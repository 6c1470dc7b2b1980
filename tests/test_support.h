#pragma once

#include "core/clock.h"
#include "identity/identity_store.h"
#include "models/identity_record.h"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp(std::chrono::seconds(1760000000)))
        : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::nanoseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<Timestamp::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

/**
 * @brief In-memory store with switchable write failures
 */
class FakeIdentityStore : public IIdentityStore {
public:
    std::vector<IdentityRecord> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<IdentityRecord> result;
        for (const auto& [id, record] : records_) {
            result.push_back(record);
        }
        return result;
    }

    bool saveRecord(const IdentityRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++save_calls_;
        if (fail_writes_) {
            return false;
        }
        records_[record.identityId] = record;
        return true;
    }

    bool deleteRecord(const std::string& identityId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) {
            return false;
        }
        records_.erase(identityId);
        return true;
    }

    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    void put(const IdentityRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[record.identityId] = record;
    }

    bool has(const std::string& identityId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.count(identityId) > 0;
    }

    int saveCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_calls_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, IdentityRecord> records_;
    bool fail_writes_ = false;
    int save_calls_ = 0;
};

inline Timestamp testTime(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

inline Embedding testEmbedding(std::vector<float> values, int64_t seconds = 1760000000,
                               const std::string& provenance = "") {
    Embedding embedding;
    embedding.values = std::move(values);
    embedding.capturedAt = testTime(seconds);
    embedding.provenance = provenance;
    return embedding;
}

/**
 * @brief Build a record whose samples are the given vectors
 */
inline IdentityRecord testRecord(const std::string& identityId,
                                 const std::vector<std::vector<float>>& vectors,
                                 int64_t enrolledAt = 1760000000) {
    IdentityRecord record;
    record.identityId = identityId;
    int64_t offset = 0;
    for (const auto& values : vectors) {
        record.samples.push_back(testEmbedding(values, enrolledAt + offset++));
    }
    record.enrolledAt = testTime(enrolledAt);
    return record;
}
