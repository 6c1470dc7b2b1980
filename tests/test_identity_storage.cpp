#include <gtest/gtest.h>
#include "identity/identity_codec.h"
#include "identity/identity_registry.h"
#include "identity/identity_storage.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

class IdentityStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temporary directory for tests
        test_dir_ = "/tmp/face_auth_test_identities_" + std::to_string(getpid());
        std::filesystem::create_directories(test_dir_);
        storage_ = std::make_unique<IdentityStorage>(test_dir_, 3);
    }

    void TearDown() override {
        // Clean up test directory
        if (std::filesystem::exists(test_dir_)) {
            std::filesystem::remove_all(test_dir_);
        }
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream file(test_dir_ + "/" + name);
        file << content;
    }

    std::string test_dir_;
    std::unique_ptr<IdentityStorage> storage_;
};

TEST_F(IdentityStorageTest, SaveAndLoadRecord) {
    IdentityRecord record = testRecord("alice", {{0.1f, 0.2f, 0.3f}, {1.0f / 3.0f, 0.0f, -2.5f}});
    record.samples[1].provenance = "cam-2";
    record.lastMatchedAt = testTime(1760000100);
    record.matchCount = 3;

    ASSERT_TRUE(storage_->saveRecord(record));
    EXPECT_TRUE(storage_->recordFileExists("alice"));

    std::string error;
    auto loaded = storage_->loadRecord("alice", &error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(loaded.value(), record);
}

TEST_F(IdentityStorageTest, SaveLeavesNoTemporaryFiles) {
    ASSERT_TRUE(storage_->saveRecord(testRecord("alice", {{0.1f, 0.2f, 0.3f}})));
    ASSERT_TRUE(storage_->saveRecord(testRecord("alice", {{0.4f, 0.5f, 0.6f}})));

    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        EXPECT_EQ(entry.path().filename().string(), "alice.json");
        ++files;
    }
    EXPECT_EQ(files, 1);
    EXPECT_EQ(storage_->loadRecord("alice")->samples[0].values[0], 0.4f);
}

TEST_F(IdentityStorageTest, LoadAllReturnsRecordsInNameOrder) {
    storage_->saveRecord(testRecord("charlie", {{0.1f, 0.2f, 0.3f}}));
    storage_->saveRecord(testRecord("alice", {{0.1f, 0.2f, 0.3f}}));
    storage_->saveRecord(testRecord("bob", {{0.1f, 0.2f, 0.3f}}));
    writeFile("notes.txt", "not an identity");

    auto records = storage_->loadAll();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].identityId, "alice");
    EXPECT_EQ(records[1].identityId, "bob");
    EXPECT_EQ(records[2].identityId, "charlie");
}

TEST_F(IdentityStorageTest, LoadAllFailsFastOnCorruptFile) {
    storage_->saveRecord(testRecord("alice", {{0.1f, 0.2f, 0.3f}}));
    writeFile("broken.json", "{\"identity_id\": \"broken\", ");

    try {
        storage_->loadAll();
        FAIL() << "Expected MalformedRecord";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::MalformedRecord);
        EXPECT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }
}

TEST_F(IdentityStorageTest, LoadAllRejectsWrongDimension) {
    IdentityStorage wide(test_dir_, 4);
    ASSERT_TRUE(wide.saveRecord(testRecord("alice", {{0.1f, 0.2f, 0.3f, 0.4f}})));

    try {
        storage_->loadAll();
        FAIL() << "Expected DimensionMismatch";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::DimensionMismatch);
    }
}

TEST_F(IdentityStorageTest, LoadAllRejectsFileNameMismatch) {
    Json::Value json = IdentityCodec::recordToJson(testRecord("alice", {{0.1f, 0.2f, 0.3f}}));
    writeFile("mallory.json", IdentityCodec::toJsonString(json));

    try {
        storage_->loadAll();
        FAIL() << "Expected MalformedRecord";
    } catch (const IdentityException& e) {
        EXPECT_EQ(e.code(), IdentityErrorCode::MalformedRecord);
    }
    EXPECT_FALSE(storage_->loadRecord("mallory").has_value());
}

TEST_F(IdentityStorageTest, DeleteRecord) {
    storage_->saveRecord(testRecord("alice", {{0.1f, 0.2f, 0.3f}}));
    EXPECT_TRUE(storage_->deleteRecord("alice"));
    EXPECT_FALSE(storage_->recordFileExists("alice"));

    // Deleting a missing file is not an error
    EXPECT_TRUE(storage_->deleteRecord("alice"));
    EXPECT_FALSE(storage_->deleteRecord("../alice"));
}

TEST_F(IdentityStorageTest, RefusesUnsafeIdentityIds) {
    IdentityRecord record = testRecord("alice", {{0.1f, 0.2f, 0.3f}});
    record.identityId = "../escape";
    EXPECT_FALSE(storage_->saveRecord(record));

    std::string error;
    EXPECT_FALSE(storage_->loadRecord("../escape", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST_F(IdentityStorageTest, RegistryStateSurvivesRestart) {
    auto store = std::make_shared<IdentityStorage>(test_dir_, 3);
    {
        IdentityRegistry registry(3, 0.6, store);
        registry.insert(testRecord("alice", {{0.1f, 0.2f, 0.3f}}));
        registry.insert(testRecord("bob", {{0.3f, 0.2f, 0.1f}}));
        registry.recordSuccessfulMatch("alice", testTime(1760000200));
        registry.remove("bob");
    }

    IdentityRegistry restarted(3, 0.6, std::make_shared<IdentityStorage>(test_dir_, 3));
    EXPECT_EQ(restarted.loadFromStore(), 1u);
    auto alice = restarted.getRecord("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->matchCount, 1u);
    EXPECT_EQ(alice->lastMatchedAt.value(), testTime(1760000200));
    EXPECT_FALSE(restarted.contains("bob"));
}
