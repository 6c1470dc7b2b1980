#include "identity/identity_storage.h"
#include "core/env_config.h"
#include "identity/identity_codec.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <plog/Log.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool readFile(const fs::path &path, std::string &content) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

} // namespace

IdentityStorage::IdentityStorage(const std::string &storageDir,
                                 size_t dimension)
    : storage_dir_(storageDir), dimension_(dimension) {
  ensureStorageDir();
}

void IdentityStorage::ensureStorageDir() {
  fs::path path(storage_dir_);
  std::string subdir = path.filename().string();
  if (subdir.empty()) {
    subdir = "identities";
  }

  std::string resolved_dir = EnvConfig::resolveDirectory(storage_dir_, subdir);
  if (resolved_dir != storage_dir_) {
    PLOG_WARNING << "[IdentityStorage] Storage directory changed from "
                 << storage_dir_ << " to " << resolved_dir << " (fallback)";
    storage_dir_ = resolved_dir;
  }
}

std::string
IdentityStorage::getRecordFilePath(const std::string &identityId) const {
  return storage_dir_ + "/" + identityId + ".json";
}

bool IdentityStorage::saveRecord(const IdentityRecord &record) {
  std::string error;
  if (!IdentityRecord::isValidIdentityId(record.identityId, error)) {
    PLOG_ERROR << "[IdentityStorage] Refusing to save record: " << error;
    return false;
  }

  const std::string filepath = getRecordFilePath(record.identityId);
  const std::string tmppath =
      filepath + ".tmp." + std::to_string(static_cast<long>(::getpid()));

  {
    std::ofstream file(tmppath, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      PLOG_ERROR << "[IdentityStorage] Failed to open file for writing: "
                 << tmppath;
      return false;
    }
    file << IdentityCodec::toJsonString(IdentityCodec::recordToJson(record));
    file.flush();
    if (!file.good()) {
      PLOG_ERROR << "[IdentityStorage] Failed to write file: " << tmppath;
      file.close();
      std::error_code ec;
      fs::remove(tmppath, ec);
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmppath, filepath, ec);
  if (ec) {
    PLOG_ERROR << "[IdentityStorage] Failed to replace " << filepath << ": "
               << ec.message();
    fs::remove(tmppath, ec);
    return false;
  }

  PLOG_DEBUG << "[IdentityStorage] Saved identity: " << record.identityId
             << " (" << record.samples.size() << " samples)";
  return true;
}

std::optional<IdentityRecord>
IdentityStorage::loadRecord(const std::string &identityId,
                            std::string *error) const {
  std::string message;
  if (!IdentityRecord::isValidIdentityId(identityId, message)) {
    if (error)
      *error = message;
    return std::nullopt;
  }

  std::string content;
  if (!readFile(getRecordFilePath(identityId), content)) {
    if (error)
      *error = "Identity file not found: " + identityId;
    return std::nullopt;
  }

  Json::Value json;
  if (!IdentityCodec::parseJsonString(content, json, error)) {
    return std::nullopt;
  }

  auto record = IdentityCodec::jsonToRecord(json, dimension_, nullptr, error);
  if (record.has_value() && record->identityId != identityId) {
    if (error)
      *error = "File name does not match identity_id '" +
               record->identityId + "'";
    return std::nullopt;
  }
  return record;
}

std::vector<IdentityRecord> IdentityStorage::loadAll() {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(storage_dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file() && it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw IdentityException(IdentityErrorCode::StorageFailure,
                            "Cannot read storage directory " + storage_dir_ +
                                ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  std::vector<IdentityRecord> records;
  records.reserve(files.size());
  for (const auto &path : files) {
    const std::string filename = path.filename().string();

    std::string content;
    if (!readFile(path, content)) {
      throw IdentityException(IdentityErrorCode::StorageFailure,
                              "Cannot open identity file " + filename);
    }

    Json::Value json;
    std::string error;
    if (!IdentityCodec::parseJsonString(content, json, &error)) {
      throw IdentityException(IdentityErrorCode::MalformedRecord,
                              filename + ": " + error);
    }

    IdentityErrorCode code = IdentityErrorCode::MalformedRecord;
    auto record = IdentityCodec::jsonToRecord(json, dimension_, &code, &error);
    if (!record.has_value()) {
      throw IdentityException(code, filename + ": " + error);
    }

    if (record->identityId != path.stem().string()) {
      throw IdentityException(IdentityErrorCode::MalformedRecord,
                              filename + ": identity_id '" +
                                  record->identityId +
                                  "' does not match file name");
    }

    records.push_back(std::move(record.value()));
  }

  PLOG_INFO << "[IdentityStorage] Loaded " << records.size()
            << " identities from " << storage_dir_;
  return records;
}

bool IdentityStorage::deleteRecord(const std::string &identityId) {
  std::string error;
  if (!IdentityRecord::isValidIdentityId(identityId, error)) {
    PLOG_ERROR << "[IdentityStorage] Refusing to delete record: " << error;
    return false;
  }

  std::error_code ec;
  fs::remove(getRecordFilePath(identityId), ec);
  if (ec) {
    PLOG_ERROR << "[IdentityStorage] Failed to delete identity " << identityId
               << ": " << ec.message();
    return false;
  }

  PLOG_DEBUG << "[IdentityStorage] Deleted identity file: " << identityId;
  return true;
}

bool IdentityStorage::recordFileExists(const std::string &identityId) const {
  return fs::exists(getRecordFilePath(identityId));
}
