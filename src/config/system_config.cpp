#include "config/system_config.h"
#include "core/env_config.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

SystemConfig& SystemConfig::getInstance() {
    static SystemConfig instance;
    return instance;
}

SystemConfig::SystemConfig() : config_json_(defaultConfig()) {}

Json::Value SystemConfig::defaultConfig() {
    Json::Value config(Json::objectValue);

    Json::Value identity(Json::objectValue);
    identity["dimension"] = 128;
    identity["threshold"] = 0.6;
    identity["minimum_accepted_samples"] = 1;
    identity["max_candidates"] = 5;
    config["identity"] = identity;

    Json::Value matching(Json::objectValue);
    matching["parallel_threshold"] = 64;
    matching["max_workers"] = 4;
    matching["timeout_ms"] = 0;
    config["matching"] = matching;

    Json::Value storage(Json::objectValue);
    storage["data_dir"] = "./data/identities";
    config["storage"] = storage;

    Json::Value webServer(Json::objectValue);
    webServer["ip_address"] = "0.0.0.0";
    webServer["port"] = 3547;
    webServer["thread_num"] = 0;

    Json::Value logging(Json::objectValue);
    logging["log_dir"] = "./logs";
    logging["log_level"] = "info";
    logging["console"] = true;
    logging["max_log_files"] = 30;

    Json::Value system(Json::objectValue);
    system["web_server"] = webServer;
    system["logging"] = logging;
    config["system"] = system;

    return config;
}

bool SystemConfig::loadConfig(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_path_ = configPath;

    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[SystemConfig] Config file not found: " << configPath << std::endl;
        std::cerr << "[SystemConfig] Initializing with default configuration" << std::endl;
        config_json_ = defaultConfig();
        loaded_ = true;
        writeConfigUnlocked(configPath);
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        std::cerr << "[SystemConfig] Error: Failed to open config file: " << configPath << std::endl;
        config_json_ = defaultConfig();
        loaded_ = false;
        return false;
    }

    Json::CharReaderBuilder builder;
    Json::Value json;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &json, &errors)) {
        std::cerr << "[SystemConfig] Failed to parse config file: " << errors << std::endl;
        config_json_ = defaultConfig();
        loaded_ = false;
        return false;
    }

    std::string error;
    if (!validateConfig(json, &error)) {
        std::cerr << "[SystemConfig] Invalid config structure (" << error
                  << "), using defaults" << std::endl;
        config_json_ = defaultConfig();
        loaded_ = false;
        return false;
    }

    config_json_ = json;
    loaded_ = true;
    std::cerr << "[SystemConfig] Successfully loaded config from: " << configPath << std::endl;
    return true;
}

bool SystemConfig::saveConfig(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = configPath.empty() ? config_path_ : configPath;
    if (path.empty()) {
        std::cerr << "[SystemConfig] Error: No config path specified" << std::endl;
        return false;
    }

    if (!writeConfigUnlocked(path)) {
        return false;
    }
    if (config_path_.empty()) {
        config_path_ = path;
    }
    return true;
}

bool SystemConfig::writeConfigUnlocked(const std::string& path) {
    std::filesystem::path filePath(path);
    if (filePath.has_parent_path() &&
        !EnvConfig::tryCreateDirectory(filePath.parent_path().string())) {
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SystemConfig] Error: Failed to open file for writing: " << path << std::endl;
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(config_json_, &file);
    file << std::endl;

    if (!file.good()) {
        std::cerr << "[SystemConfig] Error: Failed to write config file: " << path << std::endl;
        return false;
    }

    std::cerr << "[SystemConfig] Successfully saved config to: " << path << std::endl;
    return true;
}

bool SystemConfig::validateConfig(const Json::Value& json, std::string* error) {
    auto fail = [error](const std::string& message) {
        if (error) *error = message;
        return false;
    };

    if (!json.isObject()) {
        return fail("configuration must be a JSON object");
    }

    for (const char* section : {"identity", "matching", "storage", "system"}) {
        if (json.isMember(section) && !json[section].isObject()) {
            return fail(std::string(section) + " must be an object");
        }
    }

    if (json.isMember("identity")) {
        const auto& identity = json["identity"];
        if (identity.isMember("dimension") &&
            (!identity["dimension"].isUInt() || identity["dimension"].asUInt() == 0)) {
            return fail("identity.dimension must be a positive integer");
        }
        if (identity.isMember("threshold") &&
            (!identity["threshold"].isNumeric() || identity["threshold"].asDouble() < 0.0)) {
            return fail("identity.threshold must be a non-negative number");
        }
        if (identity.isMember("minimum_accepted_samples") &&
            !identity["minimum_accepted_samples"].isUInt()) {
            return fail("identity.minimum_accepted_samples must be a non-negative integer");
        }
    }

    if (json.isMember("matching")) {
        const auto& matching = json["matching"];
        for (const char* key : {"parallel_threshold", "max_workers", "timeout_ms"}) {
            if (matching.isMember(key) && !matching[key].isUInt()) {
                return fail(std::string("matching.") + key + " must be a non-negative integer");
            }
        }
    }

    return true;
}

const Json::Value& SystemConfig::sectionUnlocked(const char* section) const {
    static const Json::Value empty(Json::objectValue);
    if (config_json_.isMember(section) && config_json_[section].isObject()) {
        return config_json_[section];
    }
    return empty;
}

SystemConfig::IdentityConfig SystemConfig::getIdentityConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IdentityConfig config;

    const auto& identity = sectionUnlocked("identity");
    if (identity.isMember("dimension") && identity["dimension"].isUInt()) {
        config.dimension = identity["dimension"].asUInt();
    }
    if (identity.isMember("threshold") && identity["threshold"].isNumeric()) {
        config.threshold = identity["threshold"].asDouble();
    }
    if (identity.isMember("minimum_accepted_samples") &&
        identity["minimum_accepted_samples"].isUInt()) {
        config.minimumAcceptedSamples = identity["minimum_accepted_samples"].asUInt();
    }
    if (identity.isMember("max_candidates") && identity["max_candidates"].isUInt()) {
        config.maxCandidates = identity["max_candidates"].asUInt();
    }

    config.threshold = EnvConfig::getDouble("FACE_AUTH_THRESHOLD", config.threshold, 0.0);
    return config;
}

void SystemConfig::setIdentityConfig(const IdentityConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    Json::Value identity(Json::objectValue);
    identity["dimension"] = static_cast<Json::UInt>(config.dimension);
    identity["threshold"] = config.threshold;
    identity["minimum_accepted_samples"] = static_cast<Json::UInt>(config.minimumAcceptedSamples);
    identity["max_candidates"] = static_cast<Json::UInt>(config.maxCandidates);
    config_json_["identity"] = identity;
}

SystemConfig::MatchingConfig SystemConfig::getMatchingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MatchingConfig config;

    const auto& matching = sectionUnlocked("matching");
    if (matching.isMember("parallel_threshold") && matching["parallel_threshold"].isUInt()) {
        config.parallelThreshold = matching["parallel_threshold"].asUInt();
    }
    if (matching.isMember("max_workers") && matching["max_workers"].isUInt()) {
        config.maxWorkers = matching["max_workers"].asUInt();
    }
    if (matching.isMember("timeout_ms") && matching["timeout_ms"].isInt()) {
        config.timeoutMs = matching["timeout_ms"].asInt();
    }

    return config;
}

void SystemConfig::setMatchingConfig(const MatchingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    Json::Value matching(Json::objectValue);
    matching["parallel_threshold"] = static_cast<Json::UInt>(config.parallelThreshold);
    matching["max_workers"] = static_cast<Json::UInt>(config.maxWorkers);
    matching["timeout_ms"] = config.timeoutMs;
    config_json_["matching"] = matching;
}

SystemConfig::WebServerConfig SystemConfig::getWebServerConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WebServerConfig config;

    const auto& system = sectionUnlocked("system");
    if (system.isMember("web_server") && system["web_server"].isObject()) {
        const auto& ws = system["web_server"];

        if (ws.isMember("ip_address") && ws["ip_address"].isString()) {
            config.ipAddress = ws["ip_address"].asString();
        }
        if (ws.isMember("port") && ws["port"].isInt()) {
            config.port = static_cast<uint16_t>(ws["port"].asInt());
        }
        if (ws.isMember("thread_num") && ws["thread_num"].isInt()) {
            config.threadNum = ws["thread_num"].asInt();
        }
    }

    config.port = static_cast<uint16_t>(EnvConfig::getInt("API_PORT", config.port, 1, 65535));
    config.threadNum = EnvConfig::getInt("THREAD_NUM", config.threadNum, 0, 256);
    return config;
}

void SystemConfig::setWebServerConfig(const WebServerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_json_.isMember("system")) {
        config_json_["system"] = Json::Value(Json::objectValue);
    }

    Json::Value webServer(Json::objectValue);
    webServer["ip_address"] = config.ipAddress;
    webServer["port"] = config.port;
    webServer["thread_num"] = config.threadNum;
    config_json_["system"]["web_server"] = webServer;
}

SystemConfig::LoggingConfig SystemConfig::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LoggingConfig config;

    const auto& system = sectionUnlocked("system");
    if (system.isMember("logging") && system["logging"].isObject()) {
        const auto& log = system["logging"];

        if (log.isMember("log_dir") && log["log_dir"].isString()) {
            config.logDir = log["log_dir"].asString();
        }
        if (log.isMember("log_level") && log["log_level"].isString()) {
            config.logLevel = log["log_level"].asString();
        }
        if (log.isMember("console") && log["console"].isBool()) {
            config.console = log["console"].asBool();
        }
        if (log.isMember("max_log_files") && log["max_log_files"].isInt()) {
            config.maxLogFiles = log["max_log_files"].asInt();
        }
    }

    return config;
}

void SystemConfig::setLoggingConfig(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_json_.isMember("system")) {
        config_json_["system"] = Json::Value(Json::objectValue);
    }

    Json::Value logging(Json::objectValue);
    logging["log_dir"] = config.logDir;
    logging["log_level"] = config.logLevel;
    logging["console"] = config.console;
    logging["max_log_files"] = config.maxLogFiles;
    config_json_["system"]["logging"] = logging;
}

std::string SystemConfig::getStorageDir() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& storage = sectionUnlocked("storage");
    if (storage.isMember("data_dir") && storage["data_dir"].isString() &&
        !storage["data_dir"].asString().empty()) {
        return storage["data_dir"].asString();
    }
    return "./data/identities";
}

void SystemConfig::setStorageDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_json_.isMember("storage")) {
        config_json_["storage"] = Json::Value(Json::objectValue);
    }
    config_json_["storage"]["data_dir"] = dir;
}

Json::Value SystemConfig::getConfigJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_json_;
}

Json::Value SystemConfig::getConfigSection(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Json::Value copy = config_json_;
    auto [parent, key] = parsePath(copy, path);
    if (!parent || !parent->isMember(key)) {
        return Json::Value(Json::nullValue);
    }

    return (*parent)[key];
}

bool SystemConfig::replaceConfig(const Json::Value& json) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!validateConfig(json)) {
        return false;
    }

    config_json_ = json;
    return true;
}

bool SystemConfig::updateConfigSection(const std::string& path, const Json::Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    Json::Value updated = config_json_;
    auto [parent, key] = parsePath(updated, path);
    if (!parent) {
        return false;
    }
    (*parent)[key] = value;

    std::string error;
    if (!validateConfig(updated, &error)) {
        std::cerr << "[SystemConfig] Rejected update of " << path << ": " << error << std::endl;
        return false;
    }

    config_json_ = updated;
    return true;
}

bool SystemConfig::deleteConfigSection(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [parent, key] = parsePath(config_json_, path);
    if (!parent || !parent->isMember(key)) {
        return false;
    }

    parent->removeMember(key);
    return true;
}

std::string SystemConfig::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

bool SystemConfig::reloadConfig() {
    std::string path = getConfigPath();
    if (path.empty()) {
        return false;
    }
    return loadConfig(path);
}

bool SystemConfig::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);

    config_json_ = defaultConfig();
    loaded_ = true;

    if (!config_path_.empty()) {
        return writeConfigUnlocked(config_path_);
    }
    return true;
}

bool SystemConfig::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

std::pair<Json::Value*, std::string> SystemConfig::parsePath(Json::Value& root,
                                                             const std::string& path) {
    if (path.empty()) {
        return {nullptr, ""};
    }

    // Split path by dots or forward slashes (support both formats)
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    char delimiter = (path.find('/') != std::string::npos) ? '/' : '.';

    while (std::getline(ss, item, delimiter)) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }

    if (parts.empty()) {
        return {nullptr, ""};
    }

    Json::Value* current = &root;
    for (size_t i = 0; i < parts.size() - 1; ++i) {
        if (!current->isMember(parts[i]) || !(*current)[parts[i]].isObject()) {
            return {nullptr, ""};
        }
        current = &((*current)[parts[i]]);
    }

    return {current, parts.back()};
}
