#pragma once

#include <cstdint>
#include <filesystem>
#include <json/json.h>
#include <mutex>
#include <string>
#include <utility>

/**
 * @brief System Configuration Manager
 *
 * Manages service-wide configuration loaded from config.json
 * Thread-safe singleton pattern
 *
 * Environment variables override file values in the typed getters:
 * FACE_AUTH_THRESHOLD (identity.threshold), API_PORT and THREAD_NUM
 * (system.web_server).
 */
class SystemConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static SystemConfig& getInstance();

    /**
     * @brief Load configuration from file
     * Creates the file with defaults when it does not exist.
     * @param configPath Path to config.json file
     * @return true if loaded successfully
     */
    bool loadConfig(const std::string& configPath);

    /**
     * @brief Save configuration to file
     * @param configPath Path to config.json file (optional, uses current path if empty)
     * @return true if saved successfully
     */
    bool saveConfig(const std::string& configPath = "");

    /**
     * @brief Identity registry and enrollment settings
     */
    struct IdentityConfig {
        size_t dimension = 128;
        double threshold = 0.6;
        size_t minimumAcceptedSamples = 1;
        size_t maxCandidates = 5;
    };
    IdentityConfig getIdentityConfig() const;
    void setIdentityConfig(const IdentityConfig& config);

    /**
     * @brief Matching engine settings
     */
    struct MatchingConfig {
        size_t parallelThreshold = 64;
        size_t maxWorkers = 4;
        int timeoutMs = 0; // 0 = no deadline
    };
    MatchingConfig getMatchingConfig() const;
    void setMatchingConfig(const MatchingConfig& config);

    /**
     * @brief Get web server configuration
     */
    struct WebServerConfig {
        std::string ipAddress = "0.0.0.0";
        uint16_t port = 3547;
        int threadNum = 0; // 0 = hardware concurrency
    };
    WebServerConfig getWebServerConfig() const;
    void setWebServerConfig(const WebServerConfig& config);

    /**
     * @brief Get logging configuration
     */
    struct LoggingConfig {
        std::string logDir = "./logs";
        std::string logLevel = "info";
        bool console = true;
        int maxLogFiles = 30;
    };
    LoggingConfig getLoggingConfig() const;
    void setLoggingConfig(const LoggingConfig& config);

    /**
     * @brief Directory holding one JSON file per identity
     */
    std::string getStorageDir() const;
    void setStorageDir(const std::string& dir);

    /**
     * @brief Get full configuration as JSON
     */
    Json::Value getConfigJson() const;

    /**
     * @brief Get configuration section as JSON
     * @param path JSON path (e.g., "identity.threshold", "system/web_server")
     * @return JSON value if found, null otherwise
     */
    Json::Value getConfigSection(const std::string& path) const;

    /**
     * @brief Replace entire configuration
     * @return false if the new configuration fails validation
     */
    bool replaceConfig(const Json::Value& json);

    /**
     * @brief Update configuration section
     * @param path JSON path (e.g., "matching.max_workers")
     * @param value New value for the section
     * @return false if the path is invalid or the result fails validation
     */
    bool updateConfigSection(const std::string& path, const Json::Value& value);

    /**
     * @brief Delete configuration section
     * @return true if deleted successfully
     */
    bool deleteConfigSection(const std::string& path);

    /**
     * @brief Get config file path
     */
    std::string getConfigPath() const;

    /**
     * @brief Reload configuration from file
     */
    bool reloadConfig();

    /**
     * @brief Reset configuration to default values
     * @return true if reset (and saved, when a path is set) successfully
     */
    bool resetToDefaults();

    /**
     * @brief Check if configuration is loaded
     */
    bool isLoaded() const;

    /**
     * @brief Validate configuration structure
     * @param error Optional error message output
     */
    static bool validateConfig(const Json::Value& json, std::string* error = nullptr);

    /**
     * @brief Default configuration document
     */
    static Json::Value defaultConfig();

private:
    SystemConfig();
    ~SystemConfig() = default;
    SystemConfig(const SystemConfig&) = delete;
    SystemConfig& operator=(const SystemConfig&) = delete;

    std::string config_path_;
    mutable std::mutex mutex_;
    Json::Value config_json_;
    bool loaded_ = false;

    bool writeConfigUnlocked(const std::string& path);
    const Json::Value& sectionUnlocked(const char* section) const;

    /**
     * @brief Parse JSON path and get parent and key
     */
    static std::pair<Json::Value*, std::string> parsePath(Json::Value& root,
                                                          const std::string& path);
};
