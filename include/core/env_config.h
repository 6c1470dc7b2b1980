#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Helper functions to parse environment variables
 *
 * Provides utilities to read and parse environment variables
 * with default values and validation.
 */
namespace EnvConfig {

/**
 * @brief Get string environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @return String value or default
 */
inline std::string getString(const char *name,
                             const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return value ? std::string(value) : default_value;
}

/**
 * @brief Get integer environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @param min_value Minimum allowed value (optional)
 * @param max_value Maximum allowed value (optional)
 * @return Integer value or default
 */
inline int getInt(const char *name, int default_value,
                  int min_value = INT32_MIN, int max_value = INT32_MAX) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    int int_value = std::stoi(value);
    if (int_value < min_value || int_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return int_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

/**
 * @brief Get double environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @param min_value Minimum allowed value (optional)
 * @param max_value Maximum allowed value (optional)
 * @return Double value or default
 */
inline double getDouble(const char *name, double default_value,
                        double min_value = -1e10, double max_value = 1e10) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    double double_value = std::stod(value);
    if (!(double_value >= min_value && double_value <= max_value)) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return double_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

/**
 * @brief Try to create a directory tree
 * @return true if the directory exists afterwards
 */
inline bool tryCreateDirectory(const std::string &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    std::cerr << "[EnvConfig] ⚠ Cannot create " << path << ": "
              << ec.message() << std::endl;
    return false;
  }
  return std::filesystem::is_directory(path);
}

/**
 * @brief Resolve directory path with fallback strategy
 *
 * 1. Try to create preferred_path
 * 2. Fallback to user directory (~/.local/share/face_auth/{subdir})
 * 3. Fallback to current directory (./{subdir})
 *
 * Never throws - always returns a path (even if creation failed)
 *
 * @param preferred_path Preferred directory path
 * @param subdir Subdirectory name for fallback (e.g., "identities")
 * @return Resolved directory path
 */
inline std::string resolveDirectory(const std::string &preferred_path,
                                    const std::string &subdir = "") {
  if (std::filesystem::is_directory(preferred_path) ||
      tryCreateDirectory(preferred_path)) {
    return preferred_path;
  }

  if (subdir.empty()) {
    return preferred_path;
  }

  const char *home = std::getenv("HOME");
  if (home) {
    std::string fallback =
        std::string(home) + "/.local/share/face_auth/" + subdir;
    if (tryCreateDirectory(fallback)) {
      std::cerr << "[EnvConfig] ✓ Using fallback: " << fallback << std::endl;
      return fallback;
    }
  }

  std::string last_resort = "./" + subdir;
  if (tryCreateDirectory(last_resort)) {
    std::cerr << "[EnvConfig] ✓ Using last resort: " << last_resort
              << std::endl;
  }
  return last_resort;
}

/**
 * @brief Resolve identity data directory
 *
 * FACE_AUTH_DATA_DIR (if set) overrides the configured directory.
 *
 * @param configured_dir Directory from the storage section of the config
 * @return Resolved directory path
 */
inline std::string resolveDataDir(const std::string &configured_dir) {
  std::string dir = getString("FACE_AUTH_DATA_DIR", "");
  if (dir.empty()) {
    dir = configured_dir;
  }
  return resolveDirectory(dir, "identities");
}

/**
 * @brief Resolve config file path
 *
 * Priority:
 * 1. FACE_AUTH_CONFIG environment variable (if set)
 * 2. ./config.json if it exists
 * 3. /etc/face_auth/config.json if it exists
 * 4. ~/.config/face_auth/config.json if its directory can be created
 * 5. ./config.json (last resort)
 *
 * @return Resolved config file path
 */
inline std::string resolveConfigPath() {
  std::string env_path = getString("FACE_AUTH_CONFIG", "");
  if (!env_path.empty()) {
    std::filesystem::path filePath(env_path);
    if (filePath.has_parent_path()) {
      tryCreateDirectory(filePath.parent_path().string());
    }
    std::cerr << "[EnvConfig] Using config file from FACE_AUTH_CONFIG: "
              << env_path << std::endl;
    return env_path;
  }

  const std::string current_dir_path = "./config.json";
  if (std::filesystem::exists(current_dir_path)) {
    return current_dir_path;
  }

  const std::string system_path = "/etc/face_auth/config.json";
  if (std::filesystem::exists(system_path)) {
    return system_path;
  }

  const char *home = std::getenv("HOME");
  if (home) {
    std::string user_dir = std::string(home) + "/.config/face_auth";
    if (tryCreateDirectory(user_dir)) {
      return user_dir + "/config.json";
    }
  }

  return current_dir_path;
}

} // namespace EnvConfig
