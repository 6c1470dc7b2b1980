#pragma once

#include <atomic>

/**
 * @brief Global logging flags for controlling different types of logging
 *
 * These flags are set via command-line arguments and can be checked
 * throughout the codebase to enable/disable specific logging features.
 */

// Forward declarations - actual definitions are in src/main.cpp
extern std::atomic<bool> g_log_api;
extern std::atomic<bool> g_log_matching;

/**
 * @brief Check if API logging is enabled
 */
inline bool isApiLoggingEnabled() { return g_log_api.load(); }

/**
 * @brief Check if per-decision matching logging is enabled
 *
 * Covers candidate counts, best score and timing of each authentication.
 * Embedding values are never logged.
 */
inline bool isMatchingLoggingEnabled() { return g_log_matching.load(); }
