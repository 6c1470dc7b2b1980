#include "api/authentication_handler.h"
#include "api/health_handler.h"
#include "api/identity_handler.h"
#include "api/version_handler.h"
#include "config/system_config.h"
#include "core/clock.h"
#include "core/env_config.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include "enrollment/enrollment_pipeline.h"
#include "identity/identity_registry.h"
#include "identity/identity_storage.h"
#include "matching/matching_engine.h"
#include "transfer/identity_transfer.h"
#include <algorithm>
#include <atomic>
#include <drogon/drogon.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

/**
 * @brief Face Auth API Server
 *
 * REST API server using Drogon framework
 * Serves identity enrollment, authentication and transfer endpoints over a
 * registry hydrated from the identity file store
 */

// Global debug flag
static std::atomic<bool> g_debug_mode{false};

// Config file path given with --config (empty = resolve from environment)
static std::string g_config_path;

// Global logging flags (exported via logging_flags.h)
std::atomic<bool> g_log_api{false};
std::atomic<bool> g_log_matching{false};

/**
 * @brief Print command line usage
 */
static void printUsage(const char *program) {
  std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl;
  std::cerr << "Options:" << std::endl;
  std::cerr << "  --config, -c <path>            Configuration file "
               "(default: FACE_AUTH_CONFIG or ./config.json)"
            << std::endl;
  std::cerr << "  --debug, -d                    Enable debug log level"
            << std::endl;
  std::cerr << "  --log-api, --debug-api         Enable API "
               "request/response logging"
            << std::endl;
  std::cerr << "  --log-matching                 Enable per-decision "
               "matching logging"
            << std::endl;
  std::cerr << "  --help, -h                     Show this help message"
            << std::endl;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument vector
 * @param exitCode Exit code to use when parsing asks to stop
 * @return true if the server should start
 */
bool parseArguments(int argc, char *argv[], int &exitCode) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        exitCode = 1;
        return false;
      }
      g_config_path = argv[++i];
    } else if (arg == "--debug" || arg == "-d") {
      g_debug_mode = true;
      std::cerr << "[Main] Debug mode enabled" << std::endl;
    } else if (arg == "--log-api" || arg == "--debug-api") {
      g_log_api = true;
      std::cerr << "[Main] API logging enabled" << std::endl;
    } else if (arg == "--log-matching") {
      g_log_matching = true;
      std::cerr << "[Main] Matching logging enabled" << std::endl;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exitCode = 0;
      return false;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      std::cerr << "Use --help for usage information" << std::endl;
      exitCode = 1;
      return false;
    }
  }
  return true;
}

int main(int argc, char *argv[]) {
  int exitCode = 0;
  if (!parseArguments(argc, argv, exitCode)) {
    return exitCode;
  }

  // Load system configuration first (logger settings live in it)
  std::string configPath =
      g_config_path.empty() ? EnvConfig::resolveConfigPath() : g_config_path;
  auto &systemConfig = SystemConfig::getInstance();
  if (!systemConfig.loadConfig(configPath)) {
    std::cerr << "[Main] ⚠ Using default configuration, " << configPath
              << " could not be loaded" << std::endl;
  }

  auto loggingConfig = systemConfig.getLoggingConfig();
  plog::Severity level =
      g_debug_mode.load()
          ? plog::debug
          : Logger::parseSeverity(loggingConfig.logLevel, plog::info);
  Logger::init(loggingConfig.logDir, level, loggingConfig.maxLogFiles,
               loggingConfig.console);

  PLOG_INFO << "========================================";
  PLOG_INFO << "Face Auth API Server";
  PLOG_INFO << "========================================";
  PLOG_INFO << "[Main] Config file: " << configPath;
  if (g_log_api.load()) {
    PLOG_INFO << "[Main] API logging: ENABLED";
  }
  if (g_log_matching.load()) {
    PLOG_INFO << "[Main] Matching logging: ENABLED";
  }

  try {
    auto identityConfig = systemConfig.getIdentityConfig();
    auto matchingConfig = systemConfig.getMatchingConfig();
    std::string dataDir =
        EnvConfig::resolveDataDir(systemConfig.getStorageDir());

    PLOG_INFO << "[Main] Embedding dimension: " << identityConfig.dimension;
    PLOG_INFO << "[Main] Decision tolerance: " << identityConfig.threshold;
    PLOG_INFO << "[Main] Identity store: " << dataDir;

    SystemClock clock;
    auto storage =
        std::make_shared<IdentityStorage>(dataDir, identityConfig.dimension);
    IdentityRegistry registry(identityConfig.dimension,
                              identityConfig.threshold, storage);

    try {
      registry.loadFromStore();
    } catch (const IdentityException &e) {
      PLOG_FATAL << "[Main] Refusing to start, identity store is invalid: "
                 << identityErrorName(e.code()) << ": " << e.what();
      return 1;
    }

    EnrollmentPipeline pipeline(identityConfig.dimension, clock);

    MatchingEngineConfig engineConfig;
    engineConfig.parallelThreshold = matchingConfig.parallelThreshold;
    engineConfig.maxWorkers = matchingConfig.maxWorkers;
    MatchingEngine engine(engineConfig);

    IdentityTransfer transfer(registry, clock);

    IdentityHandler::setIdentityRegistry(&registry);
    IdentityHandler::setEnrollmentPipeline(&pipeline);
    IdentityHandler::setIdentityTransfer(&transfer);
    IdentityHandler::setMinimumAcceptedSamples(
        identityConfig.minimumAcceptedSamples);

    AuthenticationHandler::setIdentityRegistry(&registry);
    AuthenticationHandler::setMatchingEngine(&engine);
    AuthenticationHandler::setClock(&clock);
    AuthenticationHandler::setDefaults(identityConfig.maxCandidates,
                                       matchingConfig.timeoutMs);

    HealthHandler::setIdentityRegistry(&registry);

    auto webServerConfig = systemConfig.getWebServerConfig();
    unsigned int threadNum =
        webServerConfig.threadNum > 0
            ? static_cast<unsigned int>(webServerConfig.threadNum)
            : std::max(1U, std::thread::hardware_concurrency());

    PLOG_INFO << "[Main] Server will listen on: " << webServerConfig.ipAddress
              << ":" << webServerConfig.port;
    PLOG_INFO << "[Main] Thread pool size: " << threadNum;
    PLOG_INFO << "Available endpoints:";
    PLOG_INFO << "  POST   /v1/identities                        - Enroll";
    PLOG_INFO << "  GET    /v1/identities                        - List";
    PLOG_INFO << "  GET    /v1/identities/{id}/export            - Export";
    PLOG_INFO << "  POST   /v1/identities/{id}/samples           - Append";
    PLOG_INFO << "  DELETE /v1/identities/{id}                   - Delete";
    PLOG_INFO << "  POST   /v1/identities/import[?overwrite|merge] - Import";
    PLOG_INFO << "  POST   /v1/authenticate                      - Match";
    PLOG_INFO << "  GET    /v1/core/health                       - Health";
    PLOG_INFO << "  GET    /v1/core/version                      - Version";

    auto &app = drogon::app();
    app.setThreadNum(threadNum)
        .addListener(webServerConfig.ipAddress, webServerConfig.port);

    // Drogon quits the event loop on SIGINT/SIGTERM
    app.run();

    IdentityHandler::setIdentityRegistry(nullptr);
    IdentityHandler::setEnrollmentPipeline(nullptr);
    IdentityHandler::setIdentityTransfer(nullptr);
    AuthenticationHandler::setIdentityRegistry(nullptr);
    AuthenticationHandler::setMatchingEngine(nullptr);
    AuthenticationHandler::setClock(nullptr);
    HealthHandler::setIdentityRegistry(nullptr);

    PLOG_INFO << "Server stopped.";
    return 0;
  } catch (const std::exception &e) {
    PLOG_FATAL << "Fatal error: " << e.what();
    return 1;
  }
}
