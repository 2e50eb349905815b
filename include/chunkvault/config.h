#ifndef CHUNKVAULT_CONFIG_H
#define CHUNKVAULT_CONFIG_H

#include "chunkvault/errors.h"
#include "utilities/logger.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace chunkvault {

/**
 * @brief Runtime options for the upload engine.
 *
 * Loaded from YAML (see loadConfig) and then overridden by CHUNKVAULT_*
 * environment variables.
 */
struct Config {
  std::string dataDir;
  std::chrono::seconds retention{std::chrono::hours(24)};
  std::chrono::seconds sweepInterval{std::chrono::hours(1)};
  std::uint64_t defaultQuotaBytes{1ULL << 30};
  std::map<std::string, std::uint64_t> quotas; ///< Per-tenant overrides.
  std::uint64_t maxChunkBytes{64ULL * 1024 * 1024};
  std::uint32_t maxTotalChunks{100000};
  std::string logFile; ///< Empty selects <dataDir>/logs/chunkvault.log.
  LogLevel logLevel{LogLevel::INFO};
};

/// Defaults with dataDir taken from the process data directory.
Config defaultConfig();

/**
 * @brief Load configuration from a YAML file.
 *
 * A missing file yields the defaults. A file that exists but cannot be
 * parsed, or that holds out-of-range values, yields InvalidArgument.
 */
Result<Config> loadConfig(const std::string &path);

/// Apply CHUNKVAULT_DATA_DIR, CHUNKVAULT_RETENTION_SECONDS,
/// CHUNKVAULT_DEFAULT_QUOTA_BYTES and CHUNKVAULT_LOG_LEVEL.
Status applyEnvironment(Config &config);

/// CHUNKVAULT_CONFIG (default chunkvault.yaml) plus environment overrides.
Result<Config> loadConfigFromEnvironment();

std::optional<LogLevel> parseLogLevel(const std::string &name);

} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_H
