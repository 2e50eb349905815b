#include "chunkvault/config.h"
#include "utilities/var_dir.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace chunkvault {

Config defaultConfig() {
  Config config;
  config.dataDir = getDataDir();
  return config;
}

std::optional<LogLevel> parseLogLevel(const std::string &name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  return std::nullopt;
}

static Status validate(const Config &config) {
  if (config.dataDir.empty())
    return makeError(ErrorCode::InvalidArgument, "data_dir must not be empty");
  if (config.retention.count() <= 0)
    return makeError(ErrorCode::InvalidArgument,
                     "retention_seconds must be positive");
  if (config.sweepInterval.count() <= 0)
    return makeError(ErrorCode::InvalidArgument,
                     "sweep_interval_seconds must be positive");
  if (config.maxChunkBytes == 0)
    return makeError(ErrorCode::InvalidArgument,
                     "max_chunk_bytes must be positive");
  if (config.maxTotalChunks == 0)
    return makeError(ErrorCode::InvalidArgument,
                     "max_total_chunks must be positive");
  return okStatus();
}

Result<Config> loadConfig(const std::string &path) {
  Config config = defaultConfig();
  if (!std::filesystem::exists(path))
    return config;

  try {
    YAML::Node node = YAML::LoadFile(path);
    if (node["data_dir"])
      config.dataDir = node["data_dir"].as<std::string>();
    if (node["retention_seconds"])
      config.retention =
          std::chrono::seconds(node["retention_seconds"].as<long long>());
    if (node["sweep_interval_seconds"])
      config.sweepInterval =
          std::chrono::seconds(node["sweep_interval_seconds"].as<long long>());
    if (node["default_quota_bytes"])
      config.defaultQuotaBytes =
          node["default_quota_bytes"].as<std::uint64_t>();
    if (node["quotas"]) {
      for (const auto &entry : node["quotas"]) {
        config.quotas[entry.first.as<std::string>()] =
            entry.second.as<std::uint64_t>();
      }
    }
    if (node["max_chunk_bytes"])
      config.maxChunkBytes = node["max_chunk_bytes"].as<std::uint64_t>();
    if (node["max_total_chunks"])
      config.maxTotalChunks = node["max_total_chunks"].as<std::uint32_t>();
    if (node["log_file"])
      config.logFile = node["log_file"].as<std::string>();
    if (node["log_level"]) {
      auto level = parseLogLevel(node["log_level"].as<std::string>());
      if (!level)
        return makeError(ErrorCode::InvalidArgument,
                         "unknown log_level in " + path);
      config.logLevel = *level;
    }
  } catch (const YAML::Exception &e) {
    return makeError(ErrorCode::InvalidArgument,
                     "failed to parse " + path + ": " + e.what());
  }

  auto valid = validate(config);
  if (!valid)
    return valid.error();
  return config;
}

static std::optional<long long> parseInteger(const char *text) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != std::string(text).size())
      return std::nullopt;
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

Status applyEnvironment(Config &config) {
  if (const char *env = std::getenv("CHUNKVAULT_DATA_DIR"))
    config.dataDir = env;
  if (const char *env = std::getenv("CHUNKVAULT_RETENTION_SECONDS")) {
    auto value = parseInteger(env);
    if (!value)
      return makeError(ErrorCode::InvalidArgument,
                       "CHUNKVAULT_RETENTION_SECONDS is not an integer");
    config.retention = std::chrono::seconds(*value);
  }
  if (const char *env = std::getenv("CHUNKVAULT_DEFAULT_QUOTA_BYTES")) {
    auto value = parseInteger(env);
    if (!value || *value < 0)
      return makeError(ErrorCode::InvalidArgument,
                       "CHUNKVAULT_DEFAULT_QUOTA_BYTES is not a byte count");
    config.defaultQuotaBytes = static_cast<std::uint64_t>(*value);
  }
  if (const char *env = std::getenv("CHUNKVAULT_LOG_LEVEL")) {
    auto level = parseLogLevel(env);
    if (!level)
      return makeError(ErrorCode::InvalidArgument,
                       std::string("unknown CHUNKVAULT_LOG_LEVEL ") + env);
    config.logLevel = *level;
  }
  return validate(config);
}

Result<Config> loadConfigFromEnvironment() {
  const char *cfg = std::getenv("CHUNKVAULT_CONFIG");
  if (!cfg)
    cfg = "chunkvault.yaml";
  auto loaded = loadConfig(cfg);
  if (!loaded)
    return loaded;
  Config config = std::move(loaded).value();
  auto env = applyEnvironment(config);
  if (!env)
    return env.error();
  return config;
}

} // namespace chunkvault
