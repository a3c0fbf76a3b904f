#include "config/config.hpp"
#include "logger/logger.hpp"
#include "utils/file_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace safestore {
namespace config {

namespace {

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// Positive integer from the environment; invalid values keep the default
template <typename T>
void read_positive(const char* name, T& target) {
  auto value = env_value(name);
  if (!value) {
    return;
  }
  try {
    long long parsed = std::stoll(*value);
    if (parsed <= 0) {
      throw std::out_of_range("non-positive");
    }
    target = static_cast<T>(parsed);
  } catch (const std::exception&) {
    BOOST_LOG_TRIVIAL(warning) << "Config: Ignoring invalid " << name << "=" << *value;
  }
}

bool parse_flag(const std::string& value) {
  const std::string lowered = utils::to_lower(value);
  return lowered == "true" || lowered == "1" || lowered == "t" || lowered == "yes";
}

} // namespace

StoreConfig StoreConfig::from_environment() {
  StoreConfig config;

  if (auto dir = env_value("SAFESTORE_BASE_DIR")) {
    config.base_dir = *dir;
  } else if (auto legacy = env_value("AI_BASE_DIR")) {
    config.base_dir = *legacy;
  } else {
    config.base_dir = (std::filesystem::current_path() / "safestore_data").string();
  }

  if (auto level = env_value("SAFESTORE_LOG_LEVEL")) {
    config.log_level = logging::parse_severity(*level);
  }
  if (auto log_dir = env_value("SAFESTORE_LOG_DIR")) {
    config.log_dir = *log_dir;
  }
  if (auto versioning = env_value("SAFESTORE_ENABLE_VERSIONING")) {
    config.enable_versioning = parse_flag(*versioning);
  }

  read_positive("SAFESTORE_CACHE_SIZE", config.max_cache_size);

  std::uintmax_t max_file_mb = 0;
  read_positive("SAFESTORE_MAX_FILE_SIZE_MB", max_file_mb);
  if (max_file_mb > 0) {
    config.max_binary_size = max_file_mb * 1000 * 1000;
  }

  return config;
}

void StoreConfig::validate() const {
  if (base_dir.empty()) {
    throw ConfigError("base directory must not be empty");
  }
  if (max_cache_size == 0) {
    throw ConfigError("cache size must be positive");
  }
  if (cache_ttl.count() <= 0) {
    throw ConfigError("cache TTL must be positive");
  }
  if (max_binary_size == 0) {
    throw ConfigError("binary size ceiling must be positive");
  }
  if (checksum_persist_interval == 0) {
    throw ConfigError("checksum persist interval must be positive");
  }
  if (archive_retention_days < 0) {
    throw ConfigError("archive retention must not be negative");
  }
}

std::string StoreConfig::effective_log_dir() const {
  if (!log_dir.empty()) {
    return log_dir;
  }
  return (std::filesystem::path(base_dir) / "logs").string();
}

} // namespace config
} // namespace safestore
