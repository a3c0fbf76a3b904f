#ifndef SAFESTORE_CONFIG_HPP
#define SAFESTORE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace safestore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

struct StoreConfig {
  std::string base_dir;
  std::size_t max_cache_size = 100;
  std::chrono::seconds cache_ttl{300};
  bool enable_versioning = true;
  std::uintmax_t max_binary_size = 100ull * 1000 * 1000;  // 100 MB, decimal
  std::size_t checksum_persist_interval = 10;
  int archive_retention_days = 30;
  std::size_t access_log_depth = 100;
  boost::log::trivial::severity_level log_level = boost::log::trivial::info;
  std::string log_dir;  // empty: <base_dir>/logs

  // Defaults overlaid with SAFESTORE_* environment variables
  static StoreConfig from_environment();

  // Throws ConfigError when a setting cannot work
  void validate() const;

  // log_dir, or <base_dir>/logs when unset
  std::string effective_log_dir() const;
};

} // namespace config
} // namespace safestore

#endif // SAFESTORE_CONFIG_HPP
