#ifndef SAFESTORE_STORE_PATH_VALIDATOR_HPP
#define SAFESTORE_STORE_PATH_VALIDATOR_HPP

#include <array>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>
#include "logger/security_log.hpp"

namespace safestore {
namespace store {

// Confines relative paths to a base directory and rejects unsafe patterns.
// Every rejection is written to the security log; nothing here throws.
class PathValidator {
public:
  // Hidden file names that may still be addressed directly
  static constexpr std::array<const char*, 2> ALLOWED_HIDDEN_NAMES = {".gitkeep", ".htaccess"};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PathValidator(const std::filesystem::path& base_path, logging::SecurityLog& security_log);


  // ---- VALIDATION ----
  // True when relative_path resolves inside the base directory and passes
  // the denylist and hidden-file checks
  bool is_safe(const std::string& relative_path) const;
  // Absolute, normalized form of relative_path under the base directory
  std::filesystem::path resolve(const std::string& relative_path) const;
  // Path of absolute_path relative to the base directory
  std::filesystem::path relative_to_base(const std::filesystem::path& absolute_path) const;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  logging::SecurityLog& security_log_;
  std::vector<std::regex> denied_patterns_;


  // ---- CHECKS ----
  bool is_within_base(const std::filesystem::path& resolved) const;
  bool matches_denylist(const std::string& relative_path) const;
  bool is_hidden_name(const std::filesystem::path& resolved) const;
  void reject(const std::string& relative_path, const std::string& reason) const;
};

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_PATH_VALIDATOR_HPP
