#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config/config.hpp"
#include "logger/security_log.hpp"
#include "store/result.hpp"
#include "store/path_validator.hpp"
#include "store/checksum_store.hpp"
#include "store/version_archive.hpp"
#include "store/content_cache.hpp"
#include "store/operation_metrics.hpp"

namespace safestore {
namespace store {

struct FileMetadata {
  std::string name;
  std::string path;                  // relative to the base directory, '/' separated
  std::uintmax_t size{0};
  std::time_t modified{0};
  std::time_t created{0};            // inode change time where birth time is unavailable
  bool is_file{false};
  bool is_directory{false};
  std::string mime_type;
  std::string permissions;           // "rwxr-xr-x"
  unsigned int mode{0};              // octal permission bits
  std::optional<std::string> checksum;
};

struct FileInfo : FileMetadata {
  std::string human_size;
  bool cached{false};
  std::uint64_t access_count{0};
  // Most recent reads, oldest first, at most access_log_depth of them
  std::vector<std::chrono::system_clock::time_point> recent_accesses;
};

struct MetricsSnapshot {
  std::map<std::string, OperationStats> operations;
  std::size_t cache_size{0};
  std::size_t cache_capacity{0};
  double cache_hit_rate{0.0};
  std::size_t checksum_count{0};
  std::size_t security_events{0};
};

struct HealthReport {
  bool healthy{false};
  std::map<std::string, std::string> details;
};

class FileStore {
public:
  // Managed subdirectories of the base directory
  static constexpr const char* LOGS_DIR = "logs";
  static constexpr const char* TEMP_DIR = "temp";
  static constexpr const char* ARCHIVE_DIR = "archive";
  static constexpr const char* VERSIONS_DIR = "versions";
  static constexpr const char* METADATA_DIR = "metadata";
  static constexpr const char* CHECKSUM_FILE = "checksums.json";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileStore(const config::StoreConfig& config);
  explicit FileStore(const std::string& base_path);
  ~FileStore();

  FileStore(const FileStore&) = delete;
  FileStore& operator=(const FileStore&) = delete;


  // ---- TEXT AND BINARY I/O ----
  Result<std::string> read_text(const std::string& path, bool use_cache = true);
  Result<void> write_text(const std::string& path, const std::string& content,
                          bool append = false, bool backup = true);
  Result<std::vector<std::uint8_t>> read_binary(const std::string& path);
  Result<void> write_binary(const std::string& path, const std::vector<std::uint8_t>& data,
                            bool backup = true);


  // ---- DIRECTORY AND FILE MANAGEMENT ----
  Result<std::vector<FileMetadata>> list_directory(const std::string& path = "",
                                                   bool include_dirs = false,
                                                   const std::optional<std::string>& pattern = std::nullopt);
  Result<void> create_directory(const std::string& path,
                                std::filesystem::perms permissions = std::filesystem::perms(0755));
  // Soft delete into the archive area when archive is set, permanent otherwise
  Result<void> delete_file(const std::string& path, bool archive = true);
  Result<void> move_file(const std::string& source, const std::string& destination);
  Result<void> copy_file(const std::string& source, const std::string& destination);


  // ---- QUERY OPERATIONS ----
  Result<FileInfo> get_file_info(const std::string& path);
  // Case-insensitive file name search below directory; extensions filter by suffix
  Result<std::vector<FileMetadata>> search_files(const std::string& term,
                                                 const std::string& directory = "",
                                                 const std::vector<std::string>& extensions = {});
  Result<std::vector<std::string>> list_versions(const std::string& path);
  MetricsSnapshot metrics_snapshot();
  bool is_safe(const std::string& path) const { return validator_.is_safe(path); }


  // ---- ORGANIZATION ----
  // Writes content under a category folder chosen from the file extension;
  // returns the final relative path
  Result<std::string> store_categorized(const std::string& filename, const std::string& content);
  static std::string category_for(const std::string& filename);


  // ---- MAINTENANCE ----
  HealthReport health_check();
  Result<std::size_t> cleanup_archive(int max_age_days = 30);
  Result<std::size_t> cleanup_versions(int max_age_days = 30);
  // Removes temp files orphaned by interrupted writes anywhere in the tree
  Result<std::size_t> cleanup_temp_files();
  // Persists checksum metadata and flushes logs
  Result<void> shutdown();


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }
  const config::StoreConfig& config() const { return config_; }

private:
  struct AccessRecord {
    std::deque<std::chrono::system_clock::time_point> recent;
    std::uint64_t total{0};
  };

  // ---- PARAMETERS ----
  config::StoreConfig config_;
  std::filesystem::path base_path_;
  logging::SecurityLog security_log_;
  PathValidator validator_;
  ChecksumStore checksums_;
  VersionArchive versions_;
  ContentCache cache_;
  OperationMetrics metrics_;
  std::unordered_map<std::string, AccessRecord> access_log_;
  mutable std::recursive_mutex mutex_;
  std::atomic<std::uint64_t> temp_sequence_{0};
  bool shut_down_{false};


  // ---- OPERATION BOUNDARY ----
  // Times body, records the metric, and converts any escaping exception
  template <typename T, typename Body>
  Result<T> run_operation(OperationKind kind, const std::string& context, ErrorKind fallback, Body&& body);
  template <typename T>
  Result<T> deny(const std::string& path);
  // Refusal for paths inside the store's own bookkeeping, recorded as a security event
  template <typename T>
  Result<T> deny_managed(const std::string& path);


  // ---- WRITE SUPPORT ----
  // Snapshot, temp-file write, atomic rename, checksum and cache update
  void write_bytes_locked(const std::filesystem::path& target, const std::string& bytes,
                          bool append, bool backup);
  // Removes temp files left in directory by interrupted writes
  std::size_t remove_orphaned_temps(const std::filesystem::path& directory) const;


  // ---- METADATA SUPPORT ----
  FileMetadata build_metadata(const std::filesystem::path& absolute_path) const;
  void record_access(const std::string& key);
  bool is_managed_directory(const std::filesystem::path& absolute_path) const;
  // At or under logs/, temp/ or metadata/; archive/ and versions/ count when include_history is set
  bool is_managed_path(const std::filesystem::path& absolute_path, bool include_history) const;
  void ensure_layout();
};

} // namespace store
} // namespace safestore
