#ifndef SAFESTORE_STORE_VERSION_ARCHIVE_HPP
#define SAFESTORE_STORE_VERSION_ARCHIVE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safestore {
namespace store {

// Keeps copies of file content that is about to be overwritten.
// Snapshots are best effort: a failure is logged, never raised.
class VersionArchive {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  VersionArchive(const std::filesystem::path& base_path,
                 const std::filesystem::path& versions_path,
                 bool enabled = true);


  // ---- SNAPSHOTS ----
  // Copies the current bytes of absolute_path into the versions area.
  // Returns the snapshot path, or nullopt when disabled, absent or failed.
  std::optional<std::filesystem::path> snapshot(const std::filesystem::path& absolute_path);
  // Snapshot file names recorded for a relative path, oldest first
  std::vector<std::string> list(const std::filesystem::path& relative_path) const;
  // Removes snapshots last modified more than max_age_days ago
  std::size_t cleanup(int max_age_days);


  // ---- GETTERS/SETTERS ----
  bool enabled() const { return enabled_; }
  void set_enabled(bool enabled) { enabled_ = enabled; }
  const std::filesystem::path& path() const { return versions_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::filesystem::path versions_path_;
  bool enabled_;
};

// Removes regular files under directory older than max_age_days.
// Shared by version and archive retention.
std::size_t remove_entries_older_than(const std::filesystem::path& directory, int max_age_days);

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_VERSION_ARCHIVE_HPP
