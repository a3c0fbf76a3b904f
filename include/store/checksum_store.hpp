#ifndef SAFESTORE_STORE_CHECKSUM_STORE_HPP
#define SAFESTORE_STORE_CHECKSUM_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "logger/security_log.hpp"

namespace safestore {
namespace store {

// Tracks the SHA-256 digest of every file the store has written or verified.
// Not internally synchronized: FileStore calls it under its instance lock.
class ChecksumStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChecksumStore(const std::filesystem::path& metadata_file,
                logging::SecurityLog& security_log,
                std::size_t persist_interval = 10);


  // ---- DIGESTS ----
  // Hex encoded SHA-256 of content, via OpenSSL EVP
  static std::string checksum(const std::string& content);
  static std::string checksum(const std::vector<std::uint8_t>& content);


  // ---- TABLE OPERATIONS ----
  // False only when a digest is on record and differs from content's digest;
  // the mismatch is logged as a security event
  bool verify(const std::string& path, const std::string& content);
  // Records digest for path; persists every persist_interval updates
  void update(const std::string& path, const std::string& digest);
  void remove(const std::string& path);
  // Drops path and every entry below it when path names a directory
  void remove_tree(const std::string& path);
  // Carries entries from one key (or key prefix) to another
  void rename(const std::string& from, const std::string& to);
  void copy(const std::string& from, const std::string& to);

  std::optional<std::string> get(const std::string& path) const;
  bool has(const std::string& path) const;
  std::size_t size() const { return checksums_.size(); }
  // Updates recorded since the last successful save
  std::size_t pending_updates() const { return updates_since_save_; }


  // ---- PERSISTENCE ----
  // Missing or corrupt metadata leaves the table empty
  void load();
  // Writes the table via temp file and rename; false on failure
  bool save();

private:
  // ---- PARAMETERS ----
  std::filesystem::path metadata_file_;
  logging::SecurityLog& security_log_;
  std::size_t persist_interval_;
  std::size_t updates_since_save_{0};
  std::unordered_map<std::string, std::string> checksums_;


  static std::string digest_bytes(const void* data, std::size_t length);
  void note_update();
};

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_CHECKSUM_STORE_HPP
