#ifndef SAFESTORE_SECURITY_LOG_HPP
#define SAFESTORE_SECURITY_LOG_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>

namespace safestore::logging {

// Append-only audit trail of rejected paths and integrity violations.
// One instance per store; every event is also raised as a warning.
class SecurityLog {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit SecurityLog(const std::filesystem::path& log_file);


  // ---- EVENT RECORDING ----
  // Appends "timestamp | event | detail" to the log file
  void record(const std::string& event, const std::string& detail);


  // ---- QUERY OPERATIONS ----
  std::size_t event_count() const { return event_count_.load(); }
  const std::filesystem::path& path() const { return log_file_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path log_file_;
  std::mutex mutex_;
  std::atomic<std::size_t> event_count_{0};
};

} // namespace safestore::logging

#endif // SAFESTORE_SECURITY_LOG_HPP
