#include "logger/security_log.hpp"
#include "utils/file_utils.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <system_error>

namespace safestore::logging {

SecurityLog::SecurityLog(const std::filesystem::path& log_file)
  : log_file_(log_file) {
  std::error_code ec;
  std::filesystem::create_directories(log_file_.parent_path(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "SecurityLog: Failed to create log directory "
                             << log_file_.parent_path().string() << ": " << ec.message();
  }
}

void SecurityLog::record(const std::string& event, const std::string& detail) {
  ++event_count_;
  BOOST_LOG_TRIVIAL(warning) << "Security: " << event << ": " << detail;

  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream out(log_file_, std::ios::out | std::ios::app);
  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "SecurityLog: Unable to open " << log_file_.string();
    return;
  }
  out << utils::format_timestamp(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
      << " | " << event << " | " << detail << '\n';
}

} // namespace safestore::logging
