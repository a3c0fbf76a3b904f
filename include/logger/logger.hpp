#ifndef SAFESTORE_LOGGER_HPP
#define SAFESTORE_LOGGER_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>

namespace safestore::logging {

using severity_level = boost::log::trivial::severity_level;

// Size at which the operations log rolls over to a new file
constexpr std::size_t LOG_ROTATION_SIZE = 10 * 1024 * 1024;  // 10 MB
// Number of rotated operation logs retained in the log directory
constexpr std::size_t LOG_MAX_FILES = 5;

// Initialize logging with a rotating operations log in log_dir and a console
// sink for warnings and above. Safe to call more than once.
void init_logging(const std::string& log_dir,
                  severity_level min_level = severity_level::info);

// Adjust the minimum severity accepted by the logging core
void set_log_level(severity_level level);

// Maps "trace".."fatal" (any case) to a severity; unknown names yield info
severity_level parse_severity(const std::string& name);

// Flush every registered sink
void flush();

} // namespace safestore::logging

#endif // SAFESTORE_LOGGER_HPP
