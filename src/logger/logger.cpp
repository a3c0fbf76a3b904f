#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace safestore::logging {

namespace {

namespace blog = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

auto make_formatter() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << blog::trivial::severity << "]"
      << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_dir, severity_level min_level) {
  try {
    // Clear any existing sinks
    blog::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_dir);
    std::filesystem::create_directories(log_path);

    // Rotating operations log, older files collected in the same directory
    blog::add_file_log(
      keywords::file_name = (log_path / "operations_%N.log").string(),
      keywords::target = log_path.string(),
      keywords::rotation_size = LOG_ROTATION_SIZE,
      keywords::max_files = LOG_MAX_FILES,
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::auto_flush = true,
      keywords::format = make_formatter()
    );

    // Console gets warnings and above only
    blog::add_console_log(
      std::clog,
      keywords::filter = blog::trivial::severity >= blog::trivial::warning,
      keywords::format = make_formatter()
    );

    blog::add_common_attributes();
    set_log_level(min_level);
    blog::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized in " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level level) {
  blog::core::get()->set_filter(blog::trivial::severity >= level);
}

severity_level parse_severity(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")   return severity_level::trace;
  if (lowered == "debug")   return severity_level::debug;
  if (lowered == "info")    return severity_level::info;
  if (lowered == "warning" || lowered == "warn") return severity_level::warning;
  if (lowered == "error")   return severity_level::error;
  if (lowered == "fatal")   return severity_level::fatal;
  return severity_level::info;
}

void flush() {
  blog::core::get()->flush();
}

} // namespace safestore::logging
