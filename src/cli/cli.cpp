#include "cli/cli.hpp"
#include "utils/file_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace safestore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::FileStore& store, std::istream& in, std::ostream& out)
  : store_(store)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "safestore> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "safestore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  // Remainder after the first argument is kept verbatim for write/append
  std::vector<std::string> args;
  std::string rest;
  std::string token;
  if (iss >> token) {
    args.push_back(token);
    std::getline(iss, rest);
    if (!rest.empty() && rest.front() == ' ') {
      rest.erase(0, 1);
    }
    std::istringstream rest_stream(rest);
    while (rest_stream >> token) {
      args.push_back(token);
    }
  }

  process_command(command, args, rest);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args,
                          const std::string& rest) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command(args);
  }
  else if (command == "metrics") {
    handle_metrics_command();
  }
  else if (command == "health") {
    handle_health_command();
  }
  else if (command == "cleanup") {
    handle_cleanup_command(args);
  }
  else if (command == "search" && !args.empty()) {
    handle_search_command(args);
  }
  else if (args.empty()) {
    out_ << "Invalid input. Usage: <command> [arguments], type 'help' for commands" << std::endl;
  }
  else if (command == "read") {
    handle_read_command(args[0]);
  }
  else if (command == "write") {
    handle_write_command(args[0], rest, false);
  }
  else if (command == "append") {
    handle_write_command(args[0], rest, true);
  }
  else if (command == "mkdir") {
    auto result = store_.create_directory(args[0]);
    report(result.success, store::to_string(result.error) + std::string(": ") + result.message,
           "Directory ready: " + args[0]);
  }
  else if (command == "rm") {
    handle_delete_command(args[0], true);
  }
  else if (command == "purge") {
    handle_delete_command(args[0], false);
  }
  else if ((command == "mv" || command == "cp") && args.size() >= 2) {
    auto result = command == "mv" ? store_.move_file(args[0], args[1])
                                  : store_.copy_file(args[0], args[1]);
    report(result.success, store::to_string(result.error) + std::string(": ") + result.message,
           (command == "mv" ? "Moved " : "Copied ") + args[0] + " to " + args[1]);
  }
  else if (command == "info") {
    handle_info_command(args[0]);
  }
  else if (command == "versions") {
    handle_versions_command(args[0]);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_read_command(const std::string& path) {
  auto result = store_.read_text(path);
  if (!result) {
    log_and_display_error("Error reading file", std::string(store::to_string(result.error)) + ": " + result.message);
    return;
  }
  for (const auto& warning : result.warnings) {
    out_ << "Warning: " << warning << std::endl;
  }
  out_ << result.value << std::endl;
}

void CLI::handle_write_command(const std::string& path, const std::string& content, bool append) {
  auto result = store_.write_text(path, content, append);
  report(result.success, std::string(store::to_string(result.error)) + ": " + result.message,
         (append ? "Appended to " : "Wrote ") + path);
}

void CLI::handle_list_command(const std::vector<std::string>& args) {
  const std::string directory = args.empty() ? "" : args[0];
  std::optional<std::string> pattern;
  if (args.size() > 1) {
    pattern = args[1];
  }

  auto result = store_.list_directory(directory, true, pattern);
  if (!result) {
    log_and_display_error("Error listing directory", std::string(store::to_string(result.error)) + ": " + result.message);
    return;
  }
  for (const auto& entry : result.value) {
    out_ << "  " << (entry.is_directory ? "[DIR] " : "[FILE]") << " "
         << std::left << std::setw(32) << entry.name << " " << entry.size << std::endl;
  }
}

void CLI::handle_delete_command(const std::string& path, bool archive) {
  auto result = store_.delete_file(path, archive);
  report(result.success, std::string(store::to_string(result.error)) + ": " + result.message,
         archive ? "File archived successfully" : "File deleted permanently");
}

void CLI::handle_info_command(const std::string& path) {
  auto result = store_.get_file_info(path);
  if (!result) {
    log_and_display_error("Error reading info", std::string(store::to_string(result.error)) + ": " + result.message);
    return;
  }
  const auto& info = result.value;
  out_ << "  path:        " << info.path << "\n"
       << "  size:        " << info.human_size << " (" << info.size << " bytes)\n"
       << "  type:        " << (info.is_directory ? "directory" : info.mime_type) << "\n"
       << "  permissions: " << info.permissions << "\n"
       << "  checksum:    " << info.checksum.value_or("-") << "\n"
       << "  cached:      " << (info.cached ? "yes" : "no") << "\n"
       << "  accesses:    " << info.access_count << "\n"
       << "  last access: "
       << (info.recent_accesses.empty()
             ? std::string("-")
             : utils::format_timestamp(info.recent_accesses.back(), "%Y-%m-%d %H:%M:%S"))
       << std::endl;
}

void CLI::handle_search_command(const std::vector<std::string>& args) {
  const std::string directory = args.size() > 1 ? args[1] : "";
  std::vector<std::string> extensions(args.begin() + std::min<std::size_t>(args.size(), 2), args.end());

  auto result = store_.search_files(args[0], directory, extensions);
  if (!result) {
    log_and_display_error("Error searching", std::string(store::to_string(result.error)) + ": " + result.message);
    return;
  }
  for (const auto& match : result.value) {
    out_ << "  " << match.path << std::endl;
  }
  out_ << result.value.size() << " match(es)" << std::endl;
}

void CLI::handle_versions_command(const std::string& path) {
  auto result = store_.list_versions(path);
  if (!result) {
    log_and_display_error("Error listing versions", std::string(store::to_string(result.error)) + ": " + result.message);
    return;
  }
  for (const auto& version : result.value) {
    out_ << "  " << version << std::endl;
  }
}

void CLI::handle_metrics_command() {
  const auto snapshot = store_.metrics_snapshot();
  for (const auto& [name, stats] : snapshot.operations) {
    out_ << "  " << std::left << std::setw(14) << name
         << " count=" << stats.count
         << " errors=" << stats.errors
         << " avg=" << std::fixed << std::setprecision(6) << stats.average_time << "s"
         << " error_rate=" << std::setprecision(2) << stats.error_rate << std::endl;
  }
  out_ << "  cache " << snapshot.cache_size << "/" << snapshot.cache_capacity
       << " hit_rate=" << std::setprecision(2) << snapshot.cache_hit_rate << std::endl;
  out_ << "  checksums=" << snapshot.checksum_count
       << " security_events=" << snapshot.security_events << std::endl;
}

void CLI::handle_health_command() {
  const auto report = store_.health_check();
  for (const auto& [key, value] : report.details) {
    out_ << "  " << key << ": " << value << std::endl;
  }
}

void CLI::handle_cleanup_command(const std::vector<std::string>& args) {
  int days = store_.config().archive_retention_days;
  if (!args.empty()) {
    try {
      days = std::stoi(args[0]);
    } catch (const std::exception&) {
      out_ << "Invalid number of days: " << args[0] << std::endl;
      return;
    }
  }

  auto archived = store_.cleanup_archive(days);
  auto temps = store_.cleanup_temp_files();
  if (!archived || !temps) {
    log_and_display_error("Error during cleanup", archived ? temps.message : archived.message);
    return;
  }
  out_ << "Removed " << archived.value << " archive entries and "
       << temps.value << " temp files" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                         Display this help message" << std::endl;
  out_ << "  ls [dir] [regex]             List entries of <dir>" << std::endl;
  out_ << "  read <file>                  Print contents of <file>" << std::endl;
  out_ << "  write <file> <text>          Replace <file> with <text>" << std::endl;
  out_ << "  append <file> <text>         Append <text> to <file>" << std::endl;
  out_ << "  mkdir <dir>                  Create directory <dir>" << std::endl;
  out_ << "  rm <path>                    Move <path> to the archive" << std::endl;
  out_ << "  purge <path>                 Delete <path> permanently" << std::endl;
  out_ << "  mv <src> <dst>               Move a file" << std::endl;
  out_ << "  cp <src> <dst>               Copy a file" << std::endl;
  out_ << "  info <path>                  Show metadata for <path>" << std::endl;
  out_ << "  search <term> [dir] [ext..]  Find files by name" << std::endl;
  out_ << "  versions <file>              List saved versions of <file>" << std::endl;
  out_ << "  metrics                      Show operation metrics" << std::endl;
  out_ << "  health                       Run a health check" << std::endl;
  out_ << "  cleanup [days]               Purge old archive entries and temp files" << std::endl;
  out_ << "  quit                         Exit the shell" << std::endl << std::endl;
}

void CLI::report(bool success, const std::string& error, const std::string& message) {
  if (success) {
    out_ << message << std::endl;
  } else {
    log_and_display_error("Error", error);
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace safestore
