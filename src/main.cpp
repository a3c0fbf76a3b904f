#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/file_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  safestore::config::StoreConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-d <dir>] [-l <level>] [--no-versioning]\n"
        << "Optional arguments:\n"
        << "  -d, --dir          Base directory (default: $SAFESTORE_BASE_DIR or ./safestore_data)\n"
        << "  -l, --log-level    trace|debug|info|warning|error|fatal\n"
        << "  --no-versioning    Do not keep versions of overwritten files\n"
        << "Example: " << program_name << " -d /var/lib/safestore -l debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {"-d", "--dir", "-l", "--log-level"};

  ProgramOptions options;
  options.config = safestore::config::StoreConfig::from_environment();

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--no-versioning") {
      options.config.enable_versioning = false;
      continue;
    }
    if (flag == "-h" || flag == "--help") {
      print_usage(argv[0]);
      return options;
    }
    if (value_flags.count(flag) == 0 || i + 1 >= argc) {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-d" || flag == "--dir") {
      options.config.base_dir = value;
    } else {
      options.config.log_level = safestore::logging::parse_severity(value);
    }
  }

  try {
    options.config.validate();
  } catch (const safestore::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const safestore::config::StoreConfig& config) {
  try {
    safestore::logging::init_logging(config.effective_log_dir(), config.log_level);

    safestore::store::FileStore store(config);
    safestore::cli::CLI cli(store);
    cli.run();

    auto closed = store.shutdown();
    if (!closed) {
      std::cerr << "Error: " << closed.message << '\n';
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start store: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options.config)) {
    return 1;
  }
  return 0;
}
