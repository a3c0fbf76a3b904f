#include "store/version_archive.hpp"
#include "utils/file_utils.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <chrono>
#include <regex>
#include <system_error>

namespace safestore {
namespace store {

namespace {

std::string escape_regex(const std::string& text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  for (char c : text) {
    if (special.find(c) != std::string::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

VersionArchive::VersionArchive(const std::filesystem::path& base_path,
                               const std::filesystem::path& versions_path,
                               bool enabled)
  : base_path_(base_path)
  , versions_path_(versions_path)
  , enabled_(enabled) {
  BOOST_LOG_TRIVIAL(debug) << "VersionArchive: Versioning " << (enabled_ ? "enabled" : "disabled")
                           << " at " << versions_path_.string();
}


//==============================================
// SNAPSHOTS
//==============================================

std::optional<std::filesystem::path> VersionArchive::snapshot(const std::filesystem::path& absolute_path) {
  if (!enabled_) {
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(absolute_path, ec)) {
    return std::nullopt;
  }

  const std::filesystem::path relative = absolute_path.lexically_relative(base_path_);
  const std::filesystem::path flat(utils::timestamped_name(relative, utils::file_timestamp()));

  // Several overwrites within one second get a counter before the extension
  std::filesystem::path target = versions_path_ / flat;
  for (int attempt = 1; std::filesystem::exists(target, ec); ++attempt) {
    target = versions_path_ / (flat.stem().string() + "_" + std::to_string(attempt) + flat.extension().string());
  }

  std::filesystem::create_directories(versions_path_, ec);
  std::filesystem::copy_file(absolute_path, target, std::filesystem::copy_options::none, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "VersionArchive: Failed to snapshot " << absolute_path.string()
                               << ": " << ec.message();
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(info) << "VersionArchive: Saved version " << target.filename().string()
                          << " of " << relative.generic_string();
  return target;
}

std::vector<std::string> VersionArchive::list(const std::filesystem::path& relative_path) const {
  std::vector<std::string> versions;

  std::error_code ec;
  if (!std::filesystem::is_directory(versions_path_, ec)) {
    return versions;
  }

  const std::filesystem::path flat(utils::flatten_relative_path(relative_path));
  const std::regex pattern("^" + escape_regex(flat.stem().string()) +
                           R"(_[0-9]{8}_[0-9]{6}(_[0-9]+)?)" +
                           escape_regex(flat.extension().string()) + "$");

  for (const auto& entry : std::filesystem::directory_iterator(versions_path_, ec)) {
    const std::string name = entry.path().filename().string();
    if (std::regex_match(name, pattern)) {
      versions.push_back(name);
    }
  }

  std::sort(versions.begin(), versions.end());
  return versions;
}

std::size_t VersionArchive::cleanup(int max_age_days) {
  std::size_t removed = remove_entries_older_than(versions_path_, max_age_days);
  BOOST_LOG_TRIVIAL(info) << "VersionArchive: Removed " << removed << " versions older than "
                          << max_age_days << " days";
  return removed;
}


//==============================================
// RETENTION
//==============================================

std::size_t remove_entries_older_than(const std::filesystem::path& directory, int max_age_days) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return 0;
  }

  const auto cutoff = std::filesystem::file_time_type::clock::now() -
                      std::chrono::hours(24 * std::max(max_age_days, 0));

  std::vector<std::filesystem::path> expired;
  for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
    std::error_code entry_ec;
    auto modified = entry.last_write_time(entry_ec);
    if (!entry_ec && modified < cutoff) {
      expired.push_back(entry.path());
    }
  }

  std::size_t removed = 0;
  for (const auto& path : expired) {
    std::error_code remove_ec;
    std::filesystem::remove_all(path, remove_ec);
    if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Retention: Failed to remove " << path.string()
                                 << ": " << remove_ec.message();
    } else {
      ++removed;
    }
  }
  return removed;
}

} // namespace store
} // namespace safestore
