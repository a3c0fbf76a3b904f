#include "store/file_store.hpp"
#include "logger/logger.hpp"
#include "utils/file_utils.hpp"
#include <boost/log/trivial.hpp>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <regex>
#include <system_error>

namespace safestore {
namespace store {

namespace {

// Removes the temp file on scope exit unless the write was committed
class TempFileGuard {
public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    if (active_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  const std::filesystem::path& path() const { return path_; }
  void release() { active_ = false; }

private:
  std::filesystem::path path_;
  bool active_{true};
};

config::StoreConfig config_for(const std::string& base_path) {
  config::StoreConfig config;
  config.base_dir = base_path;
  return config;
}

std::filesystem::path prepare_base(const config::StoreConfig& config) {
  config.validate();
  std::filesystem::path base = std::filesystem::absolute(config.base_dir);
  std::filesystem::create_directories(base);
  return std::filesystem::canonical(base);
}

ErrorKind kind_for_errno(int err, ErrorKind fallback) {
  return (err == EACCES || err == EPERM) ? ErrorKind::PermissionDenied : fallback;
}

std::string read_file_bytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw StoreError(kind_for_errno(err, ErrorKind::OSFailure), "Failed to open file: " + path.string());
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw StoreError(ErrorKind::OSFailure, "Failed to read file: " + path.string());
  }
  return bytes;
}

// Throws for stat failures other than "does not exist"
std::filesystem::file_status checked_status(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
    throw std::filesystem::filesystem_error("Failed to stat", path, ec);
  }
  return status;
}

// First free "<stem>[_n]<ext>" in directory
std::filesystem::path unique_destination(const std::filesystem::path& directory, const std::string& name) {
  const std::filesystem::path base_name(name);
  std::filesystem::path candidate = directory / base_name;
  for (int attempt = 1; std::filesystem::exists(candidate); ++attempt) {
    candidate = directory / (base_name.stem().string() + "_" + std::to_string(attempt) +
                             base_name.extension().string());
  }
  return candidate;
}

std::string normalize_extension(const std::string& extension) {
  std::string lowered = utils::to_lower(extension);
  if (!lowered.empty() && lowered.front() != '.') {
    lowered.insert(lowered.begin(), '.');
  }
  return lowered;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStore::FileStore(const config::StoreConfig& config)
  : config_(config)
  , base_path_(prepare_base(config))
  , security_log_(base_path_ / LOGS_DIR / "security.log")
  , validator_(base_path_, security_log_)
  , checksums_(base_path_ / METADATA_DIR / CHECKSUM_FILE, security_log_, config.checksum_persist_interval)
  , versions_(base_path_, base_path_ / VERSIONS_DIR, config.enable_versioning)
  , cache_(config.max_cache_size, config.cache_ttl) {
  BOOST_LOG_TRIVIAL(info) << "FileStore: Initializing FileStore with base path: " << base_path_.string();
  ensure_layout();
  checksums_.load();
  BOOST_LOG_TRIVIAL(debug) << "FileStore: Store directory created/verified at: " << base_path_.string();
}

FileStore::FileStore(const std::string& base_path)
  : FileStore(config_for(base_path)) {
}

FileStore::~FileStore() {
  if (!shut_down_ && checksums_.pending_updates() > 0) {
    BOOST_LOG_TRIVIAL(warning) << "FileStore: Destroyed without shutdown, "
                               << checksums_.pending_updates() << " checksum updates not persisted";
  }
}


//==============================================
// OPERATION BOUNDARY
//==============================================

template <typename T, typename Body>
Result<T> FileStore::run_operation(OperationKind kind, const std::string& context,
                                   ErrorKind fallback, Body&& body) {
  const auto start = std::chrono::steady_clock::now();
  Result<T> result;

  try {
    result = body();
  }
  catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "FileStore: " << to_string(kind) << " failed for '" << context
                             << "': " << e.what();
    result = Result<T>::err(e.kind(), e.what());
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileStore: " << to_string(kind) << " failed for '" << context
                             << "': " << e.what();
    const bool denied = e.code() == std::errc::permission_denied ||
                        e.code() == std::errc::operation_not_permitted;
    result = Result<T>::err(denied ? ErrorKind::PermissionDenied : ErrorKind::OSFailure, e.what());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FileStore: Unexpected error in " << to_string(kind) << " for '"
                             << context << "': " << e.what();
    result = Result<T>::err(fallback, e.what());
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  metrics_.record(kind, elapsed.count(), result.success);
  return result;
}

template <typename T>
Result<T> FileStore::deny(const std::string& path) {
  return Result<T>::err(ErrorKind::AccessDenied, "Access denied: " + path);
}

template <typename T>
Result<T> FileStore::deny_managed(const std::string& path) {
  security_log_.record("MANAGED_PATH_REJECTED", "'" + path + "'");
  return Result<T>::err(ErrorKind::AccessDenied, "Path is reserved for the store: " + path);
}


//==============================================
// TEXT AND BINARY I/O
//==============================================

Result<std::string> FileStore::read_text(const std::string& path, bool use_cache) {
  return run_operation<std::string>(OperationKind::Read, path, ErrorKind::DecodeError,
                                    [&]() -> Result<std::string> {
    if (!validator_.is_safe(path)) {
      return deny<std::string>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    const std::string key = target.string();

    // Held across disk read and cache fill so a concurrent write cannot be
    // overtaken by stale content
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (use_cache) {
      if (auto cached = cache_.get(key)) {
        BOOST_LOG_TRIVIAL(debug) << "FileStore: Cache hit for " << path;
        record_access(key);
        return Result<std::string>::ok(std::move(*cached));
      }
    }

    const auto status = checked_status(target);
    if (!std::filesystem::exists(status)) {
      return Result<std::string>::err(ErrorKind::NotFound, "File not found: " + path);
    }
    if (std::filesystem::is_directory(status)) {
      return Result<std::string>::err(ErrorKind::NotAFile, "Path is a directory: " + path);
    }

    const std::string bytes = read_file_bytes(target);

    std::vector<std::string> warnings;
    if (!checksums_.verify(key, bytes)) {
      warnings.push_back(std::string(to_string(ErrorKind::IntegrityWarning)) +
                         ": checksum mismatch for " + path);
    } else if (!checksums_.has(key)) {
      checksums_.update(key, ChecksumStore::checksum(bytes));
    }

    std::string text = utils::sanitize_utf8(bytes);
    cache_.put(key, text);
    record_access(key);

    BOOST_LOG_TRIVIAL(info) << "FileStore: Read " << bytes.size() << " bytes from " << path;
    auto result = Result<std::string>::ok(std::move(text));
    result.warnings = std::move(warnings);
    return result;
  });
}

Result<void> FileStore::write_text(const std::string& path, const std::string& content,
                                   bool append, bool backup) {
  return run_operation<void>(OperationKind::Write, path, ErrorKind::WriteFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(path)) {
      return deny<void>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    if (target == base_path_) {
      return Result<void>::err(ErrorKind::NotAFile, "Cannot write to the base directory");
    }
    if (is_managed_path(target, true)) {
      return deny_managed<void>(path);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_bytes_locked(target, content, append, backup);

    BOOST_LOG_TRIVIAL(info) << "FileStore: " << (append ? "Appended " : "Wrote ")
                            << content.size() << " bytes to " << path;
    return Result<void>::ok();
  });
}

Result<std::vector<std::uint8_t>> FileStore::read_binary(const std::string& path) {
  using Bytes = std::vector<std::uint8_t>;
  return run_operation<Bytes>(OperationKind::ReadBinary, path, ErrorKind::OSFailure,
                              [&]() -> Result<Bytes> {
    if (!validator_.is_safe(path)) {
      return deny<Bytes>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    const auto status = checked_status(target);
    if (!std::filesystem::exists(status)) {
      return Result<Bytes>::err(ErrorKind::NotFound, "File not found: " + path);
    }
    if (std::filesystem::is_directory(status)) {
      return Result<Bytes>::err(ErrorKind::NotAFile, "Path is a directory: " + path);
    }

    const std::string bytes = read_file_bytes(target);

    std::vector<std::string> warnings;
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      if (!checksums_.verify(target.string(), bytes)) {
        warnings.push_back(std::string(to_string(ErrorKind::IntegrityWarning)) +
                           ": checksum mismatch for " + path);
      }
      record_access(target.string());
    }

    BOOST_LOG_TRIVIAL(info) << "FileStore: Read " << bytes.size() << " binary bytes from " << path;
    auto result = Result<Bytes>::ok(Bytes(bytes.begin(), bytes.end()));
    result.warnings = std::move(warnings);
    return result;
  });
}

Result<void> FileStore::write_binary(const std::string& path, const std::vector<std::uint8_t>& data,
                                     bool backup) {
  return run_operation<void>(OperationKind::WriteBinary, path, ErrorKind::WriteFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(path)) {
      return deny<void>(path);
    }

    if (data.size() > config_.max_binary_size) {
      return Result<void>::err(ErrorKind::SizeExceeded,
                               "Binary payload of " + std::to_string(data.size()) +
                               " bytes exceeds limit of " + std::to_string(config_.max_binary_size));
    }

    const std::filesystem::path target = validator_.resolve(path);
    if (target == base_path_) {
      return Result<void>::err(ErrorKind::NotAFile, "Cannot write to the base directory");
    }
    if (is_managed_path(target, true)) {
      return deny_managed<void>(path);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_bytes_locked(target, std::string(data.begin(), data.end()), false, backup);

    BOOST_LOG_TRIVIAL(info) << "FileStore: Wrote " << data.size() << " binary bytes to " << path;
    return Result<void>::ok();
  });
}


//==============================================
// DIRECTORY AND FILE MANAGEMENT
//==============================================

Result<std::vector<FileMetadata>> FileStore::list_directory(const std::string& path, bool include_dirs,
                                                            const std::optional<std::string>& pattern) {
  using Listing = std::vector<FileMetadata>;
  return run_operation<Listing>(OperationKind::List, path, ErrorKind::OSFailure,
                                [&]() -> Result<Listing> {
    if (!validator_.is_safe(path)) {
      return deny<Listing>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    const auto status = checked_status(target);
    if (!std::filesystem::exists(status)) {
      return Result<Listing>::err(ErrorKind::NotFound, "Directory not found: " + path);
    }
    if (!std::filesystem::is_directory(status)) {
      return Result<Listing>::err(ErrorKind::NotADirectory, "Not a directory: " + path);
    }

    std::optional<std::regex> filter;
    if (pattern) {
      try {
        filter.emplace(*pattern, std::regex::ECMAScript);
      } catch (const std::regex_error& e) {
        return Result<Listing>::err(ErrorKind::InvalidArgument,
                                    "Invalid pattern '" + *pattern + "': " + e.what());
      }
    }

    Listing entries;
    for (const auto& entry : std::filesystem::directory_iterator(
             target, std::filesystem::directory_options::skip_permission_denied)) {
      const std::string name = entry.path().filename().string();
      if (utils::is_temp_name(name)) {
        continue;
      }
      if (filter && !std::regex_search(name, *filter)) {
        continue;
      }

      std::error_code ec;
      const bool is_dir = entry.is_directory(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "FileStore: Skipping " << entry.path().string() << ": " << ec.message();
        continue;
      }
      if (is_dir && !include_dirs) {
        continue;
      }

      try {
        entries.push_back(build_metadata(entry.path()));
      } catch (const std::filesystem::filesystem_error& e) {
        BOOST_LOG_TRIVIAL(warning) << "FileStore: Skipping " << entry.path().string() << ": " << e.what();
      }
    }

    // Files before directories, then case-insensitive by name
    std::sort(entries.begin(), entries.end(), [](const FileMetadata& a, const FileMetadata& b) {
      if (a.is_directory != b.is_directory) {
        return !a.is_directory;
      }
      return utils::to_lower(a.name) < utils::to_lower(b.name);
    });

    BOOST_LOG_TRIVIAL(debug) << "FileStore: Listed " << entries.size() << " entries in '" << path << "'";
    return Result<Listing>::ok(std::move(entries));
  });
}

Result<void> FileStore::create_directory(const std::string& path, std::filesystem::perms permissions) {
  return run_operation<void>(OperationKind::CreateDir, path, ErrorKind::OSFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(path)) {
      return deny<void>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    if (is_managed_path(target, true)) {
      return deny_managed<void>(path);
    }
    const auto status = checked_status(target);
    if (std::filesystem::exists(status)) {
      if (!std::filesystem::is_directory(status)) {
        return Result<void>::err(ErrorKind::NotADirectory, "A file already exists at: " + path);
      }
      BOOST_LOG_TRIVIAL(debug) << "FileStore: Directory already exists: " << path;
      return Result<void>::ok();
    }

    std::filesystem::create_directories(target);

    std::error_code ec;
    std::filesystem::permissions(target, permissions, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "FileStore: Could not apply permissions to " << path << ": " << ec.message();
    }

    BOOST_LOG_TRIVIAL(info) << "FileStore: Created directory " << path;
    return Result<void>::ok();
  });
}

Result<void> FileStore::delete_file(const std::string& path, bool archive) {
  return run_operation<void>(OperationKind::Delete, path, ErrorKind::OSFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(path)) {
      return deny<void>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    if (target == base_path_) {
      return Result<void>::err(ErrorKind::AccessDenied, "Refusing to delete the base directory");
    }
    if (is_managed_path(target, true)) {
      return deny_managed<void>(path);
    }

    const auto status = checked_status(target);
    if (!std::filesystem::exists(status)) {
      return Result<void>::err(ErrorKind::NotFound, "File not found: " + path);
    }
    const bool is_dir = std::filesystem::is_directory(status);
    const std::string key = target.string();

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (archive) {
      const std::filesystem::path archive_dir = base_path_ / ARCHIVE_DIR;
      std::filesystem::create_directories(archive_dir);

      const std::filesystem::path relative = validator_.relative_to_base(target);
      const std::filesystem::path destination =
        unique_destination(archive_dir, utils::timestamped_name(relative, utils::file_timestamp()));
      std::filesystem::rename(target, destination);

      // Retention counts from the moment of archival
      std::error_code ec;
      std::filesystem::last_write_time(destination, std::filesystem::file_time_type::clock::now(), ec);

      BOOST_LOG_TRIVIAL(info) << "FileStore: Archived " << path << " to " << destination.filename().string();
    } else {
      std::filesystem::remove_all(target);
      BOOST_LOG_TRIVIAL(info) << "FileStore: Permanently deleted " << path;
    }

    if (is_dir) {
      cache_.invalidate_tree(key);
      checksums_.remove_tree(key);
    } else {
      cache_.invalidate(key);
      checksums_.remove(key);
    }
    access_log_.erase(key);
    return Result<void>::ok();
  });
}

Result<void> FileStore::move_file(const std::string& source, const std::string& destination) {
  return run_operation<void>(OperationKind::Move, source + " -> " + destination, ErrorKind::OSFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(source)) {
      return deny<void>(source);
    }
    if (!validator_.is_safe(destination)) {
      return deny<void>(destination);
    }

    const std::filesystem::path from = validator_.resolve(source);
    const std::filesystem::path to = validator_.resolve(destination);
    if (from == base_path_ || to == base_path_) {
      return Result<void>::err(ErrorKind::AccessDenied, "Refusing to move the base directory");
    }
    // Archived and versioned files may be moved out to restore them
    if (is_managed_directory(from) || is_managed_path(from, false)) {
      return deny_managed<void>(source);
    }
    if (is_managed_path(to, true)) {
      return deny_managed<void>(destination);
    }

    const auto from_status = checked_status(from);
    if (!std::filesystem::exists(from_status)) {
      return Result<void>::err(ErrorKind::NotFound, "Source not found: " + source);
    }
    const auto to_status = checked_status(to);
    if (std::filesystem::is_directory(to_status)) {
      return Result<void>::err(ErrorKind::AlreadyExists, "Destination is a directory: " + destination);
    }
    if (std::filesystem::is_directory(from_status) && std::filesystem::exists(to_status)) {
      return Result<void>::err(ErrorKind::AlreadyExists, "Destination already exists: " + destination);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // A replaced destination is versioned the same way copy_file does it
    if (std::filesystem::exists(to_status)) {
      versions_.snapshot(to);
      checksums_.remove(to.string());
    }
    std::filesystem::create_directories(to.parent_path());
    std::filesystem::rename(from, to);

    checksums_.rename(from.string(), to.string());
    cache_.invalidate_tree(from.string());
    cache_.invalidate_tree(to.string());
    access_log_.erase(from.string());

    BOOST_LOG_TRIVIAL(info) << "FileStore: Moved " << source << " to " << destination;
    return Result<void>::ok();
  });
}

Result<void> FileStore::copy_file(const std::string& source, const std::string& destination) {
  return run_operation<void>(OperationKind::Copy, source + " -> " + destination, ErrorKind::OSFailure,
                             [&]() -> Result<void> {
    if (!validator_.is_safe(source)) {
      return deny<void>(source);
    }
    if (!validator_.is_safe(destination)) {
      return deny<void>(destination);
    }

    const std::filesystem::path from = validator_.resolve(source);
    const std::filesystem::path to = validator_.resolve(destination);
    if (is_managed_path(to, true)) {
      return deny_managed<void>(destination);
    }

    const auto from_status = checked_status(from);
    if (!std::filesystem::exists(from_status)) {
      return Result<void>::err(ErrorKind::NotFound, "Source not found: " + source);
    }
    if (std::filesystem::is_directory(from_status)) {
      return Result<void>::err(ErrorKind::NotAFile, "Source is a directory: " + source);
    }
    const auto to_status = checked_status(to);
    if (std::filesystem::is_directory(to_status)) {
      return Result<void>::err(ErrorKind::NotAFile, "Destination is a directory: " + destination);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (std::filesystem::exists(to_status)) {
      versions_.snapshot(to);
    }
    std::filesystem::create_directories(to.parent_path());
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);

    if (checksums_.has(from.string())) {
      checksums_.copy(from.string(), to.string());
    } else {
      checksums_.remove(to.string());
    }
    cache_.invalidate(to.string());

    BOOST_LOG_TRIVIAL(info) << "FileStore: Copied " << source << " to " << destination;
    return Result<void>::ok();
  });
}


//==============================================
// QUERY OPERATIONS
//==============================================

Result<FileInfo> FileStore::get_file_info(const std::string& path) {
  return run_operation<FileInfo>(OperationKind::Info, path, ErrorKind::OSFailure,
                                 [&]() -> Result<FileInfo> {
    if (!validator_.is_safe(path)) {
      return deny<FileInfo>(path);
    }

    const std::filesystem::path target = validator_.resolve(path);
    if (!std::filesystem::exists(checked_status(target))) {
      return Result<FileInfo>::err(ErrorKind::NotFound, "File not found: " + path);
    }

    FileInfo info;
    static_cast<FileMetadata&>(info) = build_metadata(target);
    info.human_size = utils::human_readable_size(info.size);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const std::string key = target.string();
    info.cached = cache_.contains(key);
    if (auto it = access_log_.find(key); it != access_log_.end()) {
      info.access_count = it->second.total;
      info.recent_accesses.assign(it->second.recent.begin(), it->second.recent.end());
    }
    return Result<FileInfo>::ok(std::move(info));
  });
}

Result<std::vector<FileMetadata>> FileStore::search_files(const std::string& term, const std::string& directory,
                                                          const std::vector<std::string>& extensions) {
  using Matches = std::vector<FileMetadata>;
  return run_operation<Matches>(OperationKind::Search, directory + ":" + term, ErrorKind::OSFailure,
                                [&]() -> Result<Matches> {
    if (!validator_.is_safe(directory)) {
      return deny<Matches>(directory);
    }

    const std::filesystem::path root = validator_.resolve(directory);
    const auto status = checked_status(root);
    if (!std::filesystem::exists(status)) {
      return Result<Matches>::err(ErrorKind::NotFound, "Directory not found: " + directory);
    }
    if (!std::filesystem::is_directory(status)) {
      return Result<Matches>::err(ErrorKind::NotADirectory, "Not a directory: " + directory);
    }

    const std::string needle = utils::to_lower(term);
    std::vector<std::string> wanted;
    for (const auto& extension : extensions) {
      wanted.push_back(normalize_extension(extension));
    }

    Matches matches;
    auto visit = [&](std::filesystem::recursive_directory_iterator& it) {
      const auto& entry = *it;
      const std::string name = entry.path().filename().string();
      std::error_code ec;

      if (entry.is_directory(ec)) {
        // Hidden folders and the store's own bookkeeping are not searched
        if (name.front() == '.' || is_managed_directory(entry.path())) {
          it.disable_recursion_pending();
        }
        return;
      }
      if (!entry.is_regular_file(ec) || utils::is_temp_name(name)) {
        return;
      }
      if (utils::to_lower(name).find(needle) == std::string::npos) {
        return;
      }
      if (!wanted.empty()) {
        const std::string extension = utils::to_lower(entry.path().extension().string());
        if (std::find(wanted.begin(), wanted.end(), extension) == wanted.end()) {
          return;
        }
      }

      try {
        matches.push_back(build_metadata(entry.path()));
      } catch (const std::filesystem::filesystem_error& e) {
        BOOST_LOG_TRIVIAL(warning) << "FileStore: Skipping " << entry.path().string() << ": " << e.what();
      }
    };

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
      visit(it);
      it.increment(ec);
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "FileStore: Search walk stopped early: " << ec.message();
    }

    std::sort(matches.begin(), matches.end(), [](const FileMetadata& a, const FileMetadata& b) {
      return a.path < b.path;
    });

    BOOST_LOG_TRIVIAL(debug) << "FileStore: Search for '" << term << "' matched " << matches.size() << " files";
    return Result<Matches>::ok(std::move(matches));
  });
}

Result<std::vector<std::string>> FileStore::list_versions(const std::string& path) {
  using Names = std::vector<std::string>;
  return run_operation<Names>(OperationKind::Info, path, ErrorKind::OSFailure,
                              [&]() -> Result<Names> {
    if (!validator_.is_safe(path)) {
      return deny<Names>(path);
    }
    const std::filesystem::path relative = validator_.relative_to_base(validator_.resolve(path));
    return Result<Names>::ok(versions_.list(relative));
  });
}

MetricsSnapshot FileStore::metrics_snapshot() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  MetricsSnapshot snapshot;
  snapshot.operations = metrics_.snapshot();
  snapshot.cache_size = cache_.size();
  snapshot.cache_capacity = cache_.capacity();
  snapshot.cache_hit_rate = cache_.hit_rate();
  snapshot.checksum_count = checksums_.size();
  snapshot.security_events = security_log_.event_count();
  return snapshot;
}


//==============================================
// ORGANIZATION
//==============================================

std::string FileStore::category_for(const std::string& filename) {
  static const std::map<std::string, std::string> categories = {
    {".py", "code"},   {".js", "code"},   {".html", "code"}, {".css", "code"},
    {".json", "data"}, {".csv", "data"},
    {".txt", "documentation"}, {".md", "documentation"}
  };

  auto it = categories.find(utils::to_lower(std::filesystem::path(filename).extension().string()));
  return it != categories.end() ? it->second : "other";
}

Result<std::string> FileStore::store_categorized(const std::string& filename, const std::string& content) {
  const std::string name = std::filesystem::path(filename).filename().string();
  if (name.empty()) {
    return Result<std::string>::err(ErrorKind::InvalidArgument, "File name is empty");
  }

  const std::string final_path = category_for(name) + "/" + name;
  auto written = write_text(final_path, content);
  if (!written) {
    return Result<std::string>::err(written.error, written.message);
  }

  BOOST_LOG_TRIVIAL(info) << "FileStore: Organized " << filename << " into " << final_path;
  return Result<std::string>::ok(final_path);
}


//==============================================
// MAINTENANCE
//==============================================

HealthReport FileStore::health_check() {
  HealthReport report;
  report.healthy = true;

  try {
    for (const char* dir : {LOGS_DIR, TEMP_DIR, ARCHIVE_DIR, VERSIONS_DIR, METADATA_DIR}) {
      std::error_code ec;
      const bool present = std::filesystem::is_directory(base_path_ / dir, ec);
      report.details[dir] = present ? "ok" : "missing";
      report.healthy = report.healthy && present;
    }

    // Write, read back and remove a probe file
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const std::filesystem::path probe =
      base_path_ / TEMP_DIR / ("health_probe_" + std::to_string(++temp_sequence_) + ".txt");
    {
      std::ofstream out(probe, std::ios::binary | std::ios::trunc);
      out << "ok";
    }
    const bool readable = std::filesystem::exists(probe) && read_file_bytes(probe) == "ok";
    std::error_code ec;
    std::filesystem::remove(probe, ec);

    report.details["write_probe"] = readable ? "ok" : "failed";
    report.healthy = report.healthy && readable;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FileStore: Health check failed: " << e.what();
    report.details["error"] = e.what();
    report.healthy = false;
  }

  report.details["security_events"] = std::to_string(security_log_.event_count());
  report.details["status"] = report.healthy ? "healthy" : "degraded";
  return report;
}

Result<std::size_t> FileStore::cleanup_archive(int max_age_days) {
  return run_operation<std::size_t>(OperationKind::Maintenance, "archive", ErrorKind::OSFailure,
                                    [&]() -> Result<std::size_t> {
    if (max_age_days < 0) {
      return Result<std::size_t>::err(ErrorKind::InvalidArgument, "Retention must not be negative");
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::size_t removed = remove_entries_older_than(base_path_ / ARCHIVE_DIR, max_age_days);
    BOOST_LOG_TRIVIAL(info) << "FileStore: Removed " << removed << " archive entries older than "
                            << max_age_days << " days";
    return Result<std::size_t>::ok(removed);
  });
}

Result<std::size_t> FileStore::cleanup_versions(int max_age_days) {
  return run_operation<std::size_t>(OperationKind::Maintenance, "versions", ErrorKind::OSFailure,
                                    [&]() -> Result<std::size_t> {
    if (max_age_days < 0) {
      return Result<std::size_t>::err(ErrorKind::InvalidArgument, "Retention must not be negative");
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return Result<std::size_t>::ok(versions_.cleanup(max_age_days));
  });
}

Result<std::size_t> FileStore::cleanup_temp_files() {
  return run_operation<std::size_t>(OperationKind::Maintenance, "temp", ErrorKind::OSFailure,
                                    [&]() -> Result<std::size_t> {
    // No write is in flight while the lock is held
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::size_t removed = remove_orphaned_temps(base_path_);
    std::vector<std::filesystem::path> directories;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(
             base_path_, std::filesystem::directory_options::skip_permission_denied)) {
      std::error_code ec;
      if (entry.is_directory(ec)) {
        directories.push_back(entry.path());
      }
    }
    for (const auto& directory : directories) {
      removed += remove_orphaned_temps(directory);
    }

    // Scratch area is emptied wholesale
    for (const auto& entry : std::filesystem::directory_iterator(base_path_ / TEMP_DIR)) {
      std::error_code ec;
      removed += std::filesystem::remove_all(entry.path(), ec) > 0 ? 1 : 0;
    }

    BOOST_LOG_TRIVIAL(info) << "FileStore: Removed " << removed << " orphaned temp files";
    return Result<std::size_t>::ok(removed);
  });
}

Result<void> FileStore::shutdown() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  const bool saved = checksums_.save();
  logging::flush();
  shut_down_ = true;

  if (!saved) {
    return Result<void>::err(ErrorKind::WriteFailure, "Failed to persist checksum metadata");
  }
  BOOST_LOG_TRIVIAL(info) << "FileStore: Shutdown complete for " << base_path_.string();
  return Result<void>::ok();
}


//==============================================
// WRITE SUPPORT
//==============================================

void FileStore::write_bytes_locked(const std::filesystem::path& target, const std::string& bytes,
                                   bool append, bool backup) {
  const auto status = checked_status(target);
  const bool exists = std::filesystem::exists(status);
  if (exists && std::filesystem::is_directory(status)) {
    throw StoreError(ErrorKind::NotAFile, "Path is a directory: " + target.string());
  }

  if (exists && backup) {
    versions_.snapshot(target);
  }

  const std::filesystem::path directory = target.parent_path();
  std::filesystem::create_directories(directory);

  // Append seeds the temp file with the current content
  const std::string* payload = &bytes;
  std::string combined;
  if (append && exists) {
    combined = read_file_bytes(target);
    combined += bytes;
    payload = &combined;
  }

  TempFileGuard temp(directory / utils::make_temp_name(target.filename().string(), ++temp_sequence_));
  {
    std::ofstream out(temp.path(), std::ios::binary | std::ios::trunc);
    if (!out) {
      const int err = errno;
      throw StoreError(kind_for_errno(err, ErrorKind::WriteFailure),
                       "Failed to create temp file in " + directory.string());
    }
    out.write(payload->data(), static_cast<std::streamsize>(payload->size()));
    out.flush();
    if (!out) {
      throw StoreError(ErrorKind::WriteFailure, "Failed to write temp file for " + target.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp.path(), target, ec);
  if (ec) {
    throw StoreError(ErrorKind::WriteFailure, "Failed to commit " + target.string() + ": " + ec.message());
  }
  temp.release();

  const std::string key = target.string();
  checksums_.update(key, ChecksumStore::checksum(*payload));
  cache_.invalidate(key);
  remove_orphaned_temps(directory);
}

std::size_t FileStore::remove_orphaned_temps(const std::filesystem::path& directory) const {
  std::size_t removed = 0;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
    const std::string name = entry.path().filename().string();
    std::error_code entry_ec;
    if (utils::is_temp_name(name) && entry.is_regular_file(entry_ec)) {
      if (std::filesystem::remove(entry.path(), entry_ec)) {
        BOOST_LOG_TRIVIAL(info) << "FileStore: Removed orphaned temp file " << entry.path().string();
        ++removed;
      }
    }
  }
  return removed;
}


//==============================================
// METADATA SUPPORT
//==============================================

FileMetadata FileStore::build_metadata(const std::filesystem::path& absolute_path) const {
  struct stat st{};
  if (::stat(absolute_path.c_str(), &st) != 0) {
    throw std::filesystem::filesystem_error("Failed to stat", absolute_path,
                                            std::error_code(errno, std::generic_category()));
  }

  FileMetadata meta;
  meta.name = absolute_path.filename().string();
  meta.path = validator_.relative_to_base(absolute_path).generic_string();
  meta.is_file = S_ISREG(st.st_mode);
  meta.is_directory = S_ISDIR(st.st_mode);
  meta.size = meta.is_file ? static_cast<std::uintmax_t>(st.st_size) : 0;
  meta.modified = st.st_mtime;
  meta.created = st.st_ctime;
  meta.mode = static_cast<unsigned int>(st.st_mode & 07777);
  meta.permissions = utils::permission_string(static_cast<std::filesystem::perms>(st.st_mode & 0777));
  meta.mime_type = meta.is_directory ? "inode/directory" : utils::guess_mime_type(absolute_path);

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  meta.checksum = checksums_.get(absolute_path.string());
  return meta;
}

void FileStore::record_access(const std::string& key) {
  AccessRecord& record = access_log_[key];
  ++record.total;
  if (config_.access_log_depth == 0) {
    return;
  }
  record.recent.push_back(std::chrono::system_clock::now());
  while (record.recent.size() > config_.access_log_depth) {
    record.recent.pop_front();
  }
}

bool FileStore::is_managed_path(const std::filesystem::path& absolute_path, bool include_history) const {
  const std::filesystem::path relative = absolute_path.lexically_relative(base_path_);
  if (relative.empty()) {
    return false;
  }
  const std::string top = relative.begin()->string();
  if (top == LOGS_DIR || top == TEMP_DIR || top == METADATA_DIR) {
    return true;
  }
  return include_history && (top == ARCHIVE_DIR || top == VERSIONS_DIR);
}

bool FileStore::is_managed_directory(const std::filesystem::path& absolute_path) const {
  for (const char* dir : {LOGS_DIR, TEMP_DIR, ARCHIVE_DIR, VERSIONS_DIR, METADATA_DIR}) {
    if (absolute_path == base_path_ / dir) {
      return true;
    }
  }
  return false;
}

void FileStore::ensure_layout() {
  for (const char* dir : {LOGS_DIR, TEMP_DIR, ARCHIVE_DIR, VERSIONS_DIR, METADATA_DIR}) {
    std::filesystem::create_directories(base_path_ / dir);
  }
}

} // namespace store
} // namespace safestore
