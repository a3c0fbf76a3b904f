#ifndef SAFESTORE_UTILS_FILE_UTILS_HPP
#define SAFESTORE_UTILS_FILE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace safestore::utils {

// ---- TIME FORMATTING ----
// Local-time rendering of a wall clock instant with a strftime pattern
std::string format_timestamp(std::chrono::system_clock::time_point tp, const char* pattern);
// Second-granularity stamp used in version and archive names: YYYYmmdd_HHMMSS
std::string file_timestamp();


// ---- NAMING ----
// Flattens a relative path into a single file name ("a/b/c.txt" -> "a_b_c.txt",
// "a/b_c.txt" -> "a_b%5Fc.txt"); distinct paths give distinct names
std::string flatten_relative_path(const std::filesystem::path& relative);
// "<flattened stem>_<timestamp><extension>" for version and archive copies
std::string timestamped_name(const std::filesystem::path& relative, const std::string& timestamp);
// Hidden temp file name used while a write is in flight
std::string make_temp_name(const std::string& file_name, std::uint64_t sequence);
// True for names produced by make_temp_name
bool is_temp_name(const std::string& file_name);


// ---- METADATA HELPERS ----
std::string guess_mime_type(const std::filesystem::path& path);
std::string human_readable_size(std::uintmax_t bytes);
// "rwxr-xr-x" rendering of permission bits
std::string permission_string(std::filesystem::perms p);
std::string to_lower(std::string value);


// ---- TEXT DECODING ----
// Returns bytes as UTF-8, replacing every invalid sequence with U+FFFD
std::string sanitize_utf8(const std::string& bytes);

} // namespace safestore::utils

#endif // SAFESTORE_UTILS_FILE_UTILS_HPP
