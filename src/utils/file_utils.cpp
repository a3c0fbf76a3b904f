#include "utils/file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <regex>
#include <sstream>

namespace safestore::utils {

//==============================================
// TIME FORMATTING
//==============================================

std::string format_timestamp(std::chrono::system_clock::time_point tp, const char* pattern) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, pattern);
  return ss.str();
}

std::string file_timestamp() {
  return format_timestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
}


//==============================================
// NAMING
//==============================================

std::string flatten_relative_path(const std::filesystem::path& relative) {
  // '%' and '_' are percent-escaped so distinct paths never flatten to the same name
  std::string flat;
  for (char c : relative.generic_string()) {
    switch (c) {
      case '%':  flat += "%25"; break;
      case '_':  flat += "%5F"; break;
      case '\\': flat += "%5C"; break;
      case '/':  flat += '_'; break;
      default:   flat += c; break;
    }
  }

  // Drop separators that led the original path
  auto first = flat.find_first_not_of('_');
  return first == std::string::npos ? std::string("root") : flat.substr(first);
}

std::string timestamped_name(const std::filesystem::path& relative, const std::string& timestamp) {
  std::filesystem::path flat(flatten_relative_path(relative));
  return flat.stem().string() + "_" + timestamp + flat.extension().string();
}

std::string make_temp_name(const std::string& file_name, std::uint64_t sequence) {
  return "." + file_name + ".tmp." + std::to_string(sequence);
}

bool is_temp_name(const std::string& file_name) {
  static const std::regex temp_pattern(R"(^\..+\.tmp\.[0-9]+$)");
  return std::regex_match(file_name, temp_pattern);
}


//==============================================
// METADATA HELPERS
//==============================================

std::string guess_mime_type(const std::filesystem::path& path) {
  static const std::map<std::string, std::string> types = {
    {".txt", "text/plain"},        {".md", "text/markdown"},
    {".html", "text/html"},        {".htm", "text/html"},
    {".css", "text/css"},          {".csv", "text/csv"},
    {".js", "text/javascript"},    {".py", "text/x-python"},
    {".json", "application/json"}, {".xml", "application/xml"},
    {".pdf", "application/pdf"},   {".zip", "application/zip"},
    {".gz", "application/gzip"},   {".tar", "application/x-tar"},
    {".png", "image/png"},         {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},       {".gif", "image/gif"},
    {".svg", "image/svg+xml"},     {".webp", "image/webp"},
    {".mp3", "audio/mpeg"},        {".wav", "audio/x-wav"},
    {".mp4", "video/mp4"},         {".log", "text/plain"}
  };

  auto it = types.find(to_lower(path.extension().string()));
  return it != types.end() ? it->second : "application/octet-stream";
}

std::string human_readable_size(std::uintmax_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};

  if (bytes < 1024) {
    return std::to_string(bytes) + " B";
  }

  double size = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    ++unit;
  }

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << size << " " << units[unit];
  return ss.str();
}

std::string permission_string(std::filesystem::perms p) {
  using std::filesystem::perms;
  const std::pair<perms, char> bits[] = {
    {perms::owner_read, 'r'},  {perms::owner_write, 'w'},  {perms::owner_exec, 'x'},
    {perms::group_read, 'r'},  {perms::group_write, 'w'},  {perms::group_exec, 'x'},
    {perms::others_read, 'r'}, {perms::others_write, 'w'}, {perms::others_exec, 'x'}
  };

  std::string out;
  for (const auto& [bit, symbol] : bits) {
    out += (p & bit) != perms::none ? symbol : '-';
  }
  return out;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}


//==============================================
// TEXT DECODING
//==============================================

std::string sanitize_utf8(const std::string& bytes) {
  static const char replacement[] = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(bytes.size());

  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80) {
      out += static_cast<char>(lead);
      ++i;
      continue;
    }

    std::size_t length = 0;
    std::uint32_t code_point = 0;
    std::uint32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2; code_point = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3; code_point = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4; code_point = lead & 0x07; minimum = 0x10000;
    } else {
      out += replacement;
      ++i;
      continue;
    }

    bool valid = i + length <= n;
    for (std::size_t k = 1; valid && k < length; ++k) {
      const auto next = static_cast<unsigned char>(bytes[i + k]);
      if ((next & 0xC0) != 0x80) {
        valid = false;
      } else {
        code_point = (code_point << 6) | (next & 0x3F);
      }
    }

    // Reject overlong forms, surrogates and values past the Unicode range
    if (valid && code_point >= minimum && code_point <= 0x10FFFF &&
        !(code_point >= 0xD800 && code_point <= 0xDFFF)) {
      out.append(bytes, i, length);
      i += length;
    } else {
      out += replacement;
      ++i;
    }
  }
  return out;
}

} // namespace safestore::utils
