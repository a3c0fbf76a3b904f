#include "store/path_validator.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <system_error>

namespace safestore {
namespace store {

namespace {

// Raw-input patterns that are refused regardless of where they resolve
const char* const DENIED_PATTERNS[] = {
  R"((\.\.[/\\]){2,})",                                  // repeated parent traversal
  R"(/etc/)",
  R"(/proc/)",
  R"(c:\\windows)",
  R"((^|[/\\])\.(git|svn|hg)([/\\]|$))",                 // version control metadata
  R"((^|[/\\])(\.env(\.[^/\\]*)?|\.netrc|\.npmrc|\.pypirc)$)"  // secret files
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PathValidator::PathValidator(const std::filesystem::path& base_path, logging::SecurityLog& security_log)
  : base_path_(base_path)
  , security_log_(security_log) {
  for (const char* pattern : DENIED_PATTERNS) {
    denied_patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
  }
  BOOST_LOG_TRIVIAL(debug) << "PathValidator: Confining paths to " << base_path_.string();
}


//==============================================
// VALIDATION
//==============================================

bool PathValidator::is_safe(const std::string& relative_path) const {
  if (relative_path.find('\0') != std::string::npos) {
    reject(relative_path, "embedded NUL byte");
    return false;
  }

  std::filesystem::path resolved = resolve(relative_path);
  if (!is_within_base(resolved)) {
    reject(relative_path, "resolves outside base directory");
    return false;
  }

  if (matches_denylist(relative_path)) {
    reject(relative_path, "matches denied pattern");
    return false;
  }

  if (is_hidden_name(resolved)) {
    reject(relative_path, "hidden file name");
    return false;
  }

  return true;
}

std::filesystem::path PathValidator::resolve(const std::string& relative_path) const {
  std::filesystem::path joined = base_path_ / relative_path;

  // Symlinks in the existing prefix are followed so they cannot smuggle a path out
  std::error_code ec;
  std::filesystem::path resolved = std::filesystem::weakly_canonical(joined, ec);
  if (ec) {
    resolved = joined.lexically_normal();
  }

  if (resolved.has_parent_path() && resolved.filename().empty()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

std::filesystem::path PathValidator::relative_to_base(const std::filesystem::path& absolute_path) const {
  return absolute_path.lexically_relative(base_path_);
}


//==============================================
// CHECKS
//==============================================

bool PathValidator::is_within_base(const std::filesystem::path& resolved) const {
  auto [base_it, resolved_it] = std::mismatch(base_path_.begin(), base_path_.end(),
                                              resolved.begin(), resolved.end());
  return base_it == base_path_.end();
}

bool PathValidator::matches_denylist(const std::string& relative_path) const {
  return std::any_of(denied_patterns_.begin(), denied_patterns_.end(),
                     [&relative_path](const std::regex& pattern) {
                       return std::regex_search(relative_path, pattern);
                     });
}

bool PathValidator::is_hidden_name(const std::filesystem::path& resolved) const {
  if (resolved == base_path_) {
    return false;
  }

  const std::string name = resolved.filename().string();
  if (name.empty() || name.front() != '.') {
    return false;
  }

  return std::none_of(ALLOWED_HIDDEN_NAMES.begin(), ALLOWED_HIDDEN_NAMES.end(),
                      [&name](const char* allowed) { return name == allowed; });
}

void PathValidator::reject(const std::string& relative_path, const std::string& reason) const {
  security_log_.record("PATH_REJECTED", "'" + relative_path + "' (" + reason + ")");
}

} // namespace store
} // namespace safestore
