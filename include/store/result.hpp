#ifndef SAFESTORE_STORE_RESULT_HPP
#define SAFESTORE_STORE_RESULT_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace safestore {
namespace store {

// Failure categories reported by every FileStore operation
enum class ErrorKind {
  None,
  AccessDenied,      // path failed validation
  NotFound,
  NotAFile,
  NotADirectory,
  PermissionDenied,  // OS-level denial
  DecodeError,
  SizeExceeded,
  IntegrityWarning,
  OSFailure,
  WriteFailure,
  AlreadyExists,
  InvalidArgument
};

const char* to_string(ErrorKind kind);


// Outcome of a store operation: either a value or an error kind with message.
// Warnings carry non-fatal conditions (e.g. checksum drift) on success.
template <typename T>
struct Result {
  bool success{false};
  T value{};
  ErrorKind error{ErrorKind::None};
  std::string message;
  std::vector<std::string> warnings;

  static Result ok(T v) {
    Result r;
    r.success = true;
    r.value = std::move(v);
    return r;
  }

  static Result err(ErrorKind kind, std::string msg) {
    Result r;
    r.error = kind;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const { return success; }
};

template <>
struct Result<void> {
  bool success{false};
  ErrorKind error{ErrorKind::None};
  std::string message;
  std::vector<std::string> warnings;

  static Result ok() {
    Result r;
    r.success = true;
    return r;
  }

  static Result err(ErrorKind kind, std::string msg) {
    Result r;
    r.error = kind;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const { return success; }
};


// Internal exception type; converted to a Result at the FileStore boundary
class StoreError : public std::runtime_error {
public:
  StoreError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  explicit StoreError(const std::string& message)
    : StoreError(ErrorKind::OSFailure, message) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_RESULT_HPP
