#include "store/result.hpp"

namespace safestore {
namespace store {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:             return "None";
    case ErrorKind::AccessDenied:     return "AccessDenied";
    case ErrorKind::NotFound:         return "NotFound";
    case ErrorKind::NotAFile:         return "NotAFile";
    case ErrorKind::NotADirectory:    return "NotADirectory";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::DecodeError:      return "DecodeError";
    case ErrorKind::SizeExceeded:     return "SizeExceeded";
    case ErrorKind::IntegrityWarning: return "IntegrityWarning";
    case ErrorKind::OSFailure:        return "OSFailure";
    case ErrorKind::WriteFailure:     return "WriteFailure";
    case ErrorKind::AlreadyExists:    return "AlreadyExists";
    case ErrorKind::InvalidArgument:  return "InvalidArgument";
    default:                          return "Unknown";
  }
}

} // namespace store
} // namespace safestore
