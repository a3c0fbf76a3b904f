#include "store/operation_metrics.hpp"

namespace safestore {
namespace store {

const char* to_string(OperationKind kind) {
  switch (kind) {
    case OperationKind::Read:        return "read";
    case OperationKind::Write:       return "write";
    case OperationKind::WriteBinary: return "write_binary";
    case OperationKind::ReadBinary:  return "read_binary";
    case OperationKind::List:        return "list";
    case OperationKind::CreateDir:   return "create_dir";
    case OperationKind::Delete:      return "delete";
    case OperationKind::Move:        return "move";
    case OperationKind::Copy:        return "copy";
    case OperationKind::Info:        return "info";
    case OperationKind::Search:      return "search";
    case OperationKind::Maintenance: return "maintenance";
    default:                         return "unknown";
  }
}

void OperationMetrics::record(OperationKind kind, double duration_seconds, bool success) {
  Counter& counter = counters_[kind];
  ++counter.count;
  counter.total_time += duration_seconds;
  if (!success) {
    ++counter.errors;
  }
}

std::map<std::string, OperationStats> OperationMetrics::snapshot() const {
  std::map<std::string, OperationStats> result;
  for (const auto& [kind, counter] : counters_) {
    OperationStats stats;
    stats.count = counter.count;
    stats.total_time = counter.total_time;
    stats.errors = counter.errors;
    if (counter.count > 0) {
      stats.average_time = counter.total_time / static_cast<double>(counter.count);
      stats.error_rate = static_cast<double>(counter.errors) / static_cast<double>(counter.count);
    }
    result.emplace(to_string(kind), stats);
  }
  return result;
}

} // namespace store
} // namespace safestore
