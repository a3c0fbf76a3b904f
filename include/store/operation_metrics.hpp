#ifndef SAFESTORE_STORE_OPERATION_METRICS_HPP
#define SAFESTORE_STORE_OPERATION_METRICS_HPP

#include <cstdint>
#include <map>
#include <string>

namespace safestore {
namespace store {

enum class OperationKind {
  Read,
  Write,
  WriteBinary,
  ReadBinary,
  List,
  CreateDir,
  Delete,
  Move,
  Copy,
  Info,
  Search,
  Maintenance
};

const char* to_string(OperationKind kind);

// Derived view of one operation kind's counters
struct OperationStats {
  std::uint64_t count{0};
  double total_time{0.0};      // seconds
  std::uint64_t errors{0};
  double average_time{0.0};    // seconds
  double error_rate{0.0};      // errors / count
};

// Append-only per-operation counters; averages are derived on snapshot.
// FileStore serializes access through its instance lock.
class OperationMetrics {
public:
  void record(OperationKind kind, double duration_seconds, bool success);
  std::map<std::string, OperationStats> snapshot() const;
  void reset() { counters_.clear(); }

private:
  struct Counter {
    std::uint64_t count{0};
    double total_time{0.0};
    std::uint64_t errors{0};
  };

  std::map<OperationKind, Counter> counters_;
};

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_OPERATION_METRICS_HPP
