#include <gtest/gtest.h>
#include "store/operation_metrics.hpp"

using namespace safestore::store;

TEST(OperationMetricsTest, EmptySnapshot) {
  OperationMetrics metrics;
  EXPECT_TRUE(metrics.snapshot().empty());
}

TEST(OperationMetricsTest, DerivesAveragesAndErrorRate) {
  OperationMetrics metrics;
  metrics.record(OperationKind::Read, 0.2, true);
  metrics.record(OperationKind::Read, 0.4, true);
  metrics.record(OperationKind::Read, 0.6, false);
  metrics.record(OperationKind::Write, 1.0, false);

  auto snapshot = metrics.snapshot();
  ASSERT_EQ(snapshot.size(), 2u);

  const auto& read = snapshot.at("read");
  EXPECT_EQ(read.count, 3u);
  EXPECT_EQ(read.errors, 1u);
  EXPECT_NEAR(read.total_time, 1.2, 1e-9);
  EXPECT_NEAR(read.average_time, 0.4, 1e-9);
  EXPECT_NEAR(read.error_rate, 1.0 / 3.0, 1e-9);

  const auto& write = snapshot.at("write");
  EXPECT_EQ(write.count, 1u);
  EXPECT_DOUBLE_EQ(write.error_rate, 1.0);
}

TEST(OperationMetricsTest, KindNames) {
  EXPECT_STREQ(to_string(OperationKind::WriteBinary), "write_binary");
  EXPECT_STREQ(to_string(OperationKind::CreateDir), "create_dir");
  EXPECT_STREQ(to_string(OperationKind::Search), "search");
}

TEST(OperationMetricsTest, ResetClearsCounters) {
  OperationMetrics metrics;
  metrics.record(OperationKind::Delete, 0.1, true);
  metrics.reset();
  EXPECT_TRUE(metrics.snapshot().empty());
}
