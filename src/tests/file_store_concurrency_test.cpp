#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "store/file_store.hpp"
#include "test_utils.hpp"

using namespace safestore::store;

class FileStoreConcurrencyTest : public ::testing::Test {
protected:
  static constexpr int NUM_THREADS = 8;
  static constexpr int WRITES_PER_THREAD = 20;

  std::filesystem::path test_dir;
  std::unique_ptr<FileStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("concurrency_test");
    store = std::make_unique<FileStore>(test_dir.string());
  }

  void TearDown() override {
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  static std::string payload_for(int thread_id, int iteration) {
    // Large enough that interleaved writes would be visible as a mixture
    return std::string(4096, static_cast<char>('a' + thread_id)) + "#" + std::to_string(iteration);
  }
};

TEST_F(FileStoreConcurrencyTest, DistinctPathsKeepTheirOwnContent) {
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < WRITES_PER_THREAD; ++i) {
        const std::string path = "worker_" + std::to_string(t) + "/file.txt";
        if (!store->write_text(path, payload_for(t, i))) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  for (int t = 0; t < NUM_THREADS; ++t) {
    auto read = store->read_text("worker_" + std::to_string(t) + "/file.txt", false);
    ASSERT_TRUE(read) << read.message;
    EXPECT_EQ(read.value, payload_for(t, WRITES_PER_THREAD - 1));
    EXPECT_TRUE(read.warnings.empty());
  }
}

TEST_F(FileStoreConcurrencyTest, SamePathEndsWithExactlyOnePayload) {
  std::set<std::string> payloads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    payloads.insert(payload_for(t, 0));
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&, t]() {
      if (!store->write_text("shared.txt", payload_for(t, 0))) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  const std::string on_disk = read_whole_file(store->base_path() / "shared.txt");
  EXPECT_EQ(payloads.count(on_disk), 1u);

  // The recorded checksum belongs to the payload that won
  auto info = store->get_file_info("shared.txt");
  ASSERT_TRUE(info);
  ASSERT_TRUE(info.value.checksum.has_value());
  EXPECT_EQ(*info.value.checksum, ChecksumStore::checksum(on_disk));

  // No temp files survive the contention
  for (const auto& entry : std::filesystem::directory_iterator(store->base_path())) {
    EXPECT_EQ(entry.path().filename().string().find(".tmp."), std::string::npos);
  }
}

TEST_F(FileStoreConcurrencyTest, ReadersNeverSeePartialWrites) {
  const std::string first = std::string(8192, 'x');
  const std::string second = std::string(8192, 'y');
  ASSERT_TRUE(store->write_text("flip.txt", first));

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread writer([&]() {
    for (int i = 0; i < 50; ++i) {
      EXPECT_TRUE(store->write_text("flip.txt", i % 2 == 0 ? second : first, false, false));
    }
    done = true;
  });

  std::thread reader([&]() {
    while (!done) {
      auto read = store->read_text("flip.txt");
      if (read && read.value != first && read.value != second) {
        ++torn;
      }
    }
  });

  writer.join();
  reader.join();
  EXPECT_EQ(torn.load(), 0);
}

TEST_F(FileStoreConcurrencyTest, ConcurrentHealthChecksAllSucceed) {
  std::atomic<int> degraded{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < WRITES_PER_THREAD; ++i) {
        if (!store->health_check().healthy) {
          ++degraded;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(degraded.load(), 0);
  EXPECT_TRUE(std::filesystem::is_empty(store->base_path() / FileStore::TEMP_DIR));
}
