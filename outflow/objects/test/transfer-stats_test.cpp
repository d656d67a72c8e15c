#include "outflow/transfer-stats.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <thread>
#include <vector>

namespace outflow {

TEST(TransferStatsTest, StartsAtZero) {
  TransferStats stats;
  EXPECT_EQ(stats.snapshot(), TransferStats::Snapshot{});
}

TEST(TransferStatsTest, RecordAndReset) {
  TransferStats stats;
  stats.recordCompleted(100);
  stats.recordCompleted(50);
  stats.recordError();

  EXPECT_EQ(stats.transfers(), 2U);
  EXPECT_EQ(stats.bytesTransferred(), 150U);
  EXPECT_EQ(stats.errors(), 1U);

  stats.reset();
  EXPECT_EQ(stats.snapshot(), TransferStats::Snapshot{});
}

TEST(TransferStatsTest, JsonSnapshot) {
  TransferStats::Snapshot snapshot{3, 4096, 1};
  EXPECT_EQ(snapshot.json_str(), R"({"transfers":3,"bytesTransferred":4096,"errors":1})");
}

TEST(TransferStatsTest, ConcurrentUpdatesAreNotLost) {
  static constexpr int kNbThreads = 8;
  static constexpr int kNbIterations = 10000;
  static constexpr uint64_t kBytesPerTransfer = 7;

  TransferStats stats;
  {
    std::vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
      threads.emplace_back([&stats] {
        for (int iter = 0; iter < kNbIterations; ++iter) {
          stats.recordCompleted(kBytesPerTransfer);
          stats.recordError();
        }
      });
    }
  }
  EXPECT_EQ(stats.transfers(), static_cast<uint64_t>(kNbThreads) * kNbIterations);
  EXPECT_EQ(stats.bytesTransferred(), static_cast<uint64_t>(kNbThreads) * kNbIterations * kBytesPerTransfer);
  EXPECT_EQ(stats.errors(), static_cast<uint64_t>(kNbThreads) * kNbIterations);
}

}  // namespace outflow
