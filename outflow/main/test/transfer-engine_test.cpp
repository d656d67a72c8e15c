#include "outflow/transfer-engine.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "outflow/base-fd.hpp"
#include "outflow/fd-transfer-sink.hpp"
#include "outflow/file.hpp"
#include "outflow/source-unreadable-error.hpp"
#include "outflow/temp-file.hpp"
#include "outflow/transfer-config.hpp"
#include "outflow/transfer-sink.hpp"
#include "outflow/transfer-stats.hpp"

namespace outflow {

namespace {

constexpr std::size_t kTestChunkSize = 64UL * 1024UL;
constexpr std::size_t kTestBufferSize = 16UL * 1024UL;

TransferConfig TestConfig() { return TransferConfig{}.withChunkSize(kTestChunkSize).withBufferSize(kTestBufferSize); }

BaseFd OpenOutput(const std::filesystem::path& path) {
  return BaseFd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
}

// Collects everything written through the buffered path.
class StringSink : public TransferSink {
 public:
  ChunkResult transferFrom([[maybe_unused]] const File& file, [[maybe_unused]] std::size_t offset,
                           [[maybe_unused]] std::size_t count) override {
    return {0, ChunkResult::Code::Unsupported, EINVAL};
  }

  void write(std::span<const std::byte> data) override {
    content.append(reinterpret_cast<const char*>(data.data()), data.size());
  }

  std::string content;
};

// Moves the first chunk itself, then reports zero-copy as unsupported.
class PartialThenUnsupportedSink final : public StringSink {
 public:
  ChunkResult transferFrom(const File& file, std::size_t offset, std::size_t count) override {
    if (nbCalls++ != 0) {
      return {0, ChunkResult::Code::Unsupported, ENOSYS};
    }
    std::string buf(count, '\0');
    const std::size_t nbRead = file.readAt(std::as_writable_bytes(std::span<char>(buf)), offset);
    content.append(buf.data(), nbRead);
    return {nbRead, ChunkResult::Code::Moved, 0};
  }

  int nbCalls{};
};

// Never makes progress.
class StalledSink final : public StringSink {
 public:
  ChunkResult transferFrom([[maybe_unused]] const File& file, [[maybe_unused]] std::size_t offset,
                           [[maybe_unused]] std::size_t count) override {
    return {0, ChunkResult::Code::Moved, 0};
  }
};

class ErrorSink final : public StringSink {
 public:
  ChunkResult transferFrom([[maybe_unused]] const File& file, [[maybe_unused]] std::size_t offset,
                           [[maybe_unused]] std::size_t count) override {
    return {0, ChunkResult::Code::Error, EIO};
  }

  void write([[maybe_unused]] std::span<const std::byte> data) override {
    throw std::system_error(std::error_code(EPIPE, std::generic_category()), "broken sink");
  }
};

// Forwards to an fd sink and records the requested chunk sizes.
class RecordingSink final : public TransferSink {
 public:
  explicit RecordingSink(NativeHandle fd) : _fdSink(fd) {}

  ChunkResult transferFrom(const File& file, std::size_t offset, std::size_t count) override {
    requestedCounts.push_back(count);
    return _fdSink.transferFrom(file, offset, count);
  }

  void write(std::span<const std::byte> data) override { _fdSink.write(data); }

  std::vector<std::size_t> requestedCounts;

 private:
  FdTransferSink _fdSink;
};

}  // namespace

class TransferEngineSizesTest : public ::testing::TestWithParam<std::size_t> {
 protected:
  test::ScopedTempDir dir;
  TransferStats stats;
};

TEST_P(TransferEngineSizesTest, ZeroCopyAndBufferedProduceIdenticalContent) {
  const std::size_t fileSize = GetParam();
  test::ScopedTempFile src(dir, static_cast<uint64_t>(fileSize), 42U);

  const auto zeroCopyPath = dir.dirPath() / "zero-copy.out";
  const auto bufferedPath = dir.dirPath() / "buffered.out";

  {
    TransferEngine engine(TestConfig(), stats);
    BaseFd out = OpenOutput(zeroCopyPath);
    ASSERT_TRUE(out);
    FdTransferSink sink(out.fd());
    const auto outcome = engine.transfer(File(src.filePath().string()), sink);
    EXPECT_EQ(outcome, (TransferOutcome{TransferMode::ZeroCopy, TransferStatus::Completed, fileSize}));
    EXPECT_EQ(stats.bytesTransferred(), fileSize);
    EXPECT_EQ(stats.transfers(), 1U);
  }
  {
    TransferEngine engine(TestConfig().withZeroCopy(false), stats);
    BaseFd out = OpenOutput(bufferedPath);
    ASSERT_TRUE(out);
    FdTransferSink sink(out.fd());
    const auto outcome = engine.transfer(File(src.filePath().string()), sink);
    EXPECT_EQ(outcome, (TransferOutcome{TransferMode::Buffered, TransferStatus::Completed, fileSize}));
    EXPECT_EQ(stats.bytesTransferred(), 2U * fileSize);
    EXPECT_EQ(stats.transfers(), 2U);
  }

  EXPECT_EQ(stats.errors(), 0U);
  EXPECT_EQ(test::ReadFileContent(zeroCopyPath), src.content());
  EXPECT_EQ(test::ReadFileContent(bufferedPath), src.content());
}

INSTANTIATE_TEST_SUITE_P(FileSizes, TransferEngineSizesTest,
                         ::testing::Values(std::size_t{10UL * 1024UL}, std::size_t{1024UL * 1024UL},
                                           std::size_t{(2UL * kTestChunkSize) + 12345UL}));

class TransferEngineTest : public ::testing::Test {
 protected:
  test::ScopedTempDir dir;
  TransferStats stats;
  TransferEngine engine{TestConfig(), stats};
};

TEST_F(TransferEngineTest, InvalidConfigThrows) {
  EXPECT_THROW(TransferEngine(TransferConfig{}.withChunkSize(0), stats), std::invalid_argument);
}

TEST_F(TransferEngineTest, ChunksAreCappedAndContiguous) {
  test::ScopedTempFile src(dir, static_cast<uint64_t>((3UL * kTestChunkSize) + 1UL), 3U);
  const auto outPath = dir.dirPath() / "out";
  BaseFd out = OpenOutput(outPath);
  RecordingSink sink(out.fd());

  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome.status, TransferStatus::Completed);
  ASSERT_GE(sink.requestedCounts.size(), 4U);
  EXPECT_TRUE(std::ranges::all_of(sink.requestedCounts, [](std::size_t count) { return count <= kTestChunkSize; }));
  EXPECT_EQ(sink.requestedCounts.back(), 1U);
  EXPECT_EQ(test::ReadFileContent(outPath), src.content());
}

TEST_F(TransferEngineTest, UnsupportedFallsBackToBuffered) {
  test::ScopedTempFile src(dir, static_cast<uint64_t>(100000), 5U);
  StringSink sink;

  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::Buffered, TransferStatus::Completed, 100000U}));
  EXPECT_EQ(sink.content, src.content());
  EXPECT_EQ(stats.errors(), 1U);
  EXPECT_EQ(stats.transfers(), 1U);
  EXPECT_EQ(stats.bytesTransferred(), 100000U);
}

TEST_F(TransferEngineTest, FallbackResumesFromCursor) {
  test::ScopedTempFile src(dir, static_cast<uint64_t>((2UL * kTestChunkSize) + 999UL), 11U);
  PartialThenUnsupportedSink sink;

  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome.mode, TransferMode::Buffered);
  EXPECT_EQ(outcome.status, TransferStatus::Completed);
  EXPECT_EQ(sink.nbCalls, 2);
  EXPECT_EQ(sink.content, src.content());
  EXPECT_EQ(stats.errors(), 1U);
}

TEST_F(TransferEngineTest, StalledTransferIsFatal) {
  test::ScopedTempFile src(dir, std::string_view("some bytes that will never move"));
  StalledSink sink;

  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::ZeroCopy, TransferStatus::Stalled, 0U}));
  EXPECT_TRUE(sink.content.empty());
  EXPECT_EQ(stats.errors(), 1U);
  EXPECT_EQ(stats.transfers(), 0U);
  EXPECT_EQ(stats.bytesTransferred(), 0U);
}

TEST_F(TransferEngineTest, SinkErrors) {
  test::ScopedTempFile src(dir, std::string_view("payload"));
  ErrorSink sink;

  auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::ZeroCopy, TransferStatus::Error, 0U}));

  TransferEngine bufferedEngine(TestConfig().withZeroCopy(false), stats);
  outcome = bufferedEngine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::Buffered, TransferStatus::Error, 0U}));

  EXPECT_EQ(stats.errors(), 2U);
  EXPECT_EQ(stats.transfers(), 0U);
}

TEST_F(TransferEngineTest, SmallFilesBelowThresholdAreBuffered) {
  test::ScopedTempFile src(dir, static_cast<uint64_t>(1000), 1U);
  TransferEngine thresholdEngine(TestConfig().withZeroCopyThreshold(4096), stats);
  StringSink sink;

  const auto outcome = thresholdEngine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::Buffered, TransferStatus::Completed, 1000U}));
  EXPECT_EQ(sink.content, src.content());
  EXPECT_EQ(stats.errors(), 0U);
}

TEST_F(TransferEngineTest, EmptyFile) {
  test::ScopedTempFile src(dir, std::string_view{});
  StalledSink sink;

  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::ZeroCopy, TransferStatus::Completed, 0U}));
  EXPECT_EQ(stats.transfers(), 1U);
  EXPECT_EQ(stats.bytesTransferred(), 0U);
  EXPECT_EQ(stats.errors(), 0U);
}

TEST_F(TransferEngineTest, UnreadableSources) {
  StringSink sink;

  const auto missing = (dir.dirPath() / "missing").string();
  try {
    engine.transfer(std::string_view(missing), sink);
    FAIL() << "Expected SourceUnreadableError";
  } catch (const SourceUnreadableError& ex) {
    EXPECT_EQ(ex.code().value(), ENOENT);
  }

  EXPECT_THROW(engine.transfer(std::string_view(dir.dirPath().string()), sink), SourceUnreadableError);
  EXPECT_THROW(engine.transfer(File(), sink), SourceUnreadableError);
  EXPECT_THROW(engine.transfer(File(missing), sink), std::system_error);

  EXPECT_EQ(stats.snapshot(), TransferStats::Snapshot{});
}

TEST_F(TransferEngineTest, TransferByPath) {
  test::ScopedTempFile src(dir, static_cast<uint64_t>(5000), 9U);
  StringSink sink;
  const auto outcome = engine.transfer(std::string_view(src.filePath().string()), sink);
  EXPECT_EQ(outcome.status, TransferStatus::Completed);
  EXPECT_EQ(sink.content, src.content());
}

TEST_F(TransferEngineTest, ZeroCopyOverSocket) {
  static constexpr std::size_t kFileSize = 1024UL * 1024UL;
  test::ScopedTempFile src(dir, static_cast<uint64_t>(kFileSize), 77U);

  int sv[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
  BaseFd writer(sv[0]);
  BaseFd reader(sv[1]);

  std::string received;
  std::jthread readerThread([&received, fd = reader.fd()] {
    char buf[16384];
    while (true) {
      const auto nb = ::read(fd, buf, sizeof(buf));
      if (nb <= 0) {
        break;
      }
      received.append(buf, static_cast<std::size_t>(nb));
    }
  });

  FdTransferSink sink(writer.fd());
  const auto outcome = engine.transfer(File(src.filePath().string()), sink);
  writer.close();
  readerThread.join();

  EXPECT_EQ(outcome, (TransferOutcome{TransferMode::ZeroCopy, TransferStatus::Completed, kFileSize}));
  EXPECT_EQ(received, src.content());
}

TEST_F(TransferEngineTest, ConcurrentTransfersAreAllCounted) {
  static constexpr int kNbThreads = 8;
  static constexpr std::size_t kFileSize = (2UL * kTestChunkSize) + 17UL;
  test::ScopedTempFile src(dir, static_cast<uint64_t>(kFileSize), 123U);

  std::vector<TransferOutcome> outcomes(kNbThreads);
  {
    std::vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
      threads.emplace_back([this, &src, &outcomes, threadPos] {
        BaseFd out = OpenOutput(dir.dirPath() / ("out-" + std::to_string(threadPos)));
        FdTransferSink sink(out.fd());
        outcomes[static_cast<std::size_t>(threadPos)] = engine.transfer(File(src.filePath().string()), sink);
      });
    }
  }

  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    EXPECT_EQ(outcomes[static_cast<std::size_t>(threadPos)].status, TransferStatus::Completed);
    EXPECT_EQ(test::ReadFileContent(dir.dirPath() / ("out-" + std::to_string(threadPos))), src.content());
  }
  EXPECT_EQ(stats.transfers(), static_cast<uint64_t>(kNbThreads));
  EXPECT_EQ(stats.bytesTransferred(), static_cast<uint64_t>(kNbThreads) * kFileSize);
  EXPECT_EQ(stats.errors(), 0U);
}

TEST(TransferNamesTest, Names) {
  EXPECT_EQ(TransferModeName(TransferMode::ZeroCopy), "zero-copy");
  EXPECT_EQ(TransferModeName(TransferMode::Buffered), "buffered");
  EXPECT_EQ(TransferStatusName(TransferStatus::Completed), "completed");
  EXPECT_EQ(TransferStatusName(TransferStatus::Stalled), "stalled");
  EXPECT_EQ(TransferStatusName(TransferStatus::Error), "error");
}

}  // namespace outflow
