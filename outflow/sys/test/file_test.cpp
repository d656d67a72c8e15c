#include "outflow/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "outflow/temp-file.hpp"

namespace outflow {

TEST(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), 0U);
}

TEST(FileTest, OpenExistingFile) {
  test::ScopedTempDir dir;
  test::ScopedTempFile tmp(dir, std::string_view("hello outflow"));

  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.openError(), 0);
  EXPECT_TRUE(file.isRegular());
  EXPECT_EQ(file.size(), tmp.content().size());
}

TEST(FileTest, MissingFileReportsErrno) {
  test::ScopedTempDir dir;
  File file((dir.dirPath() / "does-not-exist").string());
  EXPECT_FALSE(file);
  EXPECT_EQ(file.openError(), ENOENT);
}

TEST(FileTest, DirectoryIsNotRegular) {
  test::ScopedTempDir dir;
  File file(dir.dirPath().string());
  ASSERT_TRUE(file);
  EXPECT_FALSE(file.isRegular());
}

TEST(FileTest, ReadAtDoesNotMoveOffset) {
  test::ScopedTempDir dir;
  test::ScopedTempFile tmp(dir, std::string_view("0123456789"));
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);

  std::array<std::byte, 4> buf{};
  ASSERT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size()), "3456");

  ASSERT_EQ(file.readAt(buf, 0), 4U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size()), "0123");

  // Short read at the end, then EOF
  EXPECT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(file.readAt(buf, 10), 0U);
}

TEST(FileTest, MoveTransfersOwnership) {
  test::ScopedTempDir dir;
  test::ScopedTempFile tmp(dir, std::string_view("abc"));
  File file(tmp.filePath().string());
  File other(std::move(file));
  EXPECT_TRUE(other);
  EXPECT_FALSE(file);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(other.size(), 3U);
}

}  // namespace outflow
