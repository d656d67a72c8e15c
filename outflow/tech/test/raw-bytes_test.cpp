#include "outflow/raw-bytes.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string_view>
#include <utility>

#include "outflow/raw-chars.hpp"

namespace outflow {

template <typename T>
class RawBaseTest : public ::testing::Test {};

using MyTypes = ::testing::Types<RawBytes, RawChars>;
TYPED_TEST_SUITE(RawBaseTest, MyTypes, );

TYPED_TEST(RawBaseTest, DefaultConstructor) {
  TypeParam buf;
  EXPECT_EQ(buf.size(), 0U);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.data(), nullptr);
  EXPECT_EQ(buf.begin(), buf.end());
}

TYPED_TEST(RawBaseTest, CapacityConstructorKeepsSizeZero) {
  TypeParam buf(16);
  EXPECT_EQ(buf.size(), 0U);
  EXPECT_EQ(buf.capacity(), 16U);
  EXPECT_EQ(buf.availableCapacity(), 16U);
}

TYPED_TEST(RawBaseTest, PushBackAndAppendGrow) {
  using Type = typename TypeParam::value_type;
  TypeParam buf;
  for (int i = 0; i < 100; ++i) {
    buf.push_back(static_cast<Type>(i));
  }
  ASSERT_EQ(buf.size(), 100U);
  for (std::size_t i = 0; i < 100; ++i) {
    EXPECT_EQ(buf[i], static_cast<Type>(i));
  }

  TypeParam other;
  other.append(buf.data(), buf.data() + buf.size());
  EXPECT_EQ(other, buf);
}

TYPED_TEST(RawBaseTest, EnsureAvailableCapacityExponentialAtLeastDoubles) {
  TypeParam buf(10);
  buf.setSize(10);
  buf.ensureAvailableCapacityExponential(1);
  EXPECT_GE(buf.capacity(), 21U);
  EXPECT_EQ(buf.size(), 10U);

  buf.ensureAvailableCapacityExponential(1000);
  EXPECT_GE(buf.availableCapacity(), 1000U);
}

TYPED_TEST(RawBaseTest, EnsureAvailableCapacityIsExact) {
  TypeParam buf;
  buf.ensureAvailableCapacity(7);
  EXPECT_EQ(buf.capacity(), 7U);
}

TYPED_TEST(RawBaseTest, EraseFrontShiftsRemaining) {
  using Type = typename TypeParam::value_type;
  TypeParam buf;
  for (int i = 0; i < 5; ++i) {
    buf.push_back(static_cast<Type>('a' + i));
  }
  buf.erase_front(2);
  ASSERT_EQ(buf.size(), 3U);
  EXPECT_EQ(buf[0], static_cast<Type>('c'));
  EXPECT_EQ(buf[2], static_cast<Type>('e'));

  buf.erase_front(3);
  EXPECT_TRUE(buf.empty());
}

TYPED_TEST(RawBaseTest, CopyAndMove) {
  using Type = typename TypeParam::value_type;
  TypeParam buf;
  buf.push_back(static_cast<Type>(1));
  buf.push_back(static_cast<Type>(2));

  TypeParam copy(buf);
  EXPECT_EQ(copy, buf);

  TypeParam moved(std::move(copy));
  EXPECT_EQ(moved, buf);
  EXPECT_TRUE(copy.empty());  // NOLINT(bugprone-use-after-move)

  TypeParam assigned;
  assigned = buf;
  EXPECT_EQ(assigned, buf);

  swap(assigned, moved);
  EXPECT_EQ(assigned, buf);
}

TEST(RawCharsTest, ViewConversion) {
  RawChars buf(std::string_view("hello"));
  std::string_view view = buf;
  EXPECT_EQ(view, "hello");
  buf.append(std::string_view(" world"));
  EXPECT_EQ(std::string_view(buf), "hello world");
}

}  // namespace outflow
