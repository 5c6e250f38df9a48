#include "ResultOrError.h"
#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

struct TestError : lfs::RoeErrorBase {
  using lfs::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = lfs::ResultOrError<T, TestError>;

Roe<int> half(int value) {
  if (value % 2 != 0) {
    return TestError(1, "odd value " + std::to_string(value));
  }
  return value / 2;
}

Roe<void> checkPositive(int value) {
  if (value <= 0) {
    return TestError(2, "not positive");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = half(8);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 4);
  EXPECT_EQ(*result, 4);
  EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = half(3);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
  EXPECT_EQ(result.error().message, "odd value 3");
  EXPECT_THROW(result.value(), std::runtime_error);
  EXPECT_EQ(result.valueOr(-1), -1);
}

TEST(ResultOrErrorTest, ArrowOperator) {
  Roe<std::string> result(std::string("ledger"));
  EXPECT_EQ(result->size(), 6u);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(checkPositive(1).isOk());
  auto failed = checkPositive(0);
  ASSERT_TRUE(failed.isError());
  EXPECT_EQ(failed.error().code, 2);
  EXPECT_THROW(checkPositive(5).error(), std::runtime_error);
}

TEST(ResultOrErrorTest, ErrorStreamsCodeAndMessage) {
  std::ostringstream oss;
  oss << TestError(7, "boom");
  EXPECT_EQ(oss.str(), "[7] boom");
}
