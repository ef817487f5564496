#include <gtest/gtest.h>
#include <lvi/Result.hpp>
#include <memory>
#include <string>

using lvi::Error;
using lvi::ErrorKind;
using lvi::Result;

namespace {
  Result<int> parse_positive(int v) {
    if (v <= 0) return Error(ErrorKind::InvalidHandle);
    return v;
  }

  Result<int> doubled(int v) {
    LVI_TRY_ASSIGN(int x, parse_positive(v));
    return x * 2;
  }

  Result<void> check(int v) {
    LVI_TRY(parse_positive(v));
    return {};
  }
}  // namespace



TEST(Result, Value) {
  Result<std::string> r = std::string("ok");
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(static_cast<bool>(r));
  ASSERT_EQ(r.value(), "ok");
}


TEST(Result, Failure) {
  Result<int> r = Error(ErrorKind::LockFailed, 3);
  ASSERT_FALSE(r.ok());
  ASSERT_EQ(r.error().kind, ErrorKind::LockFailed);
  ASSERT_EQ(r.error().status, 3);
  ASSERT_EQ(r.value_or(-1), -1);
}


TEST(Result, MoveOnlyValues) {
  Result<std::unique_ptr<int>> r = std::make_unique<int>(5);
  Result<std::unique_ptr<int>> moved = std::move(r);
  std::unique_ptr<int> p = moved.take();
  ASSERT_EQ(*p, 5);
}


TEST(Result, TryPropagates) {
  ASSERT_EQ(doubled(4).value(), 8);
  ASSERT_EQ(doubled(-4).error().kind, ErrorKind::InvalidHandle);
  ASSERT_TRUE(check(1).ok());
  ASSERT_FALSE(check(0).ok());
}


TEST(Result, ValueOfFailureDies) {
  Result<int> r = Error(ErrorKind::LockFailed);
  ASSERT_DEATH((void)r.value(), ".*");
}
