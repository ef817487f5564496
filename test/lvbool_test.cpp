#include <gtest/gtest.h>
#include <lvi/LVBool.hpp>


TEST(LVBool, FromBool) {
  ASSERT_EQ(lvi::LVBool(true).raw(), 1);
  ASSERT_EQ(lvi::LVBool(false).raw(), 0);
  ASSERT_EQ(lvi::LVBool().raw(), 0);
}


TEST(LVBool, ToBool) {
  ASSERT_TRUE(static_cast<bool>(lvi::LV_TRUE));
  ASSERT_FALSE(static_cast<bool>(lvi::LV_FALSE));
}


TEST(LVBool, AnyNonzeroByteIsTrue) {
  ASSERT_TRUE(static_cast<bool>(lvi::LVBool::from_raw(2)));
  ASSERT_TRUE(static_cast<bool>(lvi::LVBool::from_raw(0xFF)));
  ASSERT_FALSE(static_cast<bool>(lvi::LVBool::from_raw(0)));
  ASSERT_EQ(lvi::LVBool::from_raw(0xFF).raw(), 0xFF);
}


TEST(LVBool, Equality) {
  ASSERT_TRUE(lvi::LVBool(true) == lvi::LV_TRUE);
  ASSERT_TRUE(lvi::LV_TRUE != lvi::LV_FALSE);
}
