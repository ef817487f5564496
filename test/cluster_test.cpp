#include <gtest/gtest.h>
#include <lvi/Cluster.hpp>
#include <lvi/ErrorCluster.hpp>
#include <stdint.h>

using lvi::ClusterLayout;
using lvi::Packing;


TEST(ClusterLayout, Packed) {
  using L = ClusterLayout<Packing::Packed, uint8_t, uint32_t, double>;
  ASSERT_EQ(L::field_count, 3);
  ASSERT_EQ(L::offset<0>, 0);
  ASSERT_EQ(L::offset<1>, 1);
  ASSERT_EQ(L::offset<2>, 5);
  ASSERT_EQ(L::size, 13);
}


TEST(ClusterLayout, Natural) {
  using L = ClusterLayout<Packing::Natural, uint8_t, uint32_t, double>;
  ASSERT_EQ(L::offset<0>, 0);
  ASSERT_EQ(L::offset<1>, 4);
  ASSERT_EQ(L::offset<2>, 8);
  ASSERT_EQ(L::size, 16);
}


TEST(ClusterLayout, NaturalTailPadding) {
  using L = ClusterLayout<Packing::Natural, double, uint8_t>;
  ASSERT_EQ(L::offset<1>, 8);
  ASSERT_EQ(L::size, 16);

  using P = ClusterLayout<Packing::Packed, double, uint8_t>;
  ASSERT_EQ(P::size, 9);
}


TEST(ClusterLayout, FieldTypes) {
  using L = ClusterLayout<Packing::Packed, lvi::LVBool, int32_t>;
  ASSERT_TRUE((std::is_same<L::type<0>, lvi::LVBool>::value));
  ASSERT_TRUE((std::is_same<L::field<1>::type, int32_t>::value));
  ASSERT_EQ(L::field<1>::offset, 1);
}


TEST(ClusterLayout, ErrorClusterOnThisHost) {
  using L = lvi::ErrorClusterLayout;
  ASSERT_EQ(L::offset<0>, 0);
  if (sizeof(void *) == 4) {
    ASSERT_EQ(L::packing, Packing::Packed);
    ASSERT_EQ(L::offset<1>, 1);
    ASSERT_EQ(L::offset<2>, 5);
    ASSERT_EQ(L::size, 9);
  } else {
    ASSERT_EQ(L::packing, Packing::Natural);
    ASSERT_EQ(L::offset<1>, 4);
    ASSERT_EQ(L::offset<2>, 8);
    ASSERT_EQ(L::size, 16);
  }
}
