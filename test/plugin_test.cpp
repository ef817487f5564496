#include <gtest/gtest.h>
#include <lvi/ErrorCluster.hpp>
#include <lvi/Logger.hpp>
#include <string.h>
#include "FakeManager.hpp"

// The example plugin's entry points, called the way a Call Library Function
// node would call them.
extern "C" {
MgErr set_error_cluster(ErrorClusterPtr cluster);
MgErr auto_error_handling(ErrorClusterPtr cluster, intptr_t param1, intptr_t param2);
MgErr fill_u8_handle(UHandle *hp, int32_t count, uint8_t value);
int32_t string_length(UHandle str);
MgErr counter_create(int64_t start, int64_t step, LVRefNum *out);
MgErr counter_increment(LVRefNum refnum, int64_t *value);
MgErr counter_dispose(LVRefNum refnum);
}


class PluginTest : public ::testing::Test {
 public:
  void SetUp() override {
    lvi::set_log_level(LOG_ERROR);
    fake.reset();
    memset(cluster_storage, 0, sizeof(cluster_storage));
  }

  ErrorClusterPtr cluster(void) { return reinterpret_cast<ErrorClusterPtr>(cluster_storage); }

  std::string cluster_source(void) {
    return lvi::ErrorCluster::from_ptr(cluster()).value().source().value();
  }

  alignas(8) uint8_t cluster_storage[lvi::ErrorClusterLayout::size];
  lvi::test::FakeManager &fake = lvi::test::FakeManager::get();
};



TEST_F(PluginTest, SetErrorCluster) {
  ASSERT_EQ(set_error_cluster(cluster()), 42);
  auto view = lvi::ErrorCluster::from_ptr(cluster());
  ASSERT_TRUE(view.value().status());
  ASSERT_EQ(view.value().code(), 42);
  ASSERT_EQ(cluster_source(), "LVI\n<ERR>\nThis is a test");
}


TEST_F(PluginTest, AutoErrorHandling) {
  ASSERT_EQ(auto_error_handling(cluster(), 1, 2), 42);
  ASSERT_EQ(cluster_source(), "LVI Interop Error\n<ERR>\nInvalidHandle");
}


TEST_F(PluginTest, AutoErrorHandlingSkipsOnIncomingError) {
  ASSERT_EQ(set_error_cluster(cluster()), 42);
  size_t allocations = fake.allocations;

  ASSERT_EQ(auto_error_handling(cluster(), 1, 2), 42);
  ASSERT_EQ(cluster_source(), "LVI\n<ERR>\nThis is a test");
  ASSERT_EQ(fake.allocations, allocations);
}


TEST_F(PluginTest, FillNewHandle) {
  UHandle h = nullptr;
  ASSERT_EQ(fill_u8_handle(&h, 5, 0xAB), lvi::mgNoErr);
  ASSERT_NE(h, nullptr);

  auto handle = lvi::Handle<uint8_t>::from_raw(h);
  auto locked = handle.lock();
  ASSERT_TRUE(locked.ok());
  ASSERT_EQ(locked.value().size(), 5);
  for (auto b : locked.value())
    ASSERT_EQ(b, 0xAB);
}


TEST_F(PluginTest, FillExistingHandle) {
  auto handle = lvi::Handle<uint8_t>::allocate(2);
  ASSERT_TRUE(handle.ok());
  UHandle h = handle.value().into_raw();

  ASSERT_EQ(fill_u8_handle(&h, 9, 1), lvi::mgNoErr);
  ASSERT_TRUE(fake.is_live(h));
  ASSERT_EQ(fake.resizes, 1);
  ASSERT_EQ(fake.disposes, 0);

  auto back = lvi::Handle<uint8_t>::from_raw(h);
  ASSERT_EQ(back.len(), 9);
}


TEST_F(PluginTest, FillRejectsBadArguments) {
  UHandle h = nullptr;
  ASSERT_EQ(fill_u8_handle(nullptr, 1, 0), lvi::mgArgErr);
  ASSERT_EQ(fill_u8_handle(&h, -1, 0), lvi::mgArgErr);
  ASSERT_EQ(h, nullptr);
}


TEST_F(PluginTest, StringLength) {
  auto str = lvi::lstr_new("twelve chars");
  ASSERT_TRUE(str.ok());
  ASSERT_EQ(string_length(str.value().raw()), 12);
  // The plugin only borrowed it.
  ASSERT_EQ(fake.disposes, 0);

  ASSERT_EQ(string_length(nullptr), 0);
}


TEST_F(PluginTest, StringLengthMalformed) {
  auto bad = lvi::Handle<uint8_t>::allocate(2);
  ASSERT_TRUE(bad.ok());
  ASSERT_EQ(string_length(bad.value().raw()), -1);
}


TEST_F(PluginTest, Counter) {
  LVRefNum ref = 0;
  ASSERT_EQ(counter_create(10, 5, &ref), lvi::mgNoErr);
  ASSERT_NE(ref, 0);

  int64_t value = 0;
  ASSERT_EQ(counter_increment(ref, &value), lvi::mgNoErr);
  ASSERT_EQ(value, 15);
  ASSERT_EQ(counter_increment(ref, &value), lvi::mgNoErr);
  ASSERT_EQ(value, 20);
  ASSERT_EQ(fake.live_refnums(), 1);

  ASSERT_EQ(counter_dispose(ref), lvi::mgNoErr);
  ASSERT_EQ(fake.live_refnums(), 0);
  ASSERT_EQ(fake.locks, fake.unlocks);
  ASSERT_EQ(fake.bad_calls, 0);
}


TEST_F(PluginTest, CounterAfterHostInvalidates) {
  LVRefNum ref = 0;
  ASSERT_EQ(counter_create(0, 1, &ref), lvi::mgNoErr);
  fake.invalidate(ref);

  int64_t value = -1;
  ASSERT_EQ(counter_increment(ref, &value), lvi::mgArgErr);
  ASSERT_EQ(value, -1);
  ASSERT_EQ(counter_dispose(ref), lvi::mgNoErr);
}


TEST_F(PluginTest, CounterOverflow) {
  LVRefNum ref = 0;
  ASSERT_EQ(counter_create(INT64_MAX - 1, 1, &ref), lvi::mgNoErr);

  int64_t value = 0;
  ASSERT_EQ(counter_increment(ref, &value), lvi::mgNoErr);
  ASSERT_EQ(value, INT64_MAX);

  value = 0;
  ASSERT_EQ(counter_increment(ref, &value), lvi::mgArgErr);
  ASSERT_EQ(value, 0);
  ASSERT_EQ(fake.locks, fake.unlocks);
  ASSERT_EQ(counter_dispose(ref), lvi::mgNoErr);
}
