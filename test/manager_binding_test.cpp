#include <gtest/gtest.h>
#include <lvi/ManagerBinding.hpp>
#include <lvi/Logger.hpp>
#include "FakeManager.hpp"

// These tests check how the binding translates host answers into results.
// Most use a private binding around the fake's table; the global binding is
// the fake as well, installed by FakeManager::get().

class ManagerBindingTest : public ::testing::Test {
 public:
  void SetUp() override {
    lvi::set_log_level(LOG_ERROR);
    fake.reset();
  }

  lvi::test::FakeManager &fake = lvi::test::FakeManager::get();
  lvi::ManagerBinding binding{lvi::test::FakeManager::table()};
};



TEST_F(ManagerBindingTest, GlobalBindingIsResolved) {
  ASSERT_TRUE(lvi::ManagerBinding::get().memory_ready());
  ASSERT_TRUE(lvi::ManagerBinding::get().refnums_ready());
}


TEST_F(ManagerBindingTest, ResolvedOnlyOnce) {
  // The global binding was installed by the fake. Nothing can replace it.
  ASSERT_FALSE(lvi::ManagerBinding::install(lvi::ManagerTable{}));
  ASSERT_FALSE(lvi::ManagerBinding::configure(lvi::Configuration{}));
  ASSERT_TRUE(lvi::ManagerBinding::get().memory_ready());
}


TEST_F(ManagerBindingTest, EmptyTableReportsUnavailable) {
  lvi::ManagerBinding empty{lvi::ManagerTable{}};
  ASSERT_FALSE(empty.memory_ready());
  ASSERT_FALSE(empty.refnums_ready());

  auto h = empty.allocate(16);
  ASSERT_FALSE(h.ok());
  EXPECT_EQ(h.error().kind, lvi::ErrorKind::ManagerUnavailable);

  auto ref = empty.new_ref(LVRefDescriptor{8, nullptr, nullptr});
  ASSERT_FALSE(ref.ok());
  EXPECT_EQ(ref.error().kind, lvi::ErrorKind::ManagerUnavailable);

  // Cleanup calls are silently dropped rather than dereferencing anything.
  uint8_t *master = nullptr;
  empty.dispose(&master);
  empty.unlock_ref(1);
  empty.dispose_ref(1);
}


TEST_F(ManagerBindingTest, RefnumsAreOptional) {
  auto table = lvi::test::FakeManager::table();
  table.lock_ref = nullptr;
  lvi::ManagerBinding partial{table};

  ASSERT_TRUE(partial.memory_ready());
  ASSERT_FALSE(partial.refnums_ready());

  auto payload = partial.lock_ref(0x1000);
  ASSERT_FALSE(payload.ok());
  EXPECT_EQ(payload.error().kind, lvi::ErrorKind::ManagerUnavailable);
  EXPECT_EQ(fake.locks, 0);
}


TEST_F(ManagerBindingTest, AllocateAndDispose) {
  auto h = binding.allocate(32);
  ASSERT_TRUE(h.ok());
  EXPECT_TRUE(fake.is_live(h.value()));

  auto size = binding.byte_size(h.value());
  ASSERT_TRUE(size.ok());
  EXPECT_EQ(size.value(), 32);

  binding.dispose(h.value());
  EXPECT_EQ(fake.disposes, 1);
  EXPECT_EQ(fake.live_handles(), 0);
}


TEST_F(ManagerBindingTest, RefusedAllocation) {
  fake.fail_next(lvi::mFullErr);
  auto h = binding.allocate(32);
  ASSERT_FALSE(h.ok());
  EXPECT_EQ(h.error(), lvi::Error(lvi::ErrorKind::AllocationFailed, lvi::mFullErr));
}


TEST_F(ManagerBindingTest, OversizedAllocationNeverReachesHost) {
  auto h = binding.allocate((size_t)INT32_MAX + 1);
  ASSERT_FALSE(h.ok());
  EXPECT_EQ(h.error(), lvi::Error(lvi::ErrorKind::AllocationFailed, lvi::mgArgErr));
  EXPECT_EQ(fake.allocations, 0);
}


TEST_F(ManagerBindingTest, RefusedResizeCarriesHostStatus) {
  auto h = binding.allocate(8);
  ASSERT_TRUE(h.ok());

  fake.fail_next(lvi::mZoneErr);
  auto r = binding.resize(h.value(), 64);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error(), lvi::Error(lvi::ErrorKind::ResizeFailed, lvi::mZoneErr));
  EXPECT_EQ(binding.byte_size(h.value()).value(), 8);

  binding.dispose(h.value());
}


TEST_F(ManagerBindingTest, NullHandleIsInvalid) {
  auto r = binding.resize(nullptr, 8);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, lvi::ErrorKind::InvalidHandle);

  auto size = binding.byte_size(nullptr);
  ASSERT_FALSE(size.ok());
  EXPECT_EQ(size.error().kind, lvi::ErrorKind::InvalidHandle);

  // Neither call got as far as the host.
  EXPECT_EQ(fake.resizes, 0);
  EXPECT_EQ(fake.size_queries, 0);
}


TEST_F(ManagerBindingTest, UnknownHandleSize) {
  uint8_t *master = nullptr;
  auto size = binding.byte_size(&master);
  ASSERT_FALSE(size.ok());
  EXPECT_EQ(size.error(), lvi::Error(lvi::ErrorKind::InvalidHandle, lvi::mZoneErr));
}


TEST_F(ManagerBindingTest, DisposeFailureIsSwallowed) {
  uint8_t *master = nullptr;
  binding.dispose(&master);
  EXPECT_EQ(fake.disposes, 1);
  EXPECT_EQ(fake.bad_calls, 1);
}


TEST_F(ManagerBindingTest, MoveBlockCopies) {
  const char src[] = "labview";
  char dst[sizeof(src)] = {};
  binding.move_block(src, dst, sizeof(src));
  EXPECT_STREQ(dst, "labview");
  EXPECT_EQ(fake.moves, 1);

  // Empty moves are not forwarded.
  binding.move_block(src, dst, 0);
  EXPECT_EQ(fake.moves, 1);
}


TEST_F(ManagerBindingTest, RefnumCalls) {
  uint64_t initial = 99;
  auto ref = binding.new_ref(LVRefDescriptor{sizeof(initial), &initial, nullptr});
  ASSERT_TRUE(ref.ok());

  auto payload = binding.lock_ref(ref.value());
  ASSERT_TRUE(payload.ok());
  EXPECT_EQ(*static_cast<uint64_t *>(payload.value()), 99);
  binding.unlock_ref(ref.value());
  binding.dispose_ref(ref.value());

  EXPECT_EQ(fake.live_refnums(), 0);
  EXPECT_EQ(fake.bad_calls, 0);
}


TEST_F(ManagerBindingTest, RefusedRefnumCalls) {
  fake.fail_next(lvi::mFullErr);
  auto ref = binding.new_ref(LVRefDescriptor{8, nullptr, nullptr});
  ASSERT_FALSE(ref.ok());
  EXPECT_EQ(ref.error(), lvi::Error(lvi::ErrorKind::ReferenceCreationFailed, lvi::mFullErr));

  auto payload = binding.lock_ref(0xBAD);
  ASSERT_FALSE(payload.ok());
  EXPECT_EQ(payload.error(), lvi::Error(lvi::ErrorKind::LockFailed, lvi::mgArgErr));

  // Swallowed
  binding.unlock_ref(0xBAD);
  binding.dispose_ref(0xBAD);
  EXPECT_EQ(fake.bad_calls, 3);
}


TEST(Error, Rendering) {
  EXPECT_EQ(lvi::Error(lvi::ErrorKind::UseAfterDispose).to_string(), "UseAfterDispose");
  EXPECT_EQ(lvi::Error(lvi::ErrorKind::LockFailed, lvi::mgArgErr).to_string(),
      "LockFailed (host status 1: mgArgErr)");
  EXPECT_EQ(lvi::Error(lvi::ErrorKind::ResizeFailed, 1234).to_string(),
      "ResizeFailed (host status 1234: unknown)");
}


TEST(Error, CodeFallsBackToGenericError) {
  EXPECT_EQ(lvi::Error(lvi::ErrorKind::UseAfterDispose).code(), 42);
  EXPECT_EQ(lvi::Error(lvi::ErrorKind::AllocationFailed, lvi::mFullErr).code(), lvi::mFullErr);
}
