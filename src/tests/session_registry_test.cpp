#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>
#include "session/session_registry.hpp"
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace chunkd::session;
using chunkd::engine::EngineError;

class SessionRegistryTest : public ::testing::Test {
protected:
  SessionRegistry registry;

  void SetUp() override {
    init_logging();
  }
};

TEST_F(SessionRegistryTest, RecordCreatesSessionAndDeduplicates) {
  EXPECT_TRUE(registry.received_indices("s1").empty());
  EXPECT_FALSE(registry.status("s1").has_value());

  registry.record_chunk("s1", 3);
  registry.record_chunk("s1", 0);
  registry.record_chunk("s1", 3);

  EXPECT_EQ(registry.received_indices("s1"), (std::set<int64_t>{0, 3}));
  ASSERT_TRUE(registry.status("s1").has_value());
  EXPECT_EQ(registry.status("s1")->state, SessionState::OPEN);
  EXPECT_EQ(registry.sessions(), (std::vector<std::string>{"s1"}));
}

TEST_F(SessionRegistryTest, ForgetClearsMetadata) {
  registry.record_chunk("s1", 0);
  registry.forget("s1");

  EXPECT_TRUE(registry.received_indices("s1").empty());
  EXPECT_EQ(registry.size(), 0u);

  // Forgetting an unknown session is harmless
  registry.forget("unknown");
}

TEST_F(SessionRegistryTest, ConcurrentRecordsLoseNothing) {
  constexpr int num_threads = 8;
  constexpr int per_thread = 250;
  std::vector<std::thread> threads;

  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < per_thread; ++i) {
        registry.record_chunk("busy", t * per_thread + i);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry.received_indices("busy").size(), static_cast<std::size_t>(num_threads * per_thread));
}

TEST_F(SessionRegistryTest, MergeClosesSessionToUploads) {
  ASSERT_EQ(registry.begin_upload("s1"), EngineError::SUCCESS);
  registry.record_chunk("s1", 0);
  registry.end_upload("s1");

  ASSERT_EQ(registry.begin_merge("s1"), EngineError::SUCCESS);
  EXPECT_EQ(registry.status("s1")->state, SessionState::MERGING);
  EXPECT_EQ(registry.begin_upload("s1"), EngineError::SESSION_CLOSED);
  EXPECT_EQ(registry.begin_merge("s1"), EngineError::MERGE_IN_PROGRESS);

  // Other sessions are unaffected
  EXPECT_EQ(registry.begin_upload("s2"), EngineError::SUCCESS);
  registry.end_upload("s2");

  registry.reopen("s1");
  EXPECT_EQ(registry.begin_upload("s1"), EngineError::SUCCESS);
  registry.end_upload("s1");
}

TEST_F(SessionRegistryTest, ForgottenSessionAcceptsNewUploads) {
  ASSERT_EQ(registry.begin_merge("s1"), EngineError::SUCCESS);
  registry.forget("s1");

  EXPECT_EQ(registry.begin_upload("s1"), EngineError::SUCCESS);
  registry.end_upload("s1");
  EXPECT_EQ(registry.status("s1")->state, SessionState::OPEN);
}

TEST_F(SessionRegistryTest, MergeWaitsForInFlightUploads) {
  ASSERT_EQ(registry.begin_upload("s1"), EngineError::SUCCESS);

  std::atomic<bool> merge_started{false};
  auto merge = std::async(std::launch::async, [this, &merge_started]() {
    merge_started = true;
    return registry.begin_merge("s1");
  });

  while (!merge_started) {
    std::this_thread::yield();
  }
  // The merge cannot complete while the upload is in flight
  EXPECT_EQ(merge.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

  registry.record_chunk("s1", 0);
  registry.end_upload("s1");

  ASSERT_EQ(merge.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(merge.get(), EngineError::SUCCESS);
  EXPECT_EQ(registry.received_indices("s1"), (std::set<int64_t>{0}));
}

TEST_F(SessionRegistryTest, ClaimExpiredSkipsBusyAndMergingSessions) {
  registry.record_chunk("idle", 0);
  registry.record_chunk("merging", 0);
  registry.record_chunk("uploading", 0);

  ASSERT_EQ(registry.begin_merge("merging"), EngineError::SUCCESS);
  ASSERT_EQ(registry.begin_upload("uploading"), EngineError::SUCCESS);

  auto later = Clock::now() + std::chrono::hours(2);
  auto claimed = registry.claim_expired(std::chrono::hours(1), later);

  EXPECT_EQ(claimed, (std::vector<std::string>{"idle"}));
  EXPECT_EQ(registry.status("idle")->state, SessionState::EXPIRING);
  EXPECT_EQ(registry.begin_upload("idle"), EngineError::SESSION_CLOSED);
  EXPECT_EQ(registry.begin_merge("idle"), EngineError::SESSION_CLOSED);

  // Already claimed sessions are not claimed twice
  EXPECT_TRUE(registry.claim_expired(std::chrono::hours(1), later).empty());

  registry.end_upload("uploading");
}

TEST_F(SessionRegistryTest, ClaimExpiredRespectsTtl) {
  registry.record_chunk("fresh", 0);

  EXPECT_TRUE(registry.claim_expired(std::chrono::hours(1)).empty());
  // Zero disables expiry
  EXPECT_TRUE(registry.claim_expired(std::chrono::seconds(0), Clock::now() + std::chrono::hours(100)).empty());
}

TEST_F(SessionRegistryTest, RebuildFromStore) {
  auto dir = make_test_dir("registry_test");
  {
    chunkd::store::ChunkStore store(dir);
    auto a = create_test_stream("a");
    auto b = create_test_stream("b");
    auto c = create_test_stream("c");
    store.put("s1", 0, *a);
    store.put("s1", 2, *b);
    store.put("s2", 0, *c);

    EXPECT_EQ(registry.rebuild(store), 2u);
  }

  EXPECT_EQ(registry.received_indices("s1"), (std::set<int64_t>{0, 2}));
  EXPECT_EQ(registry.received_indices("s2"), (std::set<int64_t>{0}));

  auto sessions = registry.sessions();
  std::sort(sessions.begin(), sessions.end());
  EXPECT_EQ(sessions, (std::vector<std::string>{"s1", "s2"}));

  std::filesystem::remove_all(dir);
}

TEST_F(SessionRegistryTest, StateNames) {
  EXPECT_STREQ(session_state_to_string(SessionState::OPEN), "OPEN");
  EXPECT_STREQ(session_state_to_string(SessionState::MERGING), "MERGING");
  EXPECT_STREQ(session_state_to_string(SessionState::EXPIRING), "EXPIRING");
}
