#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <set>
#include <thread>
#include <vector>
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace chunkd::store;

class ChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ChunkStore> store;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("chunk_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<ChunkStore>(test_dir);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void put_and_verify(const std::string& key, int64_t index, const std::string& data) {
    auto input = create_test_stream(data);
    ASSERT_NO_THROW(store->put(key, index, *input)) << "Failed to store chunk " << index << " of " << key;
    ASSERT_TRUE(store->exists(key, index)) << "Chunk should exist after storing: " << index;

    std::stringstream output;
    ASSERT_NO_THROW(store->get(key, index, output)) << "Failed to retrieve chunk " << index;
    ASSERT_EQ(output.str(), data) << "Data mismatch for chunk " << index;
  }
};

TEST_F(ChunkStoreTest, BasicOperations) {
  put_and_verify("s1", 0, "Hello, ");
  put_and_verify("s1", 1, "World");

  // Empty chunk is legal
  put_and_verify("s1", 2, "");
  EXPECT_EQ(store->size("s1", 2), 0u);

  EXPECT_FALSE(store->exists("s1", 3));
  std::stringstream output;
  EXPECT_THROW(store->get("s1", 3, output), NotFoundError);
}

TEST_F(ChunkStoreTest, PutReturnsBytesWrittenAndLaysOutFiles) {
  auto input = create_test_stream(std::string(10000, 'z'));
  EXPECT_EQ(store->put("session", 7, *input), 10000u);
  EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / "session" / "7"));
  EXPECT_EQ(store->size("session", 7), 10000u);
}

TEST_F(ChunkStoreTest, OverwriteKeepsLatestBytes) {
  put_and_verify("s1", 0, "first version");
  put_and_verify("s1", 0, "second");

  std::stringstream output;
  store->get("s1", 0, output);
  EXPECT_EQ(output.str(), "second");
  EXPECT_EQ(store->list_indices("s1"), (std::set<int64_t>{0}));
}

TEST_F(ChunkStoreTest, ListIndicesIgnoresTemporariesAndForeignFiles) {
  put_and_verify("s1", 0, "a");
  put_and_verify("s1", 5, "b");
  put_and_verify("s1", 12, "c");

  std::ofstream(test_dir / "s1" / ".3.deadbeef.tmp") << "partial";
  std::ofstream(test_dir / "s1" / "007") << "not canonical";
  std::ofstream(test_dir / "s1" / "notes.txt") << "foreign";

  EXPECT_EQ(store->list_indices("s1"), (std::set<int64_t>{0, 5, 12}));
  EXPECT_TRUE(store->list_indices("unknown").empty());
}

TEST_F(ChunkStoreTest, ListSessions) {
  put_and_verify("alpha", 0, "a");
  put_and_verify("beta", 0, "b");

  auto sessions = store->list_sessions();
  std::sort(sessions.begin(), sessions.end());
  EXPECT_EQ(sessions, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(ChunkStoreTest, RemoveIsIdempotent) {
  put_and_verify("s1", 0, "a");
  put_and_verify("s1", 1, "b");

  EXPECT_NO_THROW(store->remove("s1"));
  EXPECT_FALSE(store->exists("s1", 0));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "s1"));

  EXPECT_NO_THROW(store->remove("s1"));
  EXPECT_NO_THROW(store->remove("never-existed"));
}

TEST_F(ChunkStoreTest, RejectsUnsafeKeysAndNegativeIndices) {
  auto input = create_test_stream("x");
  EXPECT_THROW(store->put("../escape", 0, *input), InvalidKeyError);
  EXPECT_THROW(store->put("a/b", 0, *input), InvalidKeyError);
  EXPECT_THROW(store->put("", 0, *input), InvalidKeyError);
  EXPECT_THROW(store->put("ok", -1, *input), InvalidKeyError);
  EXPECT_THROW(store->remove(".."), InvalidKeyError);

  EXPECT_FALSE(std::filesystem::exists(test_dir.parent_path() / "escape"));
}

TEST_F(ChunkStoreTest, RejectsBadInputStream) {
  std::stringstream bad;
  bad.setstate(std::ios::badbit);
  EXPECT_THROW(store->put("s1", 0, bad), StoreError);
  EXPECT_FALSE(store->exists("s1", 0));
}

TEST_F(ChunkStoreTest, PurgeTemporaries) {
  put_and_verify("s1", 0, "keep");
  std::ofstream(test_dir / "s1" / ".1.abcdef01.tmp") << "stale";
  std::ofstream(test_dir / "s1" / ".2.abcdef02.tmp") << "stale";

  EXPECT_EQ(store->purge_temporaries(), 2u);
  EXPECT_TRUE(store->exists("s1", 0));
  EXPECT_EQ(std::distance(std::filesystem::directory_iterator(test_dir / "s1"),
                          std::filesystem::directory_iterator()), 1);
}

TEST_F(ChunkStoreTest, LastWriteTime) {
  EXPECT_FALSE(store->last_write_time("missing").has_value());
  put_and_verify("s1", 0, "a");
  EXPECT_TRUE(store->last_write_time("s1").has_value());
}

TEST_F(ChunkStoreTest, ConcurrentPutsToDistinctIndices) {
  constexpr int num_threads = 8;
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};

  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &failures]() {
      try {
        auto input = create_test_stream(std::string(50000, static_cast<char>('a' + i)));
        store->put("shared", i, *input);
      } catch (const std::exception&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures, 0);
  ASSERT_EQ(store->list_indices("shared").size(), static_cast<std::size_t>(num_threads));
  for (int i = 0; i < num_threads; ++i) {
    std::stringstream output;
    store->get("shared", i, output);
    EXPECT_EQ(output.str(), std::string(50000, static_cast<char>('a' + i)));
  }
}

TEST_F(ChunkStoreTest, ConcurrentPutsToSameSlotNeverInterleave) {
  const std::string first(200000, 'A');
  const std::string second(200000, 'B');

  std::thread writer1([&]() {
    auto input = create_test_stream(first);
    store->put("race", 0, *input);
  });
  std::thread writer2([&]() {
    auto input = create_test_stream(second);
    store->put("race", 0, *input);
  });
  writer1.join();
  writer2.join();

  std::stringstream output;
  store->get("race", 0, output);
  EXPECT_TRUE(output.str() == first || output.str() == second);
  EXPECT_EQ(store->purge_temporaries(), 0u);
}
