#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include "engine/chunk_engine.hpp"
#include "test_utils.hpp"

using namespace chunkd;
using namespace chunkd::engine;

class ChunkEngineTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  config::EngineConfig config;
  std::unique_ptr<ChunkEngine> chunk_engine;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("chunk_engine_test");
    config.storage_root = test_dir;
    chunk_engine = std::make_unique<ChunkEngine>(config);
  }

  void TearDown() override {
    chunk_engine.reset();
    std::filesystem::remove_all(test_dir);
  }

  UploadResult upload(const std::string& key, int64_t index, const std::string& data) {
    auto stream = create_test_stream(data);
    return chunk_engine->upload_chunk(key, index, *stream);
  }

  void restart() {
    chunk_engine.reset();
    chunk_engine = std::make_unique<ChunkEngine>(config);
  }
};

TEST_F(ChunkEngineTest, CreatesStorageAreas) {
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "chunks"));
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "artifacts"));
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "staging"));
}

TEST_F(ChunkEngineTest, UploadMergeFetch) {
  UploadResult first = upload("s1", 1, "World");
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.bytes_stored, 5u);
  EXPECT_EQ(first.message, "Chunk received");
  ASSERT_TRUE(upload("s1", 0, "Hello, ").ok());

  MergeResult merged = chunk_engine->merge("s1", 2, "out.txt");
  ASSERT_TRUE(merged.ok()) << merged.message;
  EXPECT_EQ(merged.artifact_name, "s1_merged_out.txt");

  FetchResult fetched = chunk_engine->fetch("s1_merged_out.txt");
  ASSERT_TRUE(fetched.ok());
  EXPECT_EQ(read_all(*fetched.data), "Hello, World");

  // The session is gone once merged
  EXPECT_FALSE(chunk_engine->session_status("s1").has_value());
  EXPECT_FALSE(std::filesystem::exists(test_dir / "chunks" / "s1"));
  EXPECT_EQ(chunk_engine->artifacts(), (std::vector<std::string>{"s1_merged_out.txt"}));
  EXPECT_EQ(chunk_engine->artifact_size("s1_merged_out.txt"), std::optional<std::uintmax_t>(12));
}

TEST_F(ChunkEngineTest, MissingChunkKeepsSessionOpen) {
  ASSERT_TRUE(upload("s2", 0, "a").ok());
  ASSERT_TRUE(upload("s2", 2, "c").ok());

  MergeResult merged = chunk_engine->merge("s2", 3, "abc");
  EXPECT_EQ(merged.error, EngineError::MISSING_CHUNK);
  EXPECT_EQ(merged.missing_index, 1);

  // Upload the gap and try again
  ASSERT_TRUE(upload("s2", 1, "b").ok());
  merged = chunk_engine->merge("s2", 3, "abc");
  ASSERT_TRUE(merged.ok()) << merged.message;
  EXPECT_EQ(read_all(*chunk_engine->fetch(merged.artifact_name).data), "abc");
}

TEST_F(ChunkEngineTest, MergeOfUnknownSessionLeavesNoEntry) {
  for (int i = 0; i < 100; ++i) {
    MergeResult merged = chunk_engine->merge("ghost" + std::to_string(i), 1, "f.txt");
    EXPECT_EQ(merged.error, EngineError::MISSING_CHUNK);
    EXPECT_EQ(merged.missing_index, 0);
  }

  EXPECT_TRUE(chunk_engine->sessions().empty());
  EXPECT_EQ(chunk_engine->get_registry().size(), 0u);
  EXPECT_FALSE(chunk_engine->session_status("ghost0").has_value());

  // The key is still usable for a real upload afterwards
  ASSERT_TRUE(upload("ghost0", 0, "x").ok());
  EXPECT_TRUE(chunk_engine->merge("ghost0", 1, "f.txt").ok());
}

TEST_F(ChunkEngineTest, FailedMergeKeepsSessionWithChunks) {
  ASSERT_TRUE(upload("partial", 1, "b").ok());

  EXPECT_EQ(chunk_engine->merge("partial", 2, "f").error, EngineError::MISSING_CHUNK);

  auto status = chunk_engine->session_status("partial");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, session::SessionState::OPEN);
  EXPECT_EQ(status->received, (std::set<int64_t>{1}));
}

TEST_F(ChunkEngineTest, RejectsInvalidUploads) {
  EXPECT_EQ(upload("", 0, "x").error, EngineError::INVALID_INPUT);
  EXPECT_EQ(upload("../escape", 0, "x").error, EngineError::INVALID_INPUT);
  EXPECT_EQ(upload("a/b", 0, "x").error, EngineError::INVALID_INPUT);
  EXPECT_EQ(upload("s1", -1, "x").error, EngineError::INVALID_INPUT);

  EXPECT_TRUE(chunk_engine->sessions().empty());
  EXPECT_FALSE(std::filesystem::exists(test_dir / "escape"));
}

TEST_F(ChunkEngineTest, UploadToMergingSessionIsClosed) {
  ASSERT_TRUE(upload("s3", 0, "x").ok());
  ASSERT_EQ(chunk_engine->get_registry().begin_merge("s3"), EngineError::SUCCESS);

  EXPECT_EQ(upload("s3", 1, "y").error, EngineError::SESSION_CLOSED);

  chunk_engine->get_registry().reopen("s3");
  EXPECT_TRUE(upload("s3", 1, "y").ok());
}

TEST_F(ChunkEngineTest, UnknownArtifactIsNotFound) {
  EXPECT_EQ(chunk_engine->fetch("nothing").error, EngineError::NOT_FOUND);
  EXPECT_FALSE(chunk_engine->artifact_size("nothing").has_value());
}

TEST_F(ChunkEngineTest, RecoversSessionsAfterRestart) {
  ASSERT_TRUE(upload("s4", 0, "Hello, ").ok());
  ASSERT_TRUE(upload("s4", 1, "World").ok());

  // Leftovers of an interrupted chunk write and an interrupted merge
  std::ofstream(test_dir / "chunks" / "s4" / ".2.deadbeef.tmp") << "partial";
  std::ofstream(test_dir / "staging" / "abandoned.part") << "partial";

  restart();

  EXPECT_FALSE(std::filesystem::exists(test_dir / "chunks" / "s4" / ".2.deadbeef.tmp"));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "staging" / "abandoned.part"));

  auto status = chunk_engine->session_status("s4");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->received, (std::set<int64_t>{0, 1}));

  MergeResult merged = chunk_engine->merge("s4", 2, "greeting.txt");
  ASSERT_TRUE(merged.ok()) << merged.message;
  EXPECT_EQ(read_all(*chunk_engine->fetch("s4_merged_greeting.txt").data), "Hello, World");
}

TEST_F(ChunkEngineTest, ArtifactsSurviveRestart) {
  ASSERT_TRUE(upload("s5", 0, "kept").ok());
  ASSERT_TRUE(chunk_engine->merge("s5", 1, "f").ok());

  restart();

  FetchResult fetched = chunk_engine->fetch("s5_merged_f");
  ASSERT_TRUE(fetched.ok());
  EXPECT_EQ(read_all(*fetched.data), "kept");
}

TEST_F(ChunkEngineTest, CollectsExpiredSessions) {
  ASSERT_TRUE(upload("old", 0, "x").ok());
  ASSERT_TRUE(upload("old", 1, "y").ok());

  // Nothing is idle yet
  EXPECT_EQ(chunk_engine->collect_expired_sessions(std::chrono::hours(1)), 0u);

  auto later = session::Clock::now() + std::chrono::hours(2);
  EXPECT_EQ(chunk_engine->collect_expired_sessions(std::chrono::hours(1), later), 1u);

  EXPECT_FALSE(chunk_engine->session_status("old").has_value());
  EXPECT_FALSE(std::filesystem::exists(test_dir / "chunks" / "old"));

  // The key can be reused by a new upload
  EXPECT_TRUE(upload("old", 0, "fresh").ok());
  EXPECT_EQ(chunk_engine->session_status("old")->received, (std::set<int64_t>{0}));
}

TEST_F(ChunkEngineTest, ZeroTtlCollectsNothing) {
  ASSERT_TRUE(upload("s6", 0, "x").ok());
  auto later = session::Clock::now() + std::chrono::hours(1000);
  EXPECT_EQ(chunk_engine->collect_expired_sessions(std::chrono::seconds(0), later), 0u);
  EXPECT_TRUE(chunk_engine->session_status("s6").has_value());
}

TEST_F(ChunkEngineTest, RejectsInvalidConfig) {
  config::EngineConfig empty_root;
  EXPECT_THROW(std::make_unique<ChunkEngine>(empty_root), std::invalid_argument);

  config::EngineConfig zero_buffer;
  zero_buffer.storage_root = test_dir / "other";
  zero_buffer.merge_buffer_size = 0;
  EXPECT_THROW(std::make_unique<ChunkEngine>(zero_buffer), std::invalid_argument);
}
