#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <filesystem>
#include <memory>
#include "network/bootstrap.hpp"
#include "network/tcp_client.hpp"
#include "test_utils.hpp"

using namespace chunkd;
using namespace chunkd::network;

class BootstrapTest : public ::testing::Test {
protected:
  const std::string ADDRESS = "127.0.0.1";
  const std::string TEST_FILE_CONTENT = "Test file content";
  const size_t CHUNK_SIZE = 4;

  std::filesystem::path test_dir;
  config::EngineConfig engine_config;
  config::ServerConfig server_config;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("bootstrap_test");

    engine_config.storage_root = test_dir;
    engine_config.session_ttl = std::chrono::seconds(60);
    engine_config.sweep_interval = std::chrono::seconds(1);

    server_config.address = ADDRESS;
    server_config.port = 0;
    server_config.worker_threads = 2;
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  // Uploads content split into CHUNK_SIZE pieces; returns the chunk count
  int64_t upload_in_chunks(ChunkClient& client, const std::string& key, const std::string& content) {
    int64_t index = 0;
    for (size_t offset = 0; offset < content.size(); offset += CHUNK_SIZE, ++index) {
      ResponseFrame response = client.upload_chunk(key, index, content.substr(offset, CHUNK_SIZE));
      EXPECT_EQ(response.status, 200) << response.message;
    }
    return index;
  }
};

TEST_F(BootstrapTest, StartAndShutdown) {
  Bootstrap bootstrap(engine_config, server_config);
  ASSERT_TRUE(bootstrap.start());
  EXPECT_TRUE(bootstrap.get_server().is_running());
  EXPECT_NE(bootstrap.get_server().local_port(), 0);

  EXPECT_TRUE(bootstrap.shutdown());
  // A second shutdown is a no-op
  EXPECT_TRUE(bootstrap.shutdown());
}

TEST_F(BootstrapTest, ServesChunkedUpload) {
  Bootstrap bootstrap(engine_config, server_config);
  ASSERT_TRUE(bootstrap.start());

  ChunkClient client(ADDRESS, bootstrap.get_server().local_port());
  ASSERT_TRUE(client.connect(std::chrono::seconds(5)));

  int64_t total = upload_in_chunks(client, "upload1", TEST_FILE_CONTENT);
  ASSERT_EQ(total, 5);

  ResponseFrame merged = client.merge("upload1", total, "test.txt");
  ASSERT_EQ(merged.status, 200) << merged.message;

  ResponseFrame downloaded = client.download("upload1_merged_test.txt");
  ASSERT_EQ(downloaded.status, 200);
  EXPECT_EQ(downloaded.payload_stream->str(), TEST_FILE_CONTENT);

  client.disconnect();
  EXPECT_TRUE(bootstrap.shutdown());
}

TEST_F(BootstrapTest, SessionsSurviveRestart) {
  {
    Bootstrap bootstrap(engine_config, server_config);
    ASSERT_TRUE(bootstrap.start());

    ChunkClient client(ADDRESS, bootstrap.get_server().local_port());
    ASSERT_TRUE(client.connect(std::chrono::seconds(5)));
    ASSERT_EQ(client.upload_chunk("resumed", 0, "first half, ").status, 200);
  }

  Bootstrap restarted(engine_config, server_config);
  ASSERT_TRUE(restarted.start());
  EXPECT_TRUE(restarted.get_engine().session_status("resumed").has_value());

  ChunkClient client(ADDRESS, restarted.get_server().local_port());
  ASSERT_TRUE(client.connect(std::chrono::seconds(5)));
  ASSERT_EQ(client.upload_chunk("resumed", 1, "second half").status, 200);

  ResponseFrame merged = client.merge("resumed", 2, "whole");
  ASSERT_EQ(merged.status, 200) << merged.message;
  EXPECT_EQ(client.download("resumed_merged_whole").payload_stream->str(), "first half, second half");
}

TEST_F(BootstrapTest, PortInUseFailsStart) {
  Bootstrap first(engine_config, server_config);
  ASSERT_TRUE(first.start());

  config::EngineConfig other_engine = engine_config;
  other_engine.storage_root = test_dir / "other";
  config::ServerConfig same_port = server_config;
  same_port.port = first.get_server().local_port();

  Bootstrap second(other_engine, same_port);
  EXPECT_FALSE(second.start());
}

TEST_F(BootstrapTest, EmptyStorageRootIsRejected) {
  config::EngineConfig invalid;
  EXPECT_THROW(std::make_unique<Bootstrap>(invalid, server_config), std::invalid_argument);
}
