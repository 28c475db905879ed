#ifndef CHUNKD_CONFIG_HPP
#define CHUNKD_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkd {
namespace config {

// Storage and session lifecycle settings for a ChunkEngine
struct EngineConfig {
  // Root holding the chunks/, artifacts/ and staging/ areas
  std::filesystem::path storage_root;
  // Block size used when streaming chunks into an artifact
  std::size_t merge_buffer_size{64 * 1024};
  // Idle time after which an open session is collected; zero disables expiry
  std::chrono::seconds session_ttl{std::chrono::hours(24)};
  std::chrono::seconds sweep_interval{std::chrono::minutes(5)};
};

// Network settings for the TCP transport
struct ServerConfig {
  std::string address{"0.0.0.0"};
  // Zero binds an ephemeral port
  uint16_t port{5000};
  std::size_t worker_threads{4};
  uint64_t max_payload_size{64ull * 1024 * 1024};
  std::chrono::seconds idle_timeout{std::chrono::seconds(30)};
};

} // namespace config
} // namespace chunkd

#endif // CHUNKD_CONFIG_HPP
