#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "network/codec.hpp"

namespace chunkd {
namespace network {

// Blocking client for the chunk service. Request methods throw NetworkError
// when the connection fails; protocol-level outcomes come back in the response.
class ChunkClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkClient(const std::string& host, uint16_t port, uint64_t max_payload_size = 64ull * 1024 * 1024);
  ~ChunkClient();


  // ---- CONNECTION ----
  bool connect(std::chrono::seconds timeout = std::chrono::seconds(30));
  void disconnect();
  bool is_connected() const { return stream_ != nullptr; }


  // ---- REQUESTS ----
  ResponseFrame upload_chunk(const std::string& session_key, int64_t index, const std::string& data);
  ResponseFrame merge(const std::string& session_key, int64_t total_chunks, const std::string& original_filename);
  ResponseFrame download(const std::string& artifact_name);
  // Sends one request and waits for its response
  ResponseFrame send(const RequestFrame& request);

private:
  // ---- PARAMETERS ----
  std::string host_;
  uint16_t port_;
  std::chrono::seconds timeout_{30};
  Codec codec_;
  std::unique_ptr<boost::asio::ip::tcp::iostream> stream_;
};

} // namespace network
} // namespace chunkd
