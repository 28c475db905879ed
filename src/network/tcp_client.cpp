#include "network/tcp_client.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace chunkd {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkClient::ChunkClient(const std::string& host, uint16_t port, uint64_t max_payload_size)
  : host_(host)
  , port_(port)
  , codec_(max_payload_size) {}

ChunkClient::~ChunkClient() {
  disconnect();
}


//==============================================
// CONNECTION
//==============================================

bool ChunkClient::connect(std::chrono::seconds timeout) {
  if (stream_) {
    return true;
  }

  timeout_ = timeout;
  BOOST_LOG_TRIVIAL(info) << "Chunk client: Connecting to " << host_ << ":" << port_;

  auto stream = std::make_unique<boost::asio::ip::tcp::iostream>();
  stream->expires_after(timeout_);
  stream->connect(host_, std::to_string(port_));
  if (!*stream) {
    BOOST_LOG_TRIVIAL(error) << "Chunk client: Connection to " << host_ << ":" << port_ << " failed: "
                             << stream->error().message();
    return false;
  }

  stream_ = std::move(stream);
  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Connected to " << host_ << ":" << port_;
  return true;
}

void ChunkClient::disconnect() {
  if (stream_) {
    stream_->close();
    stream_.reset();
    BOOST_LOG_TRIVIAL(debug) << "Chunk client: Disconnected from " << host_ << ":" << port_;
  }
}


//==============================================
// REQUESTS
//==============================================

ResponseFrame ChunkClient::upload_chunk(const std::string& session_key, int64_t index, const std::string& data) {
  RequestFrame request;
  request.message_type = MessageType::UPLOAD_CHUNK;
  request.session_key = session_key;
  request.number = index;
  request.payload_size = data.size();
  request.payload_stream = std::make_shared<std::stringstream>(data);
  return send(request);
}

ResponseFrame ChunkClient::merge(const std::string& session_key, int64_t total_chunks,
                                 const std::string& original_filename) {
  RequestFrame request;
  request.message_type = MessageType::MERGE;
  request.session_key = session_key;
  request.number = total_chunks;
  request.name = original_filename;
  return send(request);
}

ResponseFrame ChunkClient::download(const std::string& artifact_name) {
  RequestFrame request;
  request.message_type = MessageType::DOWNLOAD;
  request.name = artifact_name;
  return send(request);
}

ResponseFrame ChunkClient::send(const RequestFrame& request) {
  if (!stream_) {
    throw NetworkError("Chunk client: Not connected");
  }

  try {
    stream_->expires_after(timeout_);
    codec_.serialize(request, *stream_);
    return codec_.deserialize_response(*stream_);
  }
  catch (const NetworkError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk client: Request failed: " << e.what();
    disconnect();
    throw;
  }
}

} // namespace network
} // namespace chunkd
