#ifndef CHUNKD_NETWORK_REQUEST_HANDLER_HPP
#define CHUNKD_NETWORK_REQUEST_HANDLER_HPP

#include <cstdint>
#include <string>
#include "engine/chunk_engine.hpp"
#include "network/message_frame.hpp"

namespace chunkd {
namespace network {

// Maps engine outcomes onto transport status codes
Status status_for(engine::EngineError error);

// Translates decoded requests into engine calls and engine results into responses
class RequestHandler {
public:
  // ---- CONSTRUCTOR ----
  RequestHandler(engine::ChunkEngine& engine, uint64_t max_payload_size);


  // ---- REQUEST DISPATCH ----
  ResponseFrame handle(const RequestFrame& request);
  // Response sent when a frame could not be decoded
  static ResponseFrame bad_request(const std::string& reason);

private:
  // ---- PARAMETERS ----
  engine::ChunkEngine& engine_;
  uint64_t max_payload_size_;


  // ---- REQUEST HANDLERS ----
  ResponseFrame handle_upload(const RequestFrame& request);
  ResponseFrame handle_merge(const RequestFrame& request);
  ResponseFrame handle_download(const RequestFrame& request);

  static ResponseFrame make_response(engine::EngineError error, const std::string& message);
  static void attach_payload(ResponseFrame& response, const std::string& payload);
};

} // namespace network
} // namespace chunkd

#endif // CHUNKD_NETWORK_REQUEST_HANDLER_HPP
