#include "network/request_handler.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace chunkd {
namespace network {

using engine::EngineError;

Status status_for(EngineError error) {
  switch (error) {
    case EngineError::SUCCESS: return Status::OK;
    case EngineError::INVALID_INPUT:
    case EngineError::MISSING_CHUNK:
    case EngineError::BAD_REQUEST: return Status::BAD_REQUEST;
    case EngineError::NOT_FOUND: return Status::NOT_FOUND;
    case EngineError::MERGE_IN_PROGRESS:
    case EngineError::SESSION_CLOSED: return Status::CONFLICT;
    case EngineError::STORAGE_FAILURE:
    default: return Status::SERVER_ERROR;
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

RequestHandler::RequestHandler(engine::ChunkEngine& engine, uint64_t max_payload_size)
  : engine_(engine)
  , max_payload_size_(max_payload_size) {}


//==============================================
// REQUEST DISPATCH
//==============================================

ResponseFrame RequestHandler::handle(const RequestFrame& request) {
  switch (request.message_type) {
    case MessageType::UPLOAD_CHUNK:
      return handle_upload(request);
    case MessageType::MERGE:
      return handle_merge(request);
    case MessageType::DOWNLOAD:
      return handle_download(request);
    default:
      BOOST_LOG_TRIVIAL(warning) << "Request handler: Unknown message type: "
                                 << static_cast<int>(request.message_type);
      return bad_request("Unknown message type");
  }
}

ResponseFrame RequestHandler::bad_request(const std::string& reason) {
  return make_response(EngineError::BAD_REQUEST, reason);
}


//==============================================
// REQUEST HANDLERS
//==============================================

ResponseFrame RequestHandler::handle_upload(const RequestFrame& request) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Upload of chunk " << request.number << " for session "
                           << request.session_key;

  std::stringstream empty;
  std::istream& data = request.payload_stream ? static_cast<std::istream&>(*request.payload_stream) : empty;

  engine::UploadResult result = engine_.upload_chunk(request.session_key, request.number, data);
  return make_response(result.error, result.message);
}

ResponseFrame RequestHandler::handle_merge(const RequestFrame& request) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Merge of " << request.number << " chunks for session "
                           << request.session_key;

  engine::MergeResult result = engine_.merge(request.session_key, request.number, request.name);

  ResponseFrame response = make_response(result.error, result.message);
  response.missing_index = result.missing_index;
  if (result.ok()) {
    attach_payload(response, result.artifact_name);
  }
  return response;
}

ResponseFrame RequestHandler::handle_download(const RequestFrame& request) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Download of " << request.name;

  engine::FetchResult result = engine_.fetch(request.name);
  if (!result.ok()) {
    return make_response(result.error, result.message);
  }

  if (result.size > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Artifact " << request.name << " of " << result.size
                             << " bytes exceeds the transfer limit";
    return make_response(EngineError::STORAGE_FAILURE, "Artifact exceeds transfer limit");
  }

  ResponseFrame response = make_response(EngineError::SUCCESS, "OK");
  response.payload_stream = std::make_shared<std::stringstream>();
  // Streaming an empty buffer would set failbit
  if (result.size > 0) {
    *response.payload_stream << result.data->rdbuf();
    const std::streamoff copied = response.payload_stream->tellp();
    if (copied < 0 || static_cast<uint64_t>(copied) != result.size) {
      BOOST_LOG_TRIVIAL(error) << "Request handler: Read of " << request.name << " returned "
                               << copied << " of " << result.size << " bytes";
      return make_response(EngineError::STORAGE_FAILURE, "Artifact read failed");
    }
    response.payload_size = static_cast<uint64_t>(copied);
  }
  return response;
}

ResponseFrame RequestHandler::make_response(EngineError error, const std::string& message) {
  ResponseFrame response;
  response.status = static_cast<uint16_t>(status_for(error));
  response.error = static_cast<uint8_t>(error);
  response.message = message.empty() ? engine::engine_error_to_string(error) : message;
  return response;
}

void RequestHandler::attach_payload(ResponseFrame& response, const std::string& payload) {
  response.payload_stream = std::make_shared<std::stringstream>(payload);
  response.payload_size = payload.size();
}

} // namespace network
} // namespace chunkd
