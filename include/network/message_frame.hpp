#ifndef CHUNKD_NETWORK_MESSAGE_FRAME_HPP
#define CHUNKD_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

namespace chunkd {
namespace network {

// Message type used to differentiate between requests
enum class MessageType : uint8_t {
    UPLOAD_CHUNK = 0,
    MERGE = 1,
    DOWNLOAD = 2
};

// Transport status codes
enum class Status : uint16_t {
    OK = 200,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    CONFLICT = 409,
    SERVER_ERROR = 500
};

// Upper bound on any length-prefixed string field
constexpr uint32_t MAX_STRING_LENGTH = 4096;

// Request as represented locally
struct RequestFrame {
    MessageType message_type{MessageType::UPLOAD_CHUNK};
    std::string session_key;
    // Chunk index for uploads, total chunk count for merges
    int64_t number{0};
    // Original filename for merges, artifact name for downloads
    std::string name;
    uint64_t payload_size{0};
    std::shared_ptr<std::stringstream> payload_stream;
};

// Response as represented locally
struct ResponseFrame {
    uint16_t status{static_cast<uint16_t>(Status::OK)};
    uint8_t error{0};
    int64_t missing_index{-1};
    std::string message;
    // Artifact name for merges, artifact bytes for downloads
    uint64_t payload_size{0};
    std::shared_ptr<std::stringstream> payload_stream;
};

} // namespace network
} // namespace chunkd

#endif // CHUNKD_NETWORK_MESSAGE_FRAME_HPP
