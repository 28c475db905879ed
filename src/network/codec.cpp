#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace chunkd {
namespace network {

Codec::Codec(uint64_t max_payload_size)
  : max_payload_size_(max_payload_size) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Initializing Codec with payload limit: " << max_payload_size_;
}


//==============================================
// SERIALIZATION
//==============================================

std::size_t Codec::serialize(const RequestFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw StreamError("Codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;

  // Write message type
  uint8_t msg_type = static_cast<uint8_t>(frame.message_type);
  write_bytes(output, &msg_type, sizeof(msg_type));
  total_bytes += sizeof(msg_type);

  total_bytes += write_string(output, frame.session_key);

  // Write chunk index or total in network byte order
  int64_t network_number = to_network_order(frame.number);
  write_bytes(output, &network_number, sizeof(network_number));
  total_bytes += sizeof(network_number);

  total_bytes += write_string(output, frame.name);
  total_bytes += write_payload(output, frame.payload_size, frame.payload_stream.get());

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Request serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

std::size_t Codec::serialize(const ResponseFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw StreamError("Codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;

  uint16_t network_status = to_network_order(frame.status);
  write_bytes(output, &network_status, sizeof(network_status));
  total_bytes += sizeof(network_status);

  write_bytes(output, &frame.error, sizeof(frame.error));
  total_bytes += sizeof(frame.error);

  int64_t network_missing = to_network_order(frame.missing_index);
  write_bytes(output, &network_missing, sizeof(network_missing));
  total_bytes += sizeof(network_missing);

  total_bytes += write_string(output, frame.message);
  total_bytes += write_payload(output, frame.payload_size, frame.payload_stream.get());

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Response serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}


//==============================================
// DESERIALIZATION
//==============================================

RequestFrame Codec::deserialize_request(std::istream& input) const {
  RequestFrame frame;

  // Read message type
  uint8_t msg_type;
  read_bytes(input, &msg_type, sizeof(msg_type));
  if (msg_type > static_cast<uint8_t>(MessageType::DOWNLOAD)) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Unknown message type: " << static_cast<int>(msg_type);
    throw FrameError("unknown message type " + std::to_string(msg_type));
  }
  frame.message_type = static_cast<MessageType>(msg_type);

  frame.session_key = read_string(input, "session key");

  int64_t network_number;
  read_bytes(input, &network_number, sizeof(network_number));
  frame.number = from_network_order(network_number);

  frame.name = read_string(input, "name");
  frame.payload_stream = read_payload(input, frame.payload_size);

  BOOST_LOG_TRIVIAL(debug) << "Codec: Read request type " << static_cast<int>(msg_type) << " for session "
                           << frame.session_key << " with payload of size: " << frame.payload_size;
  return frame;
}

ResponseFrame Codec::deserialize_response(std::istream& input) const {
  ResponseFrame frame;

  uint16_t network_status;
  read_bytes(input, &network_status, sizeof(network_status));
  frame.status = from_network_order(network_status);

  read_bytes(input, &frame.error, sizeof(frame.error));

  int64_t network_missing;
  read_bytes(input, &network_missing, sizeof(network_missing));
  frame.missing_index = from_network_order(network_missing);

  frame.message = read_string(input, "message");
  frame.payload_stream = read_payload(input, frame.payload_size);

  BOOST_LOG_TRIVIAL(debug) << "Codec: Read response status " << frame.status << " with payload of size: "
                           << frame.payload_size;
  return frame;
}


//==============================================
// FIELD OPERATIONS
//==============================================

std::size_t Codec::write_string(std::ostream& output, const std::string& value) const {
  if (value.size() > MAX_STRING_LENGTH) {
    throw FrameError("string field exceeds " + std::to_string(MAX_STRING_LENGTH) + " bytes");
  }

  uint32_t network_length = to_network_order(static_cast<uint32_t>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  write_bytes(output, value.data(), value.size());
  return sizeof(network_length) + value.size();
}

std::string Codec::read_string(std::istream& input, const char* field) const {
  uint32_t network_length;
  read_bytes(input, &network_length, sizeof(network_length));
  uint32_t length = from_network_order(network_length);

  if (length > MAX_STRING_LENGTH) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Oversize " << field << " field: " << length << " bytes";
    throw FrameError(std::string(field) + " exceeds " + std::to_string(MAX_STRING_LENGTH) + " bytes");
  }

  std::string value(length, '\0');
  read_bytes(input, value.data(), length);
  return value;
}

std::size_t Codec::write_payload(std::ostream& output, uint64_t size, std::stringstream* payload) const {
  if (size > max_payload_size_) {
    throw FrameError("payload of " + std::to_string(size) + " bytes exceeds limit");
  }
  if (size > 0 && !payload) {
    throw FrameError("payload size set without payload");
  }

  // Write payload size in network byte order
  uint64_t network_size = to_network_order(size);
  write_bytes(output, &network_size, sizeof(network_size));

  if (size > 0) {
    payload->clear();
    payload->seekg(0);

    char buffer[4096];
    uint64_t remaining = size;
    while (remaining > 0) {
      std::size_t block = static_cast<std::size_t>(std::min<uint64_t>(remaining, sizeof(buffer)));
      if (!payload->read(buffer, static_cast<std::streamsize>(block))) {
        throw StreamError("Codec: Payload stream shorter than declared size");
      }
      write_bytes(output, buffer, block);
      remaining -= block;
    }
  }
  return sizeof(network_size) + size;
}

std::shared_ptr<std::stringstream> Codec::read_payload(std::istream& input, uint64_t& size) const {
  uint64_t network_size;
  read_bytes(input, &network_size, sizeof(network_size));
  size = from_network_order(network_size);

  if (size > max_payload_size_) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Payload of " << size << " bytes exceeds limit of " << max_payload_size_;
    throw FrameError("payload of " + std::to_string(size) + " bytes exceeds limit");
  }

  auto payload = std::make_shared<std::stringstream>();
  char buffer[4096];
  uint64_t remaining = size;
  while (remaining > 0) {
    std::size_t block = static_cast<std::size_t>(std::min<uint64_t>(remaining, sizeof(buffer)));
    read_bytes(input, buffer, block);
    payload->write(buffer, static_cast<std::streamsize>(block));
    remaining -= block;
  }
  payload->seekg(0);
  return payload;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw StreamError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Failed to read " << size << " bytes from input stream";
    throw StreamError("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace chunkd
