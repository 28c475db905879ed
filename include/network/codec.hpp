#ifndef CHUNKD_NETWORK_CODEC_HPP
#define CHUNKD_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace chunkd {
namespace network {

// Big-endian wire format.
// Request:  u8 type | u32 len + session key | i64 number | u32 len + name | u64 size + payload
// Response: u16 status | u8 error | i64 missing index | u32 len + message | u64 size + payload
class Codec {
public:
  // ---- CONSTRUCTOR ----
  explicit Codec(uint64_t max_payload_size);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a frame to an output stream; returns bytes written
  std::size_t serialize(const RequestFrame& frame, std::ostream& output) const;
  std::size_t serialize(const ResponseFrame& frame, std::ostream& output) const;
  // Throws StreamError when input ends mid-frame and FrameError on protocol violations
  RequestFrame deserialize_request(std::istream& input) const;
  ResponseFrame deserialize_response(std::istream& input) const;

  uint64_t get_max_payload_size() const { return max_payload_size_; }

private:
  // ---- PARAMETERS ----
  uint64_t max_payload_size_;


  // ---- FIELD OPERATIONS ----
  std::size_t write_string(std::ostream& output, const std::string& value) const;
  std::string read_string(std::istream& input, const char* field) const;
  std::size_t write_payload(std::ostream& output, uint64_t size, std::stringstream* payload) const;
  std::shared_ptr<std::stringstream> read_payload(std::istream& input, uint64_t& size) const;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  template <typename T>
  static T to_network_order(T host_value) {
    return boost::endian::native_to_big(host_value);
  }

  template <typename T>
  static T from_network_order(T network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace chunkd

#endif // CHUNKD_NETWORK_CODEC_HPP
