#ifndef CHUNKD_NETWORK_ERROR_HPP
#define CHUNKD_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkd {
namespace network {

// Transport-level failures raised by the codec and client
class NetworkError : public std::runtime_error {
public:
  explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {}
};

// Frame is well delimited but violates the protocol (unknown type, oversize field)
class FrameError : public NetworkError {
public:
  explicit FrameError(const std::string& msg) : NetworkError("Malformed frame: " + msg) {}
};

// Stream ended or failed mid-frame
class StreamError : public NetworkError {
public:
  explicit StreamError(const std::string& msg) : NetworkError(msg) {}
};

} // namespace network
} // namespace chunkd

#endif // CHUNKD_NETWORK_ERROR_HPP
