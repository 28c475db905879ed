#ifndef CHUNKD_STORE_ERROR_HPP
#define CHUNKD_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkd {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Identifier would escape its storage area
class InvalidKeyError : public StoreError {
public:
  explicit InvalidKeyError(const std::string& message)
    : StoreError("Invalid key: " + message) {}
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message)
    : StoreError("Not found: " + message) {}
};

} // namespace store
} // namespace chunkd

#endif // CHUNKD_STORE_ERROR_HPP
