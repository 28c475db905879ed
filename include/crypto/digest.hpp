#ifndef CHUNKD_CRYPTO_DIGEST_HPP
#define CHUNKD_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace chunkd::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over a byte stream
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const void* data, std::size_t size);
  // Completes the digest and returns it as lower-case hex; the object cannot be updated afterwards
  std::string finalize_hex();

  // One-shot helpers
  static std::string hex_of(const std::string& data);
  static std::string hex_of(std::istream& input);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

// Returns 2 * bytes lower-case hex characters from the OpenSSL CSPRNG
std::string random_hex(std::size_t bytes);

} // namespace chunkd::crypto

#endif // CHUNKD_CRYPTO_DIGEST_HPP
