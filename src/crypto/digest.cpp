#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunkd::crypto {

namespace {

std::string to_hex(const unsigned char* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;


//==============================================
// HASHING OPERATIONS
//==============================================

void Sha256::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Sha256::finalize_hex() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  std::string result = to_hex(hash, hash_len);
  BOOST_LOG_TRIVIAL(debug) << "Digest: Generated SHA-256: " << result;
  return result;
}

std::string Sha256::hex_of(const std::string& data) {
  Sha256 digest;
  digest.update(data.data(), data.size());
  return digest.finalize_hex();
}

std::string Sha256::hex_of(std::istream& input) {
  Sha256 digest;
  char buffer[4096];
  while (input.read(buffer, sizeof(buffer))) {
    digest.update(buffer, input.gcount());
  }
  if (input.gcount() > 0) {
    digest.update(buffer, input.gcount());
  }
  return digest.finalize_hex();
}


//==============================================
// RANDOM IDENTIFIERS
//==============================================

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> raw(bytes);
  if (bytes > 0 && RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    throw RandomError("Failed to generate random bytes");
  }
  return to_hex(raw.data(), raw.size());
}

} // namespace chunkd::crypto
