#include "chainvault/crypto/hasher.hpp"
#include <openssl/evp.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace chainvault::crypto {

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

Sha256Hasher::Sha256Hasher() 
  : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::reset() {
  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to initialize hash context";
    throw DigestError("Failed to initialize hash context");
  }
}

//==============================================
// DIGEST OPERATIONS
//==============================================

Sha256Hasher& Sha256Hasher::update(const void* data, size_t size) {
  if (size == 0) {
    return *this;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to update hash with " << size << " bytes";
    throw DigestError("Failed to update hash");
  }
  return *this;
}

Sha256Hasher& Sha256Hasher::update(const std::vector<uint8_t>& data) {
  return update(data.data(), data.size());
}

Sha256Hasher& Sha256Hasher::update_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  return update(&network_value, sizeof(network_value));
}

Sha256Hasher& Sha256Hasher::update_string(const std::string& value) {
  uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(value.size()));
  update(&network_length, sizeof(network_length));
  return update(value.data(), value.size());
}

std::string Sha256Hasher::hex_digest() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Generate the final hash value
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to finalize hash";
    throw DigestError("Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(hash[i]);
  }

  reset();
  return ss.str();
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string Sha256Hasher::hash_hex(const std::vector<uint8_t>& data) {
  Sha256Hasher hasher;
  return hasher.update(data).hex_digest();
}

std::string Sha256Hasher::hash_hex(const std::string& data) {
  Sha256Hasher hasher;
  return hasher.update(data.data(), data.size()).hex_digest();
}

bool Sha256Hasher::is_hex_digest(const std::string& value) {
  if (value.size() != HEX_SIZE) {
    return false;
  }
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

} // namespace chainvault::crypto
