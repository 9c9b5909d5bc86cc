#ifndef CHAINVAULT_CRYPTO_HASHER_HPP
#define CHAINVAULT_CRYPTO_HASHER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "chainvault/crypto/crypto_error.hpp"

namespace chainvault::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 digest producing lowercase hex strings
class Sha256Hasher {
public:
  static constexpr size_t DIGEST_SIZE = 32;   // 256 bits
  static constexpr size_t HEX_SIZE = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds raw bytes into the digest
  Sha256Hasher& update(const void* data, size_t size);
  Sha256Hasher& update(const std::vector<uint8_t>& data);
  // Feeds a u64 in big endian byte order
  Sha256Hasher& update_u64(uint64_t value);
  // Feeds a u32 length prefix followed by the string bytes
  Sha256Hasher& update_string(const std::string& value);
  // Finalizes the digest and returns it as hex; the hasher is reset afterwards
  std::string hex_digest();


  // ---- ONE-SHOT HELPERS ----
  static std::string hash_hex(const std::vector<uint8_t>& data);
  static std::string hash_hex(const std::string& data);
  // True if value is 64 lowercase hex characters
  static bool is_hex_digest(const std::string& value);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;


  // ---- INITIALIZATION ----
  void reset();
};

} // namespace chainvault::crypto

#endif // CHAINVAULT_CRYPTO_HASHER_HPP
