#ifndef CHAINVAULT_CRYPTO_ERROR_HPP
#define CHAINVAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chainvault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

} // namespace chainvault::crypto

#endif // CHAINVAULT_CRYPTO_ERROR_HPP
