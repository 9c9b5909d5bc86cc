#ifndef CHAINVAULT_CHAIN_ERROR_HPP
#define CHAINVAULT_CHAIN_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chainvault {
namespace chain {

class ChainError : public std::runtime_error {
public:
  explicit ChainError(const std::string& message) : std::runtime_error(message) {}
};

// Block sequence has the wrong shape (empty, oversized payload, bad linkage)
class ShapeError : public ChainError {
public:
  explicit ShapeError(const std::string& message) : ChainError("Shape error: " + message) {}
};

class NotFoundError : public ChainError {
public:
  explicit NotFoundError(const std::string& hash) 
    : ChainError("Not found: " + hash)
    , hash_(hash) {}

  const std::string& hash() const { return hash_; }

private:
  std::string hash_;
};

class CorruptionError : public ChainError {
public:
  explicit CorruptionError(uint64_t first_broken_index)
    : ChainError("Chain broken at index " + std::to_string(first_broken_index))
    , first_broken_index_(first_broken_index) {}

  uint64_t first_broken_index() const { return first_broken_index_; }

private:
  uint64_t first_broken_index_;
};

// Received payloads do not hash to the declared file hash
class ContentMismatchError : public ChainError {
public:
  ContentMismatchError(const std::string& declared, const std::string& actual)
    : ChainError("Content hash mismatch: declared " + declared + ", computed " + actual) {}
};

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_ERROR_HPP
