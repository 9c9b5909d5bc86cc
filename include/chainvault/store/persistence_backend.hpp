#ifndef CHAINVAULT_STORE_PERSISTENCE_BACKEND_HPP
#define CHAINVAULT_STORE_PERSISTENCE_BACKEND_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "chainvault/chain/block.hpp"

namespace chainvault {
namespace store {

class PersistenceFailure : public std::runtime_error {
public:
  explicit PersistenceFailure(const std::string& message) : std::runtime_error(message) {}
};

// A persisted record could not be decoded
class RecordFormatError : public PersistenceFailure {
public:
  explicit RecordFormatError(const std::string& message) 
    : PersistenceFailure("Record format error: " + message) {}
};

// Durable storage for chain blocks, selected once at startup
class PersistenceBackend {
public:
  virtual ~PersistenceBackend() = default;

  // Returns every persisted block in index order
  virtual std::vector<chain::Block> load() = 0;
  // Durably stores one block, throws PersistenceFailure if it cannot
  virtual void persist(const chain::Block& block) = 0;
  // Removes a block persisted by an operation that was never acknowledged
  virtual void discard(const chain::Block& block) = 0;
  // Destroys every persisted block
  virtual void clear() = 0;

  virtual std::string name() const = 0;
};

} // namespace store
} // namespace chainvault

#endif // CHAINVAULT_STORE_PERSISTENCE_BACKEND_HPP
