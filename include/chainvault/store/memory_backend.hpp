#ifndef CHAINVAULT_STORE_MEMORY_BACKEND_HPP
#define CHAINVAULT_STORE_MEMORY_BACKEND_HPP

#include "chainvault/store/persistence_backend.hpp"

namespace chainvault {
namespace store {

// Keeps nothing outside process memory; the chain is lost on restart
class MemoryBackend : public PersistenceBackend {
public:
  std::vector<chain::Block> load() override { return {}; }
  void persist(const chain::Block& /*block*/) override {}
  void discard(const chain::Block& /*block*/) override {}
  void clear() override {}

  std::string name() const override { return "memory"; }
};

} // namespace store
} // namespace chainvault

#endif // CHAINVAULT_STORE_MEMORY_BACKEND_HPP
