#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "chainvault/chain/ledger.hpp"
#include "chainvault/network/request_dispatcher.hpp"
#include "chainvault/network/session_manager.hpp"
#include "chainvault/network/tcp_server.hpp"
#include "chainvault/store/persistence_backend.hpp"

namespace chainvault {
namespace server {

struct ServerConfig {
  std::string address = "127.0.0.1";
  uint16_t port = 10005;
  size_t max_block_size = chain::Chunker::DEFAULT_BLOCK_SIZE;
  std::chrono::seconds timeout{30};
};

// Owns the ledger and every network component serving it
class ChainServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChainServer(const ServerConfig& config, std::unique_ptr<store::PersistenceBackend> backend);
  ~ChainServer();

  ChainServer(const ChainServer&) = delete;
  ChainServer& operator=(const ChainServer&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Opens the ledger and starts the listener
  bool start();
  // Stops accepting, closes live sessions and joins their threads
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  chain::Ledger& get_ledger() { return *ledger_; }
  uint16_t port() const { return tcp_server_->local_port(); }
  const chain::VerifyResult& startup_verification() const { return startup_verification_; }
  std::size_t active_sessions() const { return session_manager_->active_count(); }

private:
  // ---- PARAMETERS ----
  ServerConfig config_;
  chain::VerifyResult startup_verification_;
  bool started_ = false;

  // System components, sessions are destroyed before the listener
  std::unique_ptr<chain::Ledger> ledger_;
  std::unique_ptr<network::RequestDispatcher> dispatcher_;
  std::unique_ptr<network::TCP_Server> tcp_server_;
  std::unique_ptr<network::SessionManager> session_manager_;
};

} // namespace server
} // namespace chainvault
