#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "chainvault/network/session_manager.hpp"

namespace chainvault {
namespace network {

class TCP_Server {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see local_port()
  TCP_Server(const uint16_t port, const std::string& address);
  ~TCP_Server();

  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;

  
  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();

  
  // ---- GETTERS AND SETTERS ----
  void set_session_manager(SessionManager& session_manager);
  // Port actually bound, valid once the listener has started
  uint16_t local_port() const { return bound_port_; }
  const std::string& address() const { return address_; }
  bool is_running() const { return is_running_; }

private:

  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  uint16_t bound_port_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;
  
  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  SessionManager* session_manager_; 

  
  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace network
} // namespace chainvault
