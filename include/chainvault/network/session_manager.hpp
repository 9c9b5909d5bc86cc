#ifndef CHAINVAULT_SESSION_MANAGER_HPP
#define CHAINVAULT_SESSION_MANAGER_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "chainvault/network/request_dispatcher.hpp"
#include "chainvault/network/session.hpp"

namespace chainvault {
namespace network {

// Runs each accepted connection as a Session on its own thread
class SessionManager {
public:
  // Delete copy constructor and assignment operator
  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SessionManager(RequestDispatcher& dispatcher, std::chrono::seconds timeout, size_t max_block_size);
  ~SessionManager();


  // ---- SESSION MANAGEMENT ----
  // Takes ownership of an accepted socket and starts serving it
  void create_session(boost::asio::ip::tcp::socket socket);
  // Joins threads of sessions that have ended
  std::size_t reap_finished();


  // ---- UTILITY METHODS ----
  // Sessions still serving a connection
  std::size_t active_count() const;
  // Closes every connection and joins all session threads
  void shutdown();

private:
  struct SessionHandle {
    std::shared_ptr<Session> session;
    std::thread thread;
  };

  // ---- PARAMETERS ----
  RequestDispatcher& dispatcher_;
  std::chrono::seconds timeout_;
  size_t max_block_size_;

  std::map<uint64_t, SessionHandle> sessions_;
  uint64_t next_id_ = 1;
  bool shutting_down_ = false;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_SESSION_MANAGER_HPP
