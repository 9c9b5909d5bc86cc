#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>
#include "chainvault/network/codec.hpp"
#include "chainvault/network/request.hpp"
#include "chainvault/network/request_dispatcher.hpp"
#include "chainvault/network/session_state.hpp"

namespace chainvault {
namespace network {

// Serves one client connection: reads frames, drives the command
// state machine and hands complete requests to the dispatcher.
class Session {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Session(uint64_t id, boost::asio::ip::tcp::socket socket, RequestDispatcher& dispatcher,
          std::chrono::seconds timeout, size_t max_block_size);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- CONNECTION LOOP ----
  // Blocks until the peer disconnects, times out, or close() is called
  void run();
  // Unblocks run() from another thread
  void close();


  // ---- GETTERS ----
  uint64_t id() const { return id_; }
  SessionState::State state() const;
  bool is_finished() const { return finished_; }

private:
  // ---- PARAMETERS ----
  uint64_t id_;
  boost::asio::ip::tcp::iostream stream_;
  RequestDispatcher& dispatcher_;
  std::chrono::seconds timeout_;
  // Largest BLOCK payload accepted during an ADD
  size_t max_block_size_;
  Codec codec_;

  SessionState state_;
  mutable std::mutex state_mutex_;
  std::atomic<bool> finished_{false};
  std::atomic<bool> closing_{false};

  // Payloads of the ADD in progress, dropped unless every frame arrives
  Request pending_add_;


  // ---- FRAME HANDLING ----
  // Reads and serves one frame from AWAITING_COMMAND
  void serve_frame();
  void serve_add(const MessageFrame& header);
  void serve_check(const MessageFrame& frame);
  void serve_get(const MessageFrame& frame);


  // ---- STREAM OPERATIONS ----
  MessageFrame read_frame();
  void send_frame(const MessageFrame& frame);
  void send_response(const Response& response);
  // Sends an ERROR response, ignoring transport failures
  void send_error(const std::string& message);


  // ---- STATE ----
  void transition(SessionState::State new_state);
};

} // namespace network
} // namespace chainvault
