#include "chainvault/network/tcp_server.hpp"

namespace chainvault {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address)
  : port_(port)
  , address_(address)
  , bound_port_(0)
  , is_running_(false)
  , session_manager_(nullptr) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}

  
//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }
  if (!session_manager_) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: No SessionManager set";
    return false;
  }

  try {
    // A previous shutdown leaves the io_context stopped
    io_context_.restart();

    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_,
      endpoint
    );
    bound_port_ = acceptor_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Acceptor bound to port " << bound_port_;

    is_running_ = true;

    // Start accepting connections
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting IO context";
    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        boost::asio::io_context::work work(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Create new socket for incoming connection
  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  // Set up async accept operation
  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::system::error_code ec;
        auto remote = socket->remote_endpoint(ec);
        BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted connection from " 
                                << (ec ? std::string("unknown peer") : remote.address().to_string());
        session_manager_->create_session(std::move(*socket));
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}
  
void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}
  

//==============================================
// GETTERS AND SETTERS
//==============================================

void TCP_Server::set_session_manager(SessionManager& session_manager) {
  session_manager_ = &session_manager;
  BOOST_LOG_TRIVIAL(debug) << "TCP server: SessionManager set";
}

} // namespace network
} // namespace chainvault
