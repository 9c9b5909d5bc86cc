#include "chainvault/network/session_manager.hpp"
#include <boost/log/trivial.hpp>
#include <vector>

namespace chainvault {
namespace network {

SessionManager::SessionManager(RequestDispatcher& dispatcher, std::chrono::seconds timeout, size_t max_block_size)
  : dispatcher_(dispatcher)
  , timeout_(timeout)
  , max_block_size_(max_block_size) {
  if (timeout_.count() <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Session manager: Invalid timeout: " << timeout_.count() << "s";
    throw std::invalid_argument("Session manager: Timeout must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Session manager: Initialized with timeout " << timeout_.count() << "s";
}

SessionManager::~SessionManager() {
  shutdown();
}

void SessionManager::create_session(boost::asio::ip::tcp::socket socket) {
  reap_finished();

  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_) {
    BOOST_LOG_TRIVIAL(warning) << "Session manager: Rejecting connection during shutdown";
    boost::system::error_code ec;
    socket.close(ec);
    return;
  }

  try {
    uint64_t id = next_id_++;
    auto session = std::make_shared<Session>(id, std::move(socket), dispatcher_, timeout_, max_block_size_);

    SessionHandle& handle = sessions_[id];
    handle.session = session;
    handle.thread = std::thread([session]() {
      try {
        session->run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Session manager: Session " << session->id() << " failed: " << e.what();
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Session manager: Started session " << id << ", " << sessions_.size() << " tracked";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Session manager: Error handling new connection: " << e.what();
  }
}

std::size_t SessionManager::reap_finished() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second.session->is_finished()) {
        finished.push_back(std::move(it->second.thread));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& thread : finished) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  if (!finished.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Session manager: Reaped " << finished.size() << " finished session(s)";
  }
  return finished.size();
}

std::size_t SessionManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto& entry : sessions_) {
    if (!entry.second.session->is_finished()) {
      ++active;
    }
  }
  return active;
}

void SessionManager::shutdown() {
  std::map<uint64_t, SessionHandle> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_ && sessions_.empty()) {
      return;
    }
    shutting_down_ = true;
    sessions.swap(sessions_);
  }

  BOOST_LOG_TRIVIAL(info) << "Session manager: Closing " << sessions.size() << " session(s)";

  for (auto& entry : sessions) {
    entry.second.session->close();
  }
  for (auto& entry : sessions) {
    if (entry.second.thread.joinable()) {
      entry.second.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session manager: shutdown complete";
}

} // namespace network
} // namespace chainvault
