#include "chainvault/network/session.hpp"
#include "chainvault/network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace chainvault {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(uint64_t id, boost::asio::ip::tcp::socket socket, RequestDispatcher& dispatcher,
                 std::chrono::seconds timeout, size_t max_block_size)
  : id_(id)
  , stream_(std::move(socket))
  , dispatcher_(dispatcher)
  , timeout_(timeout)
  , max_block_size_(max_block_size) {
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Opened with timeout of " << timeout_.count() << "s";
}

Session::~Session() {
  close();
}

SessionState::State Session::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.get_state();
}

void Session::transition(SessionState::State new_state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  SessionState::State old_state = state_.get_state();
  if (!state_.transition_to(new_state)) {
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": Invalid transition " << old_state << " -> " << new_state;
    throw std::logic_error("Session: Invalid state transition");
  }
  BOOST_LOG_TRIVIAL(trace) << "Session " << id_ << ": " << old_state << " -> " << new_state;
}

//==============================================
// CONNECTION LOOP
//==============================================

void Session::run() {
  while (!closing_) {
    try {
      serve_frame();
    }
    catch (const MalformedRequest& e) {
      BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": " << e.what();
      send_error(e.what());
      if (e.frame_level()) {
        BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Closing after frame error";
        break;
      }
      // Payload-level errors leave the stream in sync
      if (state() != SessionState::State::AWAITING_COMMAND) {
        transition(SessionState::State::AWAITING_COMMAND);
      }
    }
    catch (const ConnectionError& e) {
      if (stream_.error() == boost::asio::error::eof || closing_) {
        BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Peer disconnected";
      } else {
        BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Transport failure (" 
                                   << stream_.error().message() << ")";
      }
      break;
    }
    catch (const ProtocolError& e) {
      BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": " << e.what();
      break;
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": Unexpected failure: " << e.what();
      send_error(std::string("internal error: ") + e.what());
      break;
    }
  }

  if (!pending_add_.payloads.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Discarding " << pending_add_.payloads.size() 
                               << " staged block(s) of unfinished ADD for " << pending_add_.hash;
  }
  pending_add_ = Request();

  transition(SessionState::State::CLOSED);
  close();
  finished_ = true;
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Closed";
}

void Session::close() {
  closing_ = true;
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected && ec != boost::asio::error::bad_descriptor) {
    BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Socket shutdown: " << ec.message();
  }
}

//==============================================
// FRAME HANDLING
//==============================================

void Session::serve_frame() {
  MessageFrame frame = read_frame();

  switch (frame.message_type) {
    case MessageType::ADD:
      serve_add(frame);
      break;
    case MessageType::CHECK:
      serve_check(frame);
      break;
    case MessageType::GET:
      serve_get(frame);
      break;
    case MessageType::BLOCK:
      throw MalformedRequest("BLOCK frame outside of an ADD", true);
    default:
      throw MalformedRequest(std::string("unexpected ") + message_type_to_string(frame.message_type) 
                             + " frame from client", true);
  }
}

void Session::serve_add(const MessageFrame& header_frame) {
  transition(SessionState::State::ADDING);

  AddHeader header = parse_add_frame(header_frame);
  if (header.total_blocks == 0) {
    throw MalformedRequest("ADD announces zero blocks");
  }
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": ADD " << header.file_hash << " (" << header.filename 
                          << ") expecting " << header.total_blocks << " block(s)";

  pending_add_ = Request();
  pending_add_.command = MessageType::ADD;
  pending_add_.hash = header.file_hash;
  pending_add_.filename = header.filename;
  pending_add_.total_blocks = header.total_blocks;

  // Nothing reaches the ledger until every block frame has arrived
  while (pending_add_.payloads.size() < header.total_blocks) {
    MessageFrame block = read_frame();
    if (block.message_type != MessageType::BLOCK) {
      throw MalformedRequest(std::string("expected BLOCK frame during ADD, got ") 
                             + message_type_to_string(block.message_type), true);
    }
    // Refuse oversized blocks before buffering them
    if (block.payload.size() > max_block_size_) {
      throw MalformedRequest("BLOCK frame of " + std::to_string(block.payload.size()) 
                             + " bytes exceeds block size " + std::to_string(max_block_size_), true);
    }
    pending_add_.payloads.push_back(std::move(block.payload));
  }

  Request request = std::move(pending_add_);
  pending_add_ = Request();

  Response response = dispatcher_.dispatch(request);
  send_response(response);
  transition(SessionState::State::AWAITING_COMMAND);
}

void Session::serve_check(const MessageFrame& frame) {
  transition(SessionState::State::CHECKING);

  Request request;
  request.command = MessageType::CHECK;
  request.hash = parse_query_frame(frame);
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": CHECK '" << request.hash << "'";

  send_response(dispatcher_.dispatch(request));
  transition(SessionState::State::AWAITING_COMMAND);
}

void Session::serve_get(const MessageFrame& frame) {
  transition(SessionState::State::GETTING);

  Request request;
  request.command = MessageType::GET;
  request.hash = parse_query_frame(frame);
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": GET " << request.hash;

  Response response = dispatcher_.dispatch(request);
  send_response(response);
  if (response.status == Status::OK) {
    for (const auto& payload : response.blocks) {
      send_frame(make_block_frame(payload));
    }
    BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Streamed " << response.blocks.size() << " block(s)";
  }
  transition(SessionState::State::AWAITING_COMMAND);
}

//==============================================
// STREAM OPERATIONS
//==============================================

MessageFrame Session::read_frame() {
  stream_.expires_after(timeout_);
  return codec_.deserialize(stream_);
}

void Session::send_frame(const MessageFrame& frame) {
  stream_.expires_after(timeout_);
  codec_.serialize(frame, stream_);
}

void Session::send_response(const Response& response) {
  BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Responding " << status_to_string(response.status) 
                           << " (" << response.value << ") " << response.message;
  send_frame(make_response_frame(response));
}

void Session::send_error(const std::string& message) {
  Response response;
  response.status = Status::ERROR;
  response.message = message;
  try {
    send_response(response);
  }
  catch (const ProtocolError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Could not deliver error response: " << e.what();
  }
}

} // namespace network
} // namespace chainvault
