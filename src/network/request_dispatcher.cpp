#include "chainvault/network/request_dispatcher.hpp"
#include "chainvault/chain/chain_error.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "chainvault/network/network_error.hpp"
#include "chainvault/store/persistence_backend.hpp"
#include <boost/log/trivial.hpp>

namespace chainvault {
namespace network {

namespace {

Response error_response(Status status, const std::string& message, uint64_t value = 0) {
  Response response;
  response.status = status;
  response.message = message;
  response.value = value;
  return response;
}

void require_hash(const std::string& hash) {
  if (!crypto::Sha256Hasher::is_hex_digest(hash)) {
    throw MalformedRequest("not a SHA-256 hex digest: '" + hash + "'");
  }
}

} // namespace

RequestDispatcher::RequestDispatcher(chain::Ledger& ledger)
  : ledger_(ledger) {
  BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Initialized";
}

//==============================================
// DISPATCH
//==============================================

Response RequestDispatcher::dispatch(const Request& request) {
  BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Handling " << message_type_to_string(request.command) 
                           << " for '" << request.hash << "'";
  try {
    switch (request.command) {
      case MessageType::ADD:
        return handle_add(request);
      case MessageType::CHECK:
        return handle_check(request);
      case MessageType::GET:
        return handle_get(request);
      default:
        throw MalformedRequest(std::string("unexpected command ") + message_type_to_string(request.command));
    }
  }
  catch (const chain::NotFoundError& e) {
    BOOST_LOG_TRIVIAL(info) << "Dispatcher: " << e.what();
    return error_response(Status::NOT_FOUND, e.what());
  }
  catch (const chain::CorruptionError& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: " << e.what();
    return error_response(Status::CORRUPT, e.what(), e.first_broken_index());
  }
  catch (const chain::ChainError& e) {
    // ShapeError, ContentMismatchError
    BOOST_LOG_TRIVIAL(warning) << "Dispatcher: Rejected " << message_type_to_string(request.command) 
                               << ": " << e.what();
    return error_response(Status::ERROR, e.what());
  }
  catch (const store::PersistenceFailure& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Persistence failure: " << e.what();
    return error_response(Status::ERROR, e.what());
  }
  catch (const MalformedRequest& e) {
    BOOST_LOG_TRIVIAL(warning) << "Dispatcher: " << e.what();
    return error_response(Status::ERROR, e.what());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Failed to handle " << message_type_to_string(request.command) 
                             << ": " << e.what();
    return error_response(Status::ERROR, std::string("internal error: ") + e.what());
  }
}

//==============================================
// HANDLERS
//==============================================

Response RequestDispatcher::handle_add(const Request& request) {
  require_hash(request.hash);
  if (request.total_blocks != request.payloads.size()) {
    throw MalformedRequest("announced " + std::to_string(request.total_blocks) + " block(s) but received " 
                           + std::to_string(request.payloads.size()));
  }

  chain::AddResult added = ledger_.add_file(request.hash, request.filename, request.payloads);

  Response response;
  response.value = added.block_count;
  response.filename = request.filename;
  response.message = (added.already_present ? "already stored at index " : "stored at index ") 
                     + std::to_string(added.first_index);
  return response;
}

Response RequestDispatcher::handle_check(const Request& request) {
  if (request.hash.empty()) {
    return handle_verify();
  }
  require_hash(request.hash);

  chain::CheckResult checked = ledger_.check_hash(request.hash);
  Response response;
  switch (checked.kind) {
    case chain::HashKind::ABSENT:
      return error_response(Status::NOT_FOUND, "hash not stored");

    case chain::HashKind::FILE:
    case chain::HashKind::BLOCK:
      if (!checked.intact) {
        return error_response(Status::CORRUPT, "stored content no longer matches its hash",
                              checked.first_broken_index.value_or(0));
      }
      response.value = checked.block_count;
      response.message = checked.kind == chain::HashKind::FILE ? "file" : "block";
      return response;
  }
  return error_response(Status::ERROR, "unknown hash kind");
}

Response RequestDispatcher::handle_verify() {
  chain::VerifyResult verified = ledger_.verify();
  if (!verified.ok) {
    return error_response(Status::CORRUPT, "chain broken", verified.first_broken_index.value_or(0));
  }

  Response response;
  response.value = ledger_.size();
  response.message = "chain intact";
  return response;
}

Response RequestDispatcher::handle_get(const Request& request) {
  require_hash(request.hash);

  std::vector<chain::Block> blocks = ledger_.get_file(request.hash);

  Response response;
  response.value = blocks.size();
  response.filename = blocks.front().filename;
  response.blocks.reserve(blocks.size());
  for (auto& block : blocks) {
    response.blocks.push_back(std::move(block.payload));
  }
  return response;
}

} // namespace network
} // namespace chainvault
