#ifndef CHAINVAULT_NETWORK_REQUEST_DISPATCHER_HPP
#define CHAINVAULT_NETWORK_REQUEST_DISPATCHER_HPP

#include "chainvault/chain/ledger.hpp"
#include "chainvault/network/request.hpp"

namespace chainvault {
namespace network {

// Routes parsed requests to the ledger and maps errors to wire statuses
class RequestDispatcher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit RequestDispatcher(chain::Ledger& ledger);

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;


  // ---- DISPATCH ----
  // Never throws for request-level failures, they become ERROR responses
  Response dispatch(const Request& request);

private:
  // ---- PARAMETERS ----
  chain::Ledger& ledger_;


  // ---- HANDLERS ----
  Response handle_add(const Request& request);
  Response handle_check(const Request& request);
  Response handle_get(const Request& request);
  // CHECK with an empty hash
  Response handle_verify();
};

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_NETWORK_REQUEST_DISPATCHER_HPP
