#ifndef CHAINVAULT_CLIENT_CHAIN_CLIENT_HPP
#define CHAINVAULT_CLIENT_CHAIN_CLIENT_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "chainvault/chain/chunker.hpp"
#include "chainvault/network/codec.hpp"
#include "chainvault/network/request.hpp"

namespace chainvault {
namespace client {

struct ClientConfig {
  std::string address = "127.0.0.1";
  uint16_t port = 10005;
  size_t block_size = chain::Chunker::DEFAULT_BLOCK_SIZE;
  std::chrono::seconds timeout{30};
};

// Server reply as seen by the caller
struct ClientResult {
  network::Status status = network::Status::OK;
  std::string message;
  uint64_t value = 0;
  std::string filename;
  // Content hash the request was about
  std::string hash;
  // Set by get_file: where the file was written
  std::filesystem::path path;
  // Set by get_bytes: the reassembled file
  std::vector<uint8_t> content;

  bool ok() const { return status == network::Status::OK; }
};

// Speaks the chainvault protocol to one server.
// Transport failures throw network::ConnectionError.
class ChainClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChainClient(const ClientConfig& config);
  ~ChainClient();

  ChainClient(const ChainClient&) = delete;
  ChainClient& operator=(const ChainClient&) = delete;


  // ---- CONNECTION MANAGEMENT ----
  void connect();
  void close();
  bool is_connected() const;


  // ---- ADD ----
  // Splits the file into blocks and stores it under its base name
  ClientResult add_file(const std::filesystem::path& path);
  ClientResult add_bytes(const std::string& filename, const std::vector<uint8_t>& bytes);


  // ---- CHECK ----
  // Hashes a local file and asks whether the server holds it
  ClientResult check_file(const std::filesystem::path& path);
  ClientResult check_hash(const std::string& hash);
  // Asks the server to verify its whole chain
  ClientResult verify_chain();


  // ---- GET ----
  // Writes the file to output_dir under its stored name (or its hash)
  ClientResult get_file(const std::string& hash, const std::filesystem::path& output_dir);
  ClientResult get_bytes(const std::string& hash);


  // ---- GETTERS ----
  const ClientConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ClientConfig config_;
  chain::Chunker chunker_;
  network::Codec codec_;
  std::unique_ptr<boost::asio::ip::tcp::iostream> stream_;


  // ---- PROTOCOL HELPERS ----
  ClientResult send_add(const std::string& file_hash, const std::string& filename,
                        const std::vector<chain::Payload>& payloads);
  // Reads the GET header and block frames into payloads
  ClientResult receive_file(const std::string& hash, std::vector<chain::Payload>& payloads);
  void send_frame(const network::MessageFrame& frame);
  network::MessageFrame read_frame();
  ClientResult read_response();
  // Throws ConnectionError if no connection is open
  boost::asio::ip::tcp::iostream& stream();
};

} // namespace client
} // namespace chainvault

#endif // CHAINVAULT_CLIENT_CHAIN_CLIENT_HPP
