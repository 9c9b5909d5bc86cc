#include "chainvault/client/chain_client.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "chainvault/network/network_error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace chainvault {
namespace client {

using network::ConnectionError;
using network::MessageFrame;
using network::MessageType;
using network::Status;

namespace {

std::string hash_payloads(const std::vector<chain::Payload>& payloads) {
  crypto::Sha256Hasher hasher;
  for (const auto& payload : payloads) {
    hasher.update(payload);
  }
  return hasher.hex_digest();
}

std::vector<chain::Payload> read_local_file(const chain::Chunker& chunker, const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw std::runtime_error("Cannot open file: " + path.string());
  }
  return chunker.split(input);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChainClient::ChainClient(const ClientConfig& config)
  : config_(config)
  , chunker_(config.block_size) {
  BOOST_LOG_TRIVIAL(info) << "Client: Initialized for " << config_.address << ":" << config_.port 
                          << " with block size " << config_.block_size;
}

ChainClient::~ChainClient() {
  close();
}

//==============================================
// CONNECTION MANAGEMENT
//==============================================

void ChainClient::connect() {
  if (is_connected()) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Connecting to " << config_.address << ":" << config_.port;
  auto stream = std::make_unique<boost::asio::ip::tcp::iostream>();
  stream->expires_after(config_.timeout);
  stream->connect(config_.address, std::to_string(config_.port));
  if (!*stream) {
    BOOST_LOG_TRIVIAL(error) << "Client: Connection failed: " << stream->error().message();
    throw ConnectionError("cannot reach " + config_.address + ":" + std::to_string(config_.port) 
                          + " (" + stream->error().message() + ")");
  }

  stream_ = std::move(stream);
  BOOST_LOG_TRIVIAL(info) << "Client: Connected";
}

void ChainClient::close() {
  if (!stream_) {
    return;
  }
  stream_->close();
  stream_.reset();
  BOOST_LOG_TRIVIAL(debug) << "Client: Connection closed";
}

bool ChainClient::is_connected() const {
  return stream_ && stream_->good();
}

boost::asio::ip::tcp::iostream& ChainClient::stream() {
  if (!stream_) {
    throw ConnectionError("not connected");
  }
  return *stream_;
}

//==============================================
// ADD
//==============================================

ClientResult ChainClient::add_file(const std::filesystem::path& path) {
  std::vector<chain::Payload> payloads = read_local_file(chunker_, path);
  std::string file_hash = hash_payloads(payloads);
  BOOST_LOG_TRIVIAL(info) << "Client: Adding " << path << " as " << file_hash << " in " 
                          << payloads.size() << " block(s)";
  return send_add(file_hash, path.filename().string(), payloads);
}

ClientResult ChainClient::add_bytes(const std::string& filename, const std::vector<uint8_t>& bytes) {
  std::vector<chain::Payload> payloads = chunker_.split(bytes);
  std::string file_hash = crypto::Sha256Hasher::hash_hex(bytes);
  BOOST_LOG_TRIVIAL(info) << "Client: Adding " << bytes.size() << " byte(s) as " << file_hash;
  return send_add(file_hash, filename, payloads);
}

ClientResult ChainClient::send_add(const std::string& file_hash, const std::string& filename,
                                   const std::vector<chain::Payload>& payloads) {
  network::AddHeader header;
  header.file_hash = file_hash;
  header.filename = filename;
  header.total_blocks = payloads.size();

  send_frame(network::make_add_frame(header));
  for (const auto& payload : payloads) {
    send_frame(network::make_block_frame(payload));
  }

  ClientResult result = read_response();
  result.hash = file_hash;
  return result;
}

//==============================================
// CHECK
//==============================================

ClientResult ChainClient::check_file(const std::filesystem::path& path) {
  std::string file_hash = hash_payloads(read_local_file(chunker_, path));
  BOOST_LOG_TRIVIAL(info) << "Client: Checking " << path << " as " << file_hash;
  return check_hash(file_hash);
}

ClientResult ChainClient::check_hash(const std::string& hash) {
  send_frame(network::make_query_frame(MessageType::CHECK, hash));
  ClientResult result = read_response();
  result.hash = hash;
  return result;
}

ClientResult ChainClient::verify_chain() {
  return check_hash("");
}

//==============================================
// GET
//==============================================

ClientResult ChainClient::get_file(const std::string& hash, const std::filesystem::path& output_dir) {
  std::vector<chain::Payload> payloads;
  ClientResult result = receive_file(hash, payloads);
  if (!result.ok()) {
    return result;
  }

  // Only the base name is trusted, stored names never escape output_dir
  std::filesystem::path name = std::filesystem::path(result.filename).filename();
  if (name.empty() || name == "." || name == "..") {
    name = hash;
  }

  std::filesystem::create_directories(output_dir);
  result.path = output_dir / name;
  std::ofstream output(result.path, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw std::runtime_error("Cannot write file: " + result.path.string());
  }
  size_t written = chain::Chunker::reassemble(payloads, output);
  output.close();
  if (!output) {
    throw std::runtime_error("Failed writing file: " + result.path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Wrote " << written << " byte(s) to " << result.path;
  return result;
}

ClientResult ChainClient::get_bytes(const std::string& hash) {
  std::vector<chain::Payload> payloads;
  ClientResult result = receive_file(hash, payloads);
  if (result.ok()) {
    result.content = chain::Chunker::reassemble(payloads);
  }
  return result;
}

ClientResult ChainClient::receive_file(const std::string& hash, std::vector<chain::Payload>& payloads) {
  send_frame(network::make_query_frame(MessageType::GET, hash));
  ClientResult result = read_response();
  result.hash = hash;
  if (!result.ok()) {
    return result;
  }

  // The announced count is not trusted for allocation
  payloads.clear();
  for (uint64_t i = 0; i < result.value; ++i) {
    MessageFrame frame = read_frame();
    if (frame.message_type != MessageType::BLOCK) {
      throw network::ProtocolError(std::string("expected BLOCK frame, got ") 
                                   + network::message_type_to_string(frame.message_type));
    }
    payloads.push_back(std::move(frame.payload));
  }

  // The server vouches for its chain, the client still checks what arrived
  if (hash_payloads(payloads) != hash) {
    BOOST_LOG_TRIVIAL(error) << "Client: Received content does not match " << hash;
    result.status = Status::ERROR;
    result.message = "received content does not match the requested hash";
  }
  return result;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void ChainClient::send_frame(const MessageFrame& frame) {
  connect();
  stream().expires_after(config_.timeout);
  try {
    codec_.serialize(frame, stream());
  }
  catch (const ConnectionError&) {
    close();
    throw;
  }
}

MessageFrame ChainClient::read_frame() {
  stream().expires_after(config_.timeout);
  try {
    return codec_.deserialize(stream());
  }
  catch (const network::ProtocolError&) {
    close();
    throw;
  }
}

ClientResult ChainClient::read_response() {
  network::Response response = network::parse_response_frame(read_frame());

  ClientResult result;
  result.status = response.status;
  result.value = response.value;
  result.message = response.message;
  result.filename = response.filename;

  BOOST_LOG_TRIVIAL(info) << "Client: Server answered " << network::status_to_string(result.status) 
                          << " (" << result.value << ") " << result.message;
  return result;
}

} // namespace client
} // namespace chainvault
