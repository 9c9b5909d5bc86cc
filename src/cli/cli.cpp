#include "chainvault/cli/cli.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "chainvault/network/network_error.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chainvault {
namespace cli {

namespace {

// Closes the connection after each command, the server drops idle connections
class ConnectionScope {
public:
  explicit ConnectionScope(client::ChainClient& client) : client_(client) {}
  ~ConnectionScope() { client_.close(); }

private:
  client::ChainClient& client_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(client::ChainClient& client, const std::filesystem::path& output_dir,
         std::istream& input, std::ostream& output)
  : running_(false)
  , output_dir_(output_dir)
  , input_(input)
  , output_(output)
  , client_(client) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized, files are written to " << output_dir_;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "chainvault> " << std::flush;
  
  while (running_ && std::getline(input_, line)) {
    std::string reply = execute(line);
    if (!reply.empty()) {
      output_ << reply << std::endl;
    }

    if (running_) {
      output_ << "chainvault> " << std::flush;
    }
  }

  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

std::string CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument, extra;
  iss >> command >> argument >> extra;

  if (command.empty()) {
    return "";
  }
  if (!extra.empty()) {
    return "Invalid input. Usage: <command> [argument]";
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with argument: " << argument;

  if (command == "stop" || command == "quit") {
    running_ = false;
    return "Bye";
  }
  if (command == "help") {
    return handle_help_command();
  }
  if (command == "check") {
    return handle_check_command(argument);
  }
  if (command == "add" && !argument.empty()) {
    return handle_add_command(argument);
  }
  if (command == "get" && !argument.empty()) {
    return handle_get_command(argument);
  }
  return "Unknown command or invalid arguments. Type 'help' for usage.";
}

std::string CLI::handle_add_command(const std::string& path) {
  if (!std::filesystem::is_regular_file(path)) {
    return "Error opening file: " + path;
  }

  try {
    ConnectionScope scope(client_);
    client::ClientResult result = client_.add_file(path);
    if (!result.ok()) {
      return describe_failure(result);
    }
    return "Stored " + path + " as " + result.hash + " (" + std::to_string(result.value) 
           + " block(s), " + result.message + ")";
  } catch (const std::exception& e) {
    return log_and_format_error("Error adding file", e.what());
  }
}

std::string CLI::handle_check_command(const std::string& target) {
  try {
    ConnectionScope scope(client_);
    client::ClientResult result;
    if (target.empty()) {
      result = client_.verify_chain();
      if (result.ok()) {
        return "Chain intact: " + std::to_string(result.value) + " block(s)";
      }
    } else if (crypto::Sha256Hasher::is_hex_digest(target)) {
      result = client_.check_hash(target);
    } else if (std::filesystem::is_regular_file(target)) {
      result = client_.check_file(target);
    } else {
      return "Not a file or SHA-256 hash: " + target;
    }

    if (!result.ok()) {
      return describe_failure(result);
    }
    return "Present: " + result.hash + " (" + result.message + ", " + std::to_string(result.value) + " block(s))";
  } catch (const std::exception& e) {
    return log_and_format_error("Error checking", e.what());
  }
}

std::string CLI::handle_get_command(const std::string& hash) {
  if (!crypto::Sha256Hasher::is_hex_digest(hash)) {
    return "Not a SHA-256 hash: " + hash;
  }

  try {
    ConnectionScope scope(client_);
    client::ClientResult result = client_.get_file(hash, output_dir_);
    if (!result.ok()) {
      return describe_failure(result);
    }
    return "Retrieved " + result.path.string() + " (" + std::to_string(result.value) + " block(s))";
  } catch (const std::exception& e) {
    return log_and_format_error("Error retrieving file", e.what());
  }
}

std::string CLI::handle_help_command() const {
  std::ostringstream help;
  help << "Available commands:\n"
       << "  add <file>            Split <file> into blocks and store it\n"
       << "  check <file|hash>     Ask whether a file or hash is stored intact\n"
       << "  check                 Verify the whole chain\n"
       << "  get <hash>            Retrieve a stored file into " << output_dir_.string() << "\n"
       << "  help                  Display this help message\n"
       << "  stop                  Exit the shell (also: quit)";
  return help.str();
}

std::string CLI::describe_failure(const client::ClientResult& result) const {
  switch (result.status) {
    case network::Status::NOT_FOUND:
      return "Not found: " + result.hash;
    case network::Status::CORRUPT:
      return "Corrupt: " + result.message + " (first broken index " + std::to_string(result.value) + ")";
    default:
      return "Error: " + result.message;
  }
}

std::string CLI::log_and_format_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  return message + ": " + error;
}

} // namespace cli
} // namespace chainvault
