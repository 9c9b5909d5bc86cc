#include "chainvault/config/options.hpp"
#include <boost/asio/ip/address.hpp>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace chainvault {
namespace config {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t min, uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Invalid value for " + flag + ": " + value);
  }
  uint64_t number;
  try {
    number = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Value out of range for " + flag + ": " + value);
  }
  if (number < min || number > max) {
    throw std::invalid_argument("Value for " + flag + " must be between " + std::to_string(min) 
                                + " and " + std::to_string(max));
  }
  return number;
}

void check_address(const std::string& address) {
  boost::system::error_code ec;
  boost::asio::ip::make_address(address, ec);
  if (ec) {
    throw std::invalid_argument("Invalid IP address: " + address);
  }
}

// Walks flag/value pairs; switches take no value
template <typename Handler>
void walk_arguments(const std::vector<std::string>& args, const std::unordered_set<std::string>& switches,
                    const std::unordered_set<std::string>& valued, Handler handle) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& flag = args[i];
    if (switches.count(flag)) {
      handle(flag, std::string());
    } else if (valued.count(flag)) {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + flag);
      }
      handle(flag, args[++i]);
    } else {
      throw std::invalid_argument("Unknown argument: " + flag);
    }
  }
}

} // namespace

ServerOptions parse_server_options(const std::vector<std::string>& args, std::ostream& errors) {
  ServerOptions options;
  try {
    walk_arguments(args, {"--fs", "--verbose", "-h", "--help"},
                   {"--ip", "--port", "--dir", "--block-size", "--timeout", "--log"},
      [&options](const std::string& flag, const std::string& value) {
        if (flag == "--fs") {
          options.use_filesystem = true;
        } else if (flag == "--verbose") {
          options.verbose = true;
        } else if (flag == "-h" || flag == "--help") {
          options.help = true;
        } else if (flag == "--ip") {
          check_address(value);
          options.address = value;
        } else if (flag == "--port") {
          options.port = static_cast<uint16_t>(parse_number(flag, value, 0, std::numeric_limits<uint16_t>::max()));
        } else if (flag == "--dir") {
          if (value.empty()) {
            throw std::invalid_argument("Empty value for --dir");
          }
          options.directory = value;
        } else if (flag == "--block-size") {
          options.block_size = static_cast<size_t>(parse_number(flag, value, 1, 64 * 1024 * 1024));
        } else if (flag == "--timeout") {
          options.timeout_seconds = static_cast<uint32_t>(parse_number(flag, value, 1, 86400));
        } else if (flag == "--log") {
          options.log_file = value;
        }
      });
  }
  catch (const std::invalid_argument& e) {
    errors << "Error: " << e.what() << '\n';
    return options;
  }

  options.valid = true;
  return options;
}

ClientOptions parse_client_options(const std::vector<std::string>& args, std::ostream& errors) {
  ClientOptions options;
  try {
    walk_arguments(args, {"-h", "--help"},
                   {"--ip", "--port", "--block-size", "--timeout", "--log", "--out"},
      [&options](const std::string& flag, const std::string& value) {
        if (flag == "-h" || flag == "--help") {
          options.help = true;
        } else if (flag == "--ip") {
          check_address(value);
          options.address = value;
        } else if (flag == "--port") {
          options.port = static_cast<uint16_t>(parse_number(flag, value, 1, std::numeric_limits<uint16_t>::max()));
        } else if (flag == "--block-size") {
          options.block_size = static_cast<size_t>(parse_number(flag, value, 1, 64 * 1024 * 1024));
        } else if (flag == "--timeout") {
          options.timeout_seconds = static_cast<uint32_t>(parse_number(flag, value, 1, 86400));
        } else if (flag == "--log") {
          options.log_file = value;
        } else if (flag == "--out") {
          if (value.empty()) {
            throw std::invalid_argument("Empty value for --out");
          }
          options.output_dir = value;
        }
      });
  }
  catch (const std::invalid_argument& e) {
    errors << "Error: " << e.what() << '\n';
    return options;
  }

  options.valid = true;
  return options;
}

void print_server_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  --ip <addr>          Listen address (default 127.0.0.1)\n"
      << "  --port <port>        Listen port (default 10005, 0 picks a free port)\n"
      << "  --fs                 Persist blocks on disk instead of in memory\n"
      << "  --dir <path>         Block directory for --fs (default .blockchain)\n"
      << "  --block-size <n>     Largest accepted block in bytes (default 500)\n"
      << "  --timeout <seconds>  Per-frame connection timeout (default 30)\n"
      << "  --log <file>         Log file (default chainvault_server.log)\n"
      << "  --verbose            Log debug messages and echo logs to the console\n"
      << "  -h, --help           Show this message\n"
      << "Example: " << program_name << " --fs --port 10005\n";
}

void print_client_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  --ip <addr>          Server address (default 127.0.0.1)\n"
      << "  --port <port>        Server port (default 10005)\n"
      << "  --block-size <n>     Block size used to split files (default 500)\n"
      << "  --timeout <seconds>  Per-frame timeout (default 30)\n"
      << "  --log <file>         Log file (default chainvault_client.log)\n"
      << "  --out <dir>          Directory that get writes files to (default .)\n"
      << "  -h, --help           Show this message\n"
      << "Example: " << program_name << " --ip 127.0.0.1 --port 10005\n";
}

} // namespace config
} // namespace chainvault
