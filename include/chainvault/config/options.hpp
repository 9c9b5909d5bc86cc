#ifndef CHAINVAULT_CONFIG_OPTIONS_HPP
#define CHAINVAULT_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace chainvault {
namespace config {

struct ServerOptions {
  std::string address{"127.0.0.1"};
  uint16_t port{10005};
  // Filesystem backend when set, memory backend otherwise
  bool use_filesystem{false};
  std::string directory{".blockchain"};
  size_t block_size{500};
  uint32_t timeout_seconds{30};
  std::string log_file{"chainvault_server.log"};
  bool verbose{false};
  bool help{false};
  bool valid{false};
};

struct ClientOptions {
  std::string address{"127.0.0.1"};
  uint16_t port{10005};
  size_t block_size{500};
  uint32_t timeout_seconds{30};
  std::string log_file{"chainvault_client.log"};
  std::string output_dir{"."};
  bool help{false};
  bool valid{false};
};

// Arguments exclude the program name. Problems are reported on errors
// and leave valid unset.
ServerOptions parse_server_options(const std::vector<std::string>& args, std::ostream& errors);
ClientOptions parse_client_options(const std::vector<std::string>& args, std::ostream& errors);

void print_server_usage(const std::string& program_name, std::ostream& out);
void print_client_usage(const std::string& program_name, std::ostream& out);

} // namespace config
} // namespace chainvault

#endif // CHAINVAULT_CONFIG_OPTIONS_HPP
