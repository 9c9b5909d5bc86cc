#include "chainvault/cli/cli.hpp"
#include "chainvault/client/chain_client.hpp"
#include "chainvault/config/options.hpp"
#include "chainvault/logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool run_client(const chainvault::config::ClientOptions& options) {
  try {
    chainvault::client::ClientConfig config;
    config.address = options.address;
    config.port = options.port;
    config.block_size = options.block_size;
    config.timeout = std::chrono::seconds(options.timeout_seconds);

    chainvault::client::ChainClient client(config);
    chainvault::cli::CLI cli(client, options.output_dir);

    std::cout << "chainvault client for " << options.address << ":" << options.port 
              << ", type 'help' for commands" << std::endl;
    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Client: " << e.what();
    std::cerr << "Error: Failed to run client: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto options = chainvault::config::parse_client_options(args, std::cerr);
  if (!options.valid || options.help) {
    chainvault::config::print_client_usage(argv[0], options.valid ? std::cout : std::cerr);
    return options.valid ? 0 : 1;
  }

  chainvault::logger::init_logging(options.log_file);

  const bool ok = run_client(options);
  chainvault::logger::shutdown_logging();
  return ok ? 0 : 1;
}
