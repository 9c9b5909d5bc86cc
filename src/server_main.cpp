#include "chainvault/config/options.hpp"
#include "chainvault/logger/logger.hpp"
#include "chainvault/server/chain_server.hpp"
#include "chainvault/store/filesystem_backend.hpp"
#include "chainvault/store/memory_backend.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::unique_ptr<chainvault::store::PersistenceBackend> make_backend(const chainvault::config::ServerOptions& options) {
  if (options.use_filesystem) {
    return std::make_unique<chainvault::store::FilesystemBackend>(options.directory);
  }
  return std::make_unique<chainvault::store::MemoryBackend>();
}

bool run_server(const chainvault::config::ServerOptions& options) {
  try {
    chainvault::server::ServerConfig config;
    config.address = options.address;
    config.port = options.port;
    config.max_block_size = options.block_size;
    config.timeout = std::chrono::seconds(options.timeout_seconds);

    chainvault::server::ChainServer server(config, make_backend(options));
    if (!server.start()) {
      std::cerr << "Error: Failed to start server\n";
      return false;
    }

    std::cout << "chainvault server listening on " << options.address << ":" << server.port() 
              << " (" << server.get_ledger().size() << " block(s)"
              << (server.startup_verification().ok ? "" : ", chain FAILS verification") << ")" << std::endl;

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number;
      }
    });
    signals_context.run();

    std::cout << "Shutting down" << std::endl;
    return server.shutdown();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    std::cerr << "Error: Failed to run server: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto options = chainvault::config::parse_server_options(args, std::cerr);
  if (!options.valid || options.help) {
    chainvault::config::print_server_usage(argv[0], options.valid ? std::cout : std::cerr);
    return options.valid ? 0 : 1;
  }

  chainvault::logger::init_logging(options.log_file,
    options.verbose ? boost::log::trivial::debug : boost::log::trivial::info, options.verbose);

  const bool ok = run_server(options);
  chainvault::logger::shutdown_logging();
  return ok ? 0 : 1;
}
