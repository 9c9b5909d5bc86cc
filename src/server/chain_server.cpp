#include "chainvault/server/chain_server.hpp"
#include <boost/log/trivial.hpp>

namespace chainvault {
namespace server {

ChainServer::ChainServer(const ServerConfig& config, std::unique_ptr<store::PersistenceBackend> backend)
    : config_(config) {

    BOOST_LOG_TRIVIAL(info) << "Chain server: Initializing on " << config_.address << ":" << config_.port;

    try {
        // Ledger first, everything else serves it
        ledger_ = std::make_unique<chain::Ledger>(std::move(backend), config_.max_block_size);
        BOOST_LOG_TRIVIAL(debug) << "Chain server: Ledger created successfully";

        dispatcher_ = std::make_unique<network::RequestDispatcher>(*ledger_);
        BOOST_LOG_TRIVIAL(debug) << "Chain server: Request Dispatcher created successfully";

        tcp_server_ = std::make_unique<network::TCP_Server>(config_.port, config_.address);
        BOOST_LOG_TRIVIAL(debug) << "Chain server: TCP Server created successfully";

        session_manager_ = std::make_unique<network::SessionManager>(*dispatcher_, config_.timeout,
                                                                    config_.max_block_size);
        BOOST_LOG_TRIVIAL(debug) << "Chain server: Session Manager created successfully";

        tcp_server_->set_session_manager(*session_manager_);

        BOOST_LOG_TRIVIAL(info) << "Chain server: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Chain server: Failed to initialize components: " << e.what();
        throw;
    }
}

bool ChainServer::start() {
    if (started_) {
        BOOST_LOG_TRIVIAL(warning) << "Chain server: Already started";
        return false;
    }

    try {
        startup_verification_ = ledger_->open();
        if (!startup_verification_.ok) {
            BOOST_LOG_TRIVIAL(warning) << "Chain server: Serving a chain that fails verification at index " 
                                       << *startup_verification_.first_broken_index;
        }

        if (!tcp_server_->start_listener()) {
            BOOST_LOG_TRIVIAL(error) << "Chain server: Failed to start TCP server";
            return false;
        }

        started_ = true;
        BOOST_LOG_TRIVIAL(info) << "Chain server: Listening on " << config_.address << ":" << port() 
                                << " with " << ledger_->size() << " block(s) on " 
                                << ledger_->backend().name() << " backend";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Chain server: Failed to start: " << e.what();
        return false;
    }
}

bool ChainServer::shutdown() {
    try {
        BOOST_LOG_TRIVIAL(info) << "Chain server: Initiating shutdown sequence";

        // Stop accepting before closing sessions so none slip in
        if (tcp_server_) {
            BOOST_LOG_TRIVIAL(debug) << "Chain server: Shutting down TCP Server";
            tcp_server_->shutdown();
        }

        if (session_manager_) {
            BOOST_LOG_TRIVIAL(debug) << "Chain server: Shutting down Session Manager";
            session_manager_->shutdown();
        }

        started_ = false;
        BOOST_LOG_TRIVIAL(info) << "Chain server: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Chain server: Error during shutdown: " << e.what();
        return false;
    }
}

ChainServer::~ChainServer() {
    if (!shutdown()) {
        BOOST_LOG_TRIVIAL(error) << "Chain server: Failed to shutdown cleanly in destructor";
    }
}

} // namespace server
} // namespace chainvault
