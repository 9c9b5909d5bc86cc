#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include "chainvault/client/chain_client.hpp"

namespace chainvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::ChainClient& client, const std::filesystem::path& output_dir,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until stop, quit, or end of input
    void run();


    // ---- COMMAND PROCESSING ----
    // Executes one command line and returns the text shown to the user
    std::string execute(const std::string& line);
    bool is_running() const { return running_; }

private:
    // ---- PARAMETERS ----
    bool running_;
    std::filesystem::path output_dir_;
    std::istream& input_;
    std::ostream& output_;
    // System components
    client::ChainClient& client_;


    // ---- COMMAND PROCESSING ----
    std::string handle_add_command(const std::string& path);
    std::string handle_check_command(const std::string& target);
    std::string handle_get_command(const std::string& hash);
    std::string handle_help_command() const;
    // Renders non-OK replies the same way for every command
    std::string describe_failure(const client::ClientResult& result) const;
    std::string log_and_format_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chainvault
