#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "chainvault/cli/cli.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "chainvault/server/chain_server.hpp"
#include "chainvault/store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace chainvault;

class CLITest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir = make_temp_dir("cli_test");

        server::ServerConfig server_config;
        server_config.port = 0;
        server_config.max_block_size = 4;
        chain_server = std::make_unique<server::ChainServer>(server_config, std::make_unique<store::MemoryBackend>());
        ASSERT_TRUE(chain_server->start());

        client::ClientConfig client_config;
        client_config.port = chain_server->port();
        client_config.block_size = 4;
        client_config.timeout = std::chrono::seconds(5);
        client = std::make_unique<client::ChainClient>(client_config);
        cli = std::make_unique<cli::CLI>(*client, work_dir / "out", input, output);
    }

    void TearDown() override {
        cli.reset();
        client.reset();
        chain_server.reset();
        std::filesystem::remove_all(work_dir);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = work_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path work_dir;
    std::istringstream input;
    std::ostringstream output;
    std::unique_ptr<server::ChainServer> chain_server;
    std::unique_ptr<client::ChainClient> client;
    std::unique_ptr<cli::CLI> cli;
};

TEST_F(CLITest, AddCheckGetRoundTrip) {
    auto path = write_file("ten.bin", "0123456789");
    const std::string hash = crypto::Sha256Hasher::hash_hex(std::string("0123456789"));

    std::string added = cli->execute("add " + path.string());
    EXPECT_EQ(added, "Stored " + path.string() + " as " + hash + " (3 block(s), stored at index 0)");

    EXPECT_EQ(cli->execute("check " + hash), "Present: " + hash + " (file, 3 block(s))");
    EXPECT_EQ(cli->execute("check " + path.string()), "Present: " + hash + " (file, 3 block(s))");
    EXPECT_EQ(cli->execute("check"), "Chain intact: 3 block(s)");

    auto expected = work_dir / "out" / "ten.bin";
    EXPECT_EQ(cli->execute("get " + hash), "Retrieved " + expected.string() + " (3 block(s))");
    std::ifstream in(expected, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "0123456789");

    // Each command closes its connection
    EXPECT_FALSE(client->is_connected());
}

TEST_F(CLITest, AddingTwiceReportsExistingIndex) {
    auto path = write_file("six.bin", "abcdef");
    cli->execute("add " + path.string());
    std::string again = cli->execute("add " + path.string());
    EXPECT_NE(again.find("already stored at index 0"), std::string::npos) << again;
}

TEST_F(CLITest, ReportsMissingContent) {
    const std::string absent = crypto::Sha256Hasher::hash_hex(std::string("absent"));
    EXPECT_EQ(cli->execute("check " + absent), "Not found: " + absent);
    EXPECT_EQ(cli->execute("get " + absent), "Not found: " + absent);
    EXPECT_EQ(cli->execute("add " + (work_dir / "missing.txt").string()),
              "Error opening file: " + (work_dir / "missing.txt").string());
}

TEST_F(CLITest, RejectsInvalidInput) {
    EXPECT_EQ(cli->execute(""), "");
    EXPECT_EQ(cli->execute("add"), "Unknown command or invalid arguments. Type 'help' for usage.");
    EXPECT_EQ(cli->execute("frobnicate"), "Unknown command or invalid arguments. Type 'help' for usage.");
    EXPECT_EQ(cli->execute("add a b"), "Invalid input. Usage: <command> [argument]");
    EXPECT_EQ(cli->execute("get nothex"), "Not a SHA-256 hash: nothex");
    EXPECT_EQ(cli->execute("check nowhere"), "Not a file or SHA-256 hash: nowhere");
}

TEST_F(CLITest, HelpListsCommands) {
    std::string help = cli->execute("help");
    for (const char* command : {"add", "check", "get", "help", "stop"}) {
        EXPECT_NE(help.find(command), std::string::npos) << command;
    }
}

TEST_F(CLITest, RunStopsOnStop) {
    input.str("help\nstop\ncheck\n");
    cli->run();

    EXPECT_FALSE(cli->is_running());
    EXPECT_NE(output.str().find("Bye"), std::string::npos);
    // Nothing after stop is executed
    EXPECT_EQ(output.str().find("Chain intact"), std::string::npos);
}

TEST_F(CLITest, UnreachableServerIsReportedNotThrown) {
    chain_server.reset();
    std::string reply = cli->execute("check");
    EXPECT_EQ(reply.rfind("Error checking: ", 0), 0u) << reply;
}
