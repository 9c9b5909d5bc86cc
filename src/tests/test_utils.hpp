#ifndef CHAINVAULT_TEST_UTILS_HPP
#define CHAINVAULT_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

// Set logging severity level and configure logging
inline void init_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    // Add console output with formatting
    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::info
    );

    // Add commonly used attributes
    boost::log::add_common_attributes();
}

inline std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Unique scratch directory under the system temp path
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    auto dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    return dir;
}

// Flips the low bit of the last byte of a file in place
inline void flip_last_byte(const std::filesystem::path& path) {
    std::vector<char> bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    bytes.back() ^= 0x01;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), bytes.size());
}

// Replaces a directory with a symlink to itself, so every access fails with ELOOP
inline void make_unreachable(const std::filesystem::path& dir) {
    std::filesystem::remove_all(dir);
    std::filesystem::create_directory_symlink(dir, dir);
}

#endif // CHAINVAULT_TEST_UTILS_HPP
