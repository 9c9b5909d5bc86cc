#include "chainvault/logger/logger.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace chainvault::logger {

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level, bool console) {
    namespace expr = boost::log::expressions;
    namespace sinks = boost::log::sinks;

    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        boost::log::formatter formatter =
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << boost::log::trivial::severity << "]"
                << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
                << " " << expr::smessage;

        // Create and configure text file sink backend
        auto backend = boost::make_shared<sinks::text_file_backend>();
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
        auto sink = boost::make_shared<file_sink>(backend);
        sink->set_formatter(formatter);
        boost::log::core::get()->add_sink(sink);

        if (console) {
            auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
            console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            console_backend->auto_flush(true);

            using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
            auto console_frontend = boost::make_shared<console_sink>(console_backend);
            console_frontend->set_formatter(formatter);
            boost::log::core::get()->add_sink(console_frontend);
        }

        boost::log::add_common_attributes();
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
        boost::log::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(info) << "Logger: Logging to " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void shutdown_logging() {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
}

} // namespace chainvault::logger
