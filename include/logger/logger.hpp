#ifndef PAGESTORE_LOGGER_HPP
#define PAGESTORE_LOGGER_HPP

#include <stdexcept>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>

namespace pagestore::logging {

using severity_level = boost::log::trivial::severity_level;

class Logger {
public:
    // Sends all records at or above min_level to log_file
    static void init(const std::string& log_file = "pagestore.log",
                     severity_level min_level = boost::log::trivial::info) {
        namespace blog = boost::log;
        namespace keywords = boost::log::keywords;
        namespace expr = boost::log::expressions;

        // Add common attributes
        blog::add_common_attributes();

        // Setup file sink
        blog::add_file_log(
            keywords::file_name = log_file,
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = (
                expr::stream
                    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                    << " [" << blog::trivial::severity << "]"
                    << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "]"
                    << " " << expr::smessage
            ),
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );

        set_level(min_level);
    }

    // Set the minimum severity level
    static void set_level(severity_level min_level) {
        boost::log::core::get()->set_filter(
            boost::log::trivial::severity >= min_level
        );
    }

    // Accepts trace, debug, info, warning, error and fatal
    static severity_level parse_level(const std::string& text) {
        severity_level level;
        if (!boost::log::trivial::from_string(text.c_str(), text.size(), level)) {
            throw std::invalid_argument("Unknown log level: " + text);
        }
        return level;
    }
};

} // namespace pagestore::logging

#endif // PAGESTORE_LOGGER_HPP
