#include "logging.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", LogLevel)
BOOST_LOG_ATTRIBUTE_KEYWORD(channel, "Channel", std::string)

void init_logging(LogLevel min_level, const std::string& log_file) {
    logging::add_common_attributes();

    auto format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << severity << "]"
        << " [" << channel << "] "
        << expr::smessage;

    logging::add_console_log(std::clog, keywords::format = format);

    if (!log_file.empty()) {
        logging::add_file_log(
            keywords::file_name = log_file,
            keywords::auto_flush = true,
            keywords::open_mode = std::ios_base::app,
            keywords::format = format
        );
    }

    logging::core::get()->set_filter(severity >= min_level);
}

LogLevel parse_log_level(const std::string& name) {
    const std::string upper = boost::algorithm::to_upper_copy(name);
    for (int i = 0; i < 5; ++i) {
        if (upper == LOG_LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::LL_INFO;
}
