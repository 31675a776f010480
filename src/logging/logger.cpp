#include <logging/logger.hpp>

// The sinks are set up on the first use of the logger so config::init must be called before
BOOST_LOG_GLOBAL_LOGGER_INIT(_logger_mt, src::severity_logger_mt)
{
    logger_mt _logger_mt;
    logging::add_common_attributes();

    const auto _format = expr::stream 
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
        << "] <" << expr::attr<logging::trivial::severity_level>("Severity") << "> ["
        << expr::attr<std::string>("File") << ":" 
        << expr::attr<int>("Line") << "] ["
        << expr::attr<std::string>("Function") << "] "
        << expr::smessage;

    if (!config::log_file_path.empty())
    {
        logging::add_file_log(
            logging::keywords::file_name = config::log_file_path,
            logging::keywords::open_mode = std::ios::app,
            logging::keywords::format = _format);
    }
        
    if (config::console_log_enabled)
    {
        logging::add_console_log(
            std::clog,
            logging::keywords::format = _format);
    }

    // Without any sink Boost.Log would fall back to its default console output
    if (config::log_file_path.empty() && !config::console_log_enabled)
    {
        logging::core::get()->set_logging_enabled(false);
    }

    logging::core::get()->set_filter
    (
        logging::trivial::severity >= config::log_severity
    );
    return _logger_mt;
}
