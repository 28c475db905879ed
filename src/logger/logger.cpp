#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>

namespace chunkd {
namespace logger {

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const LogOptions& options) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks so repeated initialization does not duplicate output
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " [" << logging::trivial::severity << "] "
        << expr::smessage;

    if (options.console) {
      logging::add_console_log(
        std::clog,
        keywords::format = formatter,
        keywords::auto_flush = true
      );
    }

    if (!options.log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = formatter,
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    set_log_level(options.min_level);
    enable_logging();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}


//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(boost::log::trivial::severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level) {
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace logger
} // namespace chunkd
