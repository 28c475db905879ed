#ifndef CHUNKD_LOGGER_HPP
#define CHUNKD_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkd {
namespace logger {

// Sink configuration for the process-wide Boost.Log core
struct LogOptions {
  // Empty disables the file sink
  std::string log_file;
  boost::log::trivial::severity_level min_level{boost::log::trivial::info};
  bool console{true};
};


// ---- INITIALIZATION ----
// Replaces all sinks with a console sink and an optional rotating file sink
void init_logging(const LogOptions& options);


// ---- RUNTIME CONTROL ----
void set_log_level(boost::log::trivial::severity_level level);
void enable_logging();
void disable_logging();
// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level);

} // namespace logger
} // namespace chunkd

#endif // CHUNKD_LOGGER_HPP
