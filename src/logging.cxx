#include <tar-chunker/errors.hxx>
#include <tar-chunker/logging.hxx>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <iostream>

namespace tar_chunker {

Severity parse_severity(const std::string &name) {
  Severity level;
  if (!boost::log::trivial::from_string(name.data(), name.size(), level))
    throw UsageError("unknown log level '" + name + "'");
  return level;
}

void init_logging(Severity level,
                  const std::optional<std::filesystem::path> &log_file) {
  namespace logging = boost::log;

  logging::register_simple_formatter_factory<Severity, char>("Severity");
  logging::add_console_log(
      std::clog,
      logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
  if (log_file)
    logging::add_file_log(
        logging::keywords::file_name = log_file->string(),
        logging::keywords::open_mode = std::ios::app,
        logging::keywords::auto_flush = true,
        logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");

  logging::core::get()->set_filter(logging::trivial::severity >= level);
  logging::add_common_attributes();
}

} // namespace tar_chunker
