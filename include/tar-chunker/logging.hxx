#pragma once

#include <boost/log/trivial.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace tar_chunker {

using Severity = boost::log::trivial::severity_level;

/**
 * @brief Parse a severity name (trace, debug, info, warning, error, fatal).
 * @throws UsageError for any other name.
 */
Severity parse_severity(const std::string &name);

/**
 * @brief Route Boost.Log output to stderr and optionally to a file.
 *
 * Records below @p level are dropped. Standard output is never used, so it
 * stays free for a reconstructed archive stream.
 */
void init_logging(Severity level,
                  const std::optional<std::filesystem::path> &log_file);

} // namespace tar_chunker
