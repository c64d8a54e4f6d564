#pragma once

#include <tar-chunker/codec.hxx>
#include <tar-chunker/logging.hxx>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace tar_chunker {

enum class Mode { Help, Split, Unpack };

/// Settings of one command-line invocation.
struct Options {
  Mode mode = Mode::Help;
  std::optional<CodecKind> compression;

  std::filesystem::path split_to;
  std::uint64_t split_size = 0;
  bool hash = false;

  std::filesystem::path unpack_from;
  std::optional<std::filesystem::path> unpack_to;
  /// "-" selects standard output.
  std::optional<std::string> reassemble_to;

  Severity log_level = Severity::info;
  std::optional<std::filesystem::path> log_file;
};

/**
 * @brief Parse a byte count such as "4096", "512K", "5M" or "5MiB".
 *
 * Suffixes K, M, G and T are binary multiples; a trailing "i", "B" or
 * "iB" is accepted.
 *
 * @throws UsageError on malformed input or overflow.
 */
std::uint64_t parse_size(const std::string &text);

/**
 * @brief Fill Options from argv.
 *
 * Flags taking a value accept both "--flag value" and "--flag=value".
 *
 * @throws UsageError on unknown flags, missing values or conflicting modes.
 */
Options parse_options(int argc, const char *const *argv);

void print_usage(std::ostream &os);

} // namespace tar_chunker
