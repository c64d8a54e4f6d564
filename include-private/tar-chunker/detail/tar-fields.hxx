#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tar_chunker::detail {

/**
 * @brief Parse a numeric header field (size, mtime, offset, ...).
 *
 * Accepts traditional octal ASCII (optionally space padded, terminated by
 * NUL or space) and the GNU base-256 encoding signalled by the high bit of
 * the first byte. Negative base-256 values and stray characters are
 * rejected.
 *
 * @return std::nullopt when the field is not a valid non-negative number.
 */
std::optional<std::uint64_t> parse_numeric_field(const char *p,
                                                 std::size_t n);

/**
 * @brief Store @p value into a numeric header field.
 *
 * Uses zero-padded octal followed by a NUL when the value fits in
 * `n - 1` octal digits, and the base-256 encoding otherwise.
 */
void format_numeric_field(char *p, std::size_t n, std::uint64_t value);

/// Copy a possibly non-NUL-terminated text field into a std::string.
std::string extract_text_field(const char *p, std::size_t n);

/// Copy @p text into a text field, truncating and NUL padding it.
void store_text_field(char *p, std::size_t n, const std::string &text);

/**
 * @brief Check a header block's checksum.
 *
 * Historic writers summed the bytes as signed chars, so both the unsigned
 * and the signed sum are accepted.
 */
bool verify_checksum(const char *block);

/// Recompute and store the checksum field of a header block.
void write_checksum(char *block);

/// Whether entries of this type store @c size payload bytes after the header.
bool carries_payload(char flag) noexcept;

/// Whether this type describes the entry that follows it (pax, GNU long names).
bool is_metadata_type(char flag) noexcept;

/// Number of whole blocks needed for @p bytes of payload.
constexpr std::uint64_t blocks_for(std::uint64_t bytes) noexcept {
  return (bytes + 511) / 512;
}

} // namespace tar_chunker::detail
