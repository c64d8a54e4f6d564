#include <tar-chunker/block.hxx>
#include <tar-chunker/detail/tar-fields.hxx>
#include <tar-chunker/detail/tar-header.hxx>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace tar_chunker {

bool is_zero_block(const Block &block) noexcept {
  for (std::size_t i = 0; i < kBlockSize; ++i)
    if (block[i] != '\0')
      return false;
  return true;
}

namespace detail {
namespace {

constexpr std::size_t kChecksumOffset = offsetof(TarHeader, chksum);
constexpr std::size_t kChecksumSize = sizeof(TarHeader::chksum);

/**
 * @brief Decode a GNU base-256 field, big-endian after the 0x80 marker.
 *
 * Bit 6 of the first byte flags a negative number, which no field read here
 * may hold. Values wider than 64 bits are refused as well.
 */
std::optional<std::uint64_t> parse_base256(const char *p, std::size_t n) {
  const auto bytes = reinterpret_cast<const unsigned char *>(p);
  if (bytes[0] & 0x40)
    return std::nullopt;

  std::uint64_t value = bytes[0] & 0x3f;
  for (std::size_t i = 1; i < n; ++i) {
    if (value >> 56)
      return std::nullopt;
    value = (value << 8) | bytes[i];
  }
  return value;
}

std::optional<std::uint64_t> parse_octal(const char *p, std::size_t n) {
  std::size_t i = 0;
  while (i < n && p[i] == ' ')
    ++i;

  std::uint64_t result = 0;
  for (; i < n; ++i) {
    const char c = p[i];
    if (c == '\0' || c == ' ')
      break;
    if (c < '0' || c > '7')
      return std::nullopt;
    if (result > (std::numeric_limits<std::uint64_t>::max() >> 3))
      return std::nullopt;
    result = (result << 3) | static_cast<std::uint64_t>(c - '0');
  }
  for (; i < n; ++i)
    if (p[i] != '\0' && p[i] != ' ')
      return std::nullopt;
  return result;
}

void sum_header(const char *block, std::uint64_t &unsigned_sum,
                std::int64_t &signed_sum) {
  unsigned_sum = 0;
  signed_sum = 0;
  for (std::size_t i = 0; i < kBlockSize; ++i) {
    const bool in_checksum =
        i >= kChecksumOffset && i < kChecksumOffset + kChecksumSize;
    const char c = in_checksum ? ' ' : block[i];
    unsigned_sum += static_cast<unsigned char>(c);
    signed_sum += static_cast<signed char>(c);
  }
}

} // unnamed namespace

std::optional<std::uint64_t> parse_numeric_field(const char *p,
                                                 std::size_t n) {
  if (static_cast<unsigned char>(p[0]) & 0x80)
    return parse_base256(p, n);
  return parse_octal(p, n);
}

void format_numeric_field(char *p, std::size_t n, std::uint64_t value) {
  const std::size_t digits = n - 1;
  if (digits * 3 >= 64 || (value >> (digits * 3)) == 0) {
    for (std::size_t i = digits; i > 0; --i) {
      p[i - 1] = static_cast<char>('0' + (value & 7));
      value >>= 3;
    }
    p[digits] = '\0';
    return;
  }

  std::memset(p, 0, n);
  for (std::size_t i = n; i > 1; --i) {
    p[i - 1] = static_cast<char>(value & 0xff);
    value >>= 8;
  }
  p[0] = static_cast<char>(0x80);
}

std::string extract_text_field(const char *p, std::size_t n) {
  std::size_t len = 0;
  for (; len < n; ++len)
    if (p[len] == '\0')
      break;
  return std::string(p, len);
}

void store_text_field(char *p, std::size_t n, const std::string &text) {
  std::memset(p, 0, n);
  std::memcpy(p, text.data(), std::min(n, text.size()));
}

bool verify_checksum(const char *block) {
  const auto stored = parse_octal(block + kChecksumOffset, kChecksumSize);
  if (!stored)
    return false;
  std::uint64_t unsigned_sum;
  std::int64_t signed_sum;
  sum_header(block, unsigned_sum, signed_sum);
  return *stored == unsigned_sum ||
         static_cast<std::int64_t>(*stored) == signed_sum;
}

void write_checksum(char *block) {
  std::uint64_t unsigned_sum;
  std::int64_t signed_sum;
  sum_header(block, unsigned_sum, signed_sum);

  // GNU layout: six octal digits, NUL, space.
  char *field = block + kChecksumOffset;
  format_numeric_field(field, 7, unsigned_sum);
  field[7] = ' ';
}

bool carries_payload(char flag) noexcept {
  switch (flag) {
  case typeflag::kHardLink:
  case typeflag::kSymlink:
  case typeflag::kCharDevice:
  case typeflag::kBlockDevice:
  case typeflag::kDirectory:
  case typeflag::kFifo:
    return false;
  default:
    return true;
  }
}

bool is_metadata_type(char flag) noexcept {
  return flag == typeflag::kPaxExtended || flag == typeflag::kPaxGlobal ||
         flag == typeflag::kGnuLongName || flag == typeflag::kGnuLongLink;
}

} // namespace detail
} // namespace tar_chunker
