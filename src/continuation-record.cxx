#include <tar-chunker/continuation-record.hxx>
#include <tar-chunker/detail/tar-fields.hxx>
#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/errors.hxx>

#include <cstddef>
#include <cstring>

namespace tar_chunker {

using detail::GnuTarHeader;

ContinuationRecord continuation_for(const EntryInfo &entry,
                                    std::uint64_t payload_offset) {
  return ContinuationRecord{
      .name = entry.name.substr(0, kContinuationNameLength),
      .offset = payload_offset,
      .remaining = entry.size - payload_offset,
      .total_size = entry.size};
}

Block encode_continuation(const ContinuationRecord &record,
                          const Block &original_header) {
  Block block = original_header;
  auto gnu = reinterpret_cast<GnuTarHeader *>(block.data());

  // Everything past devminor is GNU-specific; start it from zero.
  constexpr auto gnu_area = offsetof(GnuTarHeader, atime);
  std::memset(block.data() + gnu_area, 0, kBlockSize - gnu_area);

  detail::store_text_field(gnu->name, sizeof(gnu->name), record.name);
  detail::format_numeric_field(gnu->size, sizeof(gnu->size), record.remaining);
  gnu->typeflag[0] = detail::typeflag::kGnuMultiVolume;
  std::memset(gnu->linkname, 0, sizeof(gnu->linkname));
  std::memcpy(gnu->magic, detail::kGnuMagic, sizeof(gnu->magic));
  detail::format_numeric_field(gnu->offset, sizeof(gnu->offset), record.offset);
  detail::format_numeric_field(gnu->realsize, sizeof(gnu->realsize),
                               record.total_size);
  detail::write_checksum(block.data());
  return block;
}

std::optional<ContinuationRecord> decode_continuation(const Block &block) {
  auto gnu = reinterpret_cast<const GnuTarHeader *>(block.data());
  if (gnu->typeflag[0] != detail::typeflag::kGnuMultiVolume ||
      std::memcmp(gnu->magic, detail::kGnuMagic, sizeof(gnu->magic)) != 0)
    return std::nullopt;

  if (!detail::verify_checksum(block.data()))
    throw MalformedHeader(0, "continuation record checksum mismatch");

  const auto remaining =
      detail::parse_numeric_field(gnu->size, sizeof(gnu->size));
  const auto offset =
      detail::parse_numeric_field(gnu->offset, sizeof(gnu->offset));
  const auto total =
      detail::parse_numeric_field(gnu->realsize, sizeof(gnu->realsize));
  if (!remaining || !offset || !total || *offset + *remaining != *total)
    throw MalformedHeader(0, "inconsistent continuation record sizes");

  return ContinuationRecord{
      .name = detail::extract_text_field(gnu->name, sizeof(gnu->name)),
      .offset = *offset,
      .remaining = *remaining,
      .total_size = *total};
}

} // namespace tar_chunker
