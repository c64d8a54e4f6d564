#include <tar-chunker/detail/tar-fields.hxx>
#include <tar-chunker/detail/tar-header.hxx>
#include <tar-chunker/entry-tracker.hxx>
#include <tar-chunker/errors.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace tar_chunker {
namespace {

using detail::GnuTarHeader;
using detail::TarHeader;

/// Metadata records (pax, GNU long names) are buffered up to this size.
constexpr std::uint64_t kMaxMetadataPayload = 1 << 20;

/**
 * @brief Resolve the entry name stored in a header.
 *
 * POSIX ustar headers may split long names between the prefix and name
 * fields. GNU headers use the prefix area for other fields, so only the
 * name field is read for them.
 */
std::string header_name(const TarHeader *tar) {
  auto name = detail::extract_text_field(tar->name, sizeof(tar->name));
  const bool posix_ustar =
      std::memcmp(tar->magic, detail::kUstarMagic, sizeof(tar->magic)) == 0;
  if (posix_ustar && tar->prefix[0] != '\0') {
    auto prefix = detail::extract_text_field(tar->prefix, sizeof(tar->prefix));
    name = prefix + "/" + name;
  }
  return name;
}

bool is_gnu_header(const TarHeader *tar) {
  return std::memcmp(tar->magic, detail::kGnuMagic, sizeof(detail::kGnuMagic)) ==
         0;
}

/// GNU long-name payloads are NUL terminated strings.
std::string strip_trailing_nuls(std::string text) {
  while (!text.empty() && text.back() == '\0')
    text.pop_back();
  return text;
}

} // unnamed namespace

EntryTracker::EntryTracker(RunState &state) : state_(state) {}

/**
 * @brief Classify one block and update the run state.
 *
 * The tracker is a small state machine:
 *  - after the end-of-archive marker every block is a trailer,
 *  - while an old GNU sparse header announces extensions, blocks are header
 *    extensions,
 *  - while payload remains, blocks are payload,
 *  - otherwise the block is a header or a zero block.
 */
BlockInfo EntryTracker::consume(const Block &block) {
  const auto offset = state_.stream_offset;
  state_.stream_offset += kBlockSize;

  if (state_.end_of_archive)
    return BlockInfo{.kind = BlockKind::Trailer, .stream_offset = offset};
  if (state_.expect_sparse_extension)
    return consume_extension(block, offset);
  if (state_.bytes_remaining > 0)
    return consume_payload(block, offset);

  if (is_zero_block(block)) {
    if (++state_.consecutive_zero_blocks >= 2)
      state_.end_of_archive = true;
    return BlockInfo{.kind = BlockKind::ZeroBlock, .stream_offset = offset};
  }
  if (state_.consecutive_zero_blocks > 0) {
    BOOST_LOG_TRIVIAL(warning)
        << "Lone zero block at offset " << offset - kBlockSize;
    state_.consecutive_zero_blocks = 0;
  }
  return consume_header(block, offset);
}

BlockInfo EntryTracker::consume_header(const Block &block,
                                       std::uint64_t offset) {
  if (!detail::verify_checksum(block.data()))
    throw MalformedHeader(offset, "checksum mismatch");

  auto tar = reinterpret_cast<const TarHeader *>(block.data());
  const auto size = detail::parse_numeric_field(tar->size, sizeof(tar->size));
  if (!size)
    throw MalformedHeader(offset, "unreadable size field");
  const auto mode = detail::parse_numeric_field(tar->mode, sizeof(tar->mode));

  EntryInfo entry;
  entry.name = header_name(tar);
  entry.link_name =
      detail::extract_text_field(tar->linkname, sizeof(tar->linkname));
  entry.typeflag = tar->typeflag[0];
  entry.size = *size;
  entry.mode = mode ? static_cast<std::uint32_t>(*mode & 07777) : 0;
  entry.header_offset = offset;
  entry.metadata = detail::is_metadata_type(entry.typeflag);

  if (entry.metadata) {
    if (entry.typeflag != detail::typeflag::kPaxGlobal &&
        entry.size > kMaxMetadataPayload)
      throw MalformedHeader(offset, "metadata record of " +
                                        std::to_string(entry.size) +
                                        " bytes exceeds limit");
  } else {
    auto &pending = state_.pending;
    if (pending.path)
      entry.name = *pending.path;
    if (pending.link_path)
      entry.link_name = *pending.link_path;
    if (pending.size)
      entry.size = *pending.size;
    pending = PendingMetadata{};
    ++state_.entries;
  }

  if (!detail::carries_payload(entry.typeflag))
    entry.size = 0;

  state_.current = std::move(entry);
  state_.current_header = block;
  state_.bytes_remaining = state_.current.size;
  state_.metadata_payload.clear();
  state_.expect_sparse_extension =
      state_.current.typeflag == detail::typeflag::kGnuSparse &&
      is_gnu_header(tar) &&
      reinterpret_cast<const GnuTarHeader *>(block.data())->isextended[0] !=
          '\0';

  BOOST_LOG_TRIVIAL(debug) << "Entry '" << state_.current.name << "' type '"
                           << state_.current.typeflag << "' size "
                           << state_.current.size << " at offset " << offset;

  BlockInfo info{.kind = BlockKind::Header, .stream_offset = offset};
  if (state_.at_entry_boundary()) {
    close_entry();
    info.entry_complete = true;
  }
  return info;
}

BlockInfo EntryTracker::consume_extension(const Block &block,
                                          std::uint64_t offset) {
  auto ext = reinterpret_cast<const detail::GnuSparseExtension *>(block.data());
  state_.expect_sparse_extension = ext->isextended[0] != '\0';

  BlockInfo info{.kind = BlockKind::HeaderExtension, .stream_offset = offset};
  if (state_.at_entry_boundary()) {
    close_entry();
    info.entry_complete = true;
  }
  return info;
}

BlockInfo EntryTracker::consume_payload(const Block &block,
                                        std::uint64_t offset) {
  const auto n = static_cast<std::size_t>(
      std::min<std::uint64_t>(kBlockSize, state_.bytes_remaining));

  BlockInfo info{.kind = BlockKind::Payload,
                 .stream_offset = offset,
                 .payload_offset = state_.payload_consumed(),
                 .payload_bytes = n};

  const auto flag = state_.current.typeflag;
  if (state_.current.metadata && flag != detail::typeflag::kPaxGlobal)
    state_.metadata_payload.append(block.data(), n);

  state_.bytes_remaining -= n;
  if (state_.bytes_remaining == 0) {
    close_entry();
    info.entry_complete = true;
  }
  return info;
}

/**
 * @brief Finish the current entry.
 *
 * Metadata records are turned into overrides for the next entry here, once
 * their whole payload is known.
 */
void EntryTracker::close_entry() {
  switch (state_.current.typeflag) {
  case detail::typeflag::kPaxExtended:
    apply_pax_records(state_.metadata_payload);
    break;
  case detail::typeflag::kGnuLongName:
    state_.pending.path = strip_trailing_nuls(state_.metadata_payload);
    break;
  case detail::typeflag::kGnuLongLink:
    state_.pending.link_path = strip_trailing_nuls(state_.metadata_payload);
    break;
  default:
    break;
  }
  state_.metadata_payload.clear();
}

/**
 * @brief Parse pax extended header records ("<len> <key>=<value>\n").
 *
 * Only the keys that change how the next entry is laid out or named are
 * kept: path, linkpath and size.
 */
void EntryTracker::apply_pax_records(const std::string &records) {
  const auto offset = state_.current.header_offset;
  std::size_t pos = 0;
  while (pos < records.size()) {
    if (records[pos] == '\0')
      break;

    const auto space = records.find(' ', pos);
    if (space == std::string::npos)
      throw MalformedHeader(offset, "pax record without length");

    std::size_t length = 0;
    for (auto i = pos; i < space; ++i) {
      if (records[i] < '0' || records[i] > '9')
        throw MalformedHeader(offset, "pax record length is not decimal");
      length = length * 10 + static_cast<std::size_t>(records[i] - '0');
    }
    if (length <= space - pos || pos + length > records.size() ||
        records[pos + length - 1] != '\n')
      throw MalformedHeader(offset, "pax record length out of range");

    const auto record = records.substr(space + 1, pos + length - space - 2);
    const auto eq = record.find('=');
    if (eq == std::string::npos)
      throw MalformedHeader(offset, "pax record without '='");
    const auto key = record.substr(0, eq);
    const auto value = record.substr(eq + 1);

    if (key == "path") {
      state_.pending.path = value;
    } else if (key == "linkpath") {
      state_.pending.link_path = value;
    } else if (key == "size") {
      if (value.empty() || value.size() > 19 ||
          value.find_first_not_of("0123456789") != std::string::npos)
        throw MalformedHeader(offset, "pax size is not a decimal number");
      state_.pending.size = std::stoull(value);
    }
    pos += length;
  }
}

void EntryTracker::finish() const {
  if (!state_.at_entry_boundary())
    throw TruncatedStream(state_.stream_offset,
                          "stream ended inside entry '" + state_.current.name +
                              "' with " +
                              std::to_string(state_.bytes_remaining) +
                              " payload bytes missing");
  if (!state_.end_of_archive)
    throw TruncatedStream(state_.stream_offset,
                          "stream ended without the end-of-archive marker");
}

} // namespace tar_chunker
